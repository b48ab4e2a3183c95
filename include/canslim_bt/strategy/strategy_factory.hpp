// include/canslim_bt/strategy/strategy_factory.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "canslim_bt/core/config_base.hpp"
#include "canslim_bt/core/error.hpp"
#include "canslim_bt/strategy/allocation_strategy.hpp"

namespace canslim_bt {

/**
 * @brief Parameters of the reference strategies
 */
struct StrategySettings : public ConfigBase {
    int max_positions{6};          // canslim
    int top_k{10};                 // factor, hybrid
    bool use_eps_either{false};    // canslim, factor
    int min_score{4};              // hybrid
    bool cash_when_bearish{false};  // hybrid

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["max_positions"] = max_positions;
        j["top_k"] = top_k;
        j["use_eps_either"] = use_eps_either;
        j["min_score"] = min_score;
        j["cash_when_bearish"] = cash_when_bearish;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("max_positions"))
            max_positions = j.at("max_positions").get<int>();
        if (j.contains("top_k"))
            top_k = j.at("top_k").get<int>();
        if (j.contains("use_eps_either"))
            use_eps_either = j.at("use_eps_either").get<bool>();
        if (j.contains("min_score"))
            min_score = j.at("min_score").get<int>();
        if (j.contains("cash_when_bearish"))
            cash_when_bearish = j.at("cash_when_bearish").get<bool>();
    }
};

/**
 * @brief Build a reference strategy by name
 *
 * Names: market, risk, canslim, factor, hybrid, flattened, leader, volume.
 * @return UNKNOWN_STRATEGY for other names, INVALID_ARGUMENT for bad settings
 */
Result<std::unique_ptr<AllocationStrategy>> create_strategy(const std::string& name,
                                                            const StrategySettings& settings);

/**
 * @brief Names accepted by create_strategy
 */
const std::vector<std::string>& strategy_names();

}  // namespace canslim_bt
