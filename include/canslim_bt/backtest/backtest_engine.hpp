// include/canslim_bt/backtest/backtest_engine.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "canslim_bt/backtest/market_snapshot.hpp"
#include "canslim_bt/core/config_base.hpp"
#include "canslim_bt/core/error.hpp"
#include "canslim_bt/core/time_utils.hpp"
#include "canslim_bt/core/types.hpp"
#include "canslim_bt/strategy/allocation_strategy.hpp"

namespace canslim_bt {

/**
 * @brief Simulation parameters
 */
struct BacktestConfig : public ConfigBase {
    double initial_capital{100000.0};
    std::optional<Timestamp> start_date;  // used by callers to build the schedule
    std::optional<Timestamp> end_date;    // overrides the last rebalance date as range end
    std::string rebalance_frequency{"quarterly"};
    std::string market_proxy{"SPY"};
    std::string cash_proxy{"SHY"};

    // Annual rate earned by idle cash; 0 keeps leftover cash flat
    double idle_cash_annual_rate{0.0};

    // Allowed excess of the weight sum over 1.0 before it is reported
    double weight_tolerance{1e-6};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["initial_capital"] = initial_capital;
        if (start_date)
            j["start_date"] = core::format_date(*start_date);
        if (end_date)
            j["end_date"] = core::format_date(*end_date);
        j["rebalance_frequency"] = rebalance_frequency;
        j["market_proxy"] = market_proxy;
        j["cash_proxy"] = cash_proxy;
        j["idle_cash_annual_rate"] = idle_cash_annual_rate;
        j["weight_tolerance"] = weight_tolerance;
        j["version"] = version;
        return j;
    }

    /**
     * @throws CanslimError on a malformed date string
     */
    void from_json(const nlohmann::json& j) override {
        if (j.contains("initial_capital"))
            initial_capital = j.at("initial_capital").get<double>();
        if (j.contains("start_date"))
            start_date = core::parse_date(j.at("start_date").get<std::string>()).value();
        if (j.contains("end_date"))
            end_date = core::parse_date(j.at("end_date").get<std::string>()).value();
        if (j.contains("rebalance_frequency"))
            rebalance_frequency = j.at("rebalance_frequency").get<std::string>();
        if (j.contains("market_proxy"))
            market_proxy = j.at("market_proxy").get<std::string>();
        if (j.contains("cash_proxy"))
            cash_proxy = j.at("cash_proxy").get<std::string>();
        if (j.contains("idle_cash_annual_rate"))
            idle_cash_annual_rate = j.at("idle_cash_annual_rate").get<double>();
        if (j.contains("weight_tolerance"))
            weight_tolerance = j.at("weight_tolerance").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief What happened at one rebalance
 */
struct RebalanceRecord {
    Timestamp date;
    bool is_first{false};
    double value_used{0.0};  // value handed to the strategy
    Allocation weights;      // as returned by the strategy
    Holdings shares;         // holdings after the rebalance
    std::vector<std::string> skipped;  // tickers without a usable price
    double weight_sum{0.0};
    double invested{0.0};
    double leftover_cash{0.0};
};

struct BacktestResults {
    EquityCurve equity_curve;
    std::vector<RebalanceRecord> rebalances;
    double initial_capital{0.0};
    double final_value{0.0};
    double total_return{0.0};
};

enum class EngineState { UNINITIALIZED, HOLDING, REBALANCING, FINISHED };

std::string engine_state_to_string(EngineState state);

/**
 * @brief Day-by-day portfolio simulation over the market proxy's calendar
 *
 * Holdings are share counts replaced wholesale at each rebalance; the value
 * of every trading day in range is marked to market from the holdings and
 * idle cash. Missing prices and invalid weights are logged and tolerated;
 * only structural problems (no schedule, no calendar, strategy failure)
 * abort a run.
 */
class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config);

    /**
     * @brief Run one simulation
     * @param strategy Allocation strategy called once per triggered rebalance
     * @param snapshot Market data shared with the strategy
     * @param rebalance_dates Rebalance schedule; the first date starts the run
     * @param diagnostics Optional sink handed to the strategy
     */
    Result<BacktestResults> run(const AllocationStrategy& strategy,
                                const MarketSnapshot& snapshot,
                                const std::vector<Timestamp>& rebalance_dates,
                                DiagnosticsSink* diagnostics = nullptr);

    EngineState state() const {
        return state_;
    }

    const BacktestConfig& config() const {
        return config_;
    }

private:
    /**
     * @brief Mark holdings to market; tickers without a price contribute 0
     */
    double mark_to_market(const Holdings& holdings, const MarketSnapshot& snapshot,
                          const Timestamp& date, bool at_rebalance) const;

    Result<RebalanceRecord> rebalance(const AllocationStrategy& strategy,
                                      const MarketSnapshot& snapshot, const Timestamp& date,
                                      double value, bool is_first,
                                      DiagnosticsSink* diagnostics) const;

    void validate_weights(const Allocation& weights, const Timestamp& date,
                          const std::string& strategy_name) const;

    BacktestConfig config_;
    EngineState state_{EngineState::UNINITIALIZED};
};

}  // namespace canslim_bt
