// include/canslim_bt/indicators/screen_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "canslim_bt/core/config_base.hpp"

namespace canslim_bt {

/**
 * @brief Thresholds and windows of the screening indicators
 */
struct ScreenConfig : public ConfigBase {
    // C and A: year-over-year diluted EPS growth
    double quarterly_eps_growth_min{0.25};
    double annual_eps_growth_min{0.20};

    // N: new 52-week high
    int new_high_lookback_days{252};

    // S: volume surge over the trailing average
    double volume_surge_factor{1.5};
    int volume_average_days{50};

    // L: excess return over the market proxy
    double leadership_excess_return_min{0.0};
    int leadership_window_days{20};

    // I: accumulation/distribution
    int accumulation_lookback_days{50};
    double accumulation_ratio_min{1.25};

    int quarterly_volume_days{63};

    // M: market direction from the proxy's moving averages
    int market_ma_short_days{50};
    int market_ma_long_days{200};
    bool use_ma_cross_for_market{true};
    bool require_close_above_ma_short{false};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["quarterly_eps_growth_min"] = quarterly_eps_growth_min;
        j["annual_eps_growth_min"] = annual_eps_growth_min;
        j["new_high_lookback_days"] = new_high_lookback_days;
        j["volume_surge_factor"] = volume_surge_factor;
        j["volume_average_days"] = volume_average_days;
        j["leadership_excess_return_min"] = leadership_excess_return_min;
        j["leadership_window_days"] = leadership_window_days;
        j["accumulation_lookback_days"] = accumulation_lookback_days;
        j["accumulation_ratio_min"] = accumulation_ratio_min;
        j["quarterly_volume_days"] = quarterly_volume_days;
        j["market_ma_short_days"] = market_ma_short_days;
        j["market_ma_long_days"] = market_ma_long_days;
        j["use_ma_cross_for_market"] = use_ma_cross_for_market;
        j["require_close_above_ma_short"] = require_close_above_ma_short;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("quarterly_eps_growth_min"))
            quarterly_eps_growth_min = j.at("quarterly_eps_growth_min").get<double>();
        if (j.contains("annual_eps_growth_min"))
            annual_eps_growth_min = j.at("annual_eps_growth_min").get<double>();
        if (j.contains("new_high_lookback_days"))
            new_high_lookback_days = j.at("new_high_lookback_days").get<int>();
        if (j.contains("volume_surge_factor"))
            volume_surge_factor = j.at("volume_surge_factor").get<double>();
        if (j.contains("volume_average_days"))
            volume_average_days = j.at("volume_average_days").get<int>();
        if (j.contains("leadership_excess_return_min"))
            leadership_excess_return_min = j.at("leadership_excess_return_min").get<double>();
        if (j.contains("leadership_window_days"))
            leadership_window_days = j.at("leadership_window_days").get<int>();
        if (j.contains("accumulation_lookback_days"))
            accumulation_lookback_days = j.at("accumulation_lookback_days").get<int>();
        if (j.contains("accumulation_ratio_min"))
            accumulation_ratio_min = j.at("accumulation_ratio_min").get<double>();
        if (j.contains("quarterly_volume_days"))
            quarterly_volume_days = j.at("quarterly_volume_days").get<int>();
        if (j.contains("market_ma_short_days"))
            market_ma_short_days = j.at("market_ma_short_days").get<int>();
        if (j.contains("market_ma_long_days"))
            market_ma_long_days = j.at("market_ma_long_days").get<int>();
        if (j.contains("use_ma_cross_for_market"))
            use_ma_cross_for_market = j.at("use_ma_cross_for_market").get<bool>();
        if (j.contains("require_close_above_ma_short"))
            require_close_above_ma_short = j.at("require_close_above_ma_short").get<bool>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

}  // namespace canslim_bt
