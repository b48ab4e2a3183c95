// include/canslim_bt/core/types.hpp

#pragma once

#include <chrono>
#include <cmath>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace canslim_bt {

/**
 * @brief Point in time; daily data is stored at 00:00 UTC of the session date
 */
using Timestamp = std::chrono::system_clock::time_point;

using Price = double;

/**
 * @brief Fractional share count
 */
using Quantity = double;

/**
 * @brief NaN marker for undefined continuous values
 */
constexpr double kUndefined = std::numeric_limits<double>::quiet_NaN();

/**
 * @brief One daily OHLCV row for a ticker
 */
struct PriceBar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    PriceBar() = default;
    PriceBar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

/**
 * @brief Reporting timeframe of a financial filing
 */
enum class Timeframe { QUARTERLY, ANNUAL };

inline std::string timeframe_to_string(Timeframe tf) {
    return tf == Timeframe::QUARTERLY ? "quarterly" : "annual";
}

/**
 * @brief One filing row: diluted EPS for a fiscal period
 */
struct FinancialRecord {
    std::string symbol;
    Timeframe timeframe{Timeframe::QUARTERLY};
    int fiscal_year{0};
    std::string fiscal_period;  // "Q1".."Q4" for quarterly, "FY" for annual
    Timestamp end_date;         // reporting period end; the as-of key
    double diluted_eps{kUndefined};
};

/**
 * @brief Target weights keyed by ticker
 * Ordered so that every pass over an allocation is deterministic
 */
using Allocation = std::map<std::string, double>;

/**
 * @brief Share counts keyed by ticker
 */
using Holdings = std::map<std::string, Quantity>;

/**
 * @brief Daily (date, portfolio value) series produced by the engine
 */
using EquityCurve = std::vector<std::pair<Timestamp, double>>;

inline bool is_undefined(double value) {
    return std::isnan(value);
}

}  // namespace canslim_bt
