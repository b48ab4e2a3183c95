// include/canslim_bt/indicators/eps_growth.hpp
#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "canslim_bt/core/types.hpp"

namespace canslim_bt {

/**
 * @brief Year-over-year EPS growth of one filing
 */
struct EpsGrowthPoint {
    Timestamp end_date;
    int fiscal_year{0};
    std::string fiscal_period;
    double eps{kUndefined};
    double growth{kUndefined};  // NaN when the prior-year filing is missing or zero

    bool passes(double threshold) const {
        return !is_undefined(growth) && growth >= threshold;
    }
};

/**
 * @brief Per-ticker EPS growth series of one timeframe, keyed by reporting end date
 *
 * Quarterly filings are compared with the same fiscal period of the previous
 * fiscal year; annual filings with the previous fiscal year.
 * growth = (eps - prior) / |prior|.
 */
class EpsGrowthSeries {
public:
    EpsGrowthSeries() = default;

    /**
     * @brief Build from filings; records of other timeframes are ignored
     */
    EpsGrowthSeries(const std::vector<FinancialRecord>& records, Timeframe timeframe);

    /**
     * @brief Latest filing with end_date <= date (binary search), or nullptr
     * A filing is never visible before its reporting end date.
     */
    const EpsGrowthPoint* as_of(const std::string& symbol, const Timestamp& date) const;

    const std::vector<EpsGrowthPoint>* series(const std::string& symbol) const;

    Timeframe timeframe() const {
        return timeframe_;
    }

    size_t num_symbols() const {
        return by_symbol_.size();
    }

private:
    Timeframe timeframe_{Timeframe::QUARTERLY};
    std::unordered_map<std::string, std::vector<EpsGrowthPoint>> by_symbol_;
};

}  // namespace canslim_bt
