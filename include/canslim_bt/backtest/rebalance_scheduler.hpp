// include/canslim_bt/backtest/rebalance_scheduler.hpp
#pragma once

#include <string>
#include <vector>
#include "canslim_bt/core/types.hpp"
#include "canslim_bt/data/series_table.hpp"

namespace canslim_bt {

enum class RebalanceFrequency { DAILY, WEEKLY, MONTHLY, QUARTERLY, YEARLY };

std::string frequency_to_string(RebalanceFrequency frequency);

/**
 * @brief Parse "daily", "weekly", "monthly", "quarterly" or "yearly" (case-insensitive)
 * Unknown strings fall back to QUARTERLY with a warning.
 */
RebalanceFrequency parse_frequency(const std::string& text);

/**
 * @brief Derives rebalance dates from a trading calendar
 *
 * The calendar is the market proxy's own date list. All results are sorted,
 * unique, and contained in the calendar.
 */
class RebalanceScheduler {
public:
    /**
     * @brief Rebalance dates within [start, end]
     *
     * DAILY returns every trading day; the other frequencies return the last
     * trading day of each bucket: (ISO year, ISO week), (year, month),
     * (year, quarter) or (year). Empty when no trading day falls in range.
     */
    static std::vector<Timestamp> get_rebalance_dates(const std::vector<Timestamp>& calendar,
                                                      RebalanceFrequency frequency,
                                                      const Timestamp& start,
                                                      const Timestamp& end);

    static std::vector<Timestamp> get_rebalance_dates(const std::vector<Timestamp>& calendar,
                                                      const std::string& frequency,
                                                      const Timestamp& start,
                                                      const Timestamp& end) {
        return get_rebalance_dates(calendar, parse_frequency(frequency), start, end);
    }

    /**
     * @brief Unique, sorted quarterly reporting end dates of a ticker
     * Empty, with a warning, when the ticker has no quarterly filings.
     */
    static std::vector<Timestamp> get_quarter_end_dates(
        const std::vector<FinancialRecord>& financials, const std::string& symbol);

    /**
     * @brief Map each target date to the last trading day on or before it
     *
     * A target earlier than the whole calendar maps to the earliest trading
     * day, with a warning.
     */
    static std::vector<Timestamp> get_filing_aligned_rebalance_dates(
        const std::vector<Timestamp>& calendar, const std::vector<Timestamp>& target_dates);

    /**
     * @brief Sorted trading days of `symbol` (the proxy's own calendar)
     */
    static std::vector<Timestamp> trading_calendar(const PriceTable& prices,
                                                   const std::string& symbol);
};

}  // namespace canslim_bt
