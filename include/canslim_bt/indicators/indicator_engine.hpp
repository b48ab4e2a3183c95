// include/canslim_bt/indicators/indicator_engine.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "canslim_bt/core/error.hpp"
#include "canslim_bt/core/types.hpp"
#include "canslim_bt/data/series_table.hpp"
#include "canslim_bt/indicators/eps_growth.hpp"
#include "canslim_bt/indicators/screen_config.hpp"

namespace canslim_bt {

/**
 * @brief A price bar with the screening signals of its ticker and date
 *
 * Every field for date d is derived from rows dated <= d only.
 */
struct IndicatorRow : public PriceBar {
    // Continuous values (NaN when undefined)
    double stock_return{0.0};
    double market_return{kUndefined};
    double excess_return{kUndefined};
    double ma_short{kUndefined};  // market proxy MAs of the same date
    double ma_long{kUndefined};
    double high_52w{kUndefined};
    double avg_volume{kUndefined};
    double volume_ratio{kUndefined};
    double l_measure{0.0};
    double ad_value{0.0};
    double ad_ratio{kUndefined};
    double quarterly_volume{0.0};
    double eps_quarterly_growth{kUndefined};
    double eps_annual_growth{kUndefined};

    // Screens
    bool market_bullish{false};
    bool new_high{false};
    bool volume_surge{false};
    bool leadership{false};
    bool accumulation_ok{false};
    bool eps_growth_quarterly{false};
    bool eps_growth_annual{false};
    bool passes_all_screens{false};  // all six screens (all_strict)
    bool eps_either{false};          // quarterly OR annual EPS, plus the other four

    int history_days{0};  // bars of this ticker up to and including this date

    IndicatorRow() = default;
    explicit IndicatorRow(const PriceBar& bar) : PriceBar(bar) {}
};

/**
 * @brief Market-direction signals of the market proxy for one date
 */
struct MarketIndicatorRow {
    Timestamp timestamp;
    std::string symbol;
    Price close{0.0};
    double ma_short{kUndefined};
    double ma_long{kUndefined};
    double market_return{0.0};
    bool market_bullish{false};
};

using IndicatorTable = SeriesTable<IndicatorRow>;
using MarketIndicatorTable = SeriesTable<MarketIndicatorRow>;

/**
 * @brief Output of one indicator pass
 */
struct EnrichedData {
    IndicatorTable stocks;
    MarketIndicatorTable market;
    std::string market_proxy;
    bool market_available{false};
};

/**
 * @brief Computes per-ticker, per-day CANSLIM screening signals
 *
 * Rolling windows use all available history up to the window size, so a
 * ticker's first rows already carry values. Callers that need full windows
 * can filter with minimum_history().
 */
class IndicatorEngine {
public:
    explicit IndicatorEngine(ScreenConfig config);

    /**
     * @brief Enrich the universe price table
     * @param universe Price bars of the selectable universe
     * @param proxies Price bars of the proxy instruments
     * @param financials Filing rows (quarterly and annual)
     * @param market_proxy Ticker of the broad-market proxy inside `proxies`
     * @return Error only on invalid windows in the configuration. A missing
     *         market proxy is logged once and yields leadership = false.
     */
    Result<EnrichedData> compute(const PriceTable& universe, const PriceTable& proxies,
                                 const std::vector<FinancialRecord>& financials,
                                 const std::string& market_proxy) const;

    /**
     * @brief Market-direction series for one proxy series
     */
    std::vector<MarketIndicatorRow> compute_market(const std::vector<PriceBar>& bars) const;

    /**
     * @brief Signals for one ticker's date-sorted bars
     */
    std::vector<IndicatorRow> compute_ticker(const std::vector<PriceBar>& bars,
                                             const MarketIndicatorTable& market,
                                             const std::string& market_proxy,
                                             const EpsGrowthSeries& quarterly,
                                             const EpsGrowthSeries& annual) const;

    /**
     * @brief Predicate for rows backed by at least `min_days` bars of history
     */
    static bool minimum_history(const IndicatorRow& row, int min_days) {
        return row.history_days >= min_days;
    }

    const ScreenConfig& config() const {
        return config_;
    }

private:
    Result<void> validate_config() const;

    ScreenConfig config_;
};

}  // namespace canslim_bt
