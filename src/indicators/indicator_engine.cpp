// src/indicators/indicator_engine.cpp

#include "canslim_bt/indicators/indicator_engine.hpp"
#include <unordered_map>
#include <utility>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"
#include "canslim_bt/indicators/rolling_window.hpp"

namespace canslim_bt {

namespace {

const char* kComponent = "IndicatorEngine";

double pct_change(double previous, double current) {
    if (previous <= 0.0 || is_undefined(previous) || is_undefined(current)) {
        return 0.0;
    }
    return current / previous - 1.0;
}

double accumulation_value(const PriceBar& bar) {
    const double range = bar.high - bar.low;
    if (range == 0.0) {
        return 0.0;
    }
    return ((bar.close - bar.low) - (bar.high - bar.close)) / range * bar.volume;
}

}  // namespace

IndicatorEngine::IndicatorEngine(ScreenConfig config) : config_(std::move(config)) {}

Result<void> IndicatorEngine::validate_config() const {
    const std::pair<const char*, int> windows[] = {
        {"new_high_lookback_days", config_.new_high_lookback_days},
        {"volume_average_days", config_.volume_average_days},
        {"leadership_window_days", config_.leadership_window_days},
        {"accumulation_lookback_days", config_.accumulation_lookback_days},
        {"quarterly_volume_days", config_.quarterly_volume_days},
        {"market_ma_short_days", config_.market_ma_short_days},
        {"market_ma_long_days", config_.market_ma_long_days},
    };
    for (const auto& [name, days] : windows) {
        if (days <= 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    std::string(name) + " must be positive, got " +
                                        std::to_string(days),
                                    kComponent);
        }
    }
    return Result<void>();
}

std::vector<MarketIndicatorRow> IndicatorEngine::compute_market(
    const std::vector<PriceBar>& bars) const {
    RollingMean ma_short(static_cast<size_t>(config_.market_ma_short_days));
    RollingMean ma_long(static_cast<size_t>(config_.market_ma_long_days));

    std::vector<MarketIndicatorRow> rows;
    rows.reserve(bars.size());
    const PriceBar* previous = nullptr;
    for (const auto& bar : bars) {
        MarketIndicatorRow row;
        row.timestamp = bar.timestamp;
        row.symbol = bar.symbol;
        row.close = bar.close;
        row.ma_short = ma_short.push(bar.close);
        row.ma_long = ma_long.push(bar.close);
        row.market_return = previous ? pct_change(previous->close, bar.close) : 0.0;

        if (!config_.use_ma_cross_for_market) {
            row.market_bullish = true;
        } else {
            row.market_bullish = row.ma_short > row.ma_long;
            if (config_.require_close_above_ma_short) {
                row.market_bullish = row.market_bullish && bar.close > row.ma_short;
            }
        }
        rows.push_back(std::move(row));
        previous = &bar;
    }
    return rows;
}

std::vector<IndicatorRow> IndicatorEngine::compute_ticker(const std::vector<PriceBar>& bars,
                                                          const MarketIndicatorTable& market,
                                                          const std::string& market_proxy,
                                                          const EpsGrowthSeries& quarterly,
                                                          const EpsGrowthSeries& annual) const {
    RollingMax high_window(static_cast<size_t>(config_.new_high_lookback_days));
    RollingMean volume_window(static_cast<size_t>(config_.volume_average_days));
    RollingMean excess_window(static_cast<size_t>(config_.leadership_window_days));
    RollingMean ad_window(static_cast<size_t>(config_.accumulation_lookback_days));
    RollingSum quarter_volume(static_cast<size_t>(config_.quarterly_volume_days));

    std::vector<IndicatorRow> rows;
    rows.reserve(bars.size());
    const PriceBar* previous = nullptr;
    int history = 0;

    for (const auto& bar : bars) {
        IndicatorRow row(bar);
        row.history_days = ++history;
        row.stock_return = previous ? pct_change(previous->close, bar.close) : 0.0;

        // M: market values of the same date; no row means not bullish
        const MarketIndicatorRow* m = market.find(market_proxy, bar.timestamp);
        if (m) {
            row.market_return = m->market_return;
            row.ma_short = m->ma_short;
            row.ma_long = m->ma_long;
            row.market_bullish = m->market_bullish;
        }

        // N
        row.high_52w = high_window.push(bar.close);
        row.new_high = bar.close >= row.high_52w;

        // S
        row.avg_volume = volume_window.push(bar.volume);
        row.volume_ratio = row.avg_volume > 0.0 ? bar.volume / row.avg_volume : kUndefined;
        row.volume_surge = bar.volume >= config_.volume_surge_factor * row.avg_volume;

        // L: the instantaneous screen needs a market return; the smoothed measure
        // treats a missing one as zero
        if (m) {
            row.excess_return = row.stock_return - row.market_return;
            row.leadership = row.excess_return > config_.leadership_excess_return_min;
        }
        row.l_measure = excess_window.push(m ? row.excess_return : row.stock_return);

        // I
        row.ad_value = accumulation_value(bar);
        row.ad_ratio = ad_window.push(row.ad_value);
        row.accumulation_ok = row.ad_ratio >= config_.accumulation_ratio_min;

        row.quarterly_volume = quarter_volume.push(bar.volume);

        // C and A: latest filing reported on or before this date
        if (const auto* q = quarterly.as_of(bar.symbol, bar.timestamp)) {
            row.eps_quarterly_growth = q->growth;
            row.eps_growth_quarterly = q->passes(config_.quarterly_eps_growth_min);
        }
        if (const auto* a = annual.as_of(bar.symbol, bar.timestamp)) {
            row.eps_annual_growth = a->growth;
            row.eps_growth_annual = a->passes(config_.annual_eps_growth_min);
        }

        const bool technicals =
            row.new_high && row.volume_surge && row.leadership && row.accumulation_ok;
        row.passes_all_screens = row.eps_growth_quarterly && row.eps_growth_annual && technicals;
        row.eps_either = (row.eps_growth_quarterly || row.eps_growth_annual) && technicals;

        rows.push_back(std::move(row));
        previous = &bar;
    }
    return rows;
}

Result<EnrichedData> IndicatorEngine::compute(const PriceTable& universe,
                                              const PriceTable& proxies,
                                              const std::vector<FinancialRecord>& financials,
                                              const std::string& market_proxy) const {
    Logger::register_component(kComponent);

    auto valid = validate_config();
    if (valid.is_error()) {
        return make_error<EnrichedData>(valid.error()->code(), valid.error()->what(), kComponent);
    }

    EnrichedData out;
    out.market_proxy = market_proxy;

    const auto* market_bars = proxies.series(market_proxy);
    if (market_bars == nullptr || market_bars->empty()) {
        WARN("No price data for market proxy '" << market_proxy
                                                << "'; leadership and market direction are false "
                                                   "for every row");
    } else {
        std::unordered_map<std::string, std::vector<MarketIndicatorRow>> market_groups;
        market_groups[market_proxy] = compute_market(*market_bars);
        out.market = MarketIndicatorTable::from_groups(std::move(market_groups));
        out.market_available = true;
    }

    const EpsGrowthSeries quarterly(financials, Timeframe::QUARTERLY);
    const EpsGrowthSeries annual(financials, Timeframe::ANNUAL);

    std::unordered_map<std::string, std::vector<IndicatorRow>> groups;
    size_t rows = 0;
    for (const auto& symbol : universe.symbols()) {
        auto ticker_rows =
            compute_ticker(*universe.series(symbol), out.market, market_proxy, quarterly, annual);
        rows += ticker_rows.size();
        groups.emplace(symbol, std::move(ticker_rows));
    }
    out.stocks = IndicatorTable::from_groups(std::move(groups));

    INFO("Computed indicators for " << universe.num_symbols() << " ticker(s), " << rows
                                    << " row(s)");
    return out;
}

}  // namespace canslim_bt
