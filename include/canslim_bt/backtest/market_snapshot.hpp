// include/canslim_bt/backtest/market_snapshot.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "canslim_bt/core/types.hpp"
#include "canslim_bt/data/series_table.hpp"
#include "canslim_bt/data/universe_snapshot.hpp"
#include "canslim_bt/indicators/indicator_engine.hpp"

namespace canslim_bt {

/**
 * @brief Read-only view of everything a strategy may consult
 *
 * Holds shared, const tables so that concurrent runs can share one copy of the
 * input data. Nothing reachable from a snapshot can be mutated through it.
 */
class MarketSnapshot {
public:
    MarketSnapshot() = default;

    /**
     * @param proxy_prices Raw bars of the proxy instruments
     * @param stocks Enriched universe rows
     * @param market Market-direction rows of the market proxy
     * @param membership Dated universe membership; null means every ticker in `stocks`
     * @param market_proxy Ticker of the broad-market proxy
     * @param cash_proxy Ticker of the cash / short-bond proxy
     */
    MarketSnapshot(std::shared_ptr<const PriceTable> proxy_prices,
                   std::shared_ptr<const IndicatorTable> stocks,
                   std::shared_ptr<const MarketIndicatorTable> market,
                   std::shared_ptr<const UniverseSnapshot> membership, std::string market_proxy,
                   std::string cash_proxy);

    /**
     * @brief Convenience constructor taking ownership of an indicator pass
     */
    static MarketSnapshot from_enriched(std::shared_ptr<const PriceTable> proxy_prices,
                                        EnrichedData enriched,
                                        std::shared_ptr<const UniverseSnapshot> membership,
                                        std::string cash_proxy);

    /**
     * @brief Close of `symbol` on `date`: proxy table first, then the universe table
     */
    std::optional<Price> price(const std::string& symbol, const Timestamp& date) const;

    /**
     * @brief Market-direction row of the market proxy on `date`, or nullptr
     */
    const MarketIndicatorRow* market_row(const Timestamp& date) const;

    /**
     * @brief Enriched row of a universe ticker on `date`, or nullptr
     */
    const IndicatorRow* stock_row(const std::string& symbol, const Timestamp& date) const;

    /**
     * @brief Selectable tickers on `date`, sorted
     */
    std::vector<std::string> members(const Timestamp& date) const;

    /**
     * @brief Enriched rows on `date` of the members that have one, in ticker order
     */
    std::vector<const IndicatorRow*> member_rows(const Timestamp& date) const;

    /**
     * @brief Trading days of the market proxy
     */
    std::vector<Timestamp> calendar() const;

    const std::string& market_proxy() const {
        return market_proxy_;
    }

    const std::string& cash_proxy() const {
        return cash_proxy_;
    }

    const PriceTable& proxy_prices() const {
        return proxy_prices_ ? *proxy_prices_ : empty_prices();
    }

    const IndicatorTable& stocks() const {
        return stocks_ ? *stocks_ : empty_stocks();
    }

    bool has_membership() const {
        return membership_ != nullptr;
    }

private:
    static const PriceTable& empty_prices();
    static const IndicatorTable& empty_stocks();

    std::shared_ptr<const PriceTable> proxy_prices_;
    std::shared_ptr<const IndicatorTable> stocks_;
    std::shared_ptr<const MarketIndicatorTable> market_;
    std::shared_ptr<const UniverseSnapshot> membership_;
    std::string market_proxy_;
    std::string cash_proxy_;
};

/**
 * @brief Tickers a strategy selected at one rebalance
 */
struct PickRecord {
    Timestamp date;
    std::string strategy;
    std::vector<std::string> tickers;
};

/**
 * @brief Append-only record of strategy picks, owned by the caller of a run
 *
 * Strategies receive it by pointer and may ignore it. Not thread-safe: each
 * run gets its own sink.
 */
class DiagnosticsSink {
public:
    void record_picks(const Timestamp& date, const std::string& strategy,
                      std::vector<std::string> tickers) {
        picks_.push_back(PickRecord{date, strategy, std::move(tickers)});
    }

    const std::vector<PickRecord>& picks() const {
        return picks_;
    }

    /**
     * @brief Mean pick count over rebalances that picked at least one ticker
     * @return 0.0 when no rebalance picked anything
     */
    double average_picks() const {
        size_t total = 0;
        size_t count = 0;
        for (const auto& record : picks_) {
            if (!record.tickers.empty()) {
                total += record.tickers.size();
                ++count;
            }
        }
        return count == 0 ? 0.0 : static_cast<double>(total) / static_cast<double>(count);
    }

    void clear() {
        picks_.clear();
    }

private:
    std::vector<PickRecord> picks_;
};

}  // namespace canslim_bt
