//===== snapshot_utils.hpp =====
#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "canslim_bt/backtest/market_snapshot.hpp"
#include "canslim_bt/strategy/allocation_strategy.hpp"
#include "test_utils.hpp"

namespace canslim_bt {
namespace testing {

/**
 * @brief Indicator rows that only carry prices; tests set the signals they need
 */
inline std::vector<IndicatorRow> to_indicator_rows(const std::vector<PriceBar>& bars) {
    std::vector<IndicatorRow> rows;
    rows.reserve(bars.size());
    for (const auto& bar : bars) {
        rows.emplace_back(bar);
    }
    return rows;
}

/**
 * @brief Snapshot over hand-built tables
 * @param market Market rows keyed under `market_proxy`; may be empty
 */
inline MarketSnapshot make_snapshot(const std::vector<PriceBar>& proxy_bars,
                                    const std::vector<IndicatorRow>& stock_rows,
                                    const std::vector<MarketIndicatorRow>& market = {},
                                    std::shared_ptr<const UniverseSnapshot> membership = nullptr,
                                    const std::string& market_proxy = "SPY",
                                    const std::string& cash_proxy = "SHY") {
    std::unordered_map<std::string, std::vector<MarketIndicatorRow>> market_groups;
    if (!market.empty()) {
        market_groups[market_proxy] = market;
    }
    return MarketSnapshot(
        std::make_shared<const PriceTable>(proxy_bars),
        std::make_shared<const IndicatorTable>(stock_rows),
        std::make_shared<const MarketIndicatorTable>(
            MarketIndicatorTable::from_groups(std::move(market_groups))),
        std::move(membership), market_proxy, cash_proxy);
}

inline MarketIndicatorRow market_row(const Timestamp& date, bool bullish,
                                     const std::string& symbol = "SPY") {
    MarketIndicatorRow row;
    row.timestamp = date;
    row.symbol = symbol;
    row.market_bullish = bullish;
    return row;
}

/**
 * @brief Strategy returning the same weights on every call
 */
class FixedWeightsStrategy : public AllocationStrategy {
public:
    explicit FixedWeightsStrategy(Allocation weights) : weights_(std::move(weights)) {}

    Result<Allocation> allocate(const Timestamp& date, double portfolio_value,
                                const MarketSnapshot&, bool is_first_rebalance,
                                DiagnosticsSink*) const override {
        calls_.push_back(Call{date, portfolio_value, is_first_rebalance});
        return weights_;
    }

    std::string name() const override {
        return "fixed";
    }

    struct Call {
        Timestamp date;
        double portfolio_value;
        bool is_first;
    };

    const std::vector<Call>& calls() const {
        return calls_;
    }

private:
    Allocation weights_;
    mutable std::vector<Call> calls_;
};

}  // namespace testing
}  // namespace canslim_bt
