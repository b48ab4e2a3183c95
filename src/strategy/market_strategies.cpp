// src/strategy/market_strategies.cpp

#include "canslim_bt/strategy/market_strategies.hpp"
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"

namespace canslim_bt {

Result<Allocation> MarketOnlyStrategy::allocate(const Timestamp& /*date*/,
                                                double /*portfolio_value*/,
                                                const MarketSnapshot& snapshot,
                                                bool /*is_first_rebalance*/,
                                                DiagnosticsSink* /*diagnostics*/) const {
    return full_allocation(snapshot.market_proxy());
}

Result<Allocation> RiskManagedMarketStrategy::allocate(const Timestamp& date,
                                                       double /*portfolio_value*/,
                                                       const MarketSnapshot& snapshot,
                                                       bool /*is_first_rebalance*/,
                                                       DiagnosticsSink* /*diagnostics*/) const {
    const auto* market = snapshot.market_row(date);
    if (market == nullptr) {
        WARN("No market data for " << core::format_date(date) << ", defaulting to "
                                   << snapshot.cash_proxy());
        return full_allocation(snapshot.cash_proxy());
    }
    return full_allocation(market->market_bullish ? snapshot.market_proxy()
                                                  : snapshot.cash_proxy());
}

}  // namespace canslim_bt
