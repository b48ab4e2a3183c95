// include/canslim_bt/strategy/market_strategies.hpp
#pragma once

#include <string>
#include "canslim_bt/strategy/allocation_strategy.hpp"

namespace canslim_bt {

/**
 * @brief Always fully invested in the market proxy
 */
class MarketOnlyStrategy : public AllocationStrategy {
public:
    Result<Allocation> allocate(const Timestamp& date, double portfolio_value,
                                const MarketSnapshot& snapshot, bool is_first_rebalance,
                                DiagnosticsSink* diagnostics) const override;

    std::string name() const override {
        return "market";
    }
};

/**
 * @brief Market proxy while the market is bullish, cash proxy otherwise
 *
 * A rebalance date without a market-direction row goes to the cash proxy.
 */
class RiskManagedMarketStrategy : public AllocationStrategy {
public:
    Result<Allocation> allocate(const Timestamp& date, double portfolio_value,
                                const MarketSnapshot& snapshot, bool is_first_rebalance,
                                DiagnosticsSink* diagnostics) const override;

    std::string name() const override {
        return "risk";
    }
};

}  // namespace canslim_bt
