// include/canslim_bt/strategy/allocation_strategy.hpp
#pragma once

#include <string>
#include "canslim_bt/backtest/market_snapshot.hpp"
#include "canslim_bt/core/error.hpp"
#include "canslim_bt/core/types.hpp"

namespace canslim_bt {

/**
 * @brief Interface for allocation strategies
 *
 * A strategy maps a rebalance date to target weights. It reads the snapshot,
 * may append picks to the diagnostics sink, and changes portfolio state only
 * through its return value.
 */
class AllocationStrategy {
public:
    virtual ~AllocationStrategy() = default;

    /**
     * @brief Target weights for a rebalance
     * @param date Rebalance date
     * @param portfolio_value Value the engine will allocate
     * @param snapshot Read-only market data
     * @param is_first_rebalance True on the first rebalance of a run
     * @param diagnostics Optional pick sink; may be null
     * @return Weights keyed by ticker; an empty map means fully uninvested
     */
    virtual Result<Allocation> allocate(const Timestamp& date, double portfolio_value,
                                        const MarketSnapshot& snapshot, bool is_first_rebalance,
                                        DiagnosticsSink* diagnostics) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief 100% in one ticker
 */
inline Allocation full_allocation(const std::string& ticker) {
    return Allocation{{ticker, 1.0}};
}

}  // namespace canslim_bt
