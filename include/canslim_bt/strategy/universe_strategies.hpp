// include/canslim_bt/strategy/universe_strategies.hpp
#pragma once

#include <string>
#include "canslim_bt/strategy/allocation_strategy.hpp"

namespace canslim_bt {

/**
 * @brief 1/N across every universe member priced on the rebalance date
 */
class UniverseEqualWeightStrategy : public AllocationStrategy {
public:
    Result<Allocation> allocate(const Timestamp& date, double portfolio_value,
                                const MarketSnapshot& snapshot, bool is_first_rebalance,
                                DiagnosticsSink* diagnostics) const override;

    std::string name() const override {
        return "flattened";
    }
};

enum class UniverseMeasure {
    LEADERSHIP,  // positive l_measure
    VOLUME       // quarterly_volume
};

std::string measure_to_string(UniverseMeasure measure);

/**
 * @brief Universe members weighted by a per-ticker measure
 *
 * Members with a non-positive or undefined measure get no weight. When the
 * measures sum to zero the allocation falls back to the market proxy.
 */
class UniverseMeasureWeightedStrategy : public AllocationStrategy {
public:
    explicit UniverseMeasureWeightedStrategy(UniverseMeasure measure);

    Result<Allocation> allocate(const Timestamp& date, double portfolio_value,
                                const MarketSnapshot& snapshot, bool is_first_rebalance,
                                DiagnosticsSink* diagnostics) const override;

    std::string name() const override {
        return measure_ == UniverseMeasure::LEADERSHIP ? "leader" : "volume";
    }

    UniverseMeasure measure() const {
        return measure_;
    }

private:
    UniverseMeasure measure_;
};

}  // namespace canslim_bt
