// include/canslim_bt/strategy/canslim_strategies.hpp
#pragma once

#include <cstddef>
#include <string>
#include "canslim_bt/strategy/allocation_strategy.hpp"

namespace canslim_bt {

/**
 * @brief Equal weight across the first N screened tickers (in ticker order)
 *
 * Goes to the cash proxy when the market is not bullish, when the market row
 * is missing, or when nothing passes the screen.
 */
class CanslimEqualWeightStrategy : public AllocationStrategy {
public:
    /**
     * @param max_positions Maximum number of tickers held
     * @param use_eps_either Screen with eps_either instead of passes_all_screens
     */
    explicit CanslimEqualWeightStrategy(size_t max_positions = 6, bool use_eps_either = false);

    Result<Allocation> allocate(const Timestamp& date, double portfolio_value,
                                const MarketSnapshot& snapshot, bool is_first_rebalance,
                                DiagnosticsSink* diagnostics) const override;

    std::string name() const override {
        return "canslim";
    }

private:
    size_t max_positions_;
    bool use_eps_either_;
};

/**
 * @brief Screened tickers weighted by close/high_52w + volume/avg_volume
 *
 * Holds the K best scores with weights proportional to score; cash proxy when
 * the market is not bullish or nothing qualifies.
 */
class FactorWeightedStrategy : public AllocationStrategy {
public:
    explicit FactorWeightedStrategy(size_t top_k = 10, bool use_eps_either = false);

    Result<Allocation> allocate(const Timestamp& date, double portfolio_value,
                                const MarketSnapshot& snapshot, bool is_first_rebalance,
                                DiagnosticsSink* diagnostics) const override;

    std::string name() const override {
        return "factor";
    }

    /**
     * @brief Score of one row, NaN when the 52-week high or average volume is not positive
     */
    static double score(const IndicatorRow& row);

private:
    size_t top_k_;
    bool use_eps_either_;
};

/**
 * @brief Universe members scored by the number of passing factors
 *
 * Factors: quarterly EPS, annual EPS, leadership, new high, volume surge and
 * accumulation. Members scoring at least min_score are held, best K first,
 * with weights proportional to score. Falls back to the market proxy when no
 * member qualifies.
 */
class HybridScoredStrategy : public AllocationStrategy {
public:
    /**
     * @param min_score Minimum number of passing factors (0..6)
     * @param top_k Maximum number of tickers held
     * @param cash_when_bearish Hold the cash proxy when the market is not bullish
     */
    explicit HybridScoredStrategy(int min_score = 4, size_t top_k = 10,
                                  bool cash_when_bearish = false);

    Result<Allocation> allocate(const Timestamp& date, double portfolio_value,
                                const MarketSnapshot& snapshot, bool is_first_rebalance,
                                DiagnosticsSink* diagnostics) const override;

    std::string name() const override {
        return "hybrid";
    }

    static int factor_count(const IndicatorRow& row);

private:
    int min_score_;
    size_t top_k_;
    bool cash_when_bearish_;
};

}  // namespace canslim_bt
