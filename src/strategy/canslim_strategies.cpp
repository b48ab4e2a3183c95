// src/strategy/canslim_strategies.cpp

#include "canslim_bt/strategy/canslim_strategies.hpp"
#include <algorithm>
#include <utility>
#include <vector>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"

namespace canslim_bt {

namespace {

/**
 * @brief True when the market row exists and is bullish; logs a missing row
 */
bool market_is_bullish(const MarketSnapshot& snapshot, const Timestamp& date) {
    const auto* market = snapshot.market_row(date);
    if (market == nullptr) {
        WARN("No market data for " << core::format_date(date) << ", treating as not bullish");
        return false;
    }
    return market->market_bullish;
}

bool passes_screen(const IndicatorRow& row, bool use_eps_either) {
    return use_eps_either ? row.eps_either : row.passes_all_screens;
}

/**
 * @brief Best `limit` entries by descending score, ties in ticker order
 */
std::vector<std::pair<std::string, double>> top_scores(
    std::vector<std::pair<std::string, double>> scored, size_t limit) {
    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });
    if (scored.size() > limit) {
        scored.resize(limit);
    }
    return scored;
}

Allocation proportional_weights(const std::vector<std::pair<std::string, double>>& scored) {
    double total = 0.0;
    for (const auto& entry : scored) {
        total += entry.second;
    }
    Allocation weights;
    for (const auto& [symbol, value] : scored) {
        weights[symbol] = value / total;
    }
    return weights;
}

void record(DiagnosticsSink* diagnostics, const Timestamp& date, const std::string& strategy,
            std::vector<std::string> tickers) {
    if (diagnostics != nullptr) {
        diagnostics->record_picks(date, strategy, std::move(tickers));
    }
}

}  // namespace

// ========== CanslimEqualWeightStrategy ==========

CanslimEqualWeightStrategy::CanslimEqualWeightStrategy(size_t max_positions, bool use_eps_either)
    : max_positions_(max_positions), use_eps_either_(use_eps_either) {}

Result<Allocation> CanslimEqualWeightStrategy::allocate(const Timestamp& date,
                                                        double /*portfolio_value*/,
                                                        const MarketSnapshot& snapshot,
                                                        bool /*is_first_rebalance*/,
                                                        DiagnosticsSink* diagnostics) const {
    if (!market_is_bullish(snapshot, date)) {
        record(diagnostics, date, name(), {});
        return full_allocation(snapshot.cash_proxy());
    }

    std::vector<std::string> chosen;
    for (const auto* row : snapshot.member_rows(date)) {
        if (chosen.size() >= max_positions_) {
            break;
        }
        if (passes_screen(*row, use_eps_either_)) {
            chosen.push_back(row->symbol);
        }
    }
    if (chosen.empty()) {
        DEBUG("No ticker passes the screen on " << core::format_date(date));
        record(diagnostics, date, name(), {});
        return full_allocation(snapshot.cash_proxy());
    }

    Allocation weights;
    const double weight = 1.0 / static_cast<double>(chosen.size());
    for (const auto& symbol : chosen) {
        weights[symbol] = weight;
    }
    record(diagnostics, date, name(), chosen);
    return weights;
}

// ========== FactorWeightedStrategy ==========

FactorWeightedStrategy::FactorWeightedStrategy(size_t top_k, bool use_eps_either)
    : top_k_(top_k), use_eps_either_(use_eps_either) {}

double FactorWeightedStrategy::score(const IndicatorRow& row) {
    if (!(row.high_52w > 0.0) || !(row.avg_volume > 0.0)) {
        return kUndefined;
    }
    return row.close / row.high_52w + row.volume / row.avg_volume;
}

Result<Allocation> FactorWeightedStrategy::allocate(const Timestamp& date,
                                                    double /*portfolio_value*/,
                                                    const MarketSnapshot& snapshot,
                                                    bool /*is_first_rebalance*/,
                                                    DiagnosticsSink* diagnostics) const {
    if (!market_is_bullish(snapshot, date)) {
        record(diagnostics, date, name(), {});
        return full_allocation(snapshot.cash_proxy());
    }

    std::vector<std::pair<std::string, double>> scored;
    for (const auto* row : snapshot.member_rows(date)) {
        if (!passes_screen(*row, use_eps_either_)) {
            continue;
        }
        const double s = score(*row);
        if (!is_undefined(s) && s > 0.0) {
            scored.emplace_back(row->symbol, s);
        }
    }
    if (scored.empty()) {
        record(diagnostics, date, name(), {});
        return full_allocation(snapshot.cash_proxy());
    }

    auto best = top_scores(std::move(scored), top_k_);
    std::vector<std::string> tickers;
    for (const auto& entry : best) {
        tickers.push_back(entry.first);
    }
    record(diagnostics, date, name(), std::move(tickers));
    return proportional_weights(best);
}

// ========== HybridScoredStrategy ==========

HybridScoredStrategy::HybridScoredStrategy(int min_score, size_t top_k, bool cash_when_bearish)
    : min_score_(min_score), top_k_(top_k), cash_when_bearish_(cash_when_bearish) {}

int HybridScoredStrategy::factor_count(const IndicatorRow& row) {
    return static_cast<int>(row.eps_growth_quarterly) + static_cast<int>(row.eps_growth_annual) +
           static_cast<int>(row.leadership) + static_cast<int>(row.new_high) +
           static_cast<int>(row.volume_surge) + static_cast<int>(row.accumulation_ok);
}

Result<Allocation> HybridScoredStrategy::allocate(const Timestamp& date,
                                                  double /*portfolio_value*/,
                                                  const MarketSnapshot& snapshot,
                                                  bool /*is_first_rebalance*/,
                                                  DiagnosticsSink* diagnostics) const {
    if (cash_when_bearish_ && !market_is_bullish(snapshot, date)) {
        record(diagnostics, date, name(), {});
        return full_allocation(snapshot.cash_proxy());
    }

    std::vector<std::pair<std::string, double>> scored;
    for (const auto* row : snapshot.member_rows(date)) {
        const int count = factor_count(*row);
        if (count >= min_score_ && count > 0) {
            scored.emplace_back(row->symbol, static_cast<double>(count));
        }
    }
    if (scored.empty()) {
        DEBUG("No universe member scores " << min_score_ << " or more on "
                                           << core::format_date(date)
                                           << ", holding the market proxy");
        record(diagnostics, date, name(), {});
        return full_allocation(snapshot.market_proxy());
    }

    auto best = top_scores(std::move(scored), top_k_);
    std::vector<std::string> tickers;
    for (const auto& entry : best) {
        tickers.push_back(entry.first);
    }
    record(diagnostics, date, name(), std::move(tickers));
    return proportional_weights(best);
}

}  // namespace canslim_bt
