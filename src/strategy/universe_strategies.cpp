// src/strategy/universe_strategies.cpp

#include "canslim_bt/strategy/universe_strategies.hpp"
#include <utility>
#include <vector>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"

namespace canslim_bt {

std::string measure_to_string(UniverseMeasure measure) {
    return measure == UniverseMeasure::LEADERSHIP ? "leadership" : "volume";
}

Result<Allocation> UniverseEqualWeightStrategy::allocate(const Timestamp& date,
                                                         double /*portfolio_value*/,
                                                         const MarketSnapshot& snapshot,
                                                         bool /*is_first_rebalance*/,
                                                         DiagnosticsSink* diagnostics) const {
    std::vector<std::string> priced;
    for (const auto* row : snapshot.member_rows(date)) {
        if (row->close > 0.0) {
            priced.push_back(row->symbol);
        }
    }
    if (priced.empty()) {
        WARN("No priced universe members on " << core::format_date(date)
                                              << ", holding the market proxy");
        if (diagnostics) {
            diagnostics->record_picks(date, name(), {});
        }
        return full_allocation(snapshot.market_proxy());
    }

    Allocation weights;
    const double weight = 1.0 / static_cast<double>(priced.size());
    for (const auto& symbol : priced) {
        weights[symbol] = weight;
    }
    if (diagnostics) {
        diagnostics->record_picks(date, name(), std::move(priced));
    }
    return weights;
}

UniverseMeasureWeightedStrategy::UniverseMeasureWeightedStrategy(UniverseMeasure measure)
    : measure_(measure) {}

Result<Allocation> UniverseMeasureWeightedStrategy::allocate(const Timestamp& date,
                                                             double /*portfolio_value*/,
                                                             const MarketSnapshot& snapshot,
                                                             bool /*is_first_rebalance*/,
                                                             DiagnosticsSink* diagnostics) const {
    Allocation measures;
    double total = 0.0;
    for (const auto* row : snapshot.member_rows(date)) {
        const double value =
            measure_ == UniverseMeasure::LEADERSHIP ? row->l_measure : row->quarterly_volume;
        if (is_undefined(value) || value <= 0.0 || !(row->close > 0.0)) {
            continue;
        }
        measures[row->symbol] = value;
        total += value;
    }

    if (total <= 0.0) {
        WARN("Total " << measure_to_string(measure_) << " measure is zero on "
                      << core::format_date(date) << ", holding the market proxy");
        if (diagnostics) {
            diagnostics->record_picks(date, name(), {});
        }
        return full_allocation(snapshot.market_proxy());
    }

    std::vector<std::string> tickers;
    for (auto& [symbol, value] : measures) {
        value /= total;
        tickers.push_back(symbol);
    }
    if (diagnostics) {
        diagnostics->record_picks(date, name(), std::move(tickers));
    }
    return measures;
}

}  // namespace canslim_bt
