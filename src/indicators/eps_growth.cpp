// src/indicators/eps_growth.cpp

#include "canslim_bt/indicators/eps_growth.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <utility>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"

namespace canslim_bt {

namespace {

using FilingKey = std::pair<int, std::string>;

double yoy_growth(double eps, double prior) {
    if (is_undefined(eps) || is_undefined(prior) || prior == 0.0) {
        return kUndefined;
    }
    return (eps - prior) / std::abs(prior);
}

}  // namespace

EpsGrowthSeries::EpsGrowthSeries(const std::vector<FinancialRecord>& records, Timeframe timeframe)
    : timeframe_(timeframe) {
    // Per ticker: (fiscal_year, period) -> filing, the last row of a repeated key wins
    std::unordered_map<std::string, std::map<FilingKey, const FinancialRecord*>> filings;
    size_t duplicates = 0;
    for (const auto& record : records) {
        if (record.timeframe != timeframe) {
            continue;
        }
        FilingKey key{record.fiscal_year,
                      timeframe == Timeframe::QUARTERLY ? record.fiscal_period : std::string()};
        auto& slot = filings[record.symbol][key];
        if (slot != nullptr) {
            ++duplicates;
        }
        slot = &record;
    }
    if (duplicates > 0) {
        WARN("Dropped " << duplicates << " repeated " << timeframe_to_string(timeframe)
                        << " filing(s); the last row per fiscal period was kept");
    }

    for (const auto& [symbol, by_key] : filings) {
        auto& points = by_symbol_[symbol];
        points.reserve(by_key.size());
        for (const auto& [key, record] : by_key) {
            EpsGrowthPoint point;
            point.end_date = core::floor_to_day(record->end_date);
            point.fiscal_year = record->fiscal_year;
            point.fiscal_period = record->fiscal_period;
            point.eps = record->diluted_eps;

            auto prior = by_key.find(FilingKey{key.first - 1, key.second});
            if (prior != by_key.end()) {
                point.growth = yoy_growth(record->diluted_eps, prior->second->diluted_eps);
            }
            points.push_back(std::move(point));
        }
        std::stable_sort(points.begin(), points.end(),
                         [](const EpsGrowthPoint& a, const EpsGrowthPoint& b) {
                             return a.end_date < b.end_date;
                         });
    }
    DEBUG("Built " << timeframe_to_string(timeframe) << " EPS growth for " << by_symbol_.size()
                   << " ticker(s)");
}

const EpsGrowthPoint* EpsGrowthSeries::as_of(const std::string& symbol,
                                             const Timestamp& date) const {
    auto it = by_symbol_.find(symbol);
    if (it == by_symbol_.end()) {
        return nullptr;
    }
    const auto& points = it->second;
    const Timestamp day = core::floor_to_day(date);
    auto pos = std::upper_bound(
        points.begin(), points.end(), day,
        [](const Timestamp& ts, const EpsGrowthPoint& point) { return ts < point.end_date; });
    if (pos == points.begin()) {
        return nullptr;
    }
    return &(*std::prev(pos));
}

const std::vector<EpsGrowthPoint>* EpsGrowthSeries::series(const std::string& symbol) const {
    auto it = by_symbol_.find(symbol);
    return it == by_symbol_.end() ? nullptr : &it->second;
}

}  // namespace canslim_bt
