//===== test_utils.hpp =====
#pragma once

#include <gtest/gtest.h>
#include <functional>
#include <string>
#include <vector>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"
#include "canslim_bt/core/types.hpp"

namespace canslim_bt {
namespace testing {

/**
 * @brief Fixture that keeps test output quiet and the logger in a known state
 */
class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.min_level = LogLevel::ERR;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

/**
 * @brief `count` consecutive weekdays starting on or after `start`
 */
inline std::vector<Timestamp> business_days(const Timestamp& start, size_t count) {
    std::vector<Timestamp> days;
    Timestamp day = core::floor_to_day(start);
    while (days.size() < count) {
        if (core::iso_weekday(day) <= 5) {
            days.push_back(day);
        }
        day = core::add_days(day, 1);
    }
    return days;
}

/**
 * @brief Bars with open = high = low = close = close_at(i)
 */
inline std::vector<PriceBar> make_series(
    const std::string& symbol, const std::vector<Timestamp>& dates,
    const std::function<double(size_t)>& close_at,
    const std::function<double(size_t)>& volume_at = [](size_t) { return 1000.0; }) {
    std::vector<PriceBar> bars;
    bars.reserve(dates.size());
    for (size_t i = 0; i < dates.size(); ++i) {
        const double close = close_at(i);
        bars.emplace_back(dates[i], close, close, close, close, volume_at(i), symbol);
    }
    return bars;
}

inline std::vector<PriceBar> flat_series(const std::string& symbol,
                                         const std::vector<Timestamp>& dates, double price) {
    return make_series(symbol, dates, [price](size_t) { return price; });
}

/**
 * @brief Linear path from `first` on dates.front() to `last` on dates.back()
 */
inline std::vector<PriceBar> linear_series(const std::string& symbol,
                                           const std::vector<Timestamp>& dates, double first,
                                           double last) {
    const double step =
        dates.size() > 1 ? (last - first) / static_cast<double>(dates.size() - 1) : 0.0;
    return make_series(symbol, dates,
                       [first, step](size_t i) { return first + step * static_cast<double>(i); });
}

inline FinancialRecord make_filing(const std::string& symbol, Timeframe timeframe,
                                   int fiscal_year, const std::string& period,
                                   const Timestamp& end_date, double eps) {
    FinancialRecord record;
    record.symbol = symbol;
    record.timeframe = timeframe;
    record.fiscal_year = fiscal_year;
    record.fiscal_period = period;
    record.end_date = end_date;
    record.diluted_eps = eps;
    return record;
}

template <typename T>
void append(std::vector<T>& into, const std::vector<T>& more) {
    into.insert(into.end(), more.begin(), more.end());
}

}  // namespace testing
}  // namespace canslim_bt
