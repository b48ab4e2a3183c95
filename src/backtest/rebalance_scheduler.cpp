// src/backtest/rebalance_scheduler.cpp

#include "canslim_bt/backtest/rebalance_scheduler.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"

namespace canslim_bt {

namespace {

std::vector<Timestamp> normalized_calendar(const std::vector<Timestamp>& calendar) {
    std::vector<Timestamp> days;
    days.reserve(calendar.size());
    for (const auto& ts : calendar) {
        days.push_back(core::floor_to_day(ts));
    }
    std::sort(days.begin(), days.end());
    days.erase(std::unique(days.begin(), days.end()), days.end());
    return days;
}

int64_t bucket_key(const Timestamp& day, RebalanceFrequency frequency) {
    const auto civil = core::to_civil(day);
    switch (frequency) {
        case RebalanceFrequency::WEEKLY: {
            auto [iso_year, iso_week] = core::iso_year_week(day);
            return static_cast<int64_t>(iso_year) * 100 + iso_week;
        }
        case RebalanceFrequency::MONTHLY:
            return static_cast<int64_t>(civil.year) * 100 + civil.month;
        case RebalanceFrequency::QUARTERLY:
            return static_cast<int64_t>(civil.year) * 10 + (civil.month - 1) / 3;
        case RebalanceFrequency::YEARLY:
            return civil.year;
        case RebalanceFrequency::DAILY:
            break;
    }
    return core::to_day_number(day);
}

}  // namespace

std::string frequency_to_string(RebalanceFrequency frequency) {
    switch (frequency) {
        case RebalanceFrequency::DAILY:
            return "daily";
        case RebalanceFrequency::WEEKLY:
            return "weekly";
        case RebalanceFrequency::MONTHLY:
            return "monthly";
        case RebalanceFrequency::QUARTERLY:
            return "quarterly";
        case RebalanceFrequency::YEARLY:
            return "yearly";
    }
    return "quarterly";
}

RebalanceFrequency parse_frequency(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "daily")
        return RebalanceFrequency::DAILY;
    if (lower == "weekly")
        return RebalanceFrequency::WEEKLY;
    if (lower == "monthly")
        return RebalanceFrequency::MONTHLY;
    if (lower == "quarterly")
        return RebalanceFrequency::QUARTERLY;
    if (lower == "yearly")
        return RebalanceFrequency::YEARLY;

    WARN("Unknown rebalance frequency '" << text << "', falling back to quarterly");
    return RebalanceFrequency::QUARTERLY;
}

std::vector<Timestamp> RebalanceScheduler::get_rebalance_dates(
    const std::vector<Timestamp>& calendar, RebalanceFrequency frequency, const Timestamp& start,
    const Timestamp& end) {
    const Timestamp first = core::floor_to_day(start);
    const Timestamp last = core::floor_to_day(end);

    std::vector<Timestamp> in_range;
    for (const auto& day : normalized_calendar(calendar)) {
        if (day >= first && day <= last) {
            in_range.push_back(day);
        }
    }
    if (in_range.empty()) {
        WARN("No trading days between " << core::format_date(first) << " and "
                                        << core::format_date(last));
        return in_range;
    }
    if (frequency == RebalanceFrequency::DAILY) {
        return in_range;
    }

    // Calendar is sorted, so a bucket ends where the key changes
    std::vector<Timestamp> dates;
    for (size_t i = 0; i < in_range.size(); ++i) {
        const bool last_of_bucket =
            i + 1 == in_range.size() ||
            bucket_key(in_range[i], frequency) != bucket_key(in_range[i + 1], frequency);
        if (last_of_bucket) {
            dates.push_back(in_range[i]);
        }
    }
    DEBUG(dates.size() << " " << frequency_to_string(frequency) << " rebalance date(s) between "
                       << core::format_date(first) << " and " << core::format_date(last));
    return dates;
}

std::vector<Timestamp> RebalanceScheduler::get_quarter_end_dates(
    const std::vector<FinancialRecord>& financials, const std::string& symbol) {
    std::vector<Timestamp> dates;
    for (const auto& record : financials) {
        if (record.symbol == symbol && record.timeframe == Timeframe::QUARTERLY) {
            dates.push_back(core::floor_to_day(record.end_date));
        }
    }
    if (dates.empty()) {
        WARN("No quarterly financials found for ticker " << symbol);
        return dates;
    }
    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return dates;
}

std::vector<Timestamp> RebalanceScheduler::get_filing_aligned_rebalance_dates(
    const std::vector<Timestamp>& calendar, const std::vector<Timestamp>& target_dates) {
    const auto days = normalized_calendar(calendar);
    std::vector<Timestamp> dates;
    if (days.empty()) {
        WARN("Empty trading calendar; no filing-aligned rebalance dates");
        return dates;
    }

    for (const auto& target : target_dates) {
        const Timestamp day = core::floor_to_day(target);
        auto pos = std::upper_bound(days.begin(), days.end(), day);
        if (pos == days.begin()) {
            WARN("No trading day on or before " << core::format_date(day)
                                                << "; using earliest available day "
                                                << core::format_date(days.front()));
            dates.push_back(days.front());
        } else {
            dates.push_back(*std::prev(pos));
        }
    }
    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return dates;
}

std::vector<Timestamp> RebalanceScheduler::trading_calendar(const PriceTable& prices,
                                                            const std::string& symbol) {
    auto days = prices.dates(symbol);
    if (days.empty()) {
        WARN("No trading calendar: ticker " << symbol << " has no price rows");
    }
    return days;
}

}  // namespace canslim_bt
