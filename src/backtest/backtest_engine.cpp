// src/backtest/backtest_engine.cpp

#include "canslim_bt/backtest/backtest_engine.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <utility>
#include "canslim_bt/core/logger.hpp"

namespace canslim_bt {

namespace {

const char* kComponent = "BacktestEngine";

constexpr double kTradingDaysPerYear = 252.0;

}  // namespace

std::string engine_state_to_string(EngineState state) {
    switch (state) {
        case EngineState::UNINITIALIZED:
            return "UNINITIALIZED";
        case EngineState::HOLDING:
            return "HOLDING";
        case EngineState::REBALANCING:
            return "REBALANCING";
        case EngineState::FINISHED:
            return "FINISHED";
    }
    return "UNKNOWN";
}

BacktestEngine::BacktestEngine(BacktestConfig config) : config_(std::move(config)) {}

double BacktestEngine::mark_to_market(const Holdings& holdings, const MarketSnapshot& snapshot,
                                      const Timestamp& date, bool at_rebalance) const {
    double value = 0.0;
    for (const auto& [symbol, shares] : holdings) {
        auto price = snapshot.price(symbol, date);
        if (!price) {
            if (at_rebalance) {
                WARN("Missing price for held ticker " << symbol << " on "
                                                      << core::format_date(date)
                                                      << " at rebalance, valued at 0");
            } else {
                DEBUG("Missing price for held ticker " << symbol << " on "
                                                       << core::format_date(date)
                                                       << ", valued at 0");
            }
            continue;
        }
        value += shares * *price;
    }
    return value;
}

void BacktestEngine::validate_weights(const Allocation& weights, const Timestamp& date,
                                      const std::string& strategy_name) const {
    double sum = 0.0;
    for (const auto& [symbol, weight] : weights) {
        if (weight < 0.0) {
            ERROR(strategy_name << " returned negative weight " << weight << " for " << symbol
                                << " on " << core::format_date(date));
        }
        sum += weight;
    }
    if (sum > 1.0 + config_.weight_tolerance) {
        ERROR(strategy_name << " returned weights summing to " << sum << " on "
                            << core::format_date(date));
    }
}

Result<RebalanceRecord> BacktestEngine::rebalance(const AllocationStrategy& strategy,
                                                  const MarketSnapshot& snapshot,
                                                  const Timestamp& date, double value,
                                                  bool is_first,
                                                  DiagnosticsSink* diagnostics) const {
    auto allocation = strategy.allocate(date, value, snapshot, is_first, diagnostics);
    if (allocation.is_error()) {
        return make_error<RebalanceRecord>(
            ErrorCode::STRATEGY_ERROR,
            "Strategy " + strategy.name() + " failed on " + core::format_date(date) + ": " +
                allocation.error()->what(),
            kComponent);
    }

    RebalanceRecord record;
    record.date = date;
    record.is_first = is_first;
    record.value_used = value;
    record.weights = allocation.take_value();

    // Contract violations are reported and then executed as given
    validate_weights(record.weights, date, strategy.name());

    for (const auto& [symbol, weight] : record.weights) {
        record.weight_sum += weight;
        auto price = snapshot.price(symbol, date);
        if (!price || *price <= 0.0) {
            WARN("No usable price for " << symbol << " on " << core::format_date(date)
                                        << ", skipping it in this rebalance");
            record.skipped.push_back(symbol);
            continue;
        }
        const Quantity shares = weight * value / *price;
        record.shares[symbol] = shares;
        record.invested += shares * *price;
    }
    record.leftover_cash = value - record.invested;

    DEBUG("Rebalanced on " << core::format_date(date) << ": value " << value << ", "
                           << record.shares.size() << " position(s), leftover cash "
                           << record.leftover_cash);
    return record;
}

Result<BacktestResults> BacktestEngine::run(const AllocationStrategy& strategy,
                                            const MarketSnapshot& snapshot,
                                            const std::vector<Timestamp>& rebalance_dates,
                                            DiagnosticsSink* diagnostics) {
    Logger::register_component(kComponent);
    state_ = EngineState::UNINITIALIZED;

    if (rebalance_dates.empty()) {
        return make_error<BacktestResults>(ErrorCode::EMPTY_SCHEDULE,
                                           "No rebalance dates; nothing to simulate", kComponent);
    }

    const auto calendar = snapshot.calendar();
    if (calendar.empty()) {
        return make_error<BacktestResults>(
            ErrorCode::EMPTY_CALENDAR,
            "Market proxy '" + snapshot.market_proxy() + "' has no trading days", kComponent);
    }

    std::set<Timestamp> schedule;
    for (const auto& date : rebalance_dates) {
        schedule.insert(core::floor_to_day(date));
    }

    // Range: first rebalance date to the last one (or the configured end), clipped to the data
    const Timestamp start = *schedule.begin();
    Timestamp end = config_.end_date ? core::floor_to_day(*config_.end_date) : *schedule.rbegin();
    if (end > calendar.back()) {
        WARN("End date " << core::format_date(end) << " is beyond available market data, "
                         << "truncating to " << core::format_date(calendar.back()));
        end = calendar.back();
    }

    std::vector<Timestamp> days;
    for (const auto& day : calendar) {
        if (day >= start && day <= end) {
            days.push_back(day);
        }
    }
    if (days.empty()) {
        return make_error<BacktestResults>(
            ErrorCode::EMPTY_CALENDAR,
            "No trading days between " + core::format_date(start) + " and " +
                core::format_date(end),
            kComponent);
    }

    const std::set<Timestamp> trading_days(days.begin(), days.end());
    for (const auto& date : schedule) {
        if (trading_days.count(date) == 0) {
            WARN("Rebalance date " << core::format_date(date)
                                   << " is not a trading day in range and will not trigger");
        }
    }

    INFO("Running " << strategy.name() << " from " << core::format_date(days.front()) << " to "
                    << core::format_date(days.back()) << " (" << days.size()
                    << " trading days, " << schedule.size() << " scheduled rebalance(s))");

    const double daily_cash_rate =
        config_.idle_cash_annual_rate > 0.0
            ? std::pow(1.0 + config_.idle_cash_annual_rate, 1.0 / kTradingDaysPerYear) - 1.0
            : 0.0;

    BacktestResults results;
    results.initial_capital = config_.initial_capital;
    results.equity_curve.reserve(days.size());

    Holdings holdings;
    double cash = 0.0;
    bool first_rebalance = true;

    for (const auto& day : days) {
        if (state_ != EngineState::UNINITIALIZED && daily_cash_rate != 0.0) {
            cash *= 1.0 + daily_cash_rate;
        }

        if (schedule.count(day) > 0) {
            double value = mark_to_market(holdings, snapshot, day, true) + cash;
            if (first_rebalance) {
                // Funds become available exactly at the first rebalance
                value = config_.initial_capital;
            }

            state_ = EngineState::REBALANCING;
            auto record = rebalance(strategy, snapshot, day, value, first_rebalance, diagnostics);
            if (record.is_error()) {
                ERROR(record.error()->what());
                return make_error<BacktestResults>(record.error()->code(),
                                                   record.error()->what(), kComponent);
            }
            holdings = record.value().shares;
            cash = record.value().leftover_cash;
            results.rebalances.push_back(record.take_value());
            first_rebalance = false;
            state_ = EngineState::HOLDING;
        }

        // Before the first rebalance the capital sits uninvested
        const double value = state_ == EngineState::UNINITIALIZED
                                 ? config_.initial_capital
                                 : mark_to_market(holdings, snapshot, day, false) + cash;
        results.equity_curve.emplace_back(day, value);
    }

    std::sort(results.equity_curve.begin(), results.equity_curve.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    state_ = EngineState::FINISHED;
    results.final_value = results.equity_curve.back().second;
    results.total_return = config_.initial_capital > 0.0
                               ? results.final_value / config_.initial_capital - 1.0
                               : kUndefined;

    INFO(strategy.name() << " finished: final value " << results.final_value
                         << ", total return " << results.total_return << ", "
                         << results.rebalances.size() << " rebalance(s)");
    return results;
}

}  // namespace canslim_bt
