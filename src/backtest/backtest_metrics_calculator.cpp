// src/backtest/backtest_metrics_calculator.cpp

#include "canslim_bt/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <numeric>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"

namespace canslim_bt {

namespace {

constexpr double kTradingDaysPerYear = 252.0;
constexpr double kDaysPerYear = 365.0;

nlohmann::json number_or_null(double value) {
    if (std::isnan(value) || std::isinf(value)) {
        return nullptr;
    }
    return value;
}

}  // namespace

nlohmann::json PerformanceMetrics::to_json() const {
    nlohmann::json j;
    j["total_return"] = number_or_null(total_return);
    j["annualized_return"] = number_or_null(annualized_return);
    j["annualized_volatility"] = number_or_null(annualized_volatility);
    j["max_drawdown"] = number_or_null(max_drawdown);
    j["sharpe_ratio"] = number_or_null(sharpe_ratio);
    j["sortino_ratio"] = number_or_null(sortino_ratio);
    j["risk_free_rate"] = number_or_null(risk_free_rate);
    j["trading_days"] = trading_days;
    return j;
}

// ========== Return Calculations ==========

double BacktestMetricsCalculator::calculate_total_return(double start_value,
                                                         double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

double BacktestMetricsCalculator::calculate_annualized_return(
    const EquityCurve& equity_curve) const {
    if (equity_curve.size() < 2) {
        return 0.0;
    }
    const double start_value = equity_curve.front().second;
    const double end_value = equity_curve.back().second;
    const auto days = core::days_between(equity_curve.front().first, equity_curve.back().first);
    if (days <= 0 || start_value <= 0.0) {
        return 0.0;
    }
    const double years = static_cast<double>(days) / kDaysPerYear;
    return std::pow(end_value / start_value, 1.0 / years) - 1.0;
}

std::vector<double> BacktestMetricsCalculator::calculate_returns_from_equity(
    const EquityCurve& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        if (equity_curve[i - 1].second > 0.0) {
            returns.push_back(equity_curve[i].second / equity_curve[i - 1].second - 1.0);
        }
    }
    return returns;
}

// ========== Volatility Metrics ==========

double BacktestMetricsCalculator::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }
    return calculate_sample_std(returns) * std::sqrt(kTradingDaysPerYear);
}

double BacktestMetricsCalculator::calculate_downside_volatility(
    const std::vector<double>& returns, double threshold) const {
    std::vector<double> downside;
    std::copy_if(returns.begin(), returns.end(), std::back_inserter(downside),
                 [threshold](double r) { return r < threshold; });
    if (downside.size() < 2) {
        return 0.0;
    }
    return calculate_sample_std(downside) * std::sqrt(kTradingDaysPerYear);
}

// ========== Risk-Adjusted Return Metrics ==========

double BacktestMetricsCalculator::calculate_sharpe_ratio(double annualized_return,
                                                         double volatility,
                                                         double risk_free_rate) const {
    if (volatility == 0.0 || std::isnan(volatility)) {
        return kUndefined;
    }
    return (annualized_return - risk_free_rate) / volatility;
}

double BacktestMetricsCalculator::calculate_sortino_ratio(double annualized_return,
                                                          double downside_volatility,
                                                          double risk_free_rate) const {
    if (downside_volatility == 0.0 || std::isnan(downside_volatility)) {
        return kUndefined;
    }
    return (annualized_return - risk_free_rate) / downside_volatility;
}

// ========== Drawdown Metrics ==========

EquityCurve BacktestMetricsCalculator::calculate_drawdowns(const EquityCurve& equity_curve) const {
    EquityCurve drawdowns;
    drawdowns.reserve(equity_curve.size());

    if (equity_curve.empty()) {
        return drawdowns;
    }

    double peak = equity_curve[0].second;
    for (const auto& [timestamp, equity] : equity_curve) {
        peak = std::max(peak, equity);
        const double drawdown = peak > 0.0 ? (equity - peak) / peak : 0.0;
        drawdowns.emplace_back(timestamp, drawdown);
    }
    return drawdowns;
}

double BacktestMetricsCalculator::calculate_max_drawdown(const EquityCurve& equity_curve) const {
    auto drawdowns = calculate_drawdowns(equity_curve);
    if (drawdowns.empty()) {
        return 0.0;
    }

    auto min_it = std::min_element(drawdowns.begin(), drawdowns.end(),
                                   [](const auto& a, const auto& b) { return a.second < b.second; });
    return min_it->second;
}

std::map<std::string, double> BacktestMetricsCalculator::calculate_monthly_returns(
    const EquityCurve& equity_curve) const {
    std::map<std::string, double> growth;

    for (size_t i = 1; i < equity_curve.size(); ++i) {
        if (equity_curve[i - 1].second <= 0.0) {
            continue;
        }
        const auto civil = core::to_civil(equity_curve[i].first);
        char key[16];
        std::snprintf(key, sizeof(key), "%04d-%02u", civil.year, civil.month);

        const double step = equity_curve[i].second / equity_curve[i - 1].second;
        auto it = growth.find(key);
        if (it == growth.end()) {
            growth.emplace(key, step);
        } else {
            it->second *= step;
        }
    }

    for (auto& entry : growth) {
        entry.second -= 1.0;
    }
    return growth;
}

// ========== Risk-Free Rate ==========

double BacktestMetricsCalculator::calculate_risk_free_rate(const PriceTable& prices,
                                                           const std::string& cash_proxy,
                                                           const Timestamp& start,
                                                           const Timestamp& end) const {
    const auto* series = prices.series(cash_proxy);
    if (series == nullptr) {
        return 0.0;
    }
    EquityCurve closes;
    for (const auto& bar : *series) {
        if (bar.timestamp >= core::floor_to_day(start) && bar.timestamp <= core::floor_to_day(end)) {
            closes.emplace_back(bar.timestamp, bar.close);
        }
    }
    if (closes.size() < 2) {
        return 0.0;
    }
    return calculate_annualized_return(closes);
}

// ========== Composite Calculation ==========

PerformanceMetrics BacktestMetricsCalculator::calculate_all_metrics(
    const EquityCurve& equity_curve, double risk_free_rate) const {
    PerformanceMetrics metrics;
    metrics.risk_free_rate = risk_free_rate;
    metrics.trading_days = static_cast<int>(equity_curve.size());

    if (equity_curve.empty()) {
        WARN("Empty equity curve, metrics are undefined");
        return metrics;
    }

    metrics.total_return =
        calculate_total_return(equity_curve.front().second, equity_curve.back().second);
    metrics.annualized_return = calculate_annualized_return(equity_curve);
    if (core::days_between(equity_curve.front().first, equity_curve.back().first) <= 0) {
        WARN("No time elapsed in equity curve, annualized return set to 0");
    }

    const auto returns = calculate_returns_from_equity(equity_curve);
    metrics.annualized_volatility = calculate_volatility(returns);
    metrics.max_drawdown = calculate_max_drawdown(equity_curve);

    metrics.sharpe_ratio = calculate_sharpe_ratio(metrics.annualized_return,
                                                  metrics.annualized_volatility, risk_free_rate);
    if (std::isnan(metrics.sharpe_ratio)) {
        WARN("Annualized volatility is zero, Sharpe ratio undefined");
    }

    const double downside = calculate_downside_volatility(returns);
    metrics.sortino_ratio =
        calculate_sortino_ratio(metrics.annualized_return, downside, risk_free_rate);
    if (std::isnan(metrics.sortino_ratio)) {
        WARN("Downside volatility is zero, Sortino ratio undefined");
    }
    return metrics;
}

// ========== Helper Methods ==========

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double BacktestMetricsCalculator::calculate_sample_std(const std::vector<double>& values) const {
    if (values.size() < 2) {
        return 0.0;
    }
    const double mean = calculate_mean(values);
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

}  // namespace canslim_bt
