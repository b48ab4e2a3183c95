// include/canslim_bt/backtest/backtest_metrics_calculator.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>
#include "canslim_bt/core/types.hpp"
#include "canslim_bt/data/series_table.hpp"

namespace canslim_bt {

/**
 * @brief Summary statistics of one equity curve
 * Undefined ratios are NaN and serialize to JSON null.
 */
struct PerformanceMetrics {
    double total_return{0.0};
    double annualized_return{0.0};
    double annualized_volatility{0.0};
    double max_drawdown{0.0};  // non-positive
    double sharpe_ratio{kUndefined};
    double sortino_ratio{kUndefined};
    double risk_free_rate{0.0};
    int trading_days{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Stateless performance calculations over an engine's equity curve
 *
 * Returns are simple daily returns; annualization uses 252 trading days for
 * volatility and calendar days / 365 for CAGR. The primitive calculations do
 * not log; calculate_all_metrics() reports degenerate inputs.
 */
class BacktestMetricsCalculator {
public:
    BacktestMetricsCalculator() = default;
    ~BacktestMetricsCalculator() = default;

    // ========== Return Calculations ==========

    /**
     * @brief Total return as decimal (0.10 = 10%); 0 when start_value <= 0
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Compound annual growth rate over elapsed calendar days / 365
     * @return 0 when no time elapsed or the start value is not positive
     */
    double calculate_annualized_return(const EquityCurve& equity_curve) const;

    /**
     * @brief Daily simple returns; steps from a non-positive value are skipped
     */
    std::vector<double> calculate_returns_from_equity(const EquityCurve& equity_curve) const;

    // ========== Volatility Metrics ==========

    /**
     * @brief Sample standard deviation (n - 1) of daily returns times sqrt(252)
     * @return 0 with fewer than two returns
     */
    double calculate_volatility(const std::vector<double>& returns) const;

    /**
     * @brief Annualized sample standard deviation of the returns below `threshold`
     */
    double calculate_downside_volatility(const std::vector<double>& returns,
                                         double threshold = 0.0) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief (annualized return - risk free rate) / annualized volatility; NaN if volatility is 0
     */
    double calculate_sharpe_ratio(double annualized_return, double volatility,
                                  double risk_free_rate = 0.0) const;

    /**
     * @brief (annualized return - risk free rate) / downside volatility; NaN if it is 0
     */
    double calculate_sortino_ratio(double annualized_return, double downside_volatility,
                                   double risk_free_rate = 0.0) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief (value - running max) / running max for every point, each <= 0
     */
    EquityCurve calculate_drawdowns(const EquityCurve& equity_curve) const;

    /**
     * @brief Deepest drawdown, a non-positive decimal
     */
    double calculate_max_drawdown(const EquityCurve& equity_curve) const;

    /**
     * @brief Compounded return per calendar month, keyed "YYYY-MM" (UTC)
     */
    std::map<std::string, double> calculate_monthly_returns(const EquityCurve& equity_curve) const;

    // ========== Risk-Free Rate ==========

    /**
     * @brief Annualized return of a cash proxy over [start, end]
     * @return 0 when the proxy has fewer than two closes in the window
     */
    double calculate_risk_free_rate(const PriceTable& prices, const std::string& cash_proxy,
                                    const Timestamp& start, const Timestamp& end) const;

    // ========== Composite Calculation ==========

    /**
     * @brief All summary metrics of a curve
     * @param equity_curve Engine output, sorted by date
     * @param risk_free_rate Annual rate subtracted in Sharpe and Sortino
     */
    PerformanceMetrics calculate_all_metrics(const EquityCurve& equity_curve,
                                             double risk_free_rate = 0.0) const;

private:
    double calculate_mean(const std::vector<double>& values) const;

    double calculate_sample_std(const std::vector<double>& values) const;
};

}  // namespace canslim_bt
