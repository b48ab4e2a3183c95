#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "canslim_bt/backtest/backtest_engine.hpp"
#include "canslim_bt/backtest/backtest_metrics_calculator.hpp"
#include "canslim_bt/backtest/market_snapshot.hpp"
#include "canslim_bt/backtest/parameter_sweep.hpp"
#include "canslim_bt/backtest/rebalance_scheduler.hpp"
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"
#include "canslim_bt/data/conversion_utils.hpp"
#include "canslim_bt/data/feather_loader.hpp"
#include "canslim_bt/indicators/indicator_engine.hpp"
#include "canslim_bt/strategy/strategy_factory.hpp"

using namespace canslim_bt;

namespace {

std::shared_ptr<arrow::Table> load_table(const std::string& path) {
    auto result = load_feather_table(path);
    if (result.is_error()) {
        throw *result.error();
    }
    return result.take_value();
}

std::vector<PriceBar> load_bars(const std::string& path) {
    auto bars = DataConversionUtils::arrow_table_to_bars(load_table(path));
    if (bars.is_error()) {
        throw *bars.error();
    }
    return bars.take_value();
}

void print_metrics(const std::string& strategy, const BacktestResults& results,
                   const PerformanceMetrics& metrics, double avg_picks) {
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "\n======= " << strategy << " =======" << std::endl;
    std::cout << "Final value:        " << results.final_value << std::endl;
    std::cout << "Total return:       " << metrics.total_return * 100.0 << "%" << std::endl;
    std::cout << "Annualized return:  " << metrics.annualized_return * 100.0 << "%" << std::endl;
    std::cout << "Volatility:         " << metrics.annualized_volatility * 100.0 << "%"
              << std::endl;
    std::cout << "Max drawdown:       " << metrics.max_drawdown * 100.0 << "%" << std::endl;
    std::cout << "Sharpe ratio:       " << metrics.sharpe_ratio << std::endl;
    std::cout << "Sortino ratio:      " << metrics.sortino_ratio << std::endl;
    std::cout << "Rebalances:         " << results.rebalances.size() << std::endl;
    if (avg_picks > 0.0) {
        std::cout << "Average picks:      " << avg_picks << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "config/bt_canslim.json";

    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            std::cerr << "ERROR: Cannot open config file " << config_path << std::endl;
            return 1;
        }
        nlohmann::json config;
        config_file >> config;

        // Initialize logger
        LoggerConfig logger_config;
        logger_config.filename_prefix = "bt_canslim";
        if (config.contains("logger"))
            logger_config.from_json(config.at("logger"));
        auto& logger = Logger::instance();
        auto init = logger.initialize(logger_config);
        if (init.is_error()) {
            std::cerr << "ERROR: Logger initialization failed: " << init.error()->what()
                      << std::endl;
            return 1;
        }
        Logger::register_component("bt_canslim");
        INFO("Logger initialized for CANSLIM backtest");

        BacktestConfig backtest_config;
        ScreenConfig screen_config;
        StrategySettings strategy_settings;
        SweepConfig sweep_config;
        if (config.contains("backtest"))
            backtest_config.from_json(config.at("backtest"));
        if (config.contains("screen"))
            screen_config.from_json(config.at("screen"));
        if (config.contains("strategy"))
            strategy_settings.from_json(config.at("strategy"));
        if (config.contains("sweep"))
            sweep_config.from_json(config.at("sweep"));

        std::vector<std::string> strategies = {"market", "canslim"};
        if (config.contains("strategies"))
            strategies = config.at("strategies").get<std::vector<std::string>>();
        const bool run_sweep = config.value("run_sweep", false);

        const nlohmann::json data = config.value("data", nlohmann::json::object());
        const std::string prices_path = data.value("prices", "data/prices.feather");
        const std::string proxies_path = data.value("proxies", "data/proxies.feather");
        const std::string financials_path = data.value("financials", "data/financials.feather");
        const std::string universe_path = data.value("universe", "");
        const std::string filing_anchor = data.value("filing_anchor_ticker", "");

        // Load input tables
        INFO("Loading input tables...");
        auto universe =
            std::make_shared<const PriceTable>(PriceTable(load_bars(prices_path)));
        auto proxies =
            std::make_shared<const PriceTable>(PriceTable(load_bars(proxies_path)));

        auto financials_result =
            DataConversionUtils::arrow_table_to_financials(load_table(financials_path));
        if (financials_result.is_error()) {
            std::cerr << "Failed to convert financials: " << financials_result.error()->what()
                      << std::endl;
            return 1;
        }
        auto financials = std::make_shared<const std::vector<FinancialRecord>>(
            financials_result.take_value());

        std::shared_ptr<const UniverseSnapshot> membership;
        if (!universe_path.empty()) {
            auto members = DataConversionUtils::arrow_table_to_universe(load_table(universe_path));
            if (members.is_error()) {
                std::cerr << "Failed to convert universe: " << members.error()->what()
                          << std::endl;
                return 1;
            }
            membership = std::make_shared<const UniverseSnapshot>(members.take_value());
        }
        INFO("Loaded " << universe->num_symbols() << " ticker(s), " << proxies->num_symbols()
                       << " proxy series and " << financials->size() << " filing(s)");

        // Build the rebalance schedule
        const auto calendar =
            RebalanceScheduler::trading_calendar(*proxies, backtest_config.market_proxy);
        if (calendar.empty()) {
            std::cerr << "No trading days for market proxy " << backtest_config.market_proxy
                      << std::endl;
            return 1;
        }
        const Timestamp start = backtest_config.start_date.value_or(calendar.front());
        const Timestamp end = backtest_config.end_date.value_or(calendar.back());

        std::vector<Timestamp> rebalance_dates;
        if (!filing_anchor.empty()) {
            std::vector<Timestamp> targets;
            for (const auto& date :
                 RebalanceScheduler::get_quarter_end_dates(*financials, filing_anchor)) {
                if (date >= start && date <= end)
                    targets.push_back(date);
            }
            rebalance_dates =
                RebalanceScheduler::get_filing_aligned_rebalance_dates(calendar, targets);
        } else {
            rebalance_dates = RebalanceScheduler::get_rebalance_dates(
                calendar, backtest_config.rebalance_frequency, start, end);
        }
        INFO("Scheduled " << rebalance_dates.size() << " rebalance(s) between "
                          << core::format_date(start) << " and " << core::format_date(end));

        // Indicators
        IndicatorEngine indicator_engine(screen_config);
        auto enriched = indicator_engine.compute(*universe, *proxies, *financials,
                                                 backtest_config.market_proxy);
        if (enriched.is_error()) {
            std::cerr << "Indicator computation failed: " << enriched.error()->what()
                      << std::endl;
            return 1;
        }
        const MarketSnapshot snapshot = MarketSnapshot::from_enriched(
            proxies, enriched.take_value(), membership, backtest_config.cash_proxy);

        BacktestMetricsCalculator calculator;
        for (const auto& name : strategies) {
            auto strategy = create_strategy(name, strategy_settings);
            if (strategy.is_error()) {
                std::cerr << "Skipping strategy " << name << ": " << strategy.error()->what()
                          << std::endl;
                continue;
            }

            DiagnosticsSink diagnostics;
            BacktestEngine engine(backtest_config);
            auto run = engine.run(*strategy.value(), snapshot, rebalance_dates, &diagnostics);
            if (run.is_error()) {
                std::cerr << "Backtest failed for " << name << ": " << run.error()->what()
                          << std::endl;
                continue;
            }

            const auto& results = run.value();
            const double risk_free = calculator.calculate_risk_free_rate(
                *proxies, backtest_config.cash_proxy, results.equity_curve.front().first,
                results.equity_curve.back().first);
            const auto metrics = calculator.calculate_all_metrics(results.equity_curve, risk_free);
            print_metrics(name, results, metrics, diagnostics.average_picks());
            INFO(name << " metrics: " << metrics.to_json().dump());
        }

        if (run_sweep) {
            const std::string sweep_strategy = config.value("sweep_strategy", "canslim");
            SweepInputs inputs;
            inputs.universe = universe;
            inputs.proxies = proxies;
            inputs.financials = financials;
            inputs.membership = membership;
            inputs.rebalance_dates = rebalance_dates;
            inputs.backtest = backtest_config;

            ParameterSweep sweep(sweep_config);
            auto sweep_results =
                sweep.run(sweep.make_grid(screen_config), inputs,
                          [&]() { return create_strategy(sweep_strategy, strategy_settings); });
            if (sweep_results.is_error()) {
                std::cerr << "Sweep failed: " << sweep_results.error()->what() << std::endl;
                return 1;
            }

            std::cout << "\n======= Sweep (" << sweep_strategy << ") =======" << std::endl;
            for (const auto& run : sweep_results.value().runs) {
                std::cout << "q=" << run.screen.quarterly_eps_growth_min
                          << " a=" << run.screen.annual_eps_growth_min
                          << " l=" << run.screen.leadership_excess_return_min << " -> ";
                if (run.ok) {
                    std::cout << run.final_value << " (avg picks " << run.avg_picks << ")";
                } else {
                    std::cout << "failed: " << run.error;
                }
                std::cout << std::endl;
            }
            if (sweep_results.value().best_index) {
                const auto& best =
                    sweep_results.value().runs[*sweep_results.value().best_index];
                std::cout << "Best: " << best.screen.to_json().dump() << std::endl;
            }
        }

        INFO("CANSLIM backtest finished");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
