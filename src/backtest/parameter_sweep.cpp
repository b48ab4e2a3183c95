// src/backtest/parameter_sweep.cpp

#include "canslim_bt/backtest/parameter_sweep.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/indicators/indicator_engine.hpp"

namespace canslim_bt {

namespace {

const char* kComponent = "ParameterSweep";

}  // namespace

ParameterSweep::ParameterSweep(SweepConfig config) : config_(std::move(config)) {}

size_t ParameterSweep::worker_count(size_t jobs) const {
    size_t workers = config_.max_workers > 0 ? static_cast<size_t>(config_.max_workers)
                                             : std::thread::hardware_concurrency();
    if (workers == 0) {
        workers = 1;
    }
    return std::min(workers, jobs);
}

WorkerLauncher ParameterSweep::default_launcher() {
    return [](const std::function<void()>& job) { return std::thread(job); };
}

size_t ParameterSweep::run_workers(size_t workers, const std::function<void()>& work,
                                   const WorkerLauncher& launch) {
    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
        for (size_t w = 0; w < workers; ++w) {
            threads.push_back(launch(work));
        }
    } catch (const std::system_error& e) {
        ERROR("Failed to start sweep worker " << threads.size() + 1 << " of " << workers << ": "
                                              << e.what());
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return threads.size();
}

std::vector<ScreenConfig> ParameterSweep::make_grid(const ScreenConfig& base,
                                                    const std::vector<double>& quarterly,
                                                    const std::vector<double>& annual,
                                                    const std::vector<double>& leadership) {
    std::vector<ScreenConfig> grid;
    grid.reserve(quarterly.size() * annual.size() * leadership.size());
    for (double q : quarterly) {
        for (double a : annual) {
            for (double l : leadership) {
                ScreenConfig screen = base;
                screen.quarterly_eps_growth_min = q;
                screen.annual_eps_growth_min = a;
                screen.leadership_excess_return_min = l;
                grid.push_back(std::move(screen));
            }
        }
    }
    return grid;
}

SweepRunResult ParameterSweep::run_one(size_t index, const ScreenConfig& screen,
                                       const SweepInputs& inputs,
                                       const StrategyBuilder& build_strategy) {
    Logger::register_component(kComponent);

    SweepRunResult result;
    result.index = index;
    result.screen = screen;

    try {
        IndicatorEngine indicators(screen);
        auto enriched = indicators.compute(*inputs.universe, *inputs.proxies, *inputs.financials,
                                           inputs.backtest.market_proxy);
        if (enriched.is_error()) {
            result.error = enriched.error()->to_string();
            return result;
        }

        const MarketSnapshot snapshot = MarketSnapshot::from_enriched(
            inputs.proxies, enriched.take_value(), inputs.membership, inputs.backtest.cash_proxy);

        auto strategy = build_strategy();
        if (strategy.is_error()) {
            result.error = strategy.error()->to_string();
            return result;
        }

        DiagnosticsSink diagnostics;
        BacktestEngine engine(inputs.backtest);
        auto run = engine.run(*strategy.value(), snapshot, inputs.rebalance_dates, &diagnostics);
        if (run.is_error()) {
            result.error = run.error()->to_string();
            return result;
        }

        const auto& curve = run.value().equity_curve;
        BacktestMetricsCalculator calculator;
        const double risk_free = calculator.calculate_risk_free_rate(
            *inputs.proxies, inputs.backtest.cash_proxy, curve.front().first, curve.back().first);

        result.final_value = run.value().final_value;
        result.total_return = run.value().total_return;
        result.avg_picks = diagnostics.average_picks();
        result.metrics = calculator.calculate_all_metrics(curve, risk_free);
        result.ok = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

Result<SweepResults> ParameterSweep::run(const std::vector<ScreenConfig>& grid,
                                         const SweepInputs& inputs,
                                         const StrategyBuilder& build_strategy) const {
    Logger::register_component(kComponent);

    if (grid.empty()) {
        return make_error<SweepResults>(ErrorCode::INVALID_ARGUMENT, "Empty parameter grid",
                                        kComponent);
    }
    if (!inputs.universe || !inputs.proxies || !inputs.financials) {
        return make_error<SweepResults>(ErrorCode::NOT_INITIALIZED,
                                        "Sweep inputs are missing a price or filings table",
                                        kComponent);
    }
    if (!build_strategy) {
        return make_error<SweepResults>(ErrorCode::INVALID_ARGUMENT,
                                        "No strategy builder supplied", kComponent);
    }

    const size_t workers = worker_count(grid.size());
    INFO("Sweeping " << grid.size() << " configuration(s) on " << workers << " worker(s)");

    SweepResults results;
    results.runs.resize(grid.size());
    std::atomic<size_t> next{0};

    // Each slot of results.runs is written by exactly one worker
    auto work = [&]() {
        for (size_t i = next.fetch_add(1); i < grid.size(); i = next.fetch_add(1)) {
            results.runs[i] = run_one(i, grid[i], inputs, build_strategy);
        }
    };

    if (run_workers(workers, work) == 0) {
        return make_error<SweepResults>(ErrorCode::THREAD_ERROR, "No sweep worker could start",
                                        kComponent);
    }

    for (const auto& run : results.runs) {
        if (!run.ok) {
            WARN("Sweep run " << run.index << " failed: " << run.error);
            continue;
        }
        INFO("Sweep run " << run.index << " => final " << run.final_value << ", return "
                          << run.total_return << ", avg picks " << run.avg_picks);
        if (!results.best_index ||
            run.final_value > results.runs[*results.best_index].final_value) {
            results.best_index = run.index;
        }
    }
    if (!results.best_index) {
        WARN("No sweep run completed successfully");
    }
    return results;
}

}  // namespace canslim_bt
