// include/canslim_bt/backtest/parameter_sweep.hpp
#pragma once

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "canslim_bt/backtest/backtest_engine.hpp"
#include "canslim_bt/backtest/backtest_metrics_calculator.hpp"
#include "canslim_bt/core/config_base.hpp"
#include "canslim_bt/core/error.hpp"
#include "canslim_bt/data/series_table.hpp"
#include "canslim_bt/data/universe_snapshot.hpp"
#include "canslim_bt/indicators/screen_config.hpp"
#include "canslim_bt/strategy/allocation_strategy.hpp"

namespace canslim_bt {

struct SweepConfig : public ConfigBase {
    int max_workers{4};  // <= 0 uses the hardware concurrency
    std::vector<double> quarterly_eps_growth_values{0.25};
    std::vector<double> annual_eps_growth_values{0.20};
    std::vector<double> leadership_excess_return_values{0.0};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["max_workers"] = max_workers;
        j["quarterly_eps_growth_values"] = quarterly_eps_growth_values;
        j["annual_eps_growth_values"] = annual_eps_growth_values;
        j["leadership_excess_return_values"] = leadership_excess_return_values;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("max_workers"))
            max_workers = j.at("max_workers").get<int>();
        if (j.contains("quarterly_eps_growth_values"))
            quarterly_eps_growth_values =
                j.at("quarterly_eps_growth_values").get<std::vector<double>>();
        if (j.contains("annual_eps_growth_values"))
            annual_eps_growth_values = j.at("annual_eps_growth_values").get<std::vector<double>>();
        if (j.contains("leadership_excess_return_values"))
            leadership_excess_return_values =
                j.at("leadership_excess_return_values").get<std::vector<double>>();
    }
};

/**
 * @brief Read-only inputs shared by every run of a sweep
 */
struct SweepInputs {
    std::shared_ptr<const PriceTable> universe;
    std::shared_ptr<const PriceTable> proxies;
    std::shared_ptr<const std::vector<FinancialRecord>> financials;
    std::shared_ptr<const UniverseSnapshot> membership;  // may be null
    std::vector<Timestamp> rebalance_dates;
    BacktestConfig backtest;
};

/**
 * @brief Outcome of one grid point
 */
struct SweepRunResult {
    size_t index{0};
    ScreenConfig screen;
    bool ok{false};
    std::string error;
    double final_value{0.0};
    double total_return{0.0};
    double avg_picks{0.0};
    PerformanceMetrics metrics;
};

struct SweepResults {
    std::vector<SweepRunResult> runs;  // in grid order
    std::optional<size_t> best_index;  // highest final value among successful runs
};

/**
 * @brief Creates a fresh strategy for each run
 */
using StrategyBuilder = std::function<Result<std::unique_ptr<AllocationStrategy>>()>;

/**
 * @brief Starts one worker thread running the given job
 */
using WorkerLauncher = std::function<std::thread(const std::function<void()>&)>;

/**
 * @brief Evaluates screening configurations in parallel
 *
 * Each grid point runs indicators, the engine and the metrics on its own
 * snapshot and diagnostics sink; only the input tables are shared. A failed
 * run is reported in its result and does not stop the others.
 */
class ParameterSweep {
public:
    explicit ParameterSweep(SweepConfig config);

    Result<SweepResults> run(const std::vector<ScreenConfig>& grid, const SweepInputs& inputs,
                             const StrategyBuilder& build_strategy) const;

    /**
     * @brief One evaluation; never throws
     */
    static SweepRunResult run_one(size_t index, const ScreenConfig& screen,
                                  const SweepInputs& inputs, const StrategyBuilder& build_strategy);

    /**
     * @brief Cartesian grid over the EPS and leadership thresholds of `base`
     * Order: quarterly outermost, leadership innermost.
     */
    static std::vector<ScreenConfig> make_grid(const ScreenConfig& base,
                                               const std::vector<double>& quarterly,
                                               const std::vector<double>& annual,
                                               const std::vector<double>& leadership);

    /**
     * @brief Start up to `workers` threads running `work` and join every one that started
     * @return Number of threads started. A launch failure stops further launches;
     *         the threads already running are still joined.
     */
    static size_t run_workers(size_t workers, const std::function<void()>& work,
                              const WorkerLauncher& launch = default_launcher());

    static WorkerLauncher default_launcher();

    std::vector<ScreenConfig> make_grid(const ScreenConfig& base) const {
        return make_grid(base, config_.quarterly_eps_growth_values,
                         config_.annual_eps_growth_values,
                         config_.leadership_excess_return_values);
    }

    const SweepConfig& config() const {
        return config_;
    }

private:
    size_t worker_count(size_t jobs) const;

    SweepConfig config_;
};

}  // namespace canslim_bt
