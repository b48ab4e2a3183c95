// src/strategy/strategy_factory.cpp

#include "canslim_bt/strategy/strategy_factory.hpp"
#include "canslim_bt/strategy/canslim_strategies.hpp"
#include "canslim_bt/strategy/market_strategies.hpp"
#include "canslim_bt/strategy/universe_strategies.hpp"

namespace canslim_bt {

namespace {

const char* kComponent = "StrategyFactory";

}  // namespace

const std::vector<std::string>& strategy_names() {
    static const std::vector<std::string> names = {"market",  "risk",      "canslim", "factor",
                                                   "hybrid",  "flattened", "leader",  "volume"};
    return names;
}

Result<std::unique_ptr<AllocationStrategy>> create_strategy(const std::string& name,
                                                            const StrategySettings& settings) {
    using StrategyPtr = std::unique_ptr<AllocationStrategy>;

    if (settings.max_positions <= 0 || settings.top_k <= 0) {
        return make_error<StrategyPtr>(ErrorCode::INVALID_ARGUMENT,
                                       "max_positions and top_k must be positive", kComponent);
    }
    if (settings.min_score < 0 || settings.min_score > 6) {
        return make_error<StrategyPtr>(ErrorCode::INVALID_ARGUMENT,
                                       "min_score must be between 0 and 6, got " +
                                           std::to_string(settings.min_score),
                                       kComponent);
    }

    const auto max_positions = static_cast<size_t>(settings.max_positions);
    const auto top_k = static_cast<size_t>(settings.top_k);

    if (name == "market")
        return StrategyPtr(std::make_unique<MarketOnlyStrategy>());
    if (name == "risk")
        return StrategyPtr(std::make_unique<RiskManagedMarketStrategy>());
    if (name == "canslim")
        return StrategyPtr(
            std::make_unique<CanslimEqualWeightStrategy>(max_positions, settings.use_eps_either));
    if (name == "factor")
        return StrategyPtr(
            std::make_unique<FactorWeightedStrategy>(top_k, settings.use_eps_either));
    if (name == "hybrid")
        return StrategyPtr(std::make_unique<HybridScoredStrategy>(settings.min_score, top_k,
                                                                  settings.cash_when_bearish));
    if (name == "flattened")
        return StrategyPtr(std::make_unique<UniverseEqualWeightStrategy>());
    if (name == "leader")
        return StrategyPtr(
            std::make_unique<UniverseMeasureWeightedStrategy>(UniverseMeasure::LEADERSHIP));
    if (name == "volume")
        return StrategyPtr(
            std::make_unique<UniverseMeasureWeightedStrategy>(UniverseMeasure::VOLUME));

    return make_error<StrategyPtr>(ErrorCode::UNKNOWN_STRATEGY, "Unknown strategy: " + name,
                                   kComponent);
}

}  // namespace canslim_bt
