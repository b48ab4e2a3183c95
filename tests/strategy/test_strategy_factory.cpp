#include <gtest/gtest.h>
#include "canslim_bt/strategy/canslim_strategies.hpp"
#include "canslim_bt/strategy/strategy_factory.hpp"
#include "canslim_bt/strategy/universe_strategies.hpp"
#include "test_utils.hpp"

using namespace canslim_bt;
using namespace canslim_bt::testing;

class StrategyFactoryTest : public TestBase {};

TEST_F(StrategyFactoryTest, BuildsEveryNamedStrategy) {
    StrategySettings settings;
    for (const auto& name : strategy_names()) {
        auto result = create_strategy(name, settings);
        ASSERT_TRUE(result.is_ok()) << name;
        ASSERT_NE(result.value(), nullptr);
        EXPECT_EQ(result.value()->name(), name);
    }
    EXPECT_EQ(strategy_names().size(), 8u);
}

TEST_F(StrategyFactoryTest, PassesSettingsThrough) {
    StrategySettings settings;
    settings.min_score = 5;
    auto result = create_strategy("volume", settings);
    ASSERT_TRUE(result.is_ok());

    const auto* volume = dynamic_cast<const UniverseMeasureWeightedStrategy*>(result.value().get());
    ASSERT_NE(volume, nullptr);
    EXPECT_EQ(volume->measure(), UniverseMeasure::VOLUME);

    auto hybrid = create_strategy("hybrid", settings);
    ASSERT_TRUE(hybrid.is_ok());
    EXPECT_NE(dynamic_cast<const HybridScoredStrategy*>(hybrid.value().get()), nullptr);
}

TEST_F(StrategyFactoryTest, UnknownNameIsRejected) {
    auto result = create_strategy("momentum", StrategySettings());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::UNKNOWN_STRATEGY);
    EXPECT_NE(std::string(result.error()->what()).find("momentum"), std::string::npos);
}

TEST_F(StrategyFactoryTest, InvalidSettingsAreRejected) {
    StrategySettings no_positions;
    no_positions.max_positions = 0;
    auto a = create_strategy("canslim", no_positions);
    ASSERT_TRUE(a.is_error());
    EXPECT_EQ(a.error()->code(), ErrorCode::INVALID_ARGUMENT);

    StrategySettings bad_score;
    bad_score.min_score = 7;
    auto b = create_strategy("hybrid", bad_score);
    ASSERT_TRUE(b.is_error());
    EXPECT_EQ(b.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(StrategyFactoryTest, SettingsFromJson) {
    StrategySettings settings;
    settings.from_json(nlohmann::json{{"max_positions", 3}, {"cash_when_bearish", true}});
    EXPECT_EQ(settings.max_positions, 3);
    EXPECT_TRUE(settings.cash_when_bearish);
    EXPECT_EQ(settings.top_k, 10);

    auto j = settings.to_json();
    StrategySettings copy;
    copy.from_json(j);
    EXPECT_EQ(copy.max_positions, 3);
    EXPECT_EQ(copy.min_score, settings.min_score);
}
