#include <gtest/gtest.h>
#include <cmath>
#include <numeric>
#include "canslim_bt/strategy/canslim_strategies.hpp"
#include "snapshot_utils.hpp"

using namespace canslim_bt;
using namespace canslim_bt::testing;

namespace {

double weight_sum(const Allocation& weights) {
    return std::accumulate(weights.begin(), weights.end(), 0.0,
                           [](double total, const auto& entry) { return total + entry.second; });
}

}  // namespace

class CanslimStrategiesTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        date = core::make_date(2024, 4, 1);
        proxies = {PriceBar(date, 520.0, 520.0, 520.0, 520.0, 0.0, "SPY"),
                   PriceBar(date, 82.0, 82.0, 82.0, 82.0, 0.0, "SHY")};
    }

    IndicatorRow row(const std::string& symbol, double close = 100.0) const {
        IndicatorRow r(PriceBar(date, close, close, close, close, 1000.0, symbol));
        r.high_52w = close;
        r.avg_volume = 1000.0;
        return r;
    }

    static IndicatorRow screened(IndicatorRow r) {
        r.passes_all_screens = true;
        r.eps_either = true;
        return r;
    }

    MarketSnapshot snapshot(const std::vector<IndicatorRow>& rows, bool bullish = true) const {
        return make_snapshot(proxies, rows, {market_row(date, bullish)});
    }

    Timestamp date;
    std::vector<PriceBar> proxies;
};

TEST_F(CanslimStrategiesTest, EqualWeightTakesFirstNScreenedInTickerOrder) {
    std::vector<IndicatorRow> rows;
    for (const char* symbol : {"E", "A", "D", "C", "B"}) {
        rows.push_back(screened(row(symbol)));
    }
    rows.push_back(row("AA"));  // fails the screen
    auto snap = snapshot(rows);

    CanslimEqualWeightStrategy strategy(3);
    DiagnosticsSink sink;
    auto result = strategy.allocate(date, 100000.0, snap, true, &sink);
    ASSERT_TRUE(result.is_ok());

    const Allocation expected = {{"A", 1.0 / 3.0}, {"B", 1.0 / 3.0}, {"C", 1.0 / 3.0}};
    ASSERT_EQ(result.value().size(), 3u);
    for (const auto& [symbol, weight] : expected) {
        EXPECT_DOUBLE_EQ(result.value().at(symbol), weight);
    }
    ASSERT_EQ(sink.picks().size(), 1u);
    EXPECT_EQ(sink.picks()[0].strategy, "canslim");
    EXPECT_EQ(sink.picks()[0].tickers, (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(CanslimStrategiesTest, EqualWeightGoesToCash) {
    CanslimEqualWeightStrategy strategy;

    // Bearish market
    auto bearish = strategy.allocate(date, 1.0, snapshot({screened(row("A"))}, false), true,
                                     nullptr);
    ASSERT_TRUE(bearish.is_ok());
    EXPECT_EQ(bearish.value(), full_allocation("SHY"));

    // Nothing passes
    DiagnosticsSink sink;
    auto empty = strategy.allocate(date, 1.0, snapshot({row("A"), row("B")}), true, &sink);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_EQ(empty.value(), full_allocation("SHY"));
    ASSERT_EQ(sink.picks().size(), 1u);
    EXPECT_TRUE(sink.picks()[0].tickers.empty());

    // No market row on the date
    auto missing = strategy.allocate(date, 1.0,
                                     make_snapshot(proxies, {screened(row("A"))}), true, nullptr);
    ASSERT_TRUE(missing.is_ok());
    EXPECT_EQ(missing.value(), full_allocation("SHY"));
}

TEST_F(CanslimStrategiesTest, EpsEitherVariantWidensTheScreen) {
    IndicatorRow either_only = row("A");
    either_only.eps_either = true;
    auto snap = snapshot({either_only});

    auto strict = CanslimEqualWeightStrategy(6, false).allocate(date, 1.0, snap, true, nullptr);
    auto loose = CanslimEqualWeightStrategy(6, true).allocate(date, 1.0, snap, true, nullptr);
    ASSERT_TRUE(strict.is_ok());
    ASSERT_TRUE(loose.is_ok());
    EXPECT_EQ(strict.value(), full_allocation("SHY"));
    EXPECT_EQ(loose.value(), full_allocation("A"));
}

TEST_F(CanslimStrategiesTest, FactorScore) {
    IndicatorRow r = row("A", 90.0);
    r.high_52w = 100.0;
    r.volume = 3000.0;
    r.avg_volume = 1500.0;
    EXPECT_DOUBLE_EQ(FactorWeightedStrategy::score(r), 0.9 + 2.0);

    r.avg_volume = 0.0;
    EXPECT_TRUE(std::isnan(FactorWeightedStrategy::score(r)));
    r.avg_volume = 1500.0;
    r.high_52w = kUndefined;
    EXPECT_TRUE(std::isnan(FactorWeightedStrategy::score(r)));
}

TEST_F(CanslimStrategiesTest, FactorWeightsAreProportionalToScore) {
    // Scores: A = 1 + 1 = 2, B = 1 + 3 = 4, C = 1 + 2 = 3
    IndicatorRow a = screened(row("A"));
    IndicatorRow b = screened(row("B"));
    b.volume = 3000.0;
    IndicatorRow c = screened(row("C"));
    c.volume = 2000.0;
    auto snap = snapshot({a, b, c});

    DiagnosticsSink sink;
    auto result = FactorWeightedStrategy(2).allocate(date, 1.0, snap, true, &sink);
    ASSERT_TRUE(result.is_ok());

    const auto& weights = result.value();
    ASSERT_EQ(weights.size(), 2u);
    EXPECT_NEAR(weights.at("B"), 4.0 / 7.0, 1e-12);
    EXPECT_NEAR(weights.at("C"), 3.0 / 7.0, 1e-12);
    EXPECT_NEAR(weight_sum(weights), 1.0, 1e-12);
    EXPECT_EQ(sink.picks()[0].tickers, (std::vector<std::string>{"B", "C"}));
}

TEST_F(CanslimStrategiesTest, FactorSkipsUnscorableRows) {
    IndicatorRow a = screened(row("A"));
    a.high_52w = kUndefined;
    auto only_unscorable = FactorWeightedStrategy().allocate(date, 1.0, snapshot({a}), true,
                                                             nullptr);
    ASSERT_TRUE(only_unscorable.is_ok());
    EXPECT_EQ(only_unscorable.value(), full_allocation("SHY"));

    auto bearish = FactorWeightedStrategy().allocate(
        date, 1.0, snapshot({screened(row("B"))}, false), true, nullptr);
    ASSERT_TRUE(bearish.is_ok());
    EXPECT_EQ(bearish.value(), full_allocation("SHY"));
}

TEST_F(CanslimStrategiesTest, HybridFactorCount) {
    IndicatorRow r = row("A");
    EXPECT_EQ(HybridScoredStrategy::factor_count(r), 0);
    r.eps_growth_quarterly = true;
    r.leadership = true;
    r.accumulation_ok = true;
    EXPECT_EQ(HybridScoredStrategy::factor_count(r), 3);
    r.eps_growth_annual = true;
    r.new_high = true;
    r.volume_surge = true;
    EXPECT_EQ(HybridScoredStrategy::factor_count(r), 6);
}

TEST_F(CanslimStrategiesTest, HybridHoldsBestScoringMembers) {
    IndicatorRow a = row("A");
    a.eps_growth_quarterly = a.eps_growth_annual = a.leadership = true;
    IndicatorRow b = row("B");
    b.eps_growth_quarterly = b.eps_growth_annual = b.leadership = b.new_high = true;
    IndicatorRow c = row("C");
    c.leadership = true;
    auto snap = snapshot({a, b, c}, false);

    // Market direction is ignored unless cash_when_bearish is set
    auto result = HybridScoredStrategy(3, 10).allocate(date, 1.0, snap, true, nullptr);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_NEAR(result.value().at("A"), 3.0 / 7.0, 1e-12);
    EXPECT_NEAR(result.value().at("B"), 4.0 / 7.0, 1e-12);

    auto cautious = HybridScoredStrategy(3, 10, true).allocate(date, 1.0, snap, true, nullptr);
    ASSERT_TRUE(cautious.is_ok());
    EXPECT_EQ(cautious.value(), full_allocation("SHY"));
}

TEST_F(CanslimStrategiesTest, HybridFallsBackToMarketProxy) {
    auto result = HybridScoredStrategy(4).allocate(date, 1.0, snapshot({row("A"), row("B")}),
                                                   true, nullptr);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), full_allocation("SPY"));

    // A zero threshold still needs at least one passing factor
    auto zero = HybridScoredStrategy(0).allocate(date, 1.0, snapshot({row("A")}), true, nullptr);
    ASSERT_TRUE(zero.is_ok());
    EXPECT_EQ(zero.value(), full_allocation("SPY"));
}

TEST_F(CanslimStrategiesTest, MembershipLimitsCandidates) {
    auto membership = std::make_shared<UniverseSnapshot>();
    membership->set_members(core::make_date(2024, 1, 2), {"B"});
    auto snap = make_snapshot(proxies, {screened(row("A")), screened(row("B"))},
                              {market_row(date, true)}, membership);

    auto result = CanslimEqualWeightStrategy().allocate(date, 1.0, snap, true, nullptr);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), full_allocation("B"));
}
