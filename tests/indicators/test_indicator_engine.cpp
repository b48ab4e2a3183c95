#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <functional>
#include "canslim_bt/indicators/indicator_engine.hpp"
#include "test_utils.hpp"

using namespace canslim_bt;
using namespace canslim_bt::testing;

namespace {

bool same_value(double a, double b) {
    return (std::isnan(a) && std::isnan(b)) || a == b;
}

// Bars with a real intraday range: high = close + above, low = close - below
std::vector<PriceBar> ranged_series(const std::string& symbol, const std::vector<Timestamp>& dates,
                                    const std::function<double(size_t)>& close_at,
                                    const std::function<double(size_t)>& volume_at, double above,
                                    double below) {
    std::vector<PriceBar> bars;
    for (size_t i = 0; i < dates.size(); ++i) {
        const double close = close_at(i);
        bars.emplace_back(dates[i], close, close + above, close - below, close, volume_at(i),
                          symbol);
    }
    return bars;
}

size_t index_of(const std::vector<Timestamp>& days, const Timestamp& day) {
    return static_cast<size_t>(std::find(days.begin(), days.end(), day) - days.begin());
}

}  // namespace

class IndicatorEngineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        // 2023-01-02 .. early April 2024
        days = business_days(core::make_date(2023, 1, 2), 330);

        // Rising market: the short MA stays above the long MA
        proxies = linear_series("SPY", days, 380.0, 520.0);

        // AAPL rises faster than the market with a volume spike every 20th day
        stocks = make_series(
            "AAPL", days, [](size_t i) { return 100.0 + 0.5 * static_cast<double>(i); },
            [](size_t i) { return i % 20 == 19 ? 5000.0 : 1000.0; });
        // MSFT drifts lower
        append(stocks, linear_series("MSFT", days, 300.0, 250.0));

        const auto Q = Timeframe::QUARTERLY;
        const auto A = Timeframe::ANNUAL;
        financials = {
            make_filing("AAPL", Q, 2022, "Q4", core::make_date(2022, 12, 31), 1.60),
            make_filing("AAPL", Q, 2023, "Q1", core::make_date(2023, 3, 31), 1.00),
            make_filing("AAPL", Q, 2023, "Q4", core::make_date(2023, 12, 31), 1.70),
            make_filing("AAPL", Q, 2024, "Q1", core::make_date(2024, 3, 31), 1.50),
            make_filing("AAPL", A, 2022, "FY", core::make_date(2022, 12, 31), 5.00),
            make_filing("AAPL", A, 2023, "FY", core::make_date(2023, 12, 31), 6.00),
        };
    }

    EnrichedData compute(const ScreenConfig& config) {
        IndicatorEngine engine(config);
        auto result = engine.compute(PriceTable(stocks), PriceTable(proxies), financials, "SPY");
        EXPECT_TRUE(result.is_ok()) << (result.error() ? result.error()->what() : "");
        return result.take_value();
    }

    std::vector<Timestamp> days;
    std::vector<PriceBar> proxies;
    std::vector<PriceBar> stocks;
    std::vector<FinancialRecord> financials;
};

TEST_F(IndicatorEngineTest, ComputesPerTickerSignals) {
    auto data = compute(ScreenConfig());
    EXPECT_TRUE(data.market_available);
    EXPECT_EQ(data.stocks.symbols(), (std::vector<std::string>{"AAPL", "MSFT"}));

    const auto* aapl = data.stocks.series("AAPL");
    ASSERT_NE(aapl, nullptr);
    ASSERT_EQ(aapl->size(), days.size());

    const auto& first = aapl->front();
    EXPECT_DOUBLE_EQ(first.stock_return, 0.0);
    EXPECT_DOUBLE_EQ(first.high_52w, 100.0);
    EXPECT_TRUE(first.new_high);
    EXPECT_EQ(first.history_days, 1);

    const auto& spike = (*aapl)[19];
    EXPECT_NEAR(spike.stock_return, 0.5 / 109.0, 1e-12);
    EXPECT_NEAR(spike.avg_volume, (19 * 1000.0 + 5000.0) / 20.0, 1e-9);
    EXPECT_TRUE(spike.volume_surge);
    EXPECT_FALSE((*aapl)[18].volume_surge);
    EXPECT_TRUE(spike.new_high);
    EXPECT_DOUBLE_EQ(spike.quarterly_volume, 19 * 1000.0 + 5000.0);

    // Flat bars carry no accumulation
    EXPECT_DOUBLE_EQ(spike.ad_value, 0.0);
    EXPECT_FALSE(spike.accumulation_ok);

    const auto* msft = data.stocks.series("MSFT");
    ASSERT_NE(msft, nullptr);
    EXPECT_FALSE(msft->back().new_high);
    EXPECT_FALSE(msft->back().leadership);
    EXPECT_LT(msft->back().l_measure, 0.0);
}

TEST_F(IndicatorEngineTest, MarketColumnsFollowTheProxy) {
    auto data = compute(ScreenConfig());

    const auto* row = data.stocks.find("AAPL", days[100]);
    const auto* market = data.market.find("SPY", days[100]);
    ASSERT_NE(row, nullptr);
    ASSERT_NE(market, nullptr);

    EXPECT_DOUBLE_EQ(row->market_return, market->market_return);
    EXPECT_DOUBLE_EQ(row->ma_short, market->ma_short);
    EXPECT_TRUE(market->market_bullish);
    EXPECT_TRUE(row->market_bullish);
    EXPECT_NEAR(row->excess_return, row->stock_return - market->market_return, 1e-15);
    EXPECT_EQ(row->leadership, row->excess_return > 0.0);
}

TEST_F(IndicatorEngineTest, MarketDirectionToggle) {
    // A falling market is bearish under the MA cross
    proxies = linear_series("SPY", days, 520.0, 380.0);

    auto crossed = compute(ScreenConfig());
    EXPECT_FALSE(crossed.stocks.find("AAPL", days[200])->market_bullish);

    ScreenConfig always;
    always.use_ma_cross_for_market = false;
    auto data = compute(always);
    for (const auto& row : *data.stocks.series("AAPL")) {
        EXPECT_TRUE(row.market_bullish);
    }
}

TEST_F(IndicatorEngineTest, StrictMarketVariantNeedsCloseAboveShortMa) {
    // Rising trend with a dip below the 50-day average at day 250
    proxies = make_series("SPY", days, [](size_t i) {
        return i == 250 ? 300.0 : 380.0 + static_cast<double>(i);
    });

    auto loose = compute(ScreenConfig());
    EXPECT_TRUE(loose.market.find("SPY", days[250])->market_bullish);

    ScreenConfig strict;
    strict.require_close_above_ma_short = true;
    auto data = compute(strict);
    EXPECT_FALSE(data.market.find("SPY", days[250])->market_bullish);
    EXPECT_TRUE(data.market.find("SPY", days[249])->market_bullish);
}

TEST_F(IndicatorEngineTest, EpsPointInTimeJoin) {
    auto data = compute(ScreenConfig());

    // 2024-03-31 is a Sunday; the Q1 filing becomes visible on Monday 2024-04-01
    const auto* friday = data.stocks.find("AAPL", core::make_date(2024, 3, 29));
    const auto* monday = data.stocks.find("AAPL", core::make_date(2024, 4, 1));
    ASSERT_NE(friday, nullptr);
    ASSERT_NE(monday, nullptr);

    // Friday still sees Q4 2023: (1.70 - 1.60) / 1.60
    EXPECT_NEAR(friday->eps_quarterly_growth, 0.0625, 1e-12);
    EXPECT_FALSE(friday->eps_growth_quarterly);

    // Monday sees Q1 2024: (1.50 - 1.00) / 1.00
    EXPECT_NEAR(monday->eps_quarterly_growth, 0.5, 1e-12);
    EXPECT_TRUE(monday->eps_growth_quarterly);

    EXPECT_NEAR(monday->eps_annual_growth, 0.2, 1e-12);
    EXPECT_TRUE(monday->eps_growth_annual);

    // Before any filing the screens fail and growth is undefined
    const auto* msft = data.stocks.find("MSFT", core::make_date(2024, 4, 1));
    ASSERT_NE(msft, nullptr);
    EXPECT_TRUE(std::isnan(msft->eps_quarterly_growth));
    EXPECT_FALSE(msft->eps_growth_quarterly);
    EXPECT_FALSE(msft->eps_growth_annual);
}

TEST_F(IndicatorEngineTest, AccumulationDistributionFromBarRange) {
    // ACC closes in the upper part of its range, DIST in the lower part
    auto rising = [](size_t i) { return 100.0 + 0.5 * static_cast<double>(i); };
    auto volume = [](size_t i) { return i % 20 == 19 ? 5000.0 : 1000.0; };
    stocks = ranged_series("ACC", days, rising, volume, 1.0, 3.0);
    append(stocks, ranged_series("DIST", days, rising, volume, 3.0, 1.0));

    auto data = compute(ScreenConfig());
    const auto* acc = data.stocks.series("ACC");
    const auto* dist = data.stocks.series("DIST");
    ASSERT_NE(acc, nullptr);
    ASSERT_NE(dist, nullptr);

    // ((3 - 1) / 4) * 1000
    EXPECT_DOUBLE_EQ((*acc)[0].ad_value, 500.0);
    EXPECT_DOUBLE_EQ((*acc)[0].ad_ratio, 500.0);
    EXPECT_TRUE((*acc)[0].accumulation_ok);

    // Spike day: 0.5 * 5000, averaged with nineteen days of 500
    EXPECT_DOUBLE_EQ((*acc)[19].ad_value, 2500.0);
    EXPECT_DOUBLE_EQ((*acc)[19].ad_ratio, (19 * 500.0 + 2500.0) / 20.0);

    // Full 50-day window (days 9..58): two spikes and 48 ordinary days
    EXPECT_DOUBLE_EQ((*acc)[58].ad_ratio, (48 * 500.0 + 2 * 2500.0) / 50.0);
    EXPECT_TRUE((*acc)[58].accumulation_ok);

    EXPECT_DOUBLE_EQ((*dist)[0].ad_value, -500.0);
    EXPECT_DOUBLE_EQ((*dist)[58].ad_ratio, -(48 * 500.0 + 2 * 2500.0) / 50.0);
    for (const auto& row : *dist) {
        EXPECT_FALSE(row.accumulation_ok);
        EXPECT_FALSE(row.passes_all_screens);
    }

    ScreenConfig strict;
    strict.accumulation_ratio_min = 600.0;
    auto raised = compute(strict);
    EXPECT_FALSE(raised.stocks.find("ACC", days[0])->accumulation_ok);
    EXPECT_TRUE(raised.stocks.find("ACC", days[19])->accumulation_ok);
}

TEST_F(IndicatorEngineTest, CompositeScreens) {
    const size_t friday = index_of(days, core::make_date(2024, 3, 29));
    const size_t monday = index_of(days, core::make_date(2024, 4, 1));
    ASSERT_LT(monday, days.size());

    // AAPL: rising closes in the upper part of the range, volume surges on both days
    stocks = ranged_series(
        "AAPL", days, [](size_t i) { return 100.0 + 0.5 * static_cast<double>(i); },
        [&](size_t i) { return i == friday || i == monday ? 5000.0 : 1000.0; }, 1.0, 3.0);
    append(stocks, linear_series("MSFT", days, 300.0, 250.0));

    auto data = compute(ScreenConfig());

    // Monday: every screen passes
    const auto* pass = data.stocks.find("AAPL", days[monday]);
    ASSERT_NE(pass, nullptr);
    EXPECT_TRUE(pass->eps_growth_quarterly);
    EXPECT_TRUE(pass->eps_growth_annual);
    EXPECT_TRUE(pass->new_high);
    EXPECT_TRUE(pass->volume_surge);
    EXPECT_TRUE(pass->leadership);
    EXPECT_TRUE(pass->accumulation_ok);
    EXPECT_TRUE(pass->market_bullish);
    EXPECT_TRUE(pass->passes_all_screens);
    EXPECT_TRUE(pass->eps_either);

    // Friday: quarterly growth 0.0625 fails, annual passes
    const auto* either = data.stocks.find("AAPL", days[friday]);
    ASSERT_NE(either, nullptr);
    EXPECT_FALSE(either->eps_growth_quarterly);
    EXPECT_TRUE(either->eps_growth_annual);
    EXPECT_TRUE(either->eps_either);
    EXPECT_FALSE(either->passes_all_screens);

    // Without the surge the technical screens fail on an ordinary day
    const auto* quiet = data.stocks.find("AAPL", days[monday - 2]);
    ASSERT_NE(quiet, nullptr);
    EXPECT_FALSE(quiet->volume_surge);
    EXPECT_FALSE(quiet->eps_either);

    for (const auto& r : *data.stocks.series("AAPL")) {
        if (r.passes_all_screens) {
            EXPECT_TRUE(r.eps_either);
        }
    }
}

TEST_F(IndicatorEngineTest, NoLookAhead) {
    // Recompute on the first 200 days only
    const size_t cutoff = 200;
    const Timestamp last_day = days[cutoff - 1];

    // Filings reported after the cutoff, with extreme EPS, only reach the full run
    const auto Q = Timeframe::QUARTERLY;
    const auto A = Timeframe::ANNUAL;
    std::vector<FinancialRecord> known = financials;
    known.push_back(make_filing("AAPL", Q, 2022, "Q3", core::make_date(2022, 9, 30), 1.00));
    known.push_back(make_filing("MSFT", Q, 2022, "Q3", core::make_date(2022, 9, 30), 2.00));
    known.push_back(make_filing("MSFT", A, 2022, "FY", core::make_date(2022, 6, 30), 9.00));
    std::vector<FinancialRecord> later = {
        make_filing("AAPL", Q, 2023, "Q3", core::add_days(last_day, 1), 500.0),
        make_filing("MSFT", Q, 2023, "Q3", core::add_days(last_day, 3), 200.0),
        make_filing("MSFT", A, 2023, "FY", core::add_days(last_day, 10), -900.0),
    };

    financials = known;
    append(financials, later);
    auto full = compute(ScreenConfig());

    auto truncate = [&](const std::vector<PriceBar>& bars) {
        std::vector<PriceBar> out;
        for (const auto& bar : bars) {
            if (bar.timestamp <= last_day)
                out.push_back(bar);
        }
        return out;
    };
    stocks = truncate(stocks);
    proxies = truncate(proxies);
    financials.clear();
    for (const auto& filing : known) {
        if (filing.end_date <= last_day)
            financials.push_back(filing);
    }
    auto partial = compute(ScreenConfig());

    size_t compared = 0;
    for (const auto& symbol : partial.stocks.symbols()) {
        for (const auto& p : *partial.stocks.series(symbol)) {
            const auto* f = full.stocks.find(symbol, p.timestamp);
            ASSERT_NE(f, nullptr);
            EXPECT_TRUE(same_value(p.stock_return, f->stock_return));
            EXPECT_TRUE(same_value(p.high_52w, f->high_52w));
            EXPECT_TRUE(same_value(p.avg_volume, f->avg_volume));
            EXPECT_TRUE(same_value(p.l_measure, f->l_measure));
            EXPECT_TRUE(same_value(p.ad_ratio, f->ad_ratio));
            EXPECT_TRUE(same_value(p.ma_long, f->ma_long));
            EXPECT_TRUE(same_value(p.eps_quarterly_growth, f->eps_quarterly_growth));
            EXPECT_TRUE(same_value(p.eps_annual_growth, f->eps_annual_growth));
            EXPECT_EQ(p.eps_growth_quarterly, f->eps_growth_quarterly);
            EXPECT_EQ(p.eps_growth_annual, f->eps_growth_annual);
            EXPECT_EQ(p.passes_all_screens, f->passes_all_screens);
            EXPECT_EQ(p.eps_either, f->eps_either);
            EXPECT_EQ(p.market_bullish, f->market_bullish);
            EXPECT_EQ(p.history_days, f->history_days);
            ++compared;
        }
    }
    EXPECT_EQ(compared, 2 * cutoff);

    // The later filings do change the full run once they are reported
    const auto* after = full.stocks.find("AAPL", days[cutoff + 5]);
    ASSERT_NE(after, nullptr);
    EXPECT_NEAR(after->eps_quarterly_growth, (500.0 - 1.00) / 1.00, 1e-9);
}

TEST_F(IndicatorEngineTest, MissingMarketProxyIsNotAnError) {
    proxies = flat_series("SHY", days, 82.0);
    auto data = compute(ScreenConfig());

    EXPECT_FALSE(data.market_available);
    const auto* aapl = data.stocks.series("AAPL");
    ASSERT_NE(aapl, nullptr);
    for (const auto& row : *aapl) {
        EXPECT_FALSE(row.leadership);
        EXPECT_FALSE(row.market_bullish);
        EXPECT_FALSE(row.passes_all_screens);
        EXPECT_TRUE(std::isnan(row.market_return));
    }
    // The smoothed measure falls back to the stock's own return
    EXPECT_GT(aapl->back().l_measure, 0.0);
}

TEST_F(IndicatorEngineTest, RejectsNonPositiveWindows) {
    ScreenConfig config;
    config.volume_average_days = 0;
    IndicatorEngine engine(config);

    auto result = engine.compute(PriceTable(stocks), PriceTable(proxies), financials, "SPY");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(IndicatorEngineTest, MinimumHistoryFilter) {
    auto data = compute(ScreenConfig());
    const auto* aapl = data.stocks.series("AAPL");

    EXPECT_FALSE(IndicatorEngine::minimum_history((*aapl)[48], 50));
    EXPECT_TRUE(IndicatorEngine::minimum_history((*aapl)[49], 50));
}
