// src/backtest/market_snapshot.cpp

#include "canslim_bt/backtest/market_snapshot.hpp"
#include <utility>

namespace canslim_bt {

MarketSnapshot::MarketSnapshot(std::shared_ptr<const PriceTable> proxy_prices,
                               std::shared_ptr<const IndicatorTable> stocks,
                               std::shared_ptr<const MarketIndicatorTable> market,
                               std::shared_ptr<const UniverseSnapshot> membership,
                               std::string market_proxy, std::string cash_proxy)
    : proxy_prices_(std::move(proxy_prices)),
      stocks_(std::move(stocks)),
      market_(std::move(market)),
      membership_(std::move(membership)),
      market_proxy_(std::move(market_proxy)),
      cash_proxy_(std::move(cash_proxy)) {}

MarketSnapshot MarketSnapshot::from_enriched(std::shared_ptr<const PriceTable> proxy_prices,
                                             EnrichedData enriched,
                                             std::shared_ptr<const UniverseSnapshot> membership,
                                             std::string cash_proxy) {
    return MarketSnapshot(std::move(proxy_prices),
                          std::make_shared<const IndicatorTable>(std::move(enriched.stocks)),
                          std::make_shared<const MarketIndicatorTable>(std::move(enriched.market)),
                          std::move(membership), std::move(enriched.market_proxy),
                          std::move(cash_proxy));
}

std::optional<Price> MarketSnapshot::price(const std::string& symbol,
                                           const Timestamp& date) const {
    if (proxy_prices_ && proxy_prices_->contains(symbol)) {
        return proxy_prices_->close(symbol, date);
    }
    if (stocks_) {
        return stocks_->close(symbol, date);
    }
    return std::nullopt;
}

const MarketIndicatorRow* MarketSnapshot::market_row(const Timestamp& date) const {
    if (!market_) {
        return nullptr;
    }
    return market_->find(market_proxy_, date);
}

const IndicatorRow* MarketSnapshot::stock_row(const std::string& symbol,
                                              const Timestamp& date) const {
    if (!stocks_) {
        return nullptr;
    }
    return stocks_->find(symbol, date);
}

std::vector<std::string> MarketSnapshot::members(const Timestamp& date) const {
    if (membership_) {
        return membership_->members_as_of(date);
    }
    return stocks().symbols();
}

std::vector<const IndicatorRow*> MarketSnapshot::member_rows(const Timestamp& date) const {
    std::vector<const IndicatorRow*> rows;
    for (const auto& symbol : members(date)) {
        if (const auto* row = stock_row(symbol, date)) {
            rows.push_back(row);
        }
    }
    return rows;
}

std::vector<Timestamp> MarketSnapshot::calendar() const {
    return proxy_prices().dates(market_proxy_);
}

const PriceTable& MarketSnapshot::empty_prices() {
    static const PriceTable table;
    return table;
}

const IndicatorTable& MarketSnapshot::empty_stocks() {
    static const IndicatorTable table;
    return table;
}

}  // namespace canslim_bt
