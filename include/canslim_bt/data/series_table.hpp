// include/canslim_bt/data/series_table.hpp
#pragma once

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"
#include "canslim_bt/core/types.hpp"

namespace canslim_bt {

/**
 * @brief In-memory daily rows grouped by ticker, each group sorted by date
 *
 * Row must expose `symbol`, `timestamp` and `close`. Rows are normalized to
 * midnight UTC; a repeated (ticker, date) keeps the row that came last and is
 * logged as a data-quality event. The table is immutable after construction.
 */
template <typename Row>
class SeriesTable {
public:
    SeriesTable() = default;

    explicit SeriesTable(std::vector<Row> rows) {
        for (auto& row : rows) {
            row.timestamp = core::floor_to_day(row.timestamp);
            series_[row.symbol].push_back(std::move(row));
        }
        for (auto& [symbol, group] : series_) {
            normalize(symbol, group);
        }
    }

    /**
     * @brief Build from groups that are already keyed by ticker
     */
    static SeriesTable from_groups(std::unordered_map<std::string, std::vector<Row>> groups) {
        SeriesTable table;
        table.series_ = std::move(groups);
        for (auto& [symbol, group] : table.series_) {
            for (auto& row : group) {
                row.timestamp = core::floor_to_day(row.timestamp);
            }
            table.normalize(symbol, group);
        }
        return table;
    }

    /**
     * @brief Row for (symbol, date) or nullptr when absent
     */
    const Row* find(const std::string& symbol, const Timestamp& date) const {
        auto it = series_.find(symbol);
        if (it == series_.end()) {
            return nullptr;
        }
        const Timestamp day = core::floor_to_day(date);
        const auto& group = it->second;
        auto pos = std::lower_bound(
            group.begin(), group.end(), day,
            [](const Row& row, const Timestamp& ts) { return row.timestamp < ts; });
        if (pos == group.end() || pos->timestamp != day) {
            return nullptr;
        }
        return &(*pos);
    }

    /**
     * @brief Latest row dated on or before `date`, or nullptr
     */
    const Row* find_as_of(const std::string& symbol, const Timestamp& date) const {
        auto it = series_.find(symbol);
        if (it == series_.end()) {
            return nullptr;
        }
        const Timestamp day = core::floor_to_day(date);
        const auto& group = it->second;
        auto pos = std::upper_bound(
            group.begin(), group.end(), day,
            [](const Timestamp& ts, const Row& row) { return ts < row.timestamp; });
        if (pos == group.begin()) {
            return nullptr;
        }
        return &(*std::prev(pos));
    }

    std::optional<Price> close(const std::string& symbol, const Timestamp& date) const {
        const Row* row = find(symbol, date);
        if (!row) {
            return std::nullopt;
        }
        return row->close;
    }

    bool contains(const std::string& symbol) const {
        return series_.find(symbol) != series_.end();
    }

    /**
     * @brief Date-sorted rows of one ticker, or nullptr
     */
    const std::vector<Row>* series(const std::string& symbol) const {
        auto it = series_.find(symbol);
        return it == series_.end() ? nullptr : &it->second;
    }

    std::vector<Timestamp> dates(const std::string& symbol) const {
        std::vector<Timestamp> out;
        if (const auto* group = series(symbol)) {
            out.reserve(group->size());
            for (const auto& row : *group) {
                out.push_back(row.timestamp);
            }
        }
        return out;
    }

    /**
     * @brief Tickers in lexicographic order
     */
    std::vector<std::string> symbols() const {
        std::vector<std::string> out;
        out.reserve(series_.size());
        for (const auto& entry : series_) {
            out.push_back(entry.first);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    size_t num_symbols() const {
        return series_.size();
    }

    size_t num_rows() const {
        size_t n = 0;
        for (const auto& entry : series_) {
            n += entry.second.size();
        }
        return n;
    }

    bool empty() const {
        return series_.empty();
    }

    const std::unordered_map<std::string, std::vector<Row>>& groups() const {
        return series_;
    }

private:
    void normalize(const std::string& symbol, std::vector<Row>& group) {
        std::stable_sort(group.begin(), group.end(), [](const Row& a, const Row& b) {
            return a.timestamp < b.timestamp;
        });
        std::vector<Row> unique_rows;
        unique_rows.reserve(group.size());
        size_t duplicates = 0;
        for (auto& row : group) {
            if (!unique_rows.empty() && unique_rows.back().timestamp == row.timestamp) {
                unique_rows.back() = std::move(row);
                ++duplicates;
            } else {
                unique_rows.push_back(std::move(row));
            }
        }
        if (duplicates > 0) {
            WARN("Dropped " << duplicates << " duplicate row(s) for " << symbol
                            << "; the last row per date was kept");
        }
        group = std::move(unique_rows);
    }

    std::unordered_map<std::string, std::vector<Row>> series_;
};

using PriceTable = SeriesTable<PriceBar>;

}  // namespace canslim_bt
