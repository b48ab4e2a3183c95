// include/canslim_bt/data/universe_snapshot.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include "canslim_bt/core/types.hpp"

namespace canslim_bt {

/**
 * @brief Dated membership lists of the selectable universe (e.g. index members)
 *
 * Membership on a query date is the most recent snapshot dated on or before
 * it; between snapshot dates the membership carries forward unchanged.
 */
class UniverseSnapshot {
public:
    UniverseSnapshot() = default;

    /**
     * @brief Record the members for a date, replacing any earlier list for that date
     * Members are deduplicated and sorted.
     */
    void set_members(const Timestamp& date, std::vector<std::string> members);

    /**
     * @brief Members in force on `date`
     * @return Empty list (with a warning) when no snapshot precedes the date
     */
    std::vector<std::string> members_as_of(const Timestamp& date) const;

    bool is_member(const std::string& symbol, const Timestamp& date) const;

    /**
     * @brief Dates on which membership can change
     */
    std::vector<Timestamp> snapshot_dates() const;

    bool empty() const {
        return snapshots_.empty();
    }

    size_t size() const {
        return snapshots_.size();
    }

    /**
     * @brief Split a delimited ticker list, trimming blanks and dropping empties
     */
    static std::vector<std::string> parse_members(const std::string& text, char delimiter = ',');

private:
    const std::vector<std::string>* lookup(const Timestamp& date) const;

    std::map<Timestamp, std::vector<std::string>> snapshots_;
};

}  // namespace canslim_bt
