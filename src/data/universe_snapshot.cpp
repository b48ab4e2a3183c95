// src/data/universe_snapshot.cpp

#include "canslim_bt/data/universe_snapshot.hpp"
#include <algorithm>
#include <sstream>
#include "canslim_bt/core/logger.hpp"
#include "canslim_bt/core/time_utils.hpp"

namespace canslim_bt {

void UniverseSnapshot::set_members(const Timestamp& date, std::vector<std::string> members) {
    std::sort(members.begin(), members.end());
    members.erase(std::unique(members.begin(), members.end()), members.end());
    if (members.empty()) {
        WARN("Empty universe snapshot on " << core::format_date(date));
    }
    snapshots_[core::floor_to_day(date)] = std::move(members);
}

const std::vector<std::string>* UniverseSnapshot::lookup(const Timestamp& date) const {
    auto it = snapshots_.upper_bound(core::floor_to_day(date));
    if (it == snapshots_.begin()) {
        return nullptr;
    }
    return &std::prev(it)->second;
}

std::vector<std::string> UniverseSnapshot::members_as_of(const Timestamp& date) const {
    const auto* members = lookup(date);
    if (!members) {
        WARN("No universe snapshot on or before " << core::format_date(date));
        return {};
    }
    return *members;
}

bool UniverseSnapshot::is_member(const std::string& symbol, const Timestamp& date) const {
    const auto* members = lookup(date);
    if (!members) {
        return false;
    }
    return std::binary_search(members->begin(), members->end(), symbol);
}

std::vector<Timestamp> UniverseSnapshot::snapshot_dates() const {
    std::vector<Timestamp> dates;
    dates.reserve(snapshots_.size());
    for (const auto& entry : snapshots_) {
        dates.push_back(entry.first);
    }
    return dates;
}

std::vector<std::string> UniverseSnapshot::parse_members(const std::string& text,
                                                         char delimiter) {
    std::vector<std::string> out;
    std::istringstream ss(text);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        auto begin = token.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            continue;
        }
        auto end = token.find_last_not_of(" \t\r\n");
        out.push_back(token.substr(begin, end - begin + 1));
    }
    return out;
}

}  // namespace canslim_bt
