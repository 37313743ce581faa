// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "model/MembershipTable.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace arealloc {

void MembershipTable::add(const std::string& unit_id, std::string zone, FloatType weight) {
    auto& entries = entries_[unit_id];
    if (std::any_of(std::begin(entries), std::end(entries), [&zone](const MembershipEntry& e) { return e.zone == zone; })) {
        throw integrity_error("Unit '" + unit_id + "' is assigned to zone '" + zone + "' more than once");
    }
    entries.push_back(MembershipEntry{std::move(zone), weight});
}

void MembershipTable::set_dominant(const std::string& unit_id, std::string zone) { dominant_[unit_id] = std::move(zone); }

const std::vector<MembershipEntry>* MembershipTable::find(const std::string& unit_id) const {
    const auto it = entries_.find(unit_id);
    if (it == std::end(entries_)) {
        return nullptr;
    }
    return &it->second;
}

bool MembershipTable::is_split(const std::string& unit_id) const {
    const auto* entries = find(unit_id);
    return entries != nullptr && entries->size() > 1;
}

const std::string& MembershipTable::dominant_zone(const std::string& unit_id) const {
    const auto dominant = dominant_.find(unit_id);
    if (dominant != std::end(dominant_)) {
        return dominant->second;
    }
    const auto* entries = find(unit_id);
    if (entries == nullptr || entries->empty()) {
        throw log::error("Unit '", unit_id, "' has no zone membership");
    }
    // first listed entry wins ties
    const auto* res = &entries->front();
    for (const auto& entry : *entries) {
        if (entry.weight > res->weight) {
            res = &entry;
        }
    }
    return res->zone;
}

void MembershipTable::validate(FloatType tolerance) const {
    for (const auto& unit : entries_) {
        FloatType sum = 0.0;
        for (const auto& entry : unit.second) {
            if (!std::isfinite(entry.weight) || entry.weight < 0.0 || entry.weight > 1.0) {
                std::ostringstream ss;
                ss << "Unit '" << unit.first << "' has weight " << entry.weight << " for zone '" << entry.zone << "' outside [0,1]";
                throw integrity_error(ss.str());
            }
            sum += entry.weight;
        }
        if (!within(sum, 1.0, tolerance)) {
            std::ostringstream ss;
            ss << "Weights of unit '" << unit.first << "' sum to " << std::setprecision(10) << sum << " instead of 1";
            throw integrity_error(ss.str());
        }
    }
    for (const auto& dominant : dominant_) {
        const auto* entries = find(dominant.first);
        if (entries == nullptr
            || std::none_of(std::begin(*entries), std::end(*entries), [&dominant](const MembershipEntry& e) { return e.zone == dominant.second; })) {
            throw integrity_error("Dominant zone '" + dominant.second + "' of unit '" + dominant.first + "' is not one of its zones");
        }
    }
}

}  // namespace arealloc
