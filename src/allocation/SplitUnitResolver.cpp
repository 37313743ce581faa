// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/SplitUnitResolver.h"

#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <utility>

#include "model/MembershipTable.h"
#include "model/UnitTable.h"
#include "model/ValidationReport.h"

namespace arealloc {

const char* to_string(AssignmentPolicy policy) {
    switch (policy) {
        case AssignmentPolicy::PROPORTIONAL:
            return "proportional";
        case AssignmentPolicy::DOMINANT:
            return "dominant";
    }
    return "unknown";
}

SplitUnitResolver::SplitUnitResolver(AssignmentPolicy policy, FloatType weight_tolerance, FloatType conservation_tolerance)
    : policy_(policy), weight_tolerance_(weight_tolerance), conservation_tolerance_(conservation_tolerance) {}

FragmentTable SplitUnitResolver::resolve(const UnitTable& units, const MembershipTable& membership, ValidationReport& report) const {
    membership.validate(weight_tolerance_);

    FragmentTable res;
    res.category_names = units.category_names;
    res.rows.reserve(units.size());

    std::map<std::pair<std::string, CategoryTuple>, FloatType> seen;
    std::set<std::string> missing;
    std::map<std::string, std::pair<FloatType, FloatType>> sums;  // unit_id -> (original, fragments)
    std::size_t duplicates = 0;

    for (const auto& unit : units.rows) {
        if (!std::isfinite(unit.base_value) || unit.base_value < 0.0) {
            std::ostringstream ss;
            ss << "Unit '" << unit.unit_id << "' " << to_string(unit.categories) << " has invalid value " << unit.base_value;
            throw integrity_error(ss.str());
        }

        const auto inserted = seen.emplace(std::make_pair(unit.unit_id, unit.categories), unit.base_value);
        if (!inserted.second) {
            if (inserted.first->second != unit.base_value) {
                std::ostringstream ss;
                ss << std::setprecision(12) << "Unit '" << unit.unit_id << "' " << to_string(unit.categories) << " has conflicting values "
                   << inserted.first->second << " and " << unit.base_value;
                throw integrity_error(ss.str());
            }
            ++duplicates;
            continue;
        }

        const auto* entries = membership.find(unit.unit_id);
        if (entries == nullptr) {
            if (missing.insert(unit.unit_id).second) {
                report.missing_joins.push_back(MissingJoin{MissingJoinKind::MEMBERSHIP, unit.unit_id, {}, {}});
            }
            continue;
        }

        auto& sum = sums[unit.unit_id];
        sum.first += unit.base_value;
        switch (policy_) {
            case AssignmentPolicy::DOMINANT:
                res.rows.push_back(Fragment{unit.unit_id, membership.dominant_zone(unit.unit_id), 1.0, unit.base_value, unit.categories});
                sum.second += unit.base_value;
                break;
            case AssignmentPolicy::PROPORTIONAL:
                for (const auto& entry : *entries) {
                    if (entry.weight <= 0.0) {
                        continue;  // carries no quantity
                    }
                    const FloatType value = unit.base_value * entry.weight;
                    res.rows.push_back(Fragment{unit.unit_id, entry.zone, entry.weight, value, unit.categories});
                    sum.second += value;
                }
                break;
        }
    }

    if (duplicates > 0) {
        log::warning(this, duplicates, " duplicate unit rows ignored");
    }
    if (!missing.empty()) {
        log::warning(this, missing.size(), " units without zone membership excluded");
    }

    for (const auto& sum : sums) {
        if (!within(sum.second.second, sum.second.first, conservation_tolerance_)) {
            std::ostringstream ss;
            ss << std::setprecision(12) << "Fragments of unit '" << sum.first << "' sum to " << sum.second.second << " instead of " << sum.second.first;
            throw integrity_error(ss.str());
        }
    }

    log::info(this, units.size(), " unit rows resolved into ", res.rows.size(), " fragments (", to_string(policy_), ")");
    return res;
}

}  // namespace arealloc
