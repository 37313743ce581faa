// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "model/ValidationReport.h"

#include <algorithm>
#include <iomanip>

namespace arealloc {

const char* to_string(CheckKind kind) {
    switch (kind) {
        case CheckKind::MAGNITUDE:
            return "magnitude";
        case CheckKind::SHARE:
            return "share";
    }
    return "unknown";
}

const char* to_string(MissingJoinKind kind) {
    switch (kind) {
        case MissingJoinKind::MEMBERSHIP:
            return "membership";
        case MissingJoinKind::ATTRIBUTE:
            return "attribute";
        case MissingJoinKind::TARGET:
            return "target";
        case MissingJoinKind::DENOMINATOR:
            return "denominator";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Discrepancy& d) {
    os << d.stratum;
    if (!d.target.empty()) {
        os << " @ " << d.target;
    }
    return os << ": expected " << std::setprecision(12) << d.expected << ", got " << d.actual << " (" << std::showpos << d.discrepancy << std::noshowpos
              << ")";
}

void ValidationReport::merge(const ValidationReport& other) {
    checks.insert(std::end(checks), std::begin(other.checks), std::end(other.checks));
    missing_joins.insert(std::end(missing_joins), std::begin(other.missing_joins), std::end(other.missing_joins));
    unallocatable.insert(std::end(unallocatable), std::begin(other.unallocatable), std::end(other.unallocatable));
    empty_strata.insert(std::end(empty_strata), std::begin(other.empty_strata), std::end(other.empty_strata));
}

std::size_t ValidationReport::violation_count() const {
    return std::count_if(std::begin(checks), std::end(checks), [](const Discrepancy& d) { return !d.within_tolerance; });
}

std::size_t ValidationReport::violation_count(CheckKind kind) const {
    return std::count_if(std::begin(checks), std::end(checks), [kind](const Discrepancy& d) { return d.kind == kind && !d.within_tolerance; });
}

std::size_t ValidationReport::missing_join_count(MissingJoinKind kind) const {
    return std::count_if(std::begin(missing_joins), std::end(missing_joins), [kind](const MissingJoin& m) { return m.kind == kind; });
}

FloatType ValidationReport::max_abs_discrepancy(CheckKind kind) const {
    FloatType res = 0.0;
    for (const auto& d : checks) {
        if (d.kind == kind) {
            res = std::max(res, std::abs(d.discrepancy));
        }
    }
    return res;
}

void ValidationReport::summarize(std::ostream& os) const {
    os << "Checked strata:        " << std::count_if(std::begin(checks), std::end(checks), [](const Discrepancy& d) { return d.kind == CheckKind::MAGNITUDE; })
       << " (" << violation_count(CheckKind::MAGNITUDE) << " beyond tolerance, max |discrepancy| " << max_abs_discrepancy(CheckKind::MAGNITUDE) << ")\n"
       << "Share checks:          " << std::count_if(std::begin(checks), std::end(checks), [](const Discrepancy& d) { return d.kind == CheckKind::SHARE; })
       << " (" << violation_count(CheckKind::SHARE) << " beyond tolerance)\n"
       << "Missing memberships:   " << missing_join_count(MissingJoinKind::MEMBERSHIP) << "\n"
       << "Missing attributes:    " << missing_join_count(MissingJoinKind::ATTRIBUTE) << "\n"
       << "Missing targets:       " << missing_join_count(MissingJoinKind::TARGET) << "\n"
       << "Missing denominators:  " << missing_join_count(MissingJoinKind::DENOMINATOR) << "\n"
       << "Unallocatable totals:  " << unallocatable.size() << "\n"
       << "Empty strata:          " << empty_strata.size() << "\n";
}

}  // namespace arealloc
