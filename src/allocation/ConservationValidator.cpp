// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/ConservationValidator.h"

#include <sstream>

#include "model/AllocationTable.h"
#include "model/ShareTable.h"
#include "model/StratumTotals.h"

namespace arealloc {

const char* to_string(ConservationPolicy policy) {
    switch (policy) {
        case ConservationPolicy::ADVISORY:
            return "advisory";
        case ConservationPolicy::STRICT:
            return "strict";
    }
    return "unknown";
}

ConservationValidator::ConservationValidator(ConservationPolicy policy, FloatType tolerance, FloatType share_tolerance)
    : policy_(policy), tolerance_(tolerance), share_tolerance_(share_tolerance) {}

void ConservationValidator::enforce(const std::vector<Discrepancy>& violations, const char* what) const {
    if (violations.empty()) {
        return;
    }
    switch (policy_) {
        case ConservationPolicy::STRICT: {
            std::ostringstream ss;
            ss << violations.size() << " " << what << " not conserved:";
            for (const auto& d : violations) {
                ss << "\n  " << d;
            }
            throw conservation_error(ss.str(), violations.size());
        }
        case ConservationPolicy::ADVISORY:
            for (const auto& d : violations) {
                log::warning(this, what, " not conserved for ", d);
            }
            break;
    }
}

std::vector<Discrepancy> ConservationValidator::validate(const AllocationTable& allocated, const TargetTotals& expected_p, ValidationReport& report) const {
    const auto expected = expected_p.reordered(allocated.stratum_dimensions);
    const auto sums = allocated.sums();

    std::vector<Discrepancy> violations;
    for (const auto& total : expected.totals) {
        const auto sum = sums.find(total.first);
        const FloatType actual = sum == std::end(sums) ? 0.0 : sum->second;
        const FloatType discrepancy = actual - total.second;
        Discrepancy d{CheckKind::MAGNITUDE, total.first.stratum, total.first.target, total.second, actual, discrepancy, within(actual, total.second, tolerance_)};
        if (!d.within_tolerance) {
            violations.push_back(d);
        }
        report.checks.push_back(std::move(d));
    }
    for (const auto& sum : sums) {
        if (expected.totals.find(sum.first) == std::end(expected.totals)) {
            report.missing_joins.push_back(MissingJoin{MissingJoinKind::TARGET, {}, sum.first.stratum, sum.first.target});
        }
    }

    log::info(this, expected.size(), " strata checked, ", violations.size(), " beyond tolerance ", tolerance_);
    enforce(violations, "stratum totals");
    return violations;
}

std::vector<Discrepancy> ConservationValidator::validate_shares(const ShareTable& shares, ValidationReport& report) const {
    std::vector<Discrepancy> violations;
    if (shares.denominator != DenominatorSource::UNITS) {
        return violations;
    }
    for (const auto& stratum : shares.strata) {
        if (stratum.second.empty) {
            continue;
        }
        FloatType sum = 0.0;
        for (const auto row_index : stratum.second.rows) {
            sum += shares.rows[row_index].share;
        }
        Discrepancy d{CheckKind::SHARE, stratum.first, {}, 1.0, sum, sum - 1.0, within(sum, 1.0, share_tolerance_)};
        if (!d.within_tolerance) {
            violations.push_back(d);
        }
        report.checks.push_back(std::move(d));
    }
    // advisory only, regardless of policy
    for (const auto& d : violations) {
        log::warning(this, "shares do not sum to 1 for ", d);
    }
    return violations;
}

}  // namespace arealloc
