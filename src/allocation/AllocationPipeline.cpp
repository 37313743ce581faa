// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/AllocationPipeline.h"

#include "allocation/Allocator.h"
#include "allocation/ShareTableBuilder.h"

namespace arealloc {

AllocationPipeline::AllocationPipeline(AllocationRequest request) : request_(std::move(request)) {}

AllocationResult AllocationPipeline::run(const UnitTable& units, const MembershipTable& membership, const TargetTotals* targets, const StratumTotals* baseline) const {
    AllocationResult res;

    const SplitUnitResolver resolver(request_.assignment, request_.membership_tolerance);
    res.fragments = resolver.resolve(units, membership, res.report);

    const ShareTableBuilder builder(request_.mode, request_.stratum_dimensions, request_.denominator);
    res.shares = builder.build(res.fragments, res.report, baseline);

    const ConservationValidator validator(request_.conservation, request_.tolerance, request_.share_tolerance);
    validator.validate_shares(res.shares, res.report);

    const Allocator allocator;
    if (targets == nullptr) {
        res.allocation = allocator.allocate_self(res.shares, request_.target_label);
        res.expected = allocator.self_totals(res.shares, request_.target_label);
    } else {
        const auto reordered = targets->reordered(request_.stratum_dimensions);
        res.allocation = allocator.allocate(res.shares, reordered, res.report);
        // unallocatable totals are reported separately and not expected to be met
        res.expected = TargetTotals(request_.stratum_dimensions);
        for (const auto& total : reordered.totals) {
            const auto stratum = res.shares.strata.find(total.first.stratum);
            if (stratum != std::end(res.shares.strata) && !stratum->second.empty) {
                res.expected.add(total.first.target, total.first.stratum, total.second);
            }
        }
    }

    validator.validate(res.allocation, res.expected, res.report);
    return res;
}

}  // namespace arealloc
