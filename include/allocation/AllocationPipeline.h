// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_ALLOCATIONPIPELINE_H
#define AREALLOC_ALLOCATIONPIPELINE_H

#include <string>
#include <vector>

#include "allocation/ConservationValidator.h"
#include "allocation/SplitUnitResolver.h"
#include "arealloc.h"
#include "model/AllocationTable.h"
#include "model/FragmentTable.h"
#include "model/ShareTable.h"
#include "model/StratumTotals.h"
#include "model/ValidationReport.h"

namespace arealloc {

class MembershipTable;
class UnitTable;

struct AllocationRequest {
    AssignmentPolicy assignment = AssignmentPolicy::PROPORTIONAL;
    ShareMode mode = ShareMode::MAGNITUDE;
    std::vector<std::string> stratum_dimensions;
    DenominatorSource denominator = DenominatorSource::UNITS;
    std::string target_label = "base";  // target-axis value of a self-reallocation
    FloatType membership_tolerance = 1e-5;
    FloatType tolerance = 1e-2;
    FloatType share_tolerance = 1e-3;
    ConservationPolicy conservation = ConservationPolicy::ADVISORY;
};

struct AllocationResult {
    FragmentTable fragments;
    ShareTable shares;
    TargetTotals expected;
    AllocationTable allocation;
    ValidationReport report;
};

/**
 * Runs resolver, share builder, allocator and validator strictly one after the other. Without
 * target totals every stratum is reallocated onto itself.
 */
class AllocationPipeline {
  private:
    AllocationRequest request_;

  public:
    explicit AllocationPipeline(AllocationRequest request);
    AllocationResult run(const UnitTable& units,
                         const MembershipTable& membership,
                         const TargetTotals* targets = nullptr,
                         const StratumTotals* baseline = nullptr) const;
    const AllocationRequest& request() const { return request_; }
    const char* name() const { return "PIPELINE"; }
};

}  // namespace arealloc

#endif
