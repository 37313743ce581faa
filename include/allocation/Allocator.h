// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_ALLOCATOR_H
#define AREALLOC_ALLOCATOR_H

#include <string>

#include "arealloc.h"
#include "model/AllocationTable.h"

namespace arealloc {

struct ShareTable;
class TargetTotals;
class ValidationReport;

class Allocator {
  public:
    /**
     * Distributes every target total onto the units of its stratum according to their shares.
     * Strata without a target total are skipped and reported, target totals without contributing
     * units are reported as unallocatable. Nothing is defaulted to zero.
     */
    AllocationTable allocate(const ShareTable& shares, const TargetTotals& targets, ValidationReport& report) const;

    // identity pass: every stratum is reallocated onto itself, labelled `target`
    AllocationTable allocate_self(const ShareTable& shares, const std::string& target) const;

    // the totals allocate_self distributes, i.e. the per-stratum sums of all non-empty strata
    TargetTotals self_totals(const ShareTable& shares, const std::string& target) const;

    const char* name() const { return "ALLOCATOR"; }
};

}  // namespace arealloc

#endif
