// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_SPLITUNITRESOLVER_H
#define AREALLOC_SPLITUNITRESOLVER_H

#include "arealloc.h"
#include "model/FragmentTable.h"

namespace arealloc {

class MembershipTable;
class UnitTable;
class ValidationReport;

enum class AssignmentPolicy {
    PROPORTIONAL,  // one fragment per zone membership, scaled by its weight
    DOMINANT       // whole unit to the zone it overlaps most
};

const char* to_string(AssignmentPolicy policy);

/**
 * Expands units spanning several zones into weighted fragments.
 *
 * Conflicting or negative unit values and invalid membership weights are integrity errors.
 * Units without membership are excluded and reported. After expansion the fragments of every
 * unit must add up to the unit's value within `conservation_tolerance`.
 */
class SplitUnitResolver {
  private:
    AssignmentPolicy policy_;
    FloatType weight_tolerance_;
    FloatType conservation_tolerance_;

  public:
    explicit SplitUnitResolver(AssignmentPolicy policy, FloatType weight_tolerance = 1e-5, FloatType conservation_tolerance = 1e-5);
    FragmentTable resolve(const UnitTable& units, const MembershipTable& membership, ValidationReport& report) const;
    AssignmentPolicy policy() const { return policy_; }
    const char* name() const { return "RESOLVER"; }
};

}  // namespace arealloc

#endif
