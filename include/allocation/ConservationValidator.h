// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_CONSERVATIONVALIDATOR_H
#define AREALLOC_CONSERVATIONVALIDATOR_H

#include <vector>

#include "arealloc.h"
#include "model/ValidationReport.h"

namespace arealloc {

struct AllocationTable;
struct ShareTable;
class TargetTotals;

enum class ConservationPolicy {
    ADVISORY,  // violations are logged and reported
    STRICT     // violations throw conservation_error
};

const char* to_string(ConservationPolicy policy);

class ConservationValidator {
  private:
    ConservationPolicy policy_;
    FloatType tolerance_;
    FloatType share_tolerance_;

    void enforce(const std::vector<Discrepancy>& violations, const char* what) const;

  public:
    explicit ConservationValidator(ConservationPolicy policy, FloatType tolerance = 1e-2, FloatType share_tolerance = 1e-3);

    /**
     * Compares per-stratum sums of `allocated` with `expected`. Every checked stratum is added to
     * the report; the ones beyond tolerance are returned. An expected stratum without allocated
     * values counts as 0, an allocated stratum without expected total is reported as missing join.
     */
    std::vector<Discrepancy> validate(const AllocationTable& allocated, const TargetTotals& expected, ValidationReport& report) const;

    // shares of every non-empty stratum must add up to 1 (only if the denominator is the stratum total itself)
    std::vector<Discrepancy> validate_shares(const ShareTable& shares, ValidationReport& report) const;

    ConservationPolicy policy() const { return policy_; }
    FloatType tolerance() const { return tolerance_; }
    FloatType share_tolerance() const { return share_tolerance_; }
    const char* name() const { return "VALIDATOR"; }
};

}  // namespace arealloc

#endif
