// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_SHARETABLEBUILDER_H
#define AREALLOC_SHARETABLEBUILDER_H

#include <string>
#include <vector>

#include "arealloc.h"
#include "model/ShareTable.h"

namespace arealloc {

struct FragmentTable;
class StratumTotals;
class ValidationReport;

/**
 * Groups fragments into strata (zone plus the selected category dimensions) and computes each
 * fragment's share of its stratum. A stratum with a zero denominator gets shares of 0 and is
 * flagged empty.
 */
class ShareTableBuilder {
  private:
    ShareMode mode_;
    std::vector<std::string> stratum_dimensions_;
    DenominatorSource denominator_;

  public:
    ShareTableBuilder(ShareMode mode, std::vector<std::string> stratum_dimensions, DenominatorSource denominator = DenominatorSource::UNITS);
    /**
     * `baseline` must be given for DenominatorSource::BASELINE. Strata without a baseline total
     * are left out and reported.
     */
    ShareTable build(const FragmentTable& fragments, ValidationReport& report, const StratumTotals* baseline = nullptr) const;
    const char* name() const { return "SHARES"; }
};

}  // namespace arealloc

#endif
