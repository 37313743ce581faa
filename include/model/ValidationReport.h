// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_VALIDATIONREPORT_H
#define AREALLOC_VALIDATIONREPORT_H

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "arealloc.h"
#include "model/StratumKey.h"

namespace arealloc {

enum class CheckKind {
    MAGNITUDE,  // allocated sum against expected total
    SHARE       // sum of shares or proportions against 1
};

enum class MissingJoinKind {
    MEMBERSHIP,   // unit without zone membership
    ATTRIBUTE,    // unit without joined attribute row
    TARGET,       // stratum without target total
    DENOMINATOR,  // stratum without baseline total
};

const char* to_string(CheckKind kind);
const char* to_string(MissingJoinKind kind);

struct Discrepancy {
    CheckKind kind;
    StratumKey stratum;
    std::string target;
    FloatType expected;
    FloatType actual;
    FloatType discrepancy;  // actual - expected
    bool within_tolerance;

    friend std::ostream& operator<<(std::ostream& os, const Discrepancy& d);
};

struct MissingJoin {
    MissingJoinKind kind;
    std::string unit_id;  // set for unit-level joins
    StratumKey stratum;   // set for stratum-level joins
    std::string target;
};

// target total with no contributing unit in its stratum
struct UnallocatableTotal {
    StratumKey stratum;
    std::string target;
    FloatType total;
};

/**
 * Issues collected by the allocation stages. Fatal conditions are thrown instead
 * (integrity_error, conservation_error); everything here accompanies a result.
 */
class ValidationReport {
  public:
    std::vector<Discrepancy> checks;
    std::vector<MissingJoin> missing_joins;
    std::vector<UnallocatableTotal> unallocatable;
    std::vector<StratumKey> empty_strata;

  public:
    void merge(const ValidationReport& other);
    std::size_t violation_count() const;
    std::size_t violation_count(CheckKind kind) const;
    std::size_t missing_join_count(MissingJoinKind kind) const;
    bool conserved() const { return violation_count(CheckKind::MAGNITUDE) == 0; }
    FloatType max_abs_discrepancy(CheckKind kind) const;
    void summarize(std::ostream& os) const;
};

}  // namespace arealloc

#endif
