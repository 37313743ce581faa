// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/ConservationValidator.h"
#include "check.h"
#include "model/AllocationTable.h"
#include "model/ShareTable.h"
#include "model/StratumTotals.h"

using namespace arealloc;

static AllocationTable allocation() {
    AllocationTable res;
    res.category_names = {"sex"};
    res.stratum_dimensions = {"sex"};
    res.rows.push_back(AllocatedValue{"U1", StratumKey("A", {"f"}), {"f"}, "2020", 0.6, 60.0});
    res.rows.push_back(AllocatedValue{"U2", StratumKey("A", {"f"}), {"f"}, "2020", 0.4, 40.0});
    res.rows.push_back(AllocatedValue{"U3", StratumKey("B", {"f"}), {"f"}, "2020", 1.0, 49.0});
    res.rows.push_back(AllocatedValue{"U4", StratumKey("E", {"f"}), {"f"}, "2020", 1.0, 1.0});
    return res;
}

static TargetTotals expected() {
    TargetTotals res({"sex"});
    res.add("2020", StratumKey("A", {"f"}), 100.005);
    res.add("2020", StratumKey("B", {"f"}), 50.0);
    res.add("2020", StratumKey("D", {"f"}), 5.0);
    return res;
}

static void advisory() {
    ValidationReport report;
    const ConservationValidator validator(ConservationPolicy::ADVISORY, 1e-2);
    const auto violations = validator.validate(allocation(), expected(), report);

    CHECK(report.checks.size() == 3);
    CHECK(report.checks[0].within_tolerance);
    CHECK_NEAR(report.checks[0].discrepancy, -0.005, 1e-9);

    // B is off by one, D has nothing allocated
    CHECK(violations.size() == 2);
    CHECK(violations[0].stratum.zone == "B");
    CHECK_NEAR(violations[0].discrepancy, -1.0, 1e-12);
    CHECK(violations[1].stratum.zone == "D");
    CHECK_NEAR(violations[1].actual, 0.0, 1e-12);
    CHECK(report.violation_count(CheckKind::MAGNITUDE) == 2);
    CHECK(!report.conserved());
    CHECK_NEAR(report.max_abs_discrepancy(CheckKind::MAGNITUDE), 5.0, 1e-12);

    // E was allocated without an expected total
    CHECK(report.missing_join_count(MissingJoinKind::TARGET) == 1);
    CHECK(report.missing_joins[0].stratum.zone == "E");
}

static void strict() {
    ValidationReport report;
    const ConservationValidator validator(ConservationPolicy::STRICT, 1e-2);
    bool thrown = false;
    try {
        validator.validate(allocation(), expected(), report);
    } catch (const conservation_error& ex) {
        thrown = true;
        CHECK(ex.violations() == 2);
    }
    CHECK(thrown);
    // all checks are recorded before failing
    CHECK(report.checks.size() == 3);

    ValidationReport loose_report;
    const ConservationValidator loose(ConservationPolicy::STRICT, 10.0);
    CHECK(loose.validate(allocation(), expected(), loose_report).empty());
    CHECK(loose_report.conserved());
}

static void share_sums() {
    ShareTable shares;
    shares.category_names = {"sex"};
    shares.stratum_dimensions = {};
    shares.rows.push_back(ShareRow{"U1", StratumKey("A", {}), {"f"}, 1.0, 3.0, 0.75});
    shares.rows.push_back(ShareRow{"U2", StratumKey("A", {}), {"f"}, 1.0, 1.0, 0.25});
    shares.rows.push_back(ShareRow{"U3", StratumKey("B", {}), {"f"}, 1.0, 1.0, 0.9});
    shares.strata[StratumKey("A", {})] = StratumSummary{4.0, 4.0, false, {0, 1}};
    shares.strata[StratumKey("B", {})] = StratumSummary{1.0, 1.0, false, {2}};
    shares.strata[StratumKey("C", {})] = StratumSummary{0.0, 0.0, true, {}};

    ValidationReport report;
    // share checks never throw
    const ConservationValidator validator(ConservationPolicy::STRICT, 1e-2, 1e-3);
    const auto violations = validator.validate_shares(shares, report);
    CHECK(report.checks.size() == 2);
    CHECK(violations.size() == 1);
    CHECK(violations[0].kind == CheckKind::SHARE);
    CHECK(violations[0].stratum.zone == "B");
    CHECK(report.conserved());
    CHECK(report.violation_count(CheckKind::SHARE) == 1);

    shares.denominator = DenominatorSource::BASELINE;
    ValidationReport baseline_report;
    CHECK(validator.validate_shares(shares, baseline_report).empty());
    CHECK(baseline_report.checks.empty());
}

int main() {
    advisory();
    strict();
    share_sums();
    std::cout << "conservation_validator: OK" << std::endl;
    return 0;
}
