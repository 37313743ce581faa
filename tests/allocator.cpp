// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/Allocator.h"
#include "allocation/ShareTableBuilder.h"
#include "check.h"
#include "model/FragmentTable.h"
#include "model/StratumTotals.h"
#include "model/ValidationReport.h"

using namespace arealloc;

static ShareTable shares(ValidationReport& report) {
    FragmentTable fragments;
    fragments.category_names = {"sex"};
    fragments.rows.push_back(Fragment{"U1", "A", 1.0, 60.0, {"f"}});
    fragments.rows.push_back(Fragment{"U2", "A", 1.0, 40.0, {"f"}});
    fragments.rows.push_back(Fragment{"U3", "B", 1.0, 20.0, {"m"}});
    fragments.rows.push_back(Fragment{"U4", "C", 1.0, 0.0, {"f"}});
    return ShareTableBuilder(ShareMode::MAGNITUDE, {"sex"}).build(fragments, report);
}

static void distributes_targets() {
    ValidationReport report;
    const auto table = shares(report);

    TargetTotals targets({"sex"});
    targets.add("2030", StratumKey("A", {"f"}), 500.0);
    targets.add("2020", StratumKey("A", {"f"}), 200.0);
    targets.add("2020", StratumKey("B", {"m"}), 10.0);

    const auto allocation = Allocator().allocate(table, targets, report);
    const auto sums = allocation.sums();
    CHECK_NEAR(sums.at(TargetKey("2020", StratumKey("A", {"f"}))), 200.0, 1e-9);
    CHECK_NEAR(sums.at(TargetKey("2030", StratumKey("A", {"f"}))), 500.0, 1e-9);
    CHECK_NEAR(sums.at(TargetKey("2020", StratumKey("B", {"m"}))), 10.0, 1e-9);

    // targets in lexical order, strata in key order, units in input order
    CHECK(allocation.rows.size() == 5);
    CHECK(allocation.rows[0].target == "2020" && allocation.rows[0].unit_id == "U1");
    CHECK_NEAR(allocation.rows[0].value, 120.0, 1e-9);
    CHECK_NEAR(allocation.rows[1].value, 80.0, 1e-9);
    CHECK(allocation.rows[2].unit_id == "U3");
    CHECK(allocation.rows[3].target == "2030");
    CHECK_NEAR(allocation.rows[3].share, 0.6, 1e-12);

    // B/m has no total for 2030
    CHECK(report.missing_join_count(MissingJoinKind::TARGET) == 1);
    CHECK(report.missing_joins.back().stratum == StratumKey("B", {"m"}));
    CHECK(report.missing_joins.back().target == "2030");
}

static void unallocatable_totals() {
    ValidationReport report;
    const auto table = shares(report);

    TargetTotals targets({"sex"});
    targets.add("2020", StratumKey("A", {"f"}), 100.0);
    targets.add("2020", StratumKey("B", {"m"}), 20.0);
    targets.add("2020", StratumKey("C", {"f"}), 7.0);  // empty stratum
    targets.add("2020", StratumKey("D", {"f"}), 3.0);  // no units at all

    const auto allocation = Allocator().allocate(table, targets, report);
    CHECK(report.unallocatable.size() == 2);
    CHECK(report.unallocatable[0].stratum == StratumKey("C", {"f"}));
    CHECK_NEAR(report.unallocatable[0].total, 7.0, 1e-12);
    CHECK(report.unallocatable[1].stratum == StratumKey("D", {"f"}));
    CHECK_NEAR(allocation.total(), 120.0, 1e-9);
    for (const auto& row : allocation.rows) {
        CHECK(row.stratum.zone != "C");
    }
}

static void empty_target_table() {
    ValidationReport report;
    const auto table = shares(report);

    const auto allocation = Allocator().allocate(table, TargetTotals({"sex"}), report);
    CHECK(allocation.rows.empty());
    // every allocatable stratum is reported, the empty stratum C/f is not
    CHECK(report.missing_join_count(MissingJoinKind::TARGET) == 2);
    CHECK(report.missing_joins[0].stratum == StratumKey("A", {"f"}));
    CHECK(report.missing_joins[1].stratum == StratumKey("B", {"m"}));
}

static void targets_with_other_category_order() {
    FragmentTable fragments;
    fragments.category_names = {"sex", "age"};
    fragments.rows.push_back(Fragment{"U1", "A", 1.0, 1.0, {"f", "0-4"}});
    fragments.rows.push_back(Fragment{"U2", "A", 1.0, 3.0, {"f", "0-4"}});
    ValidationReport report;
    const auto table = ShareTableBuilder(ShareMode::MAGNITUDE, {"sex", "age"}).build(fragments, report);

    TargetTotals targets({"age", "sex"});
    targets.add("2020", StratumKey("A", {"0-4", "f"}), 8.0);
    const auto allocation = Allocator().allocate(table, targets, report);
    CHECK(allocation.rows.size() == 2);
    CHECK_NEAR(allocation.rows[0].value, 2.0, 1e-12);
    CHECK_NEAR(allocation.rows[1].value, 6.0, 1e-12);
}

static void self_reallocation() {
    ValidationReport report;
    const auto table = shares(report);
    const Allocator allocator;

    const auto allocation = allocator.allocate_self(table, "base");
    CHECK(allocation.rows.size() == 3);
    CHECK_NEAR(allocation.rows[0].value, 60.0, 1e-12);
    CHECK_NEAR(allocation.rows[1].value, 40.0, 1e-12);
    CHECK_NEAR(allocation.rows[2].value, 20.0, 1e-12);
    CHECK(allocation.rows[0].target == "base");

    const auto totals = allocator.self_totals(table, "base");
    CHECK(totals.size() == 2);
    CHECK_NEAR(*totals.find("base", StratumKey("A", {"f"})), 100.0, 1e-12);
    CHECK(totals.find("base", StratumKey("C", {"f"})) == nullptr);
}

int main() {
    distributes_targets();
    unallocatable_totals();
    empty_target_table();
    targets_with_other_category_order();
    self_reallocation();
    std::cout << "allocator: OK" << std::endl;
    return 0;
}
