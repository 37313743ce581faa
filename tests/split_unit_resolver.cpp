// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/SplitUnitResolver.h"
#include "check.h"
#include "model/MembershipTable.h"
#include "model/UnitTable.h"
#include "model/ValidationReport.h"

using namespace arealloc;

static FloatType zone_total(const FragmentTable& fragments, const std::string& zone) {
    FloatType res = 0.0;
    for (const auto& fragment : fragments.rows) {
        if (fragment.zone == zone) {
            res += fragment.base_value;
        }
    }
    return res;
}

static void proportional_split() {
    UnitTable units({"sex"});
    units.add("U1", 100.0, {"f"});
    units.add("U2", 50.0, {"m"});
    MembershipTable membership;
    membership.add("U1", "A", 0.6);
    membership.add("U1", "B", 0.4);
    membership.add("U2", "B");

    ValidationReport report;
    const auto fragments = SplitUnitResolver(AssignmentPolicy::PROPORTIONAL).resolve(units, membership, report);
    CHECK(fragments.rows.size() == 3);
    CHECK(fragments.category_names == units.category_names);
    CHECK_NEAR(zone_total(fragments, "A"), 60.0, 1e-9);
    CHECK_NEAR(zone_total(fragments, "B"), 90.0, 1e-9);
    CHECK(fragments.rows[0].unit_id == "U1" && fragments.rows[0].zone == "A");
    CHECK_NEAR(fragments.rows[0].weight, 0.6, 1e-12);
    CHECK(fragments.rows[1].categories == CategoryTuple{"f"});
    CHECK(report.missing_joins.empty());
}

static void dominant_assignment() {
    UnitTable units;
    units.add("U1", 100.0);
    units.add("U2", 10.0);
    MembershipTable membership;
    membership.add("U1", "A", 0.3);
    membership.add("U1", "B", 0.7);
    membership.add("U2", "A", 0.5);
    membership.add("U2", "B", 0.5);

    ValidationReport report;
    const auto fragments = SplitUnitResolver(AssignmentPolicy::DOMINANT).resolve(units, membership, report);
    CHECK(fragments.rows.size() == 2);
    CHECK(fragments.rows[0].zone == "B");
    CHECK_NEAR(fragments.rows[0].base_value, 100.0, 1e-12);
    CHECK_NEAR(fragments.rows[0].weight, 1.0, 1e-12);
    // tie: first listed zone wins
    CHECK(fragments.rows[1].zone == "A");

    membership.set_dominant("U2", "B");
    const auto overridden = SplitUnitResolver(AssignmentPolicy::DOMINANT).resolve(units, membership, report);
    CHECK(overridden.rows[1].zone == "B");

    membership.set_dominant("U1", "C");
    CHECK_THROWS(SplitUnitResolver(AssignmentPolicy::DOMINANT).resolve(units, membership, report), integrity_error);
}

static void zero_weight_membership_is_dropped() {
    UnitTable units;
    units.add("U1", 10.0);
    MembershipTable membership;
    membership.add("U1", "A", 1.0);
    membership.add("U1", "B", 0.0);

    ValidationReport report;
    const auto fragments = SplitUnitResolver(AssignmentPolicy::PROPORTIONAL).resolve(units, membership, report);
    CHECK(fragments.rows.size() == 1);
    CHECK(fragments.rows[0].zone == "A");
}

static void invalid_weights() {
    UnitTable units;
    units.add("U1", 10.0);
    const SplitUnitResolver resolver(AssignmentPolicy::PROPORTIONAL);
    ValidationReport report;

    MembershipTable short_sum;
    short_sum.add("U1", "A", 0.5);
    short_sum.add("U1", "B", 0.3);
    CHECK_THROWS(resolver.resolve(units, short_sum, report), integrity_error);

    MembershipTable out_of_range;
    out_of_range.add("U1", "A", 1.5);
    out_of_range.add("U1", "B", -0.5);
    CHECK_THROWS(resolver.resolve(units, out_of_range, report), integrity_error);

    MembershipTable duplicate;
    duplicate.add("U1", "A", 0.5);
    CHECK_THROWS(duplicate.add("U1", "A", 0.5), integrity_error);

    // within tolerance, not renormalized
    MembershipTable rounded;
    rounded.add("U1", "A", 0.333333);
    rounded.add("U1", "B", 0.666666);
    const auto fragments = SplitUnitResolver(AssignmentPolicy::PROPORTIONAL, 1e-5, 1e-4).resolve(units, rounded, report);
    CHECK_NEAR(fragments.rows[0].base_value, 3.33333, 1e-9);
}

static void invalid_units() {
    MembershipTable membership;
    membership.add("U1", "A");
    const SplitUnitResolver resolver(AssignmentPolicy::PROPORTIONAL);
    ValidationReport report;

    UnitTable negative;
    negative.add("U1", -1.0);
    CHECK_THROWS(resolver.resolve(negative, membership, report), integrity_error);

    UnitTable conflicting({"sex"});
    conflicting.add("U1", 10.0, {"f"});
    conflicting.add("U1", 12.0, {"f"});
    CHECK_THROWS(resolver.resolve(conflicting, membership, report), integrity_error);

    UnitTable identical({"sex"});
    identical.add("U1", 10.0, {"f"});
    identical.add("U1", 10.0, {"f"});
    identical.add("U1", 5.0, {"m"});
    const auto fragments = resolver.resolve(identical, membership, report);
    CHECK(fragments.rows.size() == 2);
    CHECK_NEAR(zone_total(fragments, "A"), 15.0, 1e-12);

    UnitTable arity({"sex"});
    CHECK_THROWS(arity.add("U1", 1.0, {"f", "0-4"}), arealloc::exception);
}

static void missing_membership() {
    UnitTable units;
    units.add("U1", 10.0);
    units.add("U9", 5.0);
    MembershipTable membership;
    membership.add("U1", "A");

    ValidationReport report;
    const auto fragments = SplitUnitResolver(AssignmentPolicy::PROPORTIONAL).resolve(units, membership, report);
    CHECK(fragments.rows.size() == 1);
    CHECK(report.missing_join_count(MissingJoinKind::MEMBERSHIP) == 1);
    CHECK(report.missing_joins[0].unit_id == "U9");
}

int main() {
    proportional_split();
    dominant_assignment();
    zero_weight_membership_is_dropped();
    invalid_weights();
    invalid_units();
    missing_membership();
    std::cout << "split_unit_resolver: OK" << std::endl;
    return 0;
}
