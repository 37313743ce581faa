// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "check.h"
#include "allocation/SplitUnitResolver.h"
#include "exceptions.h"
#include "input/Recoder.h"
#include "model/MembershipTable.h"
#include "model/StratumTotals.h"
#include "model/UnitTable.h"
#include "model/ValidationReport.h"

using namespace arealloc;

static CategoryRecode age_groups() {
    CategoryRecode res;
    res.bands.push_back(ValueBand{"0-4", 0, 4});
    res.bands.push_back(ValueBand{"5-9", 5, 9});
    res.bands.push_back(ValueBand{"10+", 10});
    return res;
}

static void bands() {
    const auto recode = age_groups();
    CHECK(recode.apply("0") == std::optional<std::string>("0-4"));
    CHECK(recode.apply("4") == std::optional<std::string>("0-4"));
    CHECK(recode.apply("5") == std::optional<std::string>("5-9"));
    CHECK(recode.apply("90+") == std::optional<std::string>("10+"));
    CHECK(recode.apply("5-9") == std::optional<std::string>("5-9"));
    CHECK(!recode.apply("total"));
    CHECK(!recode.apply("-3"));
}

static void mapping_and_keep() {
    CategoryRecode recode;
    recode.mapping["Female"] = "f";
    recode.mapping["Male"] = "m";
    recode.keep = {"f", "m"};
    CHECK(recode.apply("Female") == std::optional<std::string>("f"));
    CHECK(recode.apply("m") == std::optional<std::string>("m"));
    CHECK(!recode.apply("Total"));
}

static void units_collapse() {
    Recoder recoder;
    recoder.add("age", age_groups());
    CHECK(!recoder.empty());

    UnitTable units({"sex", "age"});
    units.add("U1", 1.0, {"f", "1"});
    units.add("U1", 2.0, {"f", "3"});
    units.add("U1", 4.0, {"f", "7"});
    units.add("U1", 8.0, {"f", "total"});
    units.add("U2", 5.0, {"m", "2"});
    units.add("U2", 5.0, {"m", "2"});

    const auto recoded = recoder.apply(units);
    CHECK(recoded.category_names == units.category_names);
    CHECK(recoded.size() == 3);
    CHECK(recoded.rows[0].categories[1] == "0-4");
    CHECK_NEAR(recoded.rows[0].base_value, 3.0, 1e-12);
    CHECK(recoded.rows[1].categories[1] == "5-9");
    // identical rows count once
    CHECK(recoded.rows[2].unit_id == "U2");
    CHECK_NEAR(recoded.rows[2].base_value, 5.0, 1e-12);
}

static void duplicate_beside_collapsed_row() {
    Recoder recoder;
    recoder.add("age", age_groups());

    UnitTable units({"age"});
    units.add("U1", 5.0, {"2"});
    units.add("U1", 5.0, {"2"});
    units.add("U1", 3.0, {"3"});
    const auto recoded = recoder.apply(units);
    CHECK(recoded.size() == 1);
    CHECK(recoded.rows[0].categories == CategoryTuple{"0-4"});
    CHECK_NEAR(recoded.rows[0].base_value, 8.0, 1e-12);

    MembershipTable membership;
    membership.add("U1", "Z");
    ValidationReport report;
    const auto fragments = SplitUnitResolver(AssignmentPolicy::PROPORTIONAL).resolve(recoded, membership, report);
    CHECK(fragments.rows.size() == 1);
    CHECK_NEAR(fragments.rows[0].base_value, 8.0, 1e-12);

    UnitTable conflicting({"age"});
    conflicting.add("U1", 5.0, {"2"});
    conflicting.add("U1", 6.0, {"2"});
    CHECK_THROWS(recoder.apply(conflicting), integrity_error);
}

static void totals() {
    Recoder recoder;
    recoder.add("age", age_groups());

    TargetTotals targets({"age"});
    targets.add("2030", StratumKey("A", {"0"}), 1.0);
    targets.add("2030", StratumKey("A", {"4"}), 2.0);
    targets.add("2030", StratumKey("A", {"12"}), 3.0);
    targets.add("2030", StratumKey("A", {"all"}), 6.0);
    const auto recoded = recoder.apply(targets);
    CHECK(recoded.size() == 2);
    CHECK_NEAR(*recoded.find("2030", StratumKey("A", {"0-4"})), 3.0, 1e-12);
    CHECK_NEAR(*recoded.find("2030", StratumKey("A", {"10+"})), 3.0, 1e-12);

    StratumTotals baseline({"age"});
    baseline.add(StratumKey("A", {"6"}), 2.0);
    baseline.add(StratumKey("A", {"8"}), 2.5);
    const auto recoded_baseline = recoder.apply(baseline);
    CHECK(recoded_baseline.size() == 1);
    CHECK_NEAR(*recoded_baseline.find(StratumKey("A", {"5-9"})), 4.5, 1e-12);
}

int main() {
    bands();
    mapping_and_keep();
    units_collapse();
    duplicate_beside_collapsed_row();
    totals();
    std::cout << "recoder: OK" << std::endl;
    return 0;
}
