// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/Composition.h"
#include "check.h"
#include "model/AllocationTable.h"
#include "model/ValidationReport.h"

using namespace arealloc;

static AllocationTable allocation() {
    AllocationTable res;
    res.category_names = {"sex", "income"};
    res.stratum_dimensions = {};
    res.rows.push_back(AllocatedValue{"U1", StratumKey("A", {}), {"f", "low"}, "base", 0.3, 30.0});
    res.rows.push_back(AllocatedValue{"U2", StratumKey("A", {}), {"m", "low"}, "base", 0.5, 50.0});
    res.rows.push_back(AllocatedValue{"U3", StratumKey("A", {}), {"f", "high"}, "base", 0.2, 20.0});
    res.rows.push_back(AllocatedValue{"U4", StratumKey("B", {}), {"m", "high"}, "base", 1.0, 8.0});
    res.rows.push_back(AllocatedValue{"U5", StratumKey("C", {}), {"m", "low"}, "base", 0.0, 0.0});
    return res;
}

static void zone_makeup() {
    const auto composition = compose(allocation(), "sex");
    CHECK(composition.dimension == "sex");
    CHECK(composition.rows.size() == 4);

    CHECK(composition.rows[0].zone == "A" && composition.rows[0].category == "f");
    CHECK_NEAR(composition.rows[0].value, 50.0, 1e-12);
    CHECK_NEAR(composition.rows[0].zone_total, 100.0, 1e-12);
    CHECK_NEAR(composition.rows[0].percentage(), 50.0, 1e-9);
    CHECK(composition.rows[2].zone == "B");
    CHECK_NEAR(composition.rows[2].proportion, 1.0, 1e-12);
    // zero total zone: proportion 0 instead of division by zero
    CHECK(composition.rows[3].zone == "C");
    CHECK(composition.rows[3].proportion == 0.0);

    ValidationReport report;
    CHECK(check_composition(composition, 1e-3, report).empty());
    CHECK(report.checks.size() == 2);
    CHECK(report.checks[0].kind == CheckKind::SHARE);
    CHECK(report.checks[0].target == "sex");

    CHECK_THROWS(compose(allocation(), "age"), arealloc::exception);
}

static void comparison() {
    const auto by_sex = compose(allocation(), "sex");
    const auto by_income = compose(allocation(), "income");
    const auto table = compare({{"split", &by_sex}, {"income", &by_income}});

    CHECK(table.columns.size() == 4);
    CHECK(table.columns[0] == "f_split");
    CHECK(table.columns[1] == "m_split");
    CHECK(table.columns[2] == "high_income");
    CHECK(table.columns[3] == "low_income");
    CHECK(table.zones.size() == 3);
    CHECK(table.zones[1] == "B");

    // B has no female value
    CHECK(table.values[1][0] == 0.0);
    CHECK_NEAR(table.values[1][1], 100.0, 1e-9);
    CHECK_NEAR(table.values[0][2], 20.0, 1e-9);
    CHECK_NEAR(table.values[0][3], 80.0, 1e-9);
}

int main() {
    zone_makeup();
    comparison();
    std::cout << "composition: OK" << std::endl;
    return 0;
}
