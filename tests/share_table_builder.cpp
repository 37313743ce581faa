// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/ShareTableBuilder.h"
#include "check.h"
#include "model/FragmentTable.h"
#include "model/StratumTotals.h"
#include "model/ValidationReport.h"

using namespace arealloc;

static FragmentTable fragments() {
    FragmentTable res;
    res.category_names = {"sex", "age"};
    res.rows.push_back(Fragment{"U1", "A", 1.0, 30.0, {"f", "0-4"}});
    res.rows.push_back(Fragment{"U2", "A", 1.0, 10.0, {"m", "0-4"}});
    res.rows.push_back(Fragment{"U3", "A", 0.5, 60.0, {"f", "5-9"}});
    res.rows.push_back(Fragment{"U3", "B", 0.5, 60.0, {"f", "5-9"}});
    res.rows.push_back(Fragment{"U4", "C", 1.0, 0.0, {"m", "5-9"}});
    return res;
}

static void magnitude_shares() {
    ValidationReport report;
    const auto shares = ShareTableBuilder(ShareMode::MAGNITUDE, {"sex"}).build(fragments(), report);
    CHECK(shares.rows.size() == 5);
    CHECK(shares.strata.size() == 4);

    const auto& af = shares.strata.at(StratumKey("A", {"f"}));
    CHECK_NEAR(af.total, 90.0, 1e-12);
    CHECK(af.rows.size() == 2);
    CHECK_NEAR(shares.rows[af.rows[0]].share, 30.0 / 90.0, 1e-12);
    CHECK_NEAR(shares.rows[af.rows[1]].share, 60.0 / 90.0, 1e-12);
    CHECK_NEAR(shares.rows[1].share, 1.0, 1e-12);

    // rows keep input order and the full category tuple
    CHECK(shares.rows[2].unit_id == "U3");
    const CategoryTuple u3{"f", "5-9"};
    CHECK(shares.rows[2].categories == u3);
    CHECK(shares.rows[2].stratum == StratumKey("A", {"f"}));

    // zero total: flagged empty, shares 0, no division
    const auto& cm = shares.strata.at(StratumKey("C", {"m"}));
    CHECK(cm.empty);
    CHECK(shares.rows[4].share == 0.0);
    CHECK(report.empty_strata.size() == 1);
    CHECK(report.empty_strata[0] == StratumKey("C", {"m"}));
}

static void count_shares() {
    ValidationReport report;
    const auto shares = ShareTableBuilder(ShareMode::COUNT, {}).build(fragments(), report);
    const auto& a = shares.strata.at(StratumKey("A", {}));
    CHECK_NEAR(a.total, 3.0, 1e-12);
    for (const auto i : a.rows) {
        CHECK_NEAR(shares.rows[i].share, 1.0 / 3.0, 1e-12);
        CHECK_NEAR(shares.rows[i].contribution, 1.0, 1e-12);
    }
    // a zero-valued unit still counts
    CHECK(!shares.strata.at(StratumKey("C", {})).empty);
    CHECK(report.empty_strata.empty());
}

static void stratum_dimensions_in_any_order() {
    ValidationReport report;
    const auto shares = ShareTableBuilder(ShareMode::MAGNITUDE, {"age", "sex"}).build(fragments(), report);
    CHECK(shares.strata.count(StratumKey("A", {"0-4", "f"})) == 1);
    CHECK_THROWS(ShareTableBuilder(ShareMode::MAGNITUDE, {"income"}).build(fragments(), report), arealloc::exception);
    CHECK_THROWS(ShareTableBuilder(ShareMode::MAGNITUDE, {"sex", "sex"}).build(fragments(), report), arealloc::exception);
}

static void baseline_denominator() {
    StratumTotals baseline({"sex"});
    baseline.add(StratumKey("A", {"f"}), 180.0);
    baseline.add(StratumKey("A", {"m"}), 10.0);
    baseline.add(StratumKey("B", {"f"}), 0.0);

    ValidationReport report;
    const ShareTableBuilder builder(ShareMode::MAGNITUDE, {"sex"}, DenominatorSource::BASELINE);
    const auto shares = builder.build(fragments(), report, &baseline);

    CHECK_NEAR(shares.rows[0].share, 30.0 / 180.0, 1e-12);
    CHECK_NEAR(shares.strata.at(StratumKey("A", {"f"})).denominator, 180.0, 1e-12);
    CHECK_NEAR(shares.strata.at(StratumKey("A", {"f"})).total, 90.0, 1e-12);
    CHECK(shares.strata.at(StratumKey("B", {"f"})).empty);

    // C/m has no baseline total
    CHECK(shares.strata.count(StratumKey("C", {"m"})) == 0);
    CHECK(shares.rows.size() == 4);
    CHECK(report.missing_join_count(MissingJoinKind::DENOMINATOR) == 1);

    CHECK_THROWS(builder.build(fragments(), report), arealloc::exception);

    StratumTotals negative({"sex"});
    negative.add(StratumKey("A", {"f"}), -1.0);
    CHECK_THROWS(builder.build(fragments(), report, &negative), integrity_error);
}

int main() {
    magnitude_shares();
    count_shares();
    stratum_dimensions_in_any_order();
    baseline_denominator();
    std::cout << "share_table_builder: OK" << std::endl;
    return 0;
}
