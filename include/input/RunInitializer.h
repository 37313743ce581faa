// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_RUNINITIALIZER_H
#define AREALLOC_RUNINITIALIZER_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "arealloc.h"
#include "input/Recoder.h"
#include "model/MembershipTable.h"
#include "model/StratumTotals.h"
#include "model/UnitTable.h"
#include "model/ValidationReport.h"

namespace settings {
class SettingsNode;
}  // namespace settings

namespace arealloc {

class CsvTable;

/**
 * Reads the input tables named in the settings: units (optionally joined with attribute columns),
 * zone membership (from a table or from unit-id prefix rules), target totals and baseline totals,
 * all passed through the configured category recodes.
 */
class RunInitializer {
  private:
    const settings::SettingsNode& settings_;
    Recoder recoder_;
    UnitTable units_;
    MembershipTable membership_;
    std::unique_ptr<TargetTotals> targets_;
    std::unique_ptr<StratumTotals> baseline_;
    ValidationReport report_;
    FloatType membership_tolerance_ = 1e-5;

  private:
    void read_recodes(const settings::SettingsNode& recode_node);
    void read_units(const settings::SettingsNode& units_node);
    void join_attributes(const settings::SettingsNode& attributes_node);
    void read_membership_table(const settings::SettingsNode& membership_node);
    void apply_membership_rules(const settings::SettingsNode& rules_node);
    void read_targets(const settings::SettingsNode& targets_node);
    void read_baseline(const settings::SettingsNode& baseline_node);

  public:
    explicit RunInitializer(const settings::SettingsNode& settings_p);
    void initialize();

    const UnitTable& units() const { return units_; }
    const MembershipTable& membership() const { return membership_; }
    const TargetTotals* targets() const { return targets_.get(); }
    const StratumTotals* baseline() const { return baseline_.get(); }
    // joins that failed while reading, e.g. units without attributes
    const ValidationReport& report() const { return report_; }
    FloatType membership_tolerance() const { return membership_tolerance_; }
    const char* name() const { return "INITIALIZER"; }
};

std::vector<std::string> read_strings(const settings::SettingsNode& node);
std::map<std::string, std::string> read_string_map(const settings::SettingsNode& node);

}  // namespace arealloc

#endif
