// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "output/ReportOutput.h"

#include "AllocationRun.h"
#include "settingsnode.h"

namespace arealloc {

ReportOutput::ReportOutput(const AllocationRun* run, const settings::SettingsNode& settings, const std::string& pass_name)
    : Output(run), filename_(output_filename(settings, pass_name, "_report.csv")), violations_only_(settings["violations_only"].as<bool>(false)) {}

static void write_key(std::ostream& out, const StratumKey& stratum, const std::string& target, const std::string& unit_id) {
    write_field(out, stratum.zone);
    out << ',';
    std::string categories;
    for (std::size_t i = 0; i < stratum.categories.size(); ++i) {
        if (i > 0) {
            categories += '|';
        }
        categories += stratum.categories[i];
    }
    write_field(out, categories);
    out << ',';
    write_field(out, target);
    out << ',';
    write_field(out, unit_id);
    out << ',';
}

void ReportOutput::iterate(const PassResult& pass) {
    const auto& report = pass.result.report;
    auto out = open_output_file(filename_);

    out << "type,zone,categories,target,unit_id,expected_total,actual_total,discrepancy,within_tolerance\n";
    for (const auto& check : report.checks) {
        if (violations_only_ && check.within_tolerance) {
            continue;
        }
        out << to_string(check.kind) << ',';
        write_key(out, check.stratum, check.target, "");
        out << check.expected << ',' << check.actual << ',' << check.discrepancy << ',' << (check.within_tolerance ? "true" : "false") << '\n';
    }
    for (const auto& missing : report.missing_joins) {
        out << "missing_" << to_string(missing.kind) << ',';
        write_key(out, missing.stratum, missing.target, missing.unit_id);
        out << ",,,\n";
    }
    for (const auto& total : report.unallocatable) {
        out << "unallocatable,";
        write_key(out, total.stratum, total.target, "");
        out << total.total << ",,,\n";
    }
    for (const auto& stratum : report.empty_strata) {
        out << "empty,";
        write_key(out, stratum, "", "");
        out << ",,,\n";
    }
    log::info(this, "Validation report of pass '", pass.name, "' written to ", filename_);
}

}  // namespace arealloc
