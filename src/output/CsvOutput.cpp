// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "output/CsvOutput.h"

#include "AllocationRun.h"
#include "settingsnode.h"

namespace arealloc {

CsvOutput::CsvOutput(const AllocationRun* run, const settings::SettingsNode& settings, const std::string& pass_name)
    : Output(run), filename_(output_filename(settings, pass_name, ".csv")), delimiter_(settings["delimiter"].as<std::string>(",").at(0)) {}

void CsvOutput::iterate(const PassResult& pass) {
    const auto& allocation = pass.result.allocation;
    auto out = open_output_file(filename_);

    out << "unit_id" << delimiter_ << "zone";
    for (const auto& category : allocation.category_names) {
        out << delimiter_;
        write_field(out, category, delimiter_);
    }
    out << delimiter_ << "target" << delimiter_ << "share" << delimiter_ << "allocated_value\n";

    for (const auto& row : allocation.rows) {
        write_field(out, row.unit_id, delimiter_);
        out << delimiter_;
        write_field(out, row.stratum.zone, delimiter_);
        for (const auto& category : row.categories) {
            out << delimiter_;
            write_field(out, category, delimiter_);
        }
        out << delimiter_;
        write_field(out, row.target, delimiter_);
        out << delimiter_ << row.share << delimiter_ << row.value << '\n';
    }
    log::info(this, allocation.rows.size(), " allocated values written to ", filename_);
}

}  // namespace arealloc
