// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "output/NetCDFOutput.h"

#include <vector>

#include "AllocationRun.h"
#include "model/AllocationTable.h"
#include "model/ValidationReport.h"
#include "netcdfpp.h"
#include "options.h"
#include "settingsnode.h"
#include "version.h"

namespace arealloc {

NetCDFOutput::NetCDFOutput(const AllocationRun* run, const settings::SettingsNode& settings, const std::string& pass_name)
    : Output(run), filename_(output_filename(settings, pass_name, ".nc")) {}

NetCDFOutput::~NetCDFOutput() = default;

void NetCDFOutput::start() {
    file_ = std::make_unique<netCDF::File>(filename_, 'w');
    file_->add_attribute("settings").set<std::string>(run()->settings_string());
    file_->add_attribute("start_time").set<std::string>(AllocationRun::now());
    file_->add_attribute("max_threads").set<int>(run()->thread_count());
    file_->add_attribute("version").set<std::string>(Version::version);

    auto options_group = file_->add_group("options");
    for (const auto& option : Options::options) {
        options_group.add_attribute(option.name).set<unsigned char>(option.value ? 1 : 0);
    }
}

void NetCDFOutput::iterate(const PassResult& pass) {
    const auto& allocation = pass.result.allocation;
    const auto& request = *pass.request;

    file_->add_attribute("pass").set<std::string>(pass.name);
    file_->add_attribute("pass_type").set<std::string>(to_string(pass.type));
    file_->add_attribute("assignment").set<std::string>(to_string(request.assignment));
    file_->add_attribute("share_mode").set<std::string>(to_string(request.mode));
    file_->add_attribute("denominator").set<std::string>(to_string(request.denominator));
    file_->add_attribute("conservation").set<std::string>(to_string(request.conservation));

    // a dimension of size 0 would be unlimited
    if (allocation.rows.empty()) {
        log::warning(this, "Pass '", pass.name, "' allocated nothing, no values written to ", filename_);
    } else {
        write_values(allocation);
    }
    write_validation(pass.result.report, allocation.stratum_dimensions);
    file_->sync();
}

void NetCDFOutput::write_values(const AllocationTable& allocation) {
    const auto dim_row = file_->add_dimension("row", allocation.rows.size());

    {
        auto unit_var = file_->add_variable<std::string>("unit", {dim_row});
        auto zone_var = file_->add_variable<std::string>("zone", {dim_row});
        auto target_var = file_->add_variable<std::string>("target", {dim_row});
        std::vector<double> shares(allocation.rows.size());
        std::vector<double> values(allocation.rows.size());
        for (std::size_t i = 0; i < allocation.rows.size(); ++i) {
            const auto& row = allocation.rows[i];
            unit_var.set<std::string, 1>(row.unit_id, {i});
            zone_var.set<std::string, 1>(row.stratum.zone, {i});
            target_var.set<std::string, 1>(row.target, {i});
            shares[i] = row.share;
            values[i] = row.value;
        }
        auto share_var = file_->add_variable<double>("share", {dim_row});
        share_var.set_compression(false, compression_level_);
        share_var.set<double>(shares);
        auto value_var = file_->add_variable<double>("allocated_value", {dim_row});
        value_var.set_compression(false, compression_level_);
        value_var.set<double>(values);
    }

    if (!allocation.category_names.empty()) {
        const auto dim_category = file_->add_dimension("category", allocation.category_names.size());
        file_->add_variable<std::string>("category", {dim_category}).set<std::string>(allocation.category_names);
        auto category_var = file_->add_variable<std::string>("category_value", {dim_row, dim_category});
        for (std::size_t i = 0; i < allocation.rows.size(); ++i) {
            for (std::size_t j = 0; j < allocation.category_names.size(); ++j) {
                category_var.set<std::string, 2>(allocation.rows[i].categories[j], {i, j});
            }
        }
    }
}

void NetCDFOutput::write_validation(const ValidationReport& report, const std::vector<std::string>& stratum_dimensions) {
    const auto& checks = report.checks;
    auto group = file_->add_group("validation");
    group.add_attribute("missing_joins").set<int>(static_cast<int>(report.missing_joins.size()));
    group.add_attribute("unallocatable_totals").set<int>(static_cast<int>(report.unallocatable.size()));
    group.add_attribute("empty_strata").set<int>(static_cast<int>(report.empty_strata.size()));
    if (checks.empty()) {
        return;
    }
    const auto dim_check = group.add_dimension("check", checks.size());
    auto zone_var = group.add_variable<std::string>("zone", {dim_check});
    auto target_var = group.add_variable<std::string>("target", {dim_check});
    auto kind_var = group.add_variable<std::string>("kind", {dim_check});
    std::vector<double> expected(checks.size());
    std::vector<double> actual(checks.size());
    std::vector<double> discrepancy(checks.size());
    std::vector<unsigned char> within_tolerance(checks.size());
    for (std::size_t i = 0; i < checks.size(); ++i) {
        zone_var.set<std::string, 1>(checks[i].stratum.zone, {i});
        target_var.set<std::string, 1>(checks[i].target, {i});
        kind_var.set<const char*, 1>(to_string(checks[i].kind), {i});
        expected[i] = checks[i].expected;
        actual[i] = checks[i].actual;
        discrepancy[i] = checks[i].discrepancy;
        within_tolerance[i] = checks[i].within_tolerance ? 1 : 0;
    }
    group.add_variable<double>("expected_total", {dim_check}).set<double>(expected);
    group.add_variable<double>("actual_total", {dim_check}).set<double>(actual);
    group.add_variable<double>("discrepancy", {dim_check}).set<double>(discrepancy);
    group.add_variable<unsigned char>("within_tolerance", {dim_check}).set<unsigned char>(within_tolerance);

    if (!stratum_dimensions.empty()) {
        const auto dim_stratum_category = group.add_dimension("stratum_category", stratum_dimensions.size());
        group.add_variable<std::string>("stratum_category", {dim_stratum_category}).set<std::string>(stratum_dimensions);
        auto category_var = group.add_variable<std::string>("check_category", {dim_check, dim_stratum_category});
        for (std::size_t i = 0; i < checks.size(); ++i) {
            const auto& categories = checks[i].stratum.categories;
            for (std::size_t j = 0; j < stratum_dimensions.size() && j < categories.size(); ++j) {
                category_var.set<std::string, 2>(categories[j], {i, j});
            }
        }
    }
}

void NetCDFOutput::end() {
    file_->add_attribute("end_time").set<std::string>(AllocationRun::now());
    file_->close();
}

}  // namespace arealloc
