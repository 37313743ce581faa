// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_NETCDFOUTPUT_H
#define AREALLOC_NETCDFOUTPUT_H

#include <memory>
#include <string>
#include <vector>

#include "output/Output.h"

namespace netCDF {
class File;  // IWYU pragma: keep
}  // namespace netCDF

namespace arealloc {

struct AllocationTable;
class ValidationReport;

/**
 * Allocated values of a pass as NetCDF file: one entry per allocated value along dimension "row",
 * plus the conservation checks along dimension "check".
 */
class NetCDFOutput final : public Output {
  private:
    static constexpr auto compression_level_ = 7;
    std::string filename_;
    std::unique_ptr<netCDF::File> file_;

    void write_values(const AllocationTable& allocation);
    void write_validation(const ValidationReport& report, const std::vector<std::string>& stratum_dimensions);

  public:
    NetCDFOutput(const AllocationRun* run, const settings::SettingsNode& settings, const std::string& pass_name);
    ~NetCDFOutput() override;
    void start() override;
    void iterate(const PassResult& pass) override;
    void end() override;
    std::string name() const override { return "NETCDF"; }
};

}  // namespace arealloc

#endif
