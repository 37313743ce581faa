// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_CSVOUTPUT_H
#define AREALLOC_CSVOUTPUT_H

#include <string>

#include "output/Output.h"

namespace arealloc {

// allocated values of one pass: unit, zone, categories, target, share, value
class CsvOutput final : public Output {
  private:
    std::string filename_;
    char delimiter_;

  public:
    CsvOutput(const AllocationRun* run, const settings::SettingsNode& settings, const std::string& pass_name);
    void iterate(const PassResult& pass) override;
    std::string name() const override { return "CSV"; }
};

}  // namespace arealloc

#endif
