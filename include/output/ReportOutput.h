// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_REPORTOUTPUT_H
#define AREALLOC_REPORTOUTPUT_H

#include <string>

#include "output/Output.h"

namespace arealloc {

class ReportOutput final : public Output {
  private:
    std::string filename_;
    bool violations_only_;

  public:
    ReportOutput(const AllocationRun* run, const settings::SettingsNode& settings, const std::string& pass_name);
    void iterate(const PassResult& pass) override;
    std::string name() const override { return "REPORT"; }
};

}  // namespace arealloc

#endif
