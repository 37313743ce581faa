// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_COMPARISONOUTPUT_H
#define AREALLOC_COMPARISONOUTPUT_H

#include <map>
#include <string>
#include <vector>

#include "allocation/Composition.h"
#include "output/Output.h"

namespace arealloc {

// side-by-side percentages of one dimension from several composition passes, written after the last pass
class ComparisonOutput final : public Output {
  private:
    std::string filename_;
    std::string dimension_;
    std::vector<std::pair<std::string, std::string>> passes_;  // (pass name, column label)
    std::map<std::string, Composition> compositions_;          // by pass name

  public:
    ComparisonOutput(const AllocationRun* run, const settings::SettingsNode& settings);
    void iterate(const PassResult& pass) override;
    void end() override;
    std::string name() const override { return "COMPARISON"; }
};

}  // namespace arealloc

#endif
