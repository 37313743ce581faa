// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_COMPOSITIONOUTPUT_H
#define AREALLOC_COMPOSITIONOUTPUT_H

#include <string>

#include "output/Output.h"

namespace arealloc {

struct Composition;

/**
 * Zone compositions of a composition pass. If the file name contains "{dimension}" one file is
 * written per dimension, otherwise all dimensions go into one file.
 */
class CompositionOutput final : public Output {
  private:
    std::string filename_;

    static void write(std::ostream& out, const Composition& composition);

  public:
    CompositionOutput(const AllocationRun* run, const settings::SettingsNode& settings, const std::string& pass_name);
    void iterate(const PassResult& pass) override;
    std::string name() const override { return "COMPOSITION"; }
};

}  // namespace arealloc

#endif
