// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_CONSOLEOUTPUT_H
#define AREALLOC_CONSOLEOUTPUT_H

#include "output/Output.h"

namespace arealloc {

// summary of a pass and its validation report on standard output
class ConsoleOutput final : public Output {
  public:
    explicit ConsoleOutput(const AllocationRun* run);
    void iterate(const PassResult& pass) override;
    std::string name() const override { return "CONSOLE"; }
};

}  // namespace arealloc

#endif
