// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "output/ProgressOutput.h"

#include "AllocationRun.h"

namespace arealloc {

ProgressOutput::ProgressOutput(const AllocationRun* run) : Output(run), bar(run->pass_count(), "Allocation") {}

void ProgressOutput::end() { bar.close(); }

void ProgressOutput::iterate(const PassResult& pass) {
    if (!pass.result.report.conserved()) {
        bar.println("     [ " + pass.name + ": totals not conserved ]");
    }
    ++bar;
}

}  // namespace arealloc
