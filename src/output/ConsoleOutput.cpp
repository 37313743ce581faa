// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "output/ConsoleOutput.h"

#include <sstream>

#include "AllocationRun.h"

namespace arealloc {

ConsoleOutput::ConsoleOutput(const AllocationRun* run) : Output(run) {}

void ConsoleOutput::iterate(const PassResult& pass) {
    const auto& result = pass.result;
    std::ostringstream ss;
    ss << "Pass '" << pass.name << "' (" << to_string(pass.type) << ", " << to_string(pass.request->assignment) << " assignment, "
       << to_string(pass.request->mode) << " shares)\n"
       << "Fragments:             " << result.fragments.rows.size() << "\n"
       << "Strata:                " << result.shares.strata.size() << "\n"
       << "Allocated values:      " << result.allocation.rows.size() << "\n"
       << "Allocated total:       " << result.allocation.total() << "\n";
    result.report.summarize(ss);
    for (const auto& composition : pass.compositions) {
        ss << "Composition by " << composition.dimension << ": " << composition.rows.size() << " rows\n";
    }
    log::debug(ss.str());
}

}  // namespace arealloc
