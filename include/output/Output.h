// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_OUTPUT_H
#define AREALLOC_OUTPUT_H

#include <fstream>
#include <string>

#include "arealloc.h"

namespace settings {
class SettingsNode;
}  // namespace settings

namespace arealloc {

class AllocationRun;
struct PassResult;

class Output {
  protected:
    const AllocationRun* run_;

  public:
    explicit Output(const AllocationRun* run) : run_(run) {}
    virtual ~Output() = default;
    virtual void start() {}
    virtual void iterate(const PassResult& /* pass */) {}
    virtual void end() {}

    const AllocationRun* run() const { return run_; }
    virtual std::string name() const { return "OUTPUT"; }
};

// writes one delimited field, quoted if necessary
void write_field(std::ostream& os, const std::string& value, char delimiter = ',');

// `file` setting of an output, or "<pass><suffix>" if not given
std::string output_filename(const settings::SettingsNode& node, const std::string& pass_name, const char* suffix);

std::ofstream open_output_file(const std::string& filename);

}  // namespace arealloc

#endif
