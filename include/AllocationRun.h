// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_ALLOCATIONRUN_H
#define AREALLOC_ALLOCATIONRUN_H

#include <memory>
#include <string>
#include <vector>

#include "allocation/AllocationPipeline.h"
#include "allocation/Composition.h"
#include "arealloc.h"

namespace settings {
class SettingsNode;
}

namespace arealloc {

class Output;
class RunInitializer;

enum class PassType {
    DISAGGREGATION,  // distribute target totals, strictly validated by default
    ALLOCATION,      // reallocate every stratum onto itself
    COMPOSITION      // self-reallocation per zone, reported as make-up by category
};

const char* to_string(PassType type);

struct Pass {
    std::string name;
    PassType type;
    AllocationRequest request;
    std::vector<std::string> dimensions;  // composition dimensions
    std::vector<std::unique_ptr<Output>> outputs;
};

struct PassResult {
    std::string name;
    PassType type;
    const AllocationRequest* request;
    AllocationResult result;
    std::vector<Composition> compositions;
};

class AllocationRun {
  private:
    std::unique_ptr<RunInitializer> initializer_;
    std::vector<std::unique_ptr<Pass>> passes_;
    std::vector<std::unique_ptr<Output>> outputs_;  // run-wide outputs, see all passes
    std::string settings_string_;
    bool has_run_ = false;

  private:
    void read_pass(const settings::SettingsNode& pass_node);
    PassResult run_pass(const Pass& pass) const;

  public:
    explicit AllocationRun(const settings::SettingsNode& settings);
    ~AllocationRun();
    void run();
    const std::string& settings_string() const { return settings_string_; }
    std::size_t pass_count() const { return passes_.size(); }
    static unsigned int thread_count();
    static std::string now();
    const char* name() const { return "RUN"; }
};

}  // namespace arealloc

#endif
