// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "AllocationRun.h"

#include <cfenv>
#include <chrono>
#include <csignal>
#include <ctime>
#include <set>
#include <sstream>

#include "input/RunInitializer.h"
#include "openmp.h"
#include "output/ComparisonOutput.h"
#include "output/CompositionOutput.h"
#include "output/ConsoleOutput.h"
#include "output/CsvOutput.h"
#include "output/NetCDFOutput.h"
#include "output/Output.h"
#include "output/ProgressOutput.h"
#include "output/ReportOutput.h"
#include "settingsnode.h"

namespace arealloc {

const char* to_string(PassType type) {
    switch (type) {
        case PassType::DISAGGREGATION:
            return "disaggregation";
        case PassType::ALLOCATION:
            return "allocation";
        case PassType::COMPOSITION:
            return "composition";
    }
    return "unknown";
}

static void handle_fpe_error(int /* signal */) {
    if constexpr (Options::FLOATING_POINT_EXCEPTIONS) {
        unsigned int const exceptions = fetestexcept(FE_ALL_EXCEPT);  // NOLINT(hicpp-signed-bitwise)
        feclearexcept(FE_ALL_EXCEPT);                                 // NOLINT(hicpp-signed-bitwise)
        if (exceptions == 0) {
            return;
        }
        if ((exceptions & FE_OVERFLOW) != 0) {  // NOLINT(hicpp-signed-bitwise)
            log::warning("FPE_OVERFLOW");
        }
        if ((exceptions & FE_INVALID) != 0) {  // NOLINT(hicpp-signed-bitwise)
            log::warning("FPE_INVALID");
        }
        if ((exceptions & FE_DIVBYZERO) != 0) {  // NOLINT(hicpp-signed-bitwise)
            log::warning("FPE_DIVBYZERO");
        }
        if constexpr (Options::FATAL_FLOATING_POINT_EXCEPTIONS) {
            throw log::error("Floating point exception");
        }
    }
}

static AssignmentPolicy read_assignment(const settings::SettingsNode& node) {
    const auto& assignment = node.as<hashed_string>("proportional");
    switch (assignment) {
        case hash("proportional"):
            return AssignmentPolicy::PROPORTIONAL;
        case hash("dominant"):
            return AssignmentPolicy::DOMINANT;
        default:
            throw log::error("Unknown assignment '", assignment, "'");
    }
}

static ShareMode read_mode(const settings::SettingsNode& node) {
    const auto& mode = node.as<hashed_string>("magnitude");
    switch (mode) {
        case hash("magnitude"):
            return ShareMode::MAGNITUDE;
        case hash("count"):
            return ShareMode::COUNT;
        default:
            throw log::error("Unknown share mode '", mode, "'");
    }
}

static DenominatorSource read_denominator(const settings::SettingsNode& node) {
    const auto& denominator = node.as<hashed_string>("units");
    switch (denominator) {
        case hash("units"):
            return DenominatorSource::UNITS;
        case hash("baseline"):
            return DenominatorSource::BASELINE;
        default:
            throw log::error("Unknown denominator '", denominator, "'");
    }
}

static ConservationPolicy read_conservation(const settings::SettingsNode& node, ConservationPolicy fallback) {
    const auto& conservation = node.as<hashed_string>(to_string(fallback));
    switch (conservation) {
        case hash("advisory"):
            return ConservationPolicy::ADVISORY;
        case hash("strict"):
            return ConservationPolicy::STRICT;
        default:
            throw log::error("Unknown conservation policy '", conservation, "'");
    }
}

AllocationRun::AllocationRun(const settings::SettingsNode& settings) {
    if constexpr (Options::FLOATING_POINT_EXCEPTIONS) {
        signal(SIGFPE, handle_fpe_error);
        feenableexcept(FE_OVERFLOW | FE_INVALID | FE_DIVBYZERO);  // NOLINT(hicpp-signed-bitwise)
    } else {
        (void)handle_fpe_error;
    }

    {
        std::ostringstream ss;
        ss << settings;
        settings_string_ = ss.str();
    }

    initializer_ = std::make_unique<RunInitializer>(settings);
    initializer_->initialize();

    for (const auto& pass_node : settings["passes"].as_sequence()) {
        read_pass(pass_node);
    }

    if (settings.has("comparisons")) {
        for (const auto& node : settings["comparisons"].as_sequence()) {
            outputs_.emplace_back(new ComparisonOutput(this, node));
        }
    }
    if (settings["progress"].as<bool>(false)) {
        outputs_.emplace_back(new ProgressOutput(this));
    }
}

void AllocationRun::read_pass(const settings::SettingsNode& pass_node) {
    auto pass = std::make_unique<Pass>();
    pass->name = pass_node["name"].as<std::string>();
    for (const auto& other : passes_) {
        if (other->name == pass->name) {
            throw log::error(this, "Pass '", pass->name, "' defined more than once");
        }
    }

    const auto& type = pass_node["type"].as<hashed_string>();
    switch (type) {
        case hash("disaggregation"):
            pass->type = PassType::DISAGGREGATION;
            if (initializer_->targets() == nullptr) {
                throw log::error(this, "Pass '", pass->name, "' needs target totals");
            }
            break;
        case hash("allocation"):
            pass->type = PassType::ALLOCATION;
            break;
        case hash("composition"):
            pass->type = PassType::COMPOSITION;
            pass->dimensions = read_strings(pass_node["dimensions"]);
            break;
        default:
            throw log::error(this, "Unknown pass type '", type, "'");
    }

    auto& request = pass->request;
    request.assignment = read_assignment(pass_node["assignment"]);
    request.mode = read_mode(pass_node["mode"]);
    if (pass_node.has("strata")) {
        request.stratum_dimensions = read_strings(pass_node["strata"]);
    }
    request.denominator = read_denominator(pass_node["denominator"]);
    if (request.denominator == DenominatorSource::BASELINE && initializer_->baseline() == nullptr) {
        throw log::error(this, "Pass '", pass->name, "' needs baseline totals");
    }
    request.target_label = pass_node["target_label"].as<std::string>(request.target_label);
    request.membership_tolerance = initializer_->membership_tolerance();
    request.tolerance = pass_node["tolerance"].as<double>(request.tolerance);
    request.share_tolerance = pass_node["share_tolerance"].as<double>(request.share_tolerance);
    request.conservation =
        read_conservation(pass_node["conservation"], pass->type == PassType::DISAGGREGATION ? ConservationPolicy::STRICT : ConservationPolicy::ADVISORY);

    if (pass_node.has("outputs")) {
        for (const auto& node : pass_node["outputs"].as_sequence()) {
            Output* output = nullptr;
            const auto& format = node["format"].as<hashed_string>();
            switch (format) {
                case hash("csv"):
                    output = new CsvOutput(this, node, pass->name);
                    break;
                case hash("report"):
                    output = new ReportOutput(this, node, pass->name);
                    break;
                case hash("composition"):
                    if (pass->type != PassType::COMPOSITION) {
                        throw log::error(this, "Composition output for pass '", pass->name, "' which is not a composition pass");
                    }
                    output = new CompositionOutput(this, node, pass->name);
                    break;
                case hash("netcdf"):
                    output = new NetCDFOutput(this, node, pass->name);
                    break;
                case hash("console"):
                    output = new ConsoleOutput(this);
                    break;
                default:
                    throw log::error(this, "Unknown output format '", format, "'");
            }
            pass->outputs.emplace_back(output);
        }
    }

    log::info(this, "Pass '", pass->name, "': ", to_string(pass->type), ", ", to_string(request.assignment), " assignment, ", to_string(request.mode),
              " shares, ", to_string(request.conservation), " validation");
    passes_.emplace_back(std::move(pass));
}

PassResult AllocationRun::run_pass(const Pass& pass) const {
    PassResult res{pass.name, pass.type, &pass.request, {}, {}};

    const AllocationPipeline pipeline(pass.request);
    res.result =
        pipeline.run(initializer_->units(), initializer_->membership(), pass.type == PassType::DISAGGREGATION ? initializer_->targets() : nullptr,
                     initializer_->baseline());

    // joins lost while reading the inputs belong to every pass
    ValidationReport report = initializer_->report();
    report.merge(res.result.report);
    res.result.report = std::move(report);

    for (const auto& dimension : pass.dimensions) {
        res.compositions.push_back(compose(res.result.allocation, dimension));
        check_composition(res.compositions.back(), pass.request.share_tolerance, res.result.report);
    }
    return res;
}

void AllocationRun::run() {
    if (has_run_) {
        throw log::error(this, "Allocation has already run");
    }
    has_run_ = true;

    log::info(this, "Starting allocation run on max. ", thread_count(), " threads");

    for (const auto& output : outputs_) {
        output->start();
    }
    for (const auto& pass : passes_) {
        for (const auto& output : pass->outputs) {
            output->start();
        }
    }

    for (const auto& pass : passes_) {
        const auto t0 = std::chrono::high_resolution_clock::now();
        const auto result = run_pass(*pass);
        const auto t1 = std::chrono::high_resolution_clock::now();
        log::info(this, "Pass '", pass->name, "' took ", std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count(), " ms");

        for (const auto& output : pass->outputs) {
            output->iterate(result);
        }
        for (const auto& output : outputs_) {
            output->iterate(result);
        }
    }

    for (const auto& pass : passes_) {
        for (const auto& output : pass->outputs) {
            output->end();
        }
    }
    for (const auto& output : outputs_) {
        output->end();
    }
}

AllocationRun::~AllocationRun() = default;

auto AllocationRun::now() -> std::string {
    std::string res = "0000-00-00 00:00:00";
    auto t = std::time(nullptr);
    std::strftime(res.data(), res.size() + 1, "%F %T", std::localtime(&t));
    return res;
}

auto AllocationRun::thread_count() -> unsigned int { return openmp::get_thread_count(); }

}  // namespace arealloc
