// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "output/ComparisonOutput.h"

#include <algorithm>

#include "AllocationRun.h"
#include "settingsnode.h"

namespace arealloc {

ComparisonOutput::ComparisonOutput(const AllocationRun* run, const settings::SettingsNode& settings)
    : Output(run), filename_(settings["file"].as<std::string>()), dimension_(settings["dimension"].as<std::string>()) {
    for (const auto& pass_node : settings["passes"].as_sequence()) {
        if (pass_node.is_map()) {
            const auto pass_name = pass_node["pass"].as<std::string>();
            passes_.emplace_back(pass_name, pass_node["label"].as<std::string>(pass_name));
        } else {
            const auto pass_name = pass_node.as<std::string>();
            passes_.emplace_back(pass_name, pass_name);
        }
    }
}

void ComparisonOutput::iterate(const PassResult& pass) {
    const auto wanted = std::find_if(std::begin(passes_), std::end(passes_), [&pass](const auto& p) { return p.first == pass.name; });
    if (wanted == std::end(passes_)) {
        return;
    }
    const auto composition = std::find_if(std::begin(pass.compositions), std::end(pass.compositions),
                                          [this](const Composition& c) { return c.dimension == dimension_; });
    if (composition == std::end(pass.compositions)) {
        throw log::error(this, "Pass '", pass.name, "' has no composition by ", dimension_);
    }
    compositions_[pass.name] = *composition;
}

void ComparisonOutput::end() {
    std::vector<std::pair<std::string, const Composition*>> labelled;
    for (const auto& pass : passes_) {
        const auto composition = compositions_.find(pass.first);
        if (composition == std::end(compositions_)) {
            throw log::error(this, "Pass '", pass.first, "' for comparison by ", dimension_, " did not run");
        }
        labelled.emplace_back(pass.second, &composition->second);
    }
    const auto table = compare(labelled);

    auto out = open_output_file(filename_);
    out << "zone";
    for (const auto& column : table.columns) {
        out << ',';
        write_field(out, column);
    }
    out << '\n';
    for (std::size_t z = 0; z < table.zones.size(); ++z) {
        write_field(out, table.zones[z]);
        for (const auto value : table.values[z]) {
            out << ',' << value;
        }
        out << '\n';
    }
    log::info(this, "Comparison of ", labelled.size(), " passes by ", dimension_, " written to ", filename_);
}

}  // namespace arealloc
