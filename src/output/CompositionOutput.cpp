// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "output/CompositionOutput.h"

#include "AllocationRun.h"
#include "settingsnode.h"

namespace arealloc {

static constexpr const char* dimension_placeholder = "{dimension}";

CompositionOutput::CompositionOutput(const AllocationRun* run, const settings::SettingsNode& settings, const std::string& pass_name)
    : Output(run), filename_(output_filename(settings, pass_name, "_{dimension}.csv")) {}

static const char* header = "zone,dimension,category,value,zone_total,proportion,percentage\n";

void CompositionOutput::write(std::ostream& out, const Composition& composition) {
    for (const auto& row : composition.rows) {
        write_field(out, row.zone);
        out << ',';
        write_field(out, composition.dimension);
        out << ',';
        write_field(out, row.category);
        out << ',' << row.value << ',' << row.zone_total << ',' << row.proportion << ',' << row.percentage() << '\n';
    }
}

void CompositionOutput::iterate(const PassResult& pass) {
    const auto placeholder = filename_.find(dimension_placeholder);
    if (placeholder == std::string::npos) {
        auto out = open_output_file(filename_);
        out << header;
        for (const auto& composition : pass.compositions) {
            write(out, composition);
        }
        log::info(this, pass.compositions.size(), " compositions written to ", filename_);
        return;
    }
    for (const auto& composition : pass.compositions) {
        auto filename = filename_;
        filename.replace(placeholder, std::char_traits<char>::length(dimension_placeholder), composition.dimension);
        auto out = open_output_file(filename);
        out << header;
        write(out, composition);
        log::info(this, "Composition by ", composition.dimension, " written to ", filename);
    }
}

}  // namespace arealloc
