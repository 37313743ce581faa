// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "output/Output.h"

#include <limits>

#include "settingsnode.h"

namespace arealloc {

void write_field(std::ostream& os, const std::string& value, char delimiter) {
    if (value.find_first_of(std::string{delimiter, '"', '\n', '\r'}) == std::string::npos) {
        os << value;
        return;
    }
    os << '"';
    for (const auto c : value) {
        if (c == '"') {
            os << '"';
        }
        os << c;
    }
    os << '"';
}

std::string output_filename(const settings::SettingsNode& node, const std::string& pass_name, const char* suffix) {
    if (node.has("file")) {
        return node["file"].as<std::string>();
    }
    return pass_name + suffix;
}

std::ofstream open_output_file(const std::string& filename) {
    std::ofstream res(filename);
    if (!res) {
        throw log::error("Could not create '", filename, "'");
    }
    res.precision(std::numeric_limits<FloatType>::max_digits10);
    return res;
}

}  // namespace arealloc
