// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "input/CsvTable.h"

#include <algorithm>
#include <fstream>

#include "csv-parser.h"

namespace arealloc {

static std::string trimmed(std::string s) {
    // an unterminated last line leaves the stream's end marker in the cell
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == std::char_traits<char>::to_char_type(std::char_traits<char>::eof()))) {
        s.pop_back();
    }
    const auto begin = s.find_first_not_of(" \t");
    return begin == std::string::npos ? std::string() : s.substr(begin);
}

static std::vector<std::string> read_row(csv::Parser& in) {
    std::vector<std::string> res;
    do {
        res.push_back(trimmed(in.read<std::string>()));
    } while (in.next_col());
    return res;
}

CsvTable::CsvTable(std::istream& stream, std::string filename, char delimiter) : filename_(std::move(filename)) {
    try {
        csv::Parser in(stream, delimiter);
        header_ = read_row(in);
        while (in.next_row()) {
            auto row = read_row(in);
            if (row.size() != header_.size()) {
                throw log::error("Row has ", row.size(), " columns instead of ", header_.size(), " (in ", filename_, ", line ", in.row() + 1, ")");
            }
            rows_.emplace_back(std::move(row));
            lines_.push_back(in.row() + 1);
        }
    } catch (const csv::parser_exception& ex) {
        throw log::error(ex.what(), " (in ", filename_, ", line ", ex.row + 1, ", col ", ex.col + 1, ")");
    }
}

CsvTable CsvTable::read(const std::string& filename, char delimiter) {
    std::ifstream file(filename);
    if (!file) {
        throw log::error("Could not open '", filename, "'");
    }
    return CsvTable(file, filename, delimiter);
}

std::size_t CsvTable::column(const std::string& name) const {
    const auto it = std::find(std::begin(header_), std::end(header_), name);
    if (it == std::end(header_)) {
        throw log::error("Column '", name, "' not found in ", filename_);
    }
    return static_cast<std::size_t>(std::distance(std::begin(header_), it));
}

bool CsvTable::has_column(const std::string& name) const { return std::find(std::begin(header_), std::end(header_), name) != std::end(header_); }

const std::string& CsvTable::cell(std::size_t row, std::size_t column) const { return rows_[row][column]; }

FloatType CsvTable::number(std::size_t row, std::size_t column) const {
    const auto& s = rows_[row][column];
    std::size_t pos = 0;
    FloatType res;
    try {
        res = std::stod(s, &pos);
    } catch (const std::logic_error&) {
        throw log::error("Could not read number '", s, "' in column '", header_[column], "' (in ", filename_, ", line ", lines_[row], ")");
    }
    if (pos != s.size()) {
        throw log::error("Could not read number '", s, "' in column '", header_[column], "' (in ", filename_, ", line ", lines_[row], ")");
    }
    return res;
}

}  // namespace arealloc
