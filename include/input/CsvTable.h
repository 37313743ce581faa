// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_CSVTABLE_H
#define AREALLOC_CSVTABLE_H

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "arealloc.h"

namespace arealloc {

/**
 * Delimited text table with a header row, cells addressed by column name.
 */
class CsvTable {
  private:
    std::string filename_;
    std::vector<std::string> header_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<long> lines_;

  public:
    CsvTable(std::istream& stream, std::string filename, char delimiter = ',');
    static CsvTable read(const std::string& filename, char delimiter = ',');

    std::size_t column(const std::string& name) const;
    bool has_column(const std::string& name) const;
    const std::string& cell(std::size_t row, std::size_t column) const;
    FloatType number(std::size_t row, std::size_t column) const;

    const std::vector<std::string>& header() const { return header_; }
    const std::string& filename() const { return filename_; }
    std::size_t size() const { return rows_.size(); }
};

}  // namespace arealloc

#endif
