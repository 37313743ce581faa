// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_UNITTABLE_H
#define AREALLOC_UNITTABLE_H

#include <cstddef>
#include <string>
#include <vector>

#include "arealloc.h"
#include "model/StratumKey.h"

namespace arealloc {

struct UnitRecord {
    std::string unit_id;
    FloatType base_value;
    CategoryTuple categories;
};

// smallest geographic units with their quantity, one row per (unit_id, category tuple)
class UnitTable {
  public:
    std::vector<std::string> category_names;
    std::vector<UnitRecord> rows;

  public:
    UnitTable() = default;
    explicit UnitTable(std::vector<std::string> category_names_p) : category_names(std::move(category_names_p)) {}

    void add(std::string unit_id, FloatType base_value, CategoryTuple categories = {});
    std::size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
    FloatType total() const;
};

}  // namespace arealloc

#endif
