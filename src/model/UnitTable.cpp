// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "model/UnitTable.h"

namespace arealloc {

void UnitTable::add(std::string unit_id, FloatType base_value, CategoryTuple categories) {
    if (categories.size() != category_names.size()) {
        throw log::error("Unit '", unit_id, "' has ", categories.size(), " category values, expected ", category_names.size());
    }
    rows.push_back(UnitRecord{std::move(unit_id), base_value, std::move(categories)});
}

FloatType UnitTable::total() const {
    FloatType res = 0.0;
    for (const auto& row : rows) {
        res += row.base_value;
    }
    return res;
}

}  // namespace arealloc
