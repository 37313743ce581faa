// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_FRAGMENTTABLE_H
#define AREALLOC_FRAGMENTTABLE_H

#include <string>
#include <vector>

#include "arealloc.h"
#include "model/StratumKey.h"

namespace arealloc {

// part of a unit lying in one zone; base_value already multiplied by the membership weight
struct Fragment {
    std::string unit_id;
    std::string zone;
    FloatType weight;
    FloatType base_value;
    CategoryTuple categories;
};

struct FragmentTable {
    std::vector<std::string> category_names;
    std::vector<Fragment> rows;
};

}  // namespace arealloc

#endif
