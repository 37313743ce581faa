// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_ALLOCATIONTABLE_H
#define AREALLOC_ALLOCATIONTABLE_H

#include <map>
#include <string>
#include <vector>

#include "arealloc.h"
#include "model/StratumKey.h"

namespace arealloc {

struct AllocatedValue {
    std::string unit_id;
    StratumKey stratum;
    CategoryTuple categories;
    std::string target;
    FloatType share;
    FloatType value;
};

struct AllocationTable {
    std::vector<std::string> category_names;
    std::vector<std::string> stratum_dimensions;
    std::vector<AllocatedValue> rows;

    FloatType total() const;
    // per (target, stratum), summed in row order
    std::map<TargetKey, FloatType> sums() const;
};

}  // namespace arealloc

#endif
