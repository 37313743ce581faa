// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "model/AllocationTable.h"

namespace arealloc {

FloatType AllocationTable::total() const {
    FloatType res = 0.0;
    for (const auto& row : rows) {
        res += row.value;
    }
    return res;
}

std::map<TargetKey, FloatType> AllocationTable::sums() const {
    std::map<TargetKey, FloatType> res;
    for (const auto& row : rows) {
        res[TargetKey(row.target, row.stratum)] += row.value;
    }
    return res;
}

}  // namespace arealloc
