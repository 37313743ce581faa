// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_SHARETABLE_H
#define AREALLOC_SHARETABLE_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "arealloc.h"
#include "model/StratumKey.h"

namespace arealloc {

enum class ShareMode {
    COUNT,     // every fragment contributes 1
    MAGNITUDE  // every fragment contributes its base value
};

enum class DenominatorSource {
    UNITS,    // stratum total summed from the contributing fragments
    BASELINE  // externally supplied stratum total
};

const char* to_string(ShareMode mode);
const char* to_string(DenominatorSource source);

struct ShareRow {
    std::string unit_id;
    StratumKey stratum;
    CategoryTuple categories;  // full category tuple of the unit
    FloatType weight;
    FloatType contribution;
    FloatType share;
};

struct StratumSummary {
    FloatType total = 0.0;        // sum of contributions
    FloatType denominator = 0.0;  // equals total unless a baseline is used
    bool empty = false;
    std::vector<std::size_t> rows;  // indices into ShareTable::rows, in input order
};

struct ShareTable {
    ShareMode mode = ShareMode::MAGNITUDE;
    DenominatorSource denominator = DenominatorSource::UNITS;
    std::vector<std::string> category_names;
    std::vector<std::string> stratum_dimensions;
    std::vector<ShareRow> rows;
    std::map<StratumKey, StratumSummary> strata;
};

}  // namespace arealloc

#endif
