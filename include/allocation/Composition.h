// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_COMPOSITION_H
#define AREALLOC_COMPOSITION_H

#include <string>
#include <utility>
#include <vector>

#include "arealloc.h"

namespace arealloc {

struct AllocationTable;
class ValidationReport;

struct CompositionRow {
    std::string zone;
    std::string category;
    FloatType value;
    FloatType zone_total;
    FloatType proportion;

    FloatType percentage() const { return 100.0 * proportion; }
};

// make-up of every zone by the values of one category dimension
struct Composition {
    std::string dimension;
    std::vector<CompositionRow> rows;  // ordered by zone, then category
};

Composition compose(const AllocationTable& allocation, const std::string& dimension);

// proportions of every zone with a non-zero total have to add up to 1 within `tolerance` (advisory)
std::vector<const CompositionRow*> check_composition(const Composition& composition, FloatType tolerance, ValidationReport& report);

/**
 * Zone-by-category table of percentages of several labelled compositions of the same dimension.
 * Zones are the union over all compositions, cells without value are 0.
 */
struct ComparisonTable {
    std::vector<std::string> columns;  // "<category>_<label>"
    std::vector<std::string> zones;
    std::vector<std::vector<FloatType>> values;  // [zone][column]
};

ComparisonTable compare(const std::vector<std::pair<std::string, const Composition*>>& compositions);

}  // namespace arealloc

#endif
