// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/Composition.h"

#include <map>
#include <set>

#include "model/AllocationTable.h"
#include "model/ValidationReport.h"

namespace arealloc {

Composition compose(const AllocationTable& allocation, const std::string& dimension) {
    const auto index = dimension_indices(allocation.category_names, {dimension})[0];

    std::map<std::pair<std::string, std::string>, FloatType> values;
    std::map<std::string, FloatType> zone_totals;
    for (const auto& row : allocation.rows) {
        values[std::make_pair(row.stratum.zone, row.categories[index])] += row.value;
        zone_totals[row.stratum.zone] += row.value;
    }

    Composition res;
    res.dimension = dimension;
    res.rows.reserve(values.size());
    for (const auto& value : values) {
        const FloatType zone_total = zone_totals[value.first.first];
        res.rows.push_back(CompositionRow{value.first.first, value.first.second, value.second, zone_total, zone_total == 0.0 ? 0.0 : value.second / zone_total});
    }
    return res;
}

std::vector<const CompositionRow*> check_composition(const Composition& composition, FloatType tolerance, ValidationReport& report) {
    std::vector<const CompositionRow*> res;
    std::size_t i = 0;
    while (i < composition.rows.size()) {
        const auto& first = composition.rows[i];
        FloatType sum = 0.0;
        std::size_t j = i;
        for (; j < composition.rows.size() && composition.rows[j].zone == first.zone; ++j) {
            sum += composition.rows[j].proportion;
        }
        if (first.zone_total != 0.0) {
            const bool ok = within(sum, 1.0, tolerance);
            report.checks.push_back(Discrepancy{CheckKind::SHARE, StratumKey(first.zone, {}), composition.dimension, 1.0, sum, sum - 1.0, ok});
            if (!ok) {
                res.push_back(&first);
                log::warning("Composition of zone '", first.zone, "' by ", composition.dimension, " sums to ", 100.0 * sum, "%");
            }
        }
        i = j;
    }
    return res;
}

ComparisonTable compare(const std::vector<std::pair<std::string, const Composition*>>& compositions) {
    ComparisonTable res;
    std::set<std::string> zones;
    std::map<std::pair<std::string, std::size_t>, FloatType> cells;  // (zone, column) -> percentage

    for (const auto& labelled : compositions) {
        std::set<std::string> categories;
        for (const auto& row : labelled.second->rows) {
            categories.insert(row.category);
        }
        std::map<std::string, std::size_t> column_of;
        for (const auto& category : categories) {
            column_of[category] = res.columns.size();
            res.columns.push_back(category + "_" + labelled.first);
        }
        for (const auto& row : labelled.second->rows) {
            zones.insert(row.zone);
            cells[std::make_pair(row.zone, column_of[row.category])] = row.percentage();
        }
    }

    res.zones.assign(std::begin(zones), std::end(zones));
    res.values.assign(res.zones.size(), std::vector<FloatType>(res.columns.size(), 0.0));
    for (std::size_t z = 0; z < res.zones.size(); ++z) {
        for (std::size_t c = 0; c < res.columns.size(); ++c) {
            const auto cell = cells.find(std::make_pair(res.zones[z], c));
            if (cell != std::end(cells)) {
                res.values[z][c] = cell->second;
            }
        }
    }
    return res;
}

}  // namespace arealloc
