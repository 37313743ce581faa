// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_STRATUMKEY_H
#define AREALLOC_STRATUMKEY_H

#include <cstddef>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace arealloc {

// category values, interpreted positionally against the owning table's category names
using CategoryTuple = std::vector<std::string>;

// renders "(a, b)"
std::string to_string(const CategoryTuple& categories);

struct StratumKey {
    std::string zone;
    CategoryTuple categories;

    StratumKey() = default;
    StratumKey(std::string zone_p, CategoryTuple categories_p) : zone(std::move(zone_p)), categories(std::move(categories_p)) {}

    bool operator<(const StratumKey& rhs) const { return std::tie(zone, categories) < std::tie(rhs.zone, rhs.categories); }
    bool operator==(const StratumKey& rhs) const { return zone == rhs.zone && categories == rhs.categories; }
    bool operator!=(const StratumKey& rhs) const { return !(*this == rhs); }
    friend std::ostream& operator<<(std::ostream& os, const StratumKey& key);
};

// ordered by target first, so iterating a map of these visits one target-axis value at a time
struct TargetKey {
    std::string target;
    StratumKey stratum;

    TargetKey() = default;
    TargetKey(std::string target_p, StratumKey stratum_p) : target(std::move(target_p)), stratum(std::move(stratum_p)) {}

    bool operator<(const TargetKey& rhs) const { return std::tie(target, stratum) < std::tie(rhs.target, rhs.stratum); }
    bool operator==(const TargetKey& rhs) const { return target == rhs.target && stratum == rhs.stratum; }
    friend std::ostream& operator<<(std::ostream& os, const TargetKey& key) { return os << key.stratum << " @ " << key.target; }
};

/**
 * Positions of `dimensions` within `names`. Throws if a dimension is unknown or given twice.
 */
std::vector<std::size_t> dimension_indices(const std::vector<std::string>& names, const std::vector<std::string>& dimensions);

CategoryTuple project(const CategoryTuple& categories, const std::vector<std::size_t>& indices);

/**
 * Permutation mapping a table with category columns `from` onto the column order `to`.
 * Both must name the same set of categories.
 */
std::vector<std::size_t> category_permutation(const std::vector<std::string>& from, const std::vector<std::string>& to);

}  // namespace arealloc

#endif
