// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "model/StratumKey.h"

#include <algorithm>

#include "arealloc.h"

namespace arealloc {

std::string to_string(const CategoryTuple& categories) {
    std::string res = "(";
    for (std::size_t i = 0; i < categories.size(); ++i) {
        if (i > 0) {
            res += ", ";
        }
        res += categories[i];
    }
    return res + ")";
}

std::ostream& operator<<(std::ostream& os, const StratumKey& key) {
    os << key.zone;
    if (!key.categories.empty()) {
        os << ' ' << to_string(key.categories);
    }
    return os;
}

std::vector<std::size_t> dimension_indices(const std::vector<std::string>& names, const std::vector<std::string>& dimensions) {
    std::vector<std::size_t> res;
    res.reserve(dimensions.size());
    for (const auto& dimension : dimensions) {
        const auto it = std::find(std::begin(names), std::end(names), dimension);
        if (it == std::end(names)) {
            throw log::error("Unknown category '", dimension, "', available are ", to_string(names));
        }
        const auto index = static_cast<std::size_t>(std::distance(std::begin(names), it));
        if (std::find(std::begin(res), std::end(res), index) != std::end(res)) {
            throw log::error("Category '", dimension, "' given more than once");
        }
        res.push_back(index);
    }
    return res;
}

CategoryTuple project(const CategoryTuple& categories, const std::vector<std::size_t>& indices) {
    CategoryTuple res;
    res.reserve(indices.size());
    for (const auto i : indices) {
        res.push_back(categories[i]);
    }
    return res;
}

std::vector<std::size_t> category_permutation(const std::vector<std::string>& from, const std::vector<std::string>& to) {
    if (from.size() != to.size()) {
        throw log::error("Categories ", to_string(from), " do not match ", to_string(to));
    }
    return dimension_indices(from, to);
}

}  // namespace arealloc
