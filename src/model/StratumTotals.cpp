// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "model/StratumTotals.h"

namespace arealloc {

void TargetTotals::add(const std::string& target, StratumKey stratum, FloatType value) {
    if (stratum.categories.size() != category_names.size()) {
        throw log::error("Target total for ", stratum, " has ", stratum.categories.size(), " category values, expected ", category_names.size());
    }
    totals[TargetKey(target, std::move(stratum))] += value;
}

const FloatType* TargetTotals::find(const std::string& target, const StratumKey& stratum) const {
    const auto it = totals.find(TargetKey(target, stratum));
    if (it == std::end(totals)) {
        return nullptr;
    }
    return &it->second;
}

std::set<std::string> TargetTotals::targets() const {
    std::set<std::string> res;
    for (const auto& total : totals) {
        res.insert(total.first.target);
    }
    return res;
}

TargetTotals TargetTotals::reordered(const std::vector<std::string>& dimensions) const {
    if (dimensions == category_names) {
        return *this;
    }
    const auto permutation = category_permutation(category_names, dimensions);
    TargetTotals res(dimensions);
    for (const auto& total : totals) {
        res.add(total.first.target, StratumKey(total.first.stratum.zone, project(total.first.stratum.categories, permutation)), total.second);
    }
    return res;
}

void StratumTotals::add(StratumKey stratum, FloatType value) {
    if (stratum.categories.size() != category_names.size()) {
        throw log::error("Total for ", stratum, " has ", stratum.categories.size(), " category values, expected ", category_names.size());
    }
    totals[std::move(stratum)] += value;
}

const FloatType* StratumTotals::find(const StratumKey& stratum) const {
    const auto it = totals.find(stratum);
    if (it == std::end(totals)) {
        return nullptr;
    }
    return &it->second;
}

StratumTotals StratumTotals::reordered(const std::vector<std::string>& dimensions) const {
    if (dimensions == category_names) {
        return *this;
    }
    const auto permutation = category_permutation(category_names, dimensions);
    StratumTotals res(dimensions);
    for (const auto& total : totals) {
        res.add(StratumKey(total.first.zone, project(total.first.categories, permutation)), total.second);
    }
    return res;
}

}  // namespace arealloc
