// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_STRATUMTOTALS_H
#define AREALLOC_STRATUMTOTALS_H

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "arealloc.h"
#include "model/StratumKey.h"

namespace arealloc {

/**
 * Externally supplied totals per stratum and target-axis value (e.g. projected population per
 * region, age group, sex and year).
 */
class TargetTotals {
  public:
    std::vector<std::string> category_names;
    std::map<TargetKey, FloatType> totals;

  public:
    TargetTotals() = default;
    explicit TargetTotals(std::vector<std::string> category_names_p) : category_names(std::move(category_names_p)) {}

    // adds to an existing total for the same key
    void add(const std::string& target, StratumKey stratum, FloatType value);
    const FloatType* find(const std::string& target, const StratumKey& stratum) const;
    std::set<std::string> targets() const;
    std::size_t size() const { return totals.size(); }
    // same totals with categories in the order of `dimensions`
    TargetTotals reordered(const std::vector<std::string>& dimensions) const;
};

// one total per stratum, used as an external share denominator
class StratumTotals {
  public:
    std::vector<std::string> category_names;
    std::map<StratumKey, FloatType> totals;

  public:
    StratumTotals() = default;
    explicit StratumTotals(std::vector<std::string> category_names_p) : category_names(std::move(category_names_p)) {}

    void add(StratumKey stratum, FloatType value);
    const FloatType* find(const StratumKey& stratum) const;
    std::size_t size() const { return totals.size(); }
    StratumTotals reordered(const std::vector<std::string>& dimensions) const;
};

}  // namespace arealloc

#endif
