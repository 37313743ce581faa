// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_MEMBERSHIPTABLE_H
#define AREALLOC_MEMBERSHIPTABLE_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "arealloc.h"

namespace arealloc {

struct MembershipEntry {
    std::string zone;
    FloatType weight;
};

/**
 * Overlap of units with coarser zones. A unit with a single entry of weight 1 is a pure unit,
 * one with several entries is split across zones according to the weights.
 */
class MembershipTable {
  private:
    std::map<std::string, std::vector<MembershipEntry>> entries_;
    std::map<std::string, std::string> dominant_;

  public:
    using const_iterator = std::map<std::string, std::vector<MembershipEntry>>::const_iterator;

    void add(const std::string& unit_id, std::string zone, FloatType weight = 1.0);
    // explicitly supplied dominant zone, takes precedence over the largest weight
    void set_dominant(const std::string& unit_id, std::string zone);

    const std::vector<MembershipEntry>* find(const std::string& unit_id) const;
    bool is_split(const std::string& unit_id) const;
    const std::string& dominant_zone(const std::string& unit_id) const;

    /**
     * Checks every unit's weights to lie in [0,1] and to sum to 1 within `tolerance`, and every
     * explicit dominant zone to be one of the unit's zones. Throws integrity_error otherwise;
     * weights are never renormalized.
     */
    void validate(FloatType tolerance) const;

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
};

}  // namespace arealloc

#endif
