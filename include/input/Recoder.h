// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_RECODER_H
#define AREALLOC_RECODER_H

#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "model/StratumKey.h"

namespace arealloc {

class StratumTotals;
class TargetTotals;
class UnitTable;

// inclusive range of integer values (usually single-year ages) mapped onto `label`
struct ValueBand {
    std::string label;
    long min;
    long max = std::numeric_limits<long>::max();
};

/**
 * Recoding of the values of one category column, applied in the order: value map, bands, keep filter.
 * A value that is neither an integer within a band nor already a band label is dropped, as is a
 * value not in a non-empty keep list.
 */
class CategoryRecode {
  public:
    std::map<std::string, std::string> mapping;
    std::vector<ValueBand> bands;
    std::set<std::string> keep;

  public:
    std::optional<std::string> apply(const std::string& value) const;
};

/**
 * Applies category recodes to input tables by column name. Rows which end up with the same key
 * are summed, so e.g. single-year ages collapse onto age groups.
 */
class Recoder {
  private:
    std::map<std::string, CategoryRecode> recodes_;

    std::optional<CategoryTuple> recode(const std::vector<std::string>& names, const CategoryTuple& categories) const;

  public:
    void add(const std::string& column, CategoryRecode recode);
    bool empty() const { return recodes_.empty(); }

    /**
     * Rows of the same unit collapsing onto one category tuple are summed. Rows which were
     * already identical before recoding stay separate, so duplicate checks downstream still see them.
     */
    UnitTable apply(const UnitTable& units) const;
    TargetTotals apply(const TargetTotals& targets) const;
    StratumTotals apply(const StratumTotals& totals) const;

    const char* name() const { return "RECODER"; }
};

}  // namespace arealloc

#endif
