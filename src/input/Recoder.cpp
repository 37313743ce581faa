// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "input/Recoder.h"

#include <cctype>
#include <iomanip>
#include <map>
#include <sstream>
#include <utility>

#include "arealloc.h"
#include "exceptions.h"
#include "model/StratumTotals.h"
#include "model/UnitTable.h"

namespace arealloc {

// leading integer of "42" or "90+"; nullopt for anything else
static std::optional<long> integer_value(const std::string& value) {
    std::size_t end = 0;
    while (end < value.size() && std::isdigit(static_cast<unsigned char>(value[end])) != 0) {
        ++end;
    }
    if (end == 0 || end > 18 || (end < value.size() && !(end + 1 == value.size() && value[end] == '+'))) {
        return std::nullopt;
    }
    return std::stol(value.substr(0, end));
}

std::optional<std::string> CategoryRecode::apply(const std::string& value_p) const {
    std::string value = value_p;
    const auto mapped = mapping.find(value);
    if (mapped != std::end(mapping)) {
        value = mapped->second;
    }
    if (!bands.empty()) {
        const auto number = integer_value(value);
        const ValueBand* match = nullptr;
        for (const auto& band : bands) {
            if (number ? (*number >= band.min && *number <= band.max) : value == band.label) {
                match = &band;
                break;
            }
        }
        if (match == nullptr) {
            return std::nullopt;
        }
        value = match->label;
    }
    if (!keep.empty() && keep.count(value) == 0) {
        return std::nullopt;
    }
    return value;
}

void Recoder::add(const std::string& column, CategoryRecode recode) { recodes_[column] = std::move(recode); }

std::optional<CategoryTuple> Recoder::recode(const std::vector<std::string>& names, const CategoryTuple& categories) const {
    CategoryTuple res = categories;
    for (std::size_t i = 0; i < names.size(); ++i) {
        const auto recode = recodes_.find(names[i]);
        if (recode == std::end(recodes_)) {
            continue;
        }
        auto value = recode->second.apply(categories[i]);
        if (!value) {
            return std::nullopt;
        }
        res[i] = std::move(*value);
    }
    return res;
}

UnitTable Recoder::apply(const UnitTable& units) const {
    UnitTable res(units.category_names);
    std::map<std::pair<std::string, CategoryTuple>, std::size_t> index;
    // original categories and values collapsed onto each recoded key
    std::map<std::pair<std::string, CategoryTuple>, std::map<CategoryTuple, FloatType>> originals;
    std::size_t dropped = 0;
    std::size_t duplicates = 0;

    for (const auto& row : units.rows) {
        auto categories = recode(units.category_names, row.categories);
        if (!categories) {
            ++dropped;
            continue;
        }
        auto key = std::make_pair(row.unit_id, *categories);
        const auto inserted = originals[key].emplace(row.categories, row.base_value);
        if (!inserted.second) {
            if (inserted.first->second != row.base_value) {
                std::ostringstream ss;
                ss << std::setprecision(12) << "Unit '" << row.unit_id << "' " << to_string(row.categories) << " has conflicting values "
                   << inserted.first->second << " and " << row.base_value;
                throw integrity_error(ss.str());
            }
            ++duplicates;
            continue;
        }
        const auto existing = index.find(key);
        if (existing != std::end(index)) {
            res.rows[existing->second].base_value += row.base_value;
        } else {
            index.emplace(key, res.rows.size());
            res.add(row.unit_id, row.base_value, std::move(*categories));
        }
    }

    if (duplicates > 0) {
        log::warning(this, duplicates, " duplicate unit rows ignored");
    }
    if (dropped > 0) {
        log::info(this, dropped, " unit rows dropped by recoding");
    }
    return res;
}

TargetTotals Recoder::apply(const TargetTotals& targets) const {
    TargetTotals res(targets.category_names);
    std::size_t dropped = 0;
    for (const auto& total : targets.totals) {
        auto categories = recode(targets.category_names, total.first.stratum.categories);
        if (!categories) {
            ++dropped;
            continue;
        }
        res.add(total.first.target, StratumKey(total.first.stratum.zone, std::move(*categories)), total.second);
    }
    if (dropped > 0) {
        log::info(this, dropped, " target totals dropped by recoding");
    }
    return res;
}

StratumTotals Recoder::apply(const StratumTotals& totals) const {
    StratumTotals res(totals.category_names);
    std::size_t dropped = 0;
    for (const auto& total : totals.totals) {
        auto categories = recode(totals.category_names, total.first.categories);
        if (!categories) {
            ++dropped;
            continue;
        }
        res.add(StratumKey(total.first.zone, std::move(*categories)), total.second);
    }
    if (dropped > 0) {
        log::info(this, dropped, " baseline totals dropped by recoding");
    }
    return res;
}

}  // namespace arealloc
