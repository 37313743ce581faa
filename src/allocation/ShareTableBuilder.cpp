// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/ShareTableBuilder.h"

#include <set>
#include <sstream>

#include "model/FragmentTable.h"
#include "model/StratumTotals.h"
#include "model/ValidationReport.h"

namespace arealloc {

const char* to_string(ShareMode mode) {
    switch (mode) {
        case ShareMode::COUNT:
            return "count";
        case ShareMode::MAGNITUDE:
            return "magnitude";
    }
    return "unknown";
}

const char* to_string(DenominatorSource source) {
    switch (source) {
        case DenominatorSource::UNITS:
            return "units";
        case DenominatorSource::BASELINE:
            return "baseline";
    }
    return "unknown";
}

ShareTableBuilder::ShareTableBuilder(ShareMode mode, std::vector<std::string> stratum_dimensions, DenominatorSource denominator)
    : mode_(mode), stratum_dimensions_(std::move(stratum_dimensions)), denominator_(denominator) {}

ShareTable ShareTableBuilder::build(const FragmentTable& fragments, ValidationReport& report, const StratumTotals* baseline) const {
    const auto indices = dimension_indices(fragments.category_names, stratum_dimensions_);

    StratumTotals denominators;
    if (denominator_ == DenominatorSource::BASELINE) {
        if (baseline == nullptr) {
            throw log::error(this, "baseline denominator requested but no baseline totals given");
        }
        denominators = baseline->reordered(stratum_dimensions_);
    }

    ShareTable res;
    res.mode = mode_;
    res.denominator = denominator_;
    res.category_names = fragments.category_names;
    res.stratum_dimensions = stratum_dimensions_;

    std::vector<StratumKey> keys;
    keys.reserve(fragments.rows.size());
    for (const auto& fragment : fragments.rows) {
        keys.emplace_back(fragment.zone, project(fragment.categories, indices));
        auto& stratum = res.strata[keys.back()];
        stratum.total += mode_ == ShareMode::COUNT ? 1.0 : fragment.base_value;
    }

    std::set<StratumKey> excluded;
    for (auto& stratum : res.strata) {
        if (denominator_ == DenominatorSource::BASELINE) {
            const auto* total = denominators.find(stratum.first);
            if (total == nullptr) {
                excluded.insert(stratum.first);
                report.missing_joins.push_back(MissingJoin{MissingJoinKind::DENOMINATOR, {}, stratum.first, {}});
                continue;
            }
            if (!std::isfinite(*total) || *total < 0.0) {
                std::ostringstream ss;
                ss << "Baseline total for " << stratum.first << " is invalid: " << *total;
                throw integrity_error(ss.str());
            }
            stratum.second.denominator = *total;
        } else {
            stratum.second.denominator = stratum.second.total;
        }
        if (stratum.second.denominator == 0.0) {
            stratum.second.empty = true;
            report.empty_strata.push_back(stratum.first);
        }
    }
    for (const auto& key : excluded) {
        res.strata.erase(key);
    }
    if (!excluded.empty()) {
        log::warning(this, excluded.size(), " strata without baseline total excluded");
    }

    res.rows.reserve(fragments.rows.size());
    for (std::size_t i = 0; i < fragments.rows.size(); ++i) {
        const auto& fragment = fragments.rows[i];
        auto it = res.strata.find(keys[i]);
        if (it == std::end(res.strata)) {
            continue;
        }
        auto& stratum = it->second;
        const FloatType contribution = mode_ == ShareMode::COUNT ? 1.0 : fragment.base_value;
        const FloatType share = stratum.empty ? 0.0 : contribution / stratum.denominator;
        stratum.rows.push_back(res.rows.size());
        res.rows.push_back(ShareRow{fragment.unit_id, keys[i], fragment.categories, fragment.weight, contribution, share});
    }

    log::info(this, res.rows.size(), " shares in ", res.strata.size(), " strata (", to_string(mode_), ", denominator from ", to_string(denominator_), ")");
    return res;
}

}  // namespace arealloc
