// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "allocation/Allocator.h"

#include <iterator>
#include <utility>
#include <vector>

#include "model/ShareTable.h"
#include "model/StratumTotals.h"
#include "model/ValidationReport.h"

namespace arealloc {

static std::vector<std::pair<const StratumKey*, const StratumSummary*>> allocatable_strata(const ShareTable& shares) {
    std::vector<std::pair<const StratumKey*, const StratumSummary*>> res;
    res.reserve(shares.strata.size());
    for (const auto& stratum : shares.strata) {
        if (!stratum.second.empty) {
            res.emplace_back(&stratum.first, &stratum.second);
        }
    }
    return res;
}

static AllocationTable empty_allocation(const ShareTable& shares) {
    AllocationTable res;
    res.category_names = shares.category_names;
    res.stratum_dimensions = shares.stratum_dimensions;
    return res;
}

AllocationTable Allocator::allocate(const ShareTable& shares, const TargetTotals& targets_p, ValidationReport& report) const {
    const auto targets = targets_p.reordered(shares.stratum_dimensions);

    std::size_t unallocatable_count = 0;
    for (const auto& total : targets.totals) {
        const auto stratum = shares.strata.find(total.first.stratum);
        if (stratum == std::end(shares.strata) || stratum->second.empty) {
            report.unallocatable.push_back(UnallocatableTotal{total.first.stratum, total.first.target, total.second});
            ++unallocatable_count;
        }
    }
    if (unallocatable_count > 0) {
        log::warning(this, unallocatable_count, " target totals have no contributing units");
    }

    const auto strata = allocatable_strata(shares);
    auto res = empty_allocation(shares);
    std::size_t missing_count = 0;

    if (targets.totals.empty()) {
        // no target-axis value at all, every stratum lacks its total
        for (const auto& stratum : strata) {
            report.missing_joins.push_back(MissingJoin{MissingJoinKind::TARGET, {}, *stratum.first, {}});
            ++missing_count;
        }
    }

    for (const auto& target : targets.targets()) {
        std::vector<std::vector<AllocatedValue>> values(strata.size());
        std::vector<char> missing(strata.size(), 0);

#pragma omp parallel for default(shared) schedule(guided)
        for (std::size_t i = 0; i < strata.size(); ++i) {  // NOLINT(modernize-loop-convert)
            const auto* total = targets.find(target, *strata[i].first);
            if (total == nullptr) {
                missing[i] = 1;
                continue;
            }
            auto& stratum_values = values[i];
            stratum_values.reserve(strata[i].second->rows.size());
            for (const auto row_index : strata[i].second->rows) {
                const auto& row = shares.rows[row_index];
                stratum_values.push_back(AllocatedValue{row.unit_id, row.stratum, row.categories, target, row.share, row.share * *total});
            }
        }

        for (std::size_t i = 0; i < strata.size(); ++i) {
            if (missing[i] != 0) {
                report.missing_joins.push_back(MissingJoin{MissingJoinKind::TARGET, {}, *strata[i].first, target});
                ++missing_count;
            } else {
                res.rows.insert(std::end(res.rows), std::make_move_iterator(std::begin(values[i])), std::make_move_iterator(std::end(values[i])));
            }
        }
    }
    if (missing_count > 0) {
        log::warning(this, missing_count, " strata without target total skipped");
    }

    log::info(this, res.rows.size(), " values allocated for ", targets.targets().size(), " targets");
    return res;
}

AllocationTable Allocator::allocate_self(const ShareTable& shares, const std::string& target) const {
    const auto strata = allocatable_strata(shares);
    std::vector<std::vector<AllocatedValue>> values(strata.size());

#pragma omp parallel for default(shared) schedule(guided)
    for (std::size_t i = 0; i < strata.size(); ++i) {  // NOLINT(modernize-loop-convert)
        auto& stratum_values = values[i];
        stratum_values.reserve(strata[i].second->rows.size());
        for (const auto row_index : strata[i].second->rows) {
            const auto& row = shares.rows[row_index];
            // the contribution itself, so stratum sums reproduce the stratum total exactly
            stratum_values.push_back(AllocatedValue{row.unit_id, row.stratum, row.categories, target, row.share, row.contribution});
        }
    }

    auto res = empty_allocation(shares);
    for (auto& stratum_values : values) {
        res.rows.insert(std::end(res.rows), std::make_move_iterator(std::begin(stratum_values)), std::make_move_iterator(std::end(stratum_values)));
    }
    log::info(this, res.rows.size(), " values reallocated onto their own strata");
    return res;
}

TargetTotals Allocator::self_totals(const ShareTable& shares, const std::string& target) const {
    TargetTotals res(shares.stratum_dimensions);
    for (const auto& stratum : shares.strata) {
        if (!stratum.second.empty) {
            res.add(target, stratum.first, stratum.second.total);
        }
    }
    return res;
}

}  // namespace arealloc
