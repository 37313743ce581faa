// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "input/RunInitializer.h"

#include <set>
#include <utility>

#include "input/CsvTable.h"
#include "settingsnode.h"

namespace arealloc {

std::vector<std::string> read_strings(const settings::SettingsNode& node) {
    std::vector<std::string> res;
    for (const auto& item : node.as_sequence()) {
        res.push_back(item.as<std::string>());
    }
    return res;
}

std::map<std::string, std::string> read_string_map(const settings::SettingsNode& node) {
    std::map<std::string, std::string> res;
    for (const auto& item : node.as_map()) {
        res.emplace(item.first, item.second.as<std::string>());
    }
    return res;
}

static char read_delimiter(const settings::SettingsNode& node) {
    const auto delimiter = node["delimiter"].as<std::string>(",");
    if (delimiter.size() != 1) {
        throw log::error("Delimiter '", delimiter, "' must be a single character");
    }
    return delimiter[0];
}

static std::vector<std::size_t> read_columns(const CsvTable& table, const std::vector<std::string>& names) {
    std::vector<std::size_t> res;
    res.reserve(names.size());
    for (const auto& name : names) {
        res.push_back(table.column(name));
    }
    return res;
}

static CategoryTuple read_categories(const CsvTable& table, std::size_t row, const std::vector<std::size_t>& columns) {
    CategoryTuple res;
    res.reserve(columns.size());
    for (const auto column : columns) {
        res.push_back(table.cell(row, column));
    }
    return res;
}

static const std::string& renamed(const std::map<std::string, std::string>& names, const std::string& name) {
    const auto it = names.find(name);
    return it == std::end(names) ? name : it->second;
}

RunInitializer::RunInitializer(const settings::SettingsNode& settings_p) : settings_(settings_p) {}

void RunInitializer::read_recodes(const settings::SettingsNode& recode_node) {
    for (const auto& column : recode_node.as_map()) {
        CategoryRecode recode;
        if (column.second.has("map")) {
            recode.mapping = read_string_map(column.second["map"]);
        }
        if (column.second.has("bands")) {
            for (const auto& band_node : column.second["bands"].as_sequence()) {
                ValueBand band{band_node["label"].as<std::string>(), band_node["min"].as<int>()};
                if (band_node.has("max")) {
                    band.max = band_node["max"].as<int>();
                }
                if (band.max < band.min) {
                    throw log::error(this, "Band '", band.label, "' of '", column.first, "' is empty");
                }
                recode.bands.push_back(std::move(band));
            }
        }
        if (column.second.has("keep")) {
            const auto keep = read_strings(column.second["keep"]);
            recode.keep.insert(std::begin(keep), std::end(keep));
        }
        recoder_.add(column.first, std::move(recode));
    }
}

void RunInitializer::read_units(const settings::SettingsNode& units_node) {
    const auto filename = units_node["file"].as<std::string>();
    const auto table = CsvTable::read(filename, read_delimiter(units_node));
    const auto id_column = table.column(units_node["id"].as<std::string>());
    const bool has_value = units_node.has("value");
    const std::size_t value_column = has_value ? table.column(units_node["value"].as<std::string>()) : 0;
    std::vector<std::string> category_names;
    if (units_node.has("categories")) {
        category_names = read_strings(units_node["categories"]);
    }
    const auto category_columns = read_columns(table, category_names);

    UnitTable units(category_names);
    std::size_t skipped = 0;
    for (std::size_t row = 0; row < table.size(); ++row) {
        if (has_value && table.cell(row, value_column).empty()) {
            ++skipped;
            continue;
        }
        units.add(table.cell(row, id_column), has_value ? table.number(row, value_column) : 1.0, read_categories(table, row, category_columns));
    }
    if (skipped > 0) {
        log::warning(this, skipped, " unit rows without value in ", filename, " skipped");
    }
    units_ = std::move(units);
    log::info(this, units_.size(), " unit rows read from ", filename, ", total ", units_.total());
}

void RunInitializer::join_attributes(const settings::SettingsNode& attributes_node) {
    const auto filename = attributes_node["file"].as<std::string>();
    const auto table = CsvTable::read(filename, read_delimiter(attributes_node));
    const auto id_column = table.column(attributes_node["id"].as<std::string>());
    const auto attribute_names = read_strings(attributes_node["categories"]);
    const auto attribute_columns = read_columns(table, attribute_names);

    std::map<std::string, CategoryTuple> attributes;
    for (std::size_t row = 0; row < table.size(); ++row) {
        if (!attributes.emplace(table.cell(row, id_column), read_categories(table, row, attribute_columns)).second) {
            throw log::error(this, "Unit '", table.cell(row, id_column), "' listed more than once in ", filename);
        }
    }

    auto category_names = units_.category_names;
    category_names.insert(std::end(category_names), std::begin(attribute_names), std::end(attribute_names));
    UnitTable units(category_names);
    std::set<std::string> missing;
    for (const auto& row : units_.rows) {
        const auto attribute = attributes.find(row.unit_id);
        if (attribute == std::end(attributes)) {
            if (missing.insert(row.unit_id).second) {
                report_.missing_joins.push_back(MissingJoin{MissingJoinKind::ATTRIBUTE, row.unit_id, {}, {}});
            }
            continue;
        }
        auto categories = row.categories;
        categories.insert(std::end(categories), std::begin(attribute->second), std::end(attribute->second));
        units.add(row.unit_id, row.base_value, std::move(categories));
    }
    if (!missing.empty()) {
        log::warning(this, missing.size(), " units without attributes in ", filename, " excluded");
    }
    units_ = std::move(units);
    log::info(this, "Attributes joined, total ", units_.total());
}

void RunInitializer::read_membership_table(const settings::SettingsNode& membership_node) {
    const auto filename = membership_node["file"].as<std::string>();
    const auto table = CsvTable::read(filename, read_delimiter(membership_node));
    const auto unit_column = table.column(membership_node["unit"].as<std::string>());
    const auto zone_column = table.column(membership_node["zone"].as<std::string>());
    const bool has_weight = membership_node.has("weight");
    const std::size_t weight_column = has_weight ? table.column(membership_node["weight"].as<std::string>()) : 0;
    const bool has_dominant = membership_node.has("dominant");
    const std::size_t dominant_column = has_dominant ? table.column(membership_node["dominant"].as<std::string>()) : 0;

    for (std::size_t row = 0; row < table.size(); ++row) {
        const auto& unit_id = table.cell(row, unit_column);
        membership_.add(unit_id, table.cell(row, zone_column), has_weight ? table.number(row, weight_column) : 1.0);
        if (has_dominant && !table.cell(row, dominant_column).empty()) {
            membership_.set_dominant(unit_id, table.cell(row, dominant_column));
        }
    }
    log::info(this, membership_.size(), " unit memberships read from ", filename);
}

void RunInitializer::apply_membership_rules(const settings::SettingsNode& rules_node) {
    std::map<std::string, std::string> prefixes;
    if (rules_node.has("prefixes")) {
        prefixes = read_string_map(rules_node["prefixes"]);
    }
    std::map<std::string, std::vector<MembershipEntry>> splits;
    if (rules_node.has("splits")) {
        for (const auto& split_node : rules_node["splits"].as_sequence()) {
            auto& entries = splits[split_node["unit"].as<std::string>()];
            for (const auto& zone : split_node["zones"].as_map()) {
                entries.push_back(MembershipEntry{zone.first, zone.second.as<double>()});
            }
        }
    }

    std::set<std::string> unit_ids;
    for (const auto& row : units_.rows) {
        unit_ids.insert(row.unit_id);
    }
    for (const auto& unit_id : unit_ids) {
        const auto split = splits.find(unit_id);
        if (split != std::end(splits)) {
            for (const auto& entry : split->second) {
                membership_.add(unit_id, entry.zone, entry.weight);
            }
            continue;
        }
        const std::string* zone = nullptr;
        std::size_t matched = 0;
        for (const auto& prefix : prefixes) {
            if (prefix.first.size() > matched && unit_id.compare(0, prefix.first.size(), prefix.first) == 0) {
                zone = &prefix.second;
                matched = prefix.first.size();
            }
        }
        if (zone != nullptr) {
            membership_.add(unit_id, *zone);
        }
    }
    for (const auto& split : splits) {
        if (unit_ids.count(split.first) == 0) {
            log::warning(this, "Split unit '", split.first, "' not found in units");
        }
    }
    log::info(this, membership_.size(), " unit memberships derived from rules, ", splits.size(), " split units");
}

void RunInitializer::read_targets(const settings::SettingsNode& targets_node) {
    const auto filename = targets_node["file"].as<std::string>();
    const auto table = CsvTable::read(filename, read_delimiter(targets_node));
    const auto zone_column = table.column(targets_node["zone"].as<std::string>());
    const auto axis_column = table.column(targets_node["axis"].as<std::string>());
    const auto value_column = table.column(targets_node["value"].as<std::string>());
    std::vector<std::string> category_names;
    if (targets_node.has("categories")) {
        category_names = read_strings(targets_node["categories"]);
    }
    const auto category_columns = read_columns(table, category_names);
    std::map<std::string, std::string> zone_names;
    if (targets_node.has("zone_names")) {
        zone_names = read_string_map(targets_node["zone_names"]);
    }

    TargetTotals targets(category_names);
    for (std::size_t row = 0; row < table.size(); ++row) {
        if (table.cell(row, value_column).empty()) {
            continue;
        }
        targets.add(table.cell(row, axis_column), StratumKey(renamed(zone_names, table.cell(row, zone_column)), read_categories(table, row, category_columns)),
                    table.number(row, value_column));
    }
    targets_ = std::make_unique<TargetTotals>(recoder_.empty() ? std::move(targets) : recoder_.apply(targets));
    log::info(this, targets_->size(), " target totals for ", targets_->targets().size(), " targets read from ", filename);
}

void RunInitializer::read_baseline(const settings::SettingsNode& baseline_node) {
    const auto filename = baseline_node["file"].as<std::string>();
    const auto table = CsvTable::read(filename, read_delimiter(baseline_node));
    const auto zone_column = table.column(baseline_node["zone"].as<std::string>());
    const auto value_column = table.column(baseline_node["value"].as<std::string>());
    std::vector<std::string> category_names;
    if (baseline_node.has("categories")) {
        category_names = read_strings(baseline_node["categories"]);
    }
    const auto category_columns = read_columns(table, category_names);
    std::map<std::string, std::string> zone_names;
    if (baseline_node.has("zone_names")) {
        zone_names = read_string_map(baseline_node["zone_names"]);
    }

    StratumTotals baseline(category_names);
    for (std::size_t row = 0; row < table.size(); ++row) {
        if (table.cell(row, value_column).empty()) {
            continue;
        }
        baseline.add(StratumKey(renamed(zone_names, table.cell(row, zone_column)), read_categories(table, row, category_columns)), table.number(row, value_column));
    }
    baseline_ = std::make_unique<StratumTotals>(recoder_.empty() ? std::move(baseline) : recoder_.apply(baseline));
    log::info(this, baseline_->size(), " baseline totals read from ", filename);
}

void RunInitializer::initialize() {
    if (settings_.has("recode")) {
        read_recodes(settings_["recode"]);
    }

    const settings::SettingsNode& units_node = settings_["units"];
    read_units(units_node);
    if (units_node.has("attributes")) {
        join_attributes(units_node["attributes"]);
    }
    if (!recoder_.empty()) {
        units_ = recoder_.apply(units_);
        log::info(this, "Units recoded, ", units_.size(), " rows, total ", units_.total());
    }

    const settings::SettingsNode& membership_node = settings_["membership"];
    membership_tolerance_ = membership_node["tolerance"].as<double>(1e-5);
    if (membership_node.has("rules")) {
        apply_membership_rules(membership_node["rules"]);
    } else {
        read_membership_table(membership_node);
    }

    if (settings_.has("targets")) {
        read_targets(settings_["targets"]);
    }
    if (settings_.has("baseline")) {
        read_baseline(settings_["baseline"]);
    }
}

}  // namespace arealloc
