#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <hastat/core/result_helpers.h>
#include <hastat/import/reconciliation_planner.h>

namespace hastat::importer {

namespace {

using TargetKey = std::pair<StatisticsTable, RowId>;

std::optional<MetadataId> referencedMetadataId(const MutationIntent& intent) {
    const FieldSet* fields = nullptr;
    if (const auto* insert = std::get_if<InsertIntent>(&intent)) {
        fields = &insert->values;
    } else if (const auto* update = std::get_if<UpdateIntent>(&intent)) {
        fields = &update->changes;
    } else {
        return std::nullopt;
    }
    const FieldValue* value = findField(*fields, StatisticField::MetadataId);
    if (!value)
        return std::nullopt;
    return std::get<int64_t>(*value);
}

std::optional<TargetKey> targetKey(const MutationIntent& intent) {
    if (const auto* update = std::get_if<UpdateIntent>(&intent))
        return TargetKey{update->table, update->id};
    if (const auto* del = std::get_if<DeleteIntent>(&intent))
        return TargetKey{del->table, del->id};
    return std::nullopt;
}

} // namespace

std::vector<MutationIntent> ImportPlan::orderedIntents() const {
    std::vector<MutationIntent> out;
    out.reserve(intentCount());
    for (const auto& tablePlan : tables) {
        out.insert(out.end(), tablePlan.intents.begin(), tablePlan.intents.end());
    }
    return out;
}

std::size_t ImportPlan::intentCount() const {
    std::size_t count = 0;
    for (const auto& tablePlan : tables) {
        count += tablePlan.intents.size();
    }
    return count;
}

Result<ImportPlan> ReconciliationPlanner::plan(std::vector<Classification> results) {
    ImportPlan plan;
    std::vector<MutationIntent> intents;

    for (auto& result : results) {
        if (auto* intent = std::get_if<MutationIntent>(&result)) {
            intents.push_back(std::move(*intent));
        } else if (auto* skipped = std::get_if<SkippedRow>(&result)) {
            plan.skipped.push_back(*skipped);
        } else {
            plan.invalid.push_back(std::move(std::get<ValidationIssue>(result)));
        }
    }

    // One lookup for every metadata_id any intent references
    std::set<MetadataId> referenced;
    for (const auto& intent : intents) {
        if (auto id = referencedMetadataId(intent))
            referenced.insert(*id);
    }
    if (!referenced.empty()) {
        HASTAT_TRY_UNWRAP(existing, lookup_.existingMetadataIds(referenced));

        std::vector<MutationIntent> known;
        known.reserve(intents.size());
        for (auto& intent : intents) {
            auto id = referencedMetadataId(intent);
            if (id && !existing.contains(*id)) {
                plan.invalid.push_back(ValidationIssue{
                    intentLine(intent), ValidationKind::UnknownMetadataId, "metadata_id",
                    std::format("Unknown metadata_id: {}", *id)});
                continue;
            }
            known.push_back(std::move(intent));
        }
        intents = std::move(known);
    }

    // Last write wins per (table, id)
    std::map<TargetKey, std::size_t> lastIndex;
    for (std::size_t i = 0; i < intents.size(); ++i) {
        if (auto key = targetKey(intents[i]))
            lastIndex[*key] = i;
    }

    std::vector<MutationIntent> survivors;
    survivors.reserve(intents.size());
    for (std::size_t i = 0; i < intents.size(); ++i) {
        if (auto key = targetKey(intents[i])) {
            std::size_t winner = lastIndex[*key];
            if (winner != i) {
                Conflict conflict{key->first, key->second, intentLine(intents[i]),
                                  intentLine(intents[winner])};
                spdlog::debug("Line {} overridden by line {} for {} id={}",
                              conflict.overriddenLine, conflict.winningLine,
                              metadata::tableName(conflict.table), conflict.id);
                plan.conflicts.push_back(conflict);
                continue;
            }
        }
        survivors.push_back(std::move(intents[i]));
    }

    for (auto table : metadata::kStatisticsTables) {
        TablePlan tablePlan{table, {}};
        auto appendKind = [&](auto kindTag) {
            using Kind = decltype(kindTag);
            for (const auto& intent : survivors) {
                if (std::holds_alternative<Kind>(intent) && intentTable(intent) == table)
                    tablePlan.intents.push_back(intent);
            }
        };
        appendKind(DeleteIntent{});
        appendKind(UpdateIntent{});
        appendKind(InsertIntent{});
        if (!tablePlan.intents.empty())
            plan.tables.push_back(std::move(tablePlan));
    }

    std::stable_sort(plan.invalid.begin(), plan.invalid.end(),
                     [](const ValidationIssue& a, const ValidationIssue& b) { return a.line < b.line; });

    spdlog::debug("Planned {} intents across {} tables ({} invalid, {} skipped, {} conflicts)",
                  plan.intentCount(), plan.tables.size(), plan.invalid.size(), plan.skipped.size(),
                  plan.conflicts.size());
    return plan;
}

} // namespace hastat::importer
