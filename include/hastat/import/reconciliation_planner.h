#pragma once

#include <hastat/core/types.h>
#include <hastat/import/import_types.h>
#include <hastat/metadata/recorder_store.h>

#include <cstddef>
#include <vector>

namespace hastat::importer {

/**
 * @brief Intents of one table in execution order: deletes, updates, inserts
 */
struct TablePlan {
    StatisticsTable table;
    std::vector<MutationIntent> intents;
};

/**
 * @brief Planner output: executable intents plus everything that will not execute
 */
struct ImportPlan {
    /// Catalog order; tables without intents are omitted
    std::vector<TablePlan> tables;
    std::vector<ValidationIssue> invalid;
    std::vector<SkippedRow> skipped;
    std::vector<Conflict> conflicts;

    /// All intents across tables, in execution order
    [[nodiscard]] std::vector<MutationIntent> orderedIntents() const;
    [[nodiscard]] std::size_t intentCount() const;
};

/**
 * @brief Turn a run's classifications into an ordered, de-duplicated plan
 *
 * Validation issues never stop planning; every invalid row ends up in the plan so one
 * corrected re-run can fix them all. Only a failing metadata lookup is an error.
 */
class ReconciliationPlanner {
public:
    explicit ReconciliationPlanner(metadata::IMetadataLookup& lookup) : lookup_(lookup) {}

    Result<ImportPlan> plan(std::vector<Classification> results);

private:
    metadata::IMetadataLookup& lookup_;
};

} // namespace hastat::importer
