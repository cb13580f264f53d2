#pragma once

#include <hastat/core/types.h>
#include <hastat/import/import_types.h>
#include <hastat/import/reconciliation_planner.h>
#include <hastat/metadata/database.h>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace hastat::importer {

enum class ExecutionMode { Apply, DryRun };

/**
 * @brief Transaction boundary for Apply runs
 */
enum class TransactionScope {
    PerRun,  ///< one transaction for every table (default)
    PerTable ///< one transaction per table, in catalog order
};

struct ExecutionResult {
    ExecutionMode mode = ExecutionMode::Apply;
    std::size_t inserts = 0;
    std::size_t updates = 0;
    std::size_t deletes = 0;
    /// Generated ids of applied inserts, in execution order
    std::vector<RowId> insertedIds;
    /// Literal statements in planning order (dry run only)
    std::vector<std::string> statements;
};

/**
 * @brief Apply intents in a transaction, or render them as SQL without writing
 *
 * Apply is all-or-nothing per transaction: an update or delete that does not hit exactly
 * one row, or any database error, rolls back and fails with ExecutionFailed naming the
 * intent index. DryRun never touches the database and never fails.
 */
class MutationExecutor {
public:
    explicit MutationExecutor(metadata::Database& db) : db_(db) {}

    Result<ExecutionResult> execute(std::span<const MutationIntent> intents, ExecutionMode mode);

    /**
     * @brief Execute a whole plan; PerTable commits each table on its own
     *
     * On a PerTable failure the error message lists the tables that already committed.
     */
    Result<ExecutionResult> execute(const ImportPlan& plan, ExecutionMode mode,
                                    TransactionScope scope = TransactionScope::PerRun);

private:
    metadata::Database& db_;

    Result<void> applyOne(const MutationIntent& intent, std::size_t index, ExecutionResult& result);
    Result<void> applyInTransaction(std::span<const MutationIntent> intents, std::size_t firstIndex,
                                    ExecutionResult& result);
};

} // namespace hastat::importer
