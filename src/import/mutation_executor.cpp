#include <spdlog/spdlog.h>
#include <format>
#include <hastat/core/result_helpers.h>
#include <hastat/import/mutation_executor.h>
#include <hastat/import/statement_builder.h>

namespace hastat::importer {

namespace {

Error intentFailure(const MutationIntent& intent, std::size_t index, const std::string& reason) {
    return Error{ErrorCode::ExecutionFailed,
                 std::format("Intent {} (line {}, {}) failed: {}", index, intentLine(intent),
                             describeIntent(intent), reason)};
}

void count(const MutationIntent& intent, ExecutionResult& result) {
    if (std::holds_alternative<InsertIntent>(intent)) {
        ++result.inserts;
    } else if (std::holds_alternative<UpdateIntent>(intent)) {
        ++result.updates;
    } else {
        ++result.deletes;
    }
}

void merge(ExecutionResult& into, ExecutionResult&& from) {
    into.inserts += from.inserts;
    into.updates += from.updates;
    into.deletes += from.deletes;
    into.insertedIds.insert(into.insertedIds.end(), from.insertedIds.begin(),
                            from.insertedIds.end());
}

} // namespace

Result<void> MutationExecutor::applyOne(const MutationIntent& intent, std::size_t index,
                                        ExecutionResult& result) {
    SqlStatement statement = buildStatement(intent);
    spdlog::debug("Executing intent {}: {}", index, statement.render());

    auto stmt = db_.prepare(statement.sql);
    if (!stmt) {
        return intentFailure(intent, index, stmt.error().message);
    }
    if (auto bound = statement.bindTo(stmt.value()); !bound) {
        return intentFailure(intent, index, bound.error().message);
    }
    if (auto executed = stmt.value().execute(); !executed) {
        return intentFailure(intent, index, executed.error().message);
    }

    if (std::holds_alternative<InsertIntent>(intent)) {
        result.insertedIds.push_back(db_.lastInsertRowId());
    } else if (int affected = db_.changes(); affected != 1) {
        // The row vanished (or never existed) between planning and execution
        return intentFailure(intent, index, std::format("expected 1 affected row, got {}", affected));
    }
    count(intent, result);
    return {};
}

Result<void> MutationExecutor::applyInTransaction(std::span<const MutationIntent> intents,
                                                  std::size_t firstIndex,
                                                  ExecutionResult& result) {
    metadata::Transaction tx(db_);
    if (!tx.status()) {
        return Error{ErrorCode::TransactionFailed,
                     "Failed to begin transaction: " + tx.status().error().message};
    }

    ExecutionResult pending;
    for (std::size_t i = 0; i < intents.size(); ++i) {
        auto applied = applyOne(intents[i], firstIndex + i, pending);
        if (!applied) {
            spdlog::error("{}", applied.error().message);
            return applied; // tx rolls back
        }
    }

    if (auto committed = tx.commit(); !committed) {
        return Error{ErrorCode::TransactionFailed,
                     "Failed to commit transaction: " + committed.error().message};
    }
    merge(result, std::move(pending));
    return {};
}

Result<ExecutionResult> MutationExecutor::execute(std::span<const MutationIntent> intents,
                                                  ExecutionMode mode) {
    ExecutionResult result;
    result.mode = mode;

    if (mode == ExecutionMode::DryRun) {
        result.statements.reserve(intents.size());
        for (const auto& intent : intents) {
            result.statements.push_back(buildStatement(intent).render());
            count(intent, result);
        }
        return result;
    }

    if (intents.empty()) {
        return result;
    }
    HASTAT_TRY(applyInTransaction(intents, 0, result));
    spdlog::debug("Committed {} inserts, {} updates, {} deletes", result.inserts, result.updates,
                  result.deletes);
    return result;
}

Result<ExecutionResult> MutationExecutor::execute(const ImportPlan& plan, ExecutionMode mode,
                                                  TransactionScope scope) {
    if (mode == ExecutionMode::DryRun || scope == TransactionScope::PerRun) {
        auto intents = plan.orderedIntents();
        return execute(std::span<const MutationIntent>(intents), mode);
    }

    ExecutionResult result;
    result.mode = mode;
    std::vector<std::string> committed;
    std::size_t offset = 0;

    for (const auto& tablePlan : plan.tables) {
        auto applied = applyInTransaction(tablePlan.intents, offset, result);
        if (!applied) {
            std::string done;
            for (const auto& name : committed) {
                done += done.empty() ? name : ", " + name;
            }
            return Error{applied.error().code,
                         std::format("{} (already committed: {})", applied.error().message,
                                     done.empty() ? "none" : done)};
        }
        committed.emplace_back(metadata::tableName(tablePlan.table));
        spdlog::debug("Committed {} intents for {}", tablePlan.intents.size(),
                      metadata::tableName(tablePlan.table));
        offset += tablePlan.intents.size();
    }
    return result;
}

} // namespace hastat::importer
