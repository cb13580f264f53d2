#pragma once

#include <hastat/import/import_types.h>
#include <hastat/import/mutation_executor.h>
#include <hastat/import/reconciliation_planner.h>
#include <hastat/metadata/schema_catalog.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace hastat::importer {

/**
 * @brief Outcome of one import run
 */
struct ImportReport {
    ExecutionMode mode = ExecutionMode::Apply;
    std::size_t rowsRead = 0;
    std::size_t skipped = 0;
    std::size_t invalid = 0;
    std::map<ValidationKind, std::size_t> invalidByKind;
    /// Every invalid row with its reason, by line
    std::vector<ValidationIssue> invalidRows;
    std::vector<Conflict> conflicts;
    /// Applied, or would-apply in a dry run
    std::size_t inserts = 0;
    std::size_t updates = 0;
    std::size_t deletes = 0;
    std::vector<RowId> insertedIds;
    /// Literal statements in planning order (dry run only)
    std::vector<std::string> statements;
    metadata::SchemaCheck schema;

    [[nodiscard]] std::size_t conflictCount() const { return conflicts.size(); }
};

class SummaryReporter {
public:
    /**
     * @brief Pure aggregation of executor output and planner diagnostics
     */
    static ImportReport summarize(const ExecutionResult& execution, const ImportPlan& diagnostics,
                                  std::size_t rowsRead = 0, metadata::SchemaCheck schema = {});

    /**
     * @brief "2 inserts, 1 updates, 1 deletes, 3 skips, 1 invalid, 0 conflicts"
     */
    static std::string countsLine(const ImportReport& report);

    /**
     * @brief One line per invalid row and per conflict
     */
    static std::vector<std::string> detailLines(const ImportReport& report);
};

} // namespace hastat::importer
