#pragma once

#include <hastat/core/types.h>
#include <hastat/import/import_types.h>
#include <hastat/import/mutation_executor.h>
#include <hastat/import/summary_reporter.h>
#include <hastat/metadata/database.h>

#include <istream>
#include <vector>

namespace hastat::importer {

struct ImportOptions {
    ExecutionMode mode = ExecutionMode::Apply;
    TransactionScope scope = TransactionScope::PerRun;
};

/**
 * @brief End-to-end import on one connection: read, classify, plan, execute, summarize
 *
 * Fatal errors (CSV structure, metadata lookup, execution) come back as an Error with
 * nothing committed by the failing transaction. Invalid rows are not fatal; they are
 * listed in the report.
 */
class ImportService {
public:
    explicit ImportService(metadata::Database& db) : db_(db) {}

    Result<ImportReport> run(std::istream& csv, const ImportOptions& options = {});

    /**
     * @brief Parse CSV input into rows; the header must contain a table column
     *
     * Unknown columns (entity, date, anything else) are ignored and values are trimmed.
     */
    static Result<std::vector<ImportRow>> readRows(std::istream& csv);

private:
    metadata::Database& db_;
};

} // namespace hastat::importer
