#include <spdlog/spdlog.h>
#include <array>
#include <optional>
#include <hastat/common/csv.h>
#include <hastat/config/config_helpers.h>
#include <hastat/core/result_helpers.h>
#include <hastat/import/import_service.h>
#include <hastat/import/reconciliation_planner.h>
#include <hastat/import/row_classifier.h>
#include <hastat/metadata/recorder_store.h>
#include <hastat/metadata/schema_catalog.h>

namespace hastat::importer {

Result<std::vector<ImportRow>> ImportService::readRows(std::istream& csv) {
    common::CsvReader reader(csv);
    HASTAT_TRY(reader.readHeader());

    auto tableColumn = reader.columnIndex("table");
    if (!tableColumn) {
        return Error{ErrorCode::InvalidData, "CSV header has no 'table' column"};
    }
    auto idColumn = reader.columnIndex("id");

    std::array<std::optional<std::size_t>, kStatisticFieldCount> fieldColumns{};
    for (auto field : kStatisticFields) {
        fieldColumns[static_cast<std::size_t>(field)] = reader.columnIndex(fieldName(field));
    }

    HASTAT_TRY_UNWRAP(records, reader.readAll());

    std::vector<ImportRow> rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
        ImportRow row;
        row.line = record.line;
        row.table = config::trimmed(record.fields[*tableColumn]);
        if (idColumn)
            row.id = config::trimmed(record.fields[*idColumn]);
        for (std::size_t i = 0; i < kStatisticFieldCount; ++i) {
            if (fieldColumns[i])
                row.values[i] = config::trimmed(record.fields[*fieldColumns[i]]);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<ImportReport> ImportService::run(std::istream& csv, const ImportOptions& options) {
    HASTAT_TRY_UNWRAP(version, metadata::SchemaCatalog::readSchemaVersion(db_));
    auto schema = metadata::SchemaCatalog::checkSchemaVersion(version);
    if (schema.warning) {
        spdlog::debug("{}", *schema.warning);
    }

    HASTAT_TRY_UNWRAP(rows, readRows(csv));
    spdlog::debug("Read {} rows from CSV", rows.size());

    RowClassifier classifier;
    std::vector<Classification> classified;
    classified.reserve(rows.size());
    for (const auto& row : rows) {
        classified.push_back(classifier.classify(row));
    }

    metadata::RecorderStore store(db_);
    ReconciliationPlanner planner(store);
    HASTAT_TRY_UNWRAP(plan, planner.plan(std::move(classified)));

    MutationExecutor executor(db_);
    HASTAT_TRY_UNWRAP(execution, executor.execute(plan, options.mode, options.scope));

    return SummaryReporter::summarize(execution, plan, rows.size(), std::move(schema));
}

} // namespace hastat::importer
