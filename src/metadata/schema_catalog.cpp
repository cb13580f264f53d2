#include <spdlog/spdlog.h>
#include <format>
#include <hastat/core/result_helpers.h>
#include <hastat/metadata/schema_catalog.h>

namespace hastat::metadata {

namespace {

std::vector<ColumnSpec> statisticsColumns() {
    return {
        {"id", ColumnType::Integer, false},
        {"created_ts", ColumnType::Real},
        {"metadata_id", ColumnType::Integer},
        {"start_ts", ColumnType::Real},
        {"mean", ColumnType::Real},
        {"min", ColumnType::Real},
        {"max", ColumnType::Real},
        {"last_reset", ColumnType::Text},
        {"last_reset_ts", ColumnType::Real},
        {"state", ColumnType::Real},
        {"sum", ColumnType::Real},
    };
}

TableSpec statisticsSpec(std::string_view name) {
    return TableSpec{
        .name = name,
        .primaryKey = "id",
        .columns = statisticsColumns(),
        .requiredForInsert = {"metadata_id", "start_ts"},
        .optionalImport = {"created_ts", "mean", "min", "max", "last_reset", "last_reset_ts",
                           "state", "sum"},
    };
}

const std::vector<TableSpec>& knownTables() {
    static const std::vector<TableSpec> tables = {
        statisticsSpec("statistics"),
        statisticsSpec("statistics_short_term"),
        TableSpec{
            .name = "statistics_meta",
            .primaryKey = "id",
            .columns = {{"id", ColumnType::Integer, false},
                        {"statistic_id", ColumnType::Text},
                        {"source", ColumnType::Text},
                        {"unit_of_measurement", ColumnType::Text}},
        },
        TableSpec{
            .name = "schema_changes",
            .primaryKey = "change_id",
            .columns = {{"change_id", ColumnType::Integer, false},
                        {"schema_version", ColumnType::Integer},
                        {"changed", ColumnType::Text}},
        },
    };
    return tables;
}

constexpr std::array<std::string_view, 14> kCsvColumns = {
    "table", "entity", "date",       "id",            "metadata_id", "created_ts", "start_ts",
    "mean",  "min",    "max",        "last_reset",    "last_reset_ts", "state",    "sum"};

} // namespace

std::string_view tableName(StatisticsTable table) {
    switch (table) {
        case StatisticsTable::LongTerm:
            return "statistics";
        case StatisticsTable::ShortTerm:
            return "statistics_short_term";
    }
    return "statistics";
}

std::optional<StatisticsTable> statisticsTableFromName(std::string_view name) {
    for (auto table : kStatisticsTables) {
        if (tableName(table) == name)
            return table;
    }
    return std::nullopt;
}

const ColumnSpec* TableSpec::column(std::string_view columnName) const {
    for (const auto& col : columns) {
        if (col.name == columnName)
            return &col;
    }
    return nullptr;
}

Result<const TableSpec*> SchemaCatalog::describe(std::string_view tableName) {
    for (const auto& spec : knownTables()) {
        if (spec.name == tableName)
            return &spec;
    }
    return Error{ErrorCode::UnknownTable, "Unknown table: " + std::string(tableName)};
}

const TableSpec& SchemaCatalog::describe(StatisticsTable table) {
    return knownTables()[table == StatisticsTable::LongTerm ? 0 : 1];
}

std::span<const TableSpec> SchemaCatalog::tables() {
    return knownTables();
}

std::span<const std::string_view> SchemaCatalog::csvColumns() {
    return kCsvColumns;
}

SchemaCheck SchemaCatalog::checkSchemaVersion(std::optional<int> observedVersion) {
    SchemaCheck check;
    check.observedVersion = observedVersion;
    if (observedVersion && *observedVersion > KNOWN_SCHEMA_VERSION) {
        check.compatible = false;
        check.warning = std::format("Detected schema version {} > {}. This may indicate "
                                    "compatibility issues. Proceed with caution.",
                                    *observedVersion, KNOWN_SCHEMA_VERSION);
    }
    return check;
}

Result<std::optional<int>> SchemaCatalog::readSchemaVersion(Database& db) {
    HASTAT_TRY_UNWRAP(exists, db.tableExists("schema_changes"));
    if (!exists) {
        spdlog::debug("No schema_changes table; schema version unknown");
        return std::optional<int>{};
    }

    HASTAT_TRY_UNWRAP(stmt, db.prepare("SELECT schema_version FROM schema_changes "
                                       "ORDER BY change_id DESC LIMIT 1"));
    HASTAT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow || stmt.isNull(0)) {
        return std::optional<int>{};
    }
    return std::optional<int>{stmt.getInt(0)};
}

} // namespace hastat::metadata
