#pragma once

#include <hastat/core/types.h>
#include <hastat/metadata/database.h>

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hastat::metadata {

/// Highest recorder schema version the column assumptions below were written against
inline constexpr int KNOWN_SCHEMA_VERSION = 50;

/// Estimated storage per field, used for the size columns of status and list
inline constexpr int BYTES_PER_FIELD = 8;

enum class ColumnType { Integer, Real, Text };

struct ColumnSpec {
    std::string_view name;
    ColumnType type;
    bool nullable = true;
};

/**
 * @brief The two structurally identical statistics tables
 *
 * Table membership is part of a record's identity.
 */
enum class StatisticsTable { LongTerm, ShortTerm };

inline constexpr std::array<StatisticsTable, 2> kStatisticsTables = {StatisticsTable::LongTerm,
                                                                     StatisticsTable::ShortTerm};

std::string_view tableName(StatisticsTable table);

/**
 * @brief Map a table name to a statistics table, if it is one
 */
std::optional<StatisticsTable> statisticsTableFromName(std::string_view name);

/**
 * @brief Static description of one known table
 */
struct TableSpec {
    std::string_view name;
    std::string_view primaryKey;
    std::vector<ColumnSpec> columns;
    /// Columns an import row must specify to insert (empty for non-importable tables)
    std::vector<std::string_view> requiredForInsert;
    /// Columns an import row may specify in addition to the required ones
    std::vector<std::string_view> optionalImport;

    [[nodiscard]] const ColumnSpec* column(std::string_view columnName) const;
    [[nodiscard]] bool importable() const { return !requiredForInsert.empty(); }
};

/**
 * @brief Outcome of comparing the observed schema version with KNOWN_SCHEMA_VERSION
 */
struct SchemaCheck {
    bool compatible = true;
    std::optional<int> observedVersion;
    std::optional<std::string> warning;
};

/**
 * @brief Read-only catalog of the recorder tables this tool understands
 */
class SchemaCatalog {
public:
    /**
     * @brief Describe a known table
     * @return the table description, or UnknownTable
     */
    static Result<const TableSpec*> describe(std::string_view tableName);

    static const TableSpec& describe(StatisticsTable table);

    /**
     * @brief All known tables: statistics, statistics_short_term, statistics_meta,
     *        schema_changes
     */
    static std::span<const TableSpec> tables();

    /**
     * @brief Column order of the export/import CSV contract
     *
     * table, entity, date, id, metadata_id, created_ts, start_ts, mean, min, max, last_reset,
     * last_reset_ts, state, sum. entity and date are display-only.
     */
    static std::span<const std::string_view> csvColumns();

    /**
     * @brief Compare an observed schema version with the known one
     *
     * A newer database stays usable; the caller is warned that column assumptions may be
     * stale. An unknown version (nullopt) is treated as compatible.
     */
    static SchemaCheck checkSchemaVersion(std::optional<int> observedVersion);

    /**
     * @brief Schema version recorded in the newest schema_changes row
     * @return nullopt when the table is absent or empty
     */
    static Result<std::optional<int>> readSchemaVersion(Database& db);
};

} // namespace hastat::metadata
