#pragma once

#include <hastat/core/types.h>
#include <hastat/metadata/schema_catalog.h>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hastat::importer {

using metadata::StatisticsTable;

/**
 * @brief Importable columns of a statistics row (everything except id)
 */
enum class StatisticField {
    MetadataId,
    CreatedTs,
    StartTs,
    Mean,
    Min,
    Max,
    LastReset,
    LastResetTs,
    State,
    Sum
};

inline constexpr std::size_t kStatisticFieldCount = 10;

inline constexpr std::array<StatisticField, kStatisticFieldCount> kStatisticFields = {
    StatisticField::MetadataId, StatisticField::CreatedTs,   StatisticField::StartTs,
    StatisticField::Mean,       StatisticField::Min,         StatisticField::Max,
    StatisticField::LastReset,  StatisticField::LastResetTs, StatisticField::State,
    StatisticField::Sum};

std::string_view fieldName(StatisticField field);

/**
 * @brief Measurement fields decide between delete and update for rows that carry an id
 *
 * metadata_id, created_ts and start_ts are key fields; a row with an id whose measurement
 * fields are all blank is a delete even when the key fields are filled in (the shape an
 * exported row takes after its values are cleared).
 */
constexpr bool isMeasurementField(StatisticField field) {
    return field != StatisticField::MetadataId && field != StatisticField::CreatedTs &&
           field != StatisticField::StartTs;
}

/// A typed column value; the alternative follows the catalog column type
using FieldValue = std::variant<int64_t, double, std::string>;

struct FieldAssignment {
    StatisticField field;
    FieldValue value;

    bool operator==(const FieldAssignment&) const = default;
};

/// Assignments in StatisticField order, at most one per field
using FieldSet = std::vector<FieldAssignment>;

const FieldValue* findField(const FieldSet& fields, StatisticField field);

/**
 * @brief One parsed input line, still as strings
 *
 * Empty strings mean "not specified", which is distinct from a literal zero.
 */
struct ImportRow {
    std::size_t line = 0;
    std::string table;
    std::string id;
    std::array<std::string, kStatisticFieldCount> values{};

    [[nodiscard]] const std::string& value(StatisticField field) const {
        return values[static_cast<std::size_t>(field)];
    }
    std::string& value(StatisticField field) { return values[static_cast<std::size_t>(field)]; }
};

struct InsertIntent {
    StatisticsTable table;
    FieldSet values;
    std::size_t line = 0;
};

/// Sparse patch: only the listed fields are written
struct UpdateIntent {
    StatisticsTable table;
    RowId id;
    FieldSet changes;
    std::size_t line = 0;
};

struct DeleteIntent {
    StatisticsTable table;
    RowId id;
    std::size_t line = 0;
};

using MutationIntent = std::variant<InsertIntent, UpdateIntent, DeleteIntent>;

StatisticsTable intentTable(const MutationIntent& intent);
std::size_t intentLine(const MutationIntent& intent);

/**
 * @brief Short human label, e.g. "UPDATE statistics id=5"
 */
std::string describeIntent(const MutationIntent& intent);

/// A blank line: counted, never executed, never an error
struct SkippedRow {
    std::size_t line = 0;
};

enum class ValidationKind {
    MissingTable,
    UnknownTable,
    MissingMetadataId,
    MissingStartTs,
    UnknownMetadataId,
    InvalidValue
};

std::string_view validationKindName(ValidationKind kind);

struct ValidationIssue {
    std::size_t line = 0;
    ValidationKind kind;
    std::string field;
    std::string message;
};

using Classification = std::variant<MutationIntent, SkippedRow, ValidationIssue>;

/**
 * @brief A (table, id) targeted by more than one row; the later row wins
 */
struct Conflict {
    StatisticsTable table;
    RowId id;
    std::size_t overriddenLine = 0;
    std::size_t winningLine = 0;
};

} // namespace hastat::importer
