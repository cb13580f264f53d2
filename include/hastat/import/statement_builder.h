#pragma once

#include <hastat/core/types.h>
#include <hastat/import/import_types.h>
#include <hastat/metadata/database.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace hastat::importer {

using SqlValue = std::variant<std::nullptr_t, int64_t, double, std::string>;

/**
 * @brief Render a value as an SQL literal: NULL, 42, 3198.37, 'text'
 */
std::string renderLiteral(const SqlValue& value);

SqlValue toSqlValue(const FieldValue& value);

/**
 * @brief Parameterized statement with its positional values
 */
struct SqlStatement {
    std::string sql;
    std::vector<SqlValue> params;

    /**
     * @brief Bind params to a statement prepared from sql
     */
    Result<void> bindTo(metadata::Statement& stmt) const;

    /**
     * @brief Literal, directly executable form terminated by ';'
     */
    [[nodiscard]] std::string render() const;
};

/**
 * @brief Builder for the point INSERT/UPDATE/DELETE statements the importer issues
 */
class StatementBuilder {
public:
    StatementBuilder& insertInto(std::string_view table);
    StatementBuilder& value(std::string_view column, SqlValue value);

    StatementBuilder& update(std::string_view table);
    StatementBuilder& set(std::string_view column, SqlValue value);

    StatementBuilder& deleteFrom(std::string_view table);

    StatementBuilder& whereEquals(std::string_view column, SqlValue value);

    [[nodiscard]] SqlStatement build() const;

    void reset();

private:
    enum class StatementType { None, Insert, Update, Delete };

    StatementType type_ = StatementType::None;
    std::string table_;
    std::vector<std::pair<std::string, SqlValue>> columns_;
    std::vector<std::pair<std::string, SqlValue>> where_;
};

/**
 * @brief The statement that carries out one intent
 */
SqlStatement buildStatement(const MutationIntent& intent);

} // namespace hastat::importer
