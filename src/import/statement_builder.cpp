#include <hastat/common/number_format.h>
#include <hastat/import/statement_builder.h>

namespace hastat::importer {

std::string renderLiteral(const SqlValue& value) {
    struct Renderer {
        std::string operator()(std::nullptr_t) const { return "NULL"; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const { return common::formatReal(v); }
        std::string operator()(const std::string& v) const { return common::sqlQuote(v); }
    };
    return std::visit(Renderer{}, value);
}

SqlValue toSqlValue(const FieldValue& value) {
    return std::visit([](const auto& v) -> SqlValue { return v; }, value);
}

Result<void> SqlStatement::bindTo(metadata::Statement& stmt) const {
    int index = 1;
    for (const auto& param : params) {
        auto result = std::visit([&](const auto& v) { return stmt.bind(index, v); }, param);
        if (!result)
            return result;
        ++index;
    }
    return {};
}

std::string SqlStatement::render() const {
    std::string out;
    out.reserve(sql.size() + params.size() * 8 + 1);
    std::size_t next = 0;
    // The builder only emits '?' as a placeholder; identifiers come from the catalog
    for (char c : sql) {
        if (c == '?' && next < params.size()) {
            out += renderLiteral(params[next++]);
        } else {
            out += c;
        }
    }
    out += ';';
    return out;
}

StatementBuilder& StatementBuilder::insertInto(std::string_view table) {
    type_ = StatementType::Insert;
    table_ = table;
    return *this;
}

StatementBuilder& StatementBuilder::value(std::string_view column, SqlValue value) {
    columns_.emplace_back(std::string(column), std::move(value));
    return *this;
}

StatementBuilder& StatementBuilder::update(std::string_view table) {
    type_ = StatementType::Update;
    table_ = table;
    return *this;
}

StatementBuilder& StatementBuilder::set(std::string_view column, SqlValue value) {
    columns_.emplace_back(std::string(column), std::move(value));
    return *this;
}

StatementBuilder& StatementBuilder::deleteFrom(std::string_view table) {
    type_ = StatementType::Delete;
    table_ = table;
    return *this;
}

StatementBuilder& StatementBuilder::whereEquals(std::string_view column, SqlValue value) {
    where_.emplace_back(std::string(column), std::move(value));
    return *this;
}

SqlStatement StatementBuilder::build() const {
    SqlStatement out;

    switch (type_) {
        case StatementType::Insert: {
            std::string names;
            std::string placeholders;
            for (std::size_t i = 0; i < columns_.size(); ++i) {
                if (i > 0) {
                    names += ", ";
                    placeholders += ", ";
                }
                names += columns_[i].first;
                placeholders += "?";
                out.params.push_back(columns_[i].second);
            }
            out.sql = "INSERT INTO " + table_ + " (" + names + ") VALUES (" + placeholders + ")";
            return out;
        }
        case StatementType::Update: {
            out.sql = "UPDATE " + table_ + " SET ";
            for (std::size_t i = 0; i < columns_.size(); ++i) {
                if (i > 0)
                    out.sql += ", ";
                out.sql += columns_[i].first + " = ?";
                out.params.push_back(columns_[i].second);
            }
            break;
        }
        case StatementType::Delete:
            out.sql = "DELETE FROM " + table_;
            break;
        case StatementType::None:
            return out;
    }

    for (std::size_t i = 0; i < where_.size(); ++i) {
        out.sql += (i == 0) ? " WHERE " : " AND ";
        out.sql += where_[i].first + " = ?";
        out.params.push_back(where_[i].second);
    }
    return out;
}

void StatementBuilder::reset() {
    type_ = StatementType::None;
    table_.clear();
    columns_.clear();
    where_.clear();
}

SqlStatement buildStatement(const MutationIntent& intent) {
    struct Visitor {
        SqlStatement operator()(const InsertIntent& insert) const {
            StatementBuilder builder;
            builder.insertInto(metadata::tableName(insert.table));
            for (const auto& assignment : insert.values) {
                builder.value(fieldName(assignment.field), toSqlValue(assignment.value));
            }
            return builder.build();
        }
        SqlStatement operator()(const UpdateIntent& update) const {
            StatementBuilder builder;
            builder.update(metadata::tableName(update.table));
            for (const auto& assignment : update.changes) {
                builder.set(fieldName(assignment.field), toSqlValue(assignment.value));
            }
            return builder.whereEquals("id", update.id).build();
        }
        SqlStatement operator()(const DeleteIntent& del) const {
            StatementBuilder builder;
            return builder.deleteFrom(metadata::tableName(del.table))
                .whereEquals("id", del.id)
                .build();
        }
    };
    return std::visit(Visitor{}, intent);
}

} // namespace hastat::importer
