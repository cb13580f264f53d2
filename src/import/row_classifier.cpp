// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <hastat/common/number_format.h>
#include <hastat/import/row_classifier.h>

namespace hastat::importer {

namespace {

ValidationIssue issue(const ImportRow& row, ValidationKind kind, std::string_view field,
                      std::string message) {
    return ValidationIssue{row.line, kind, std::string(field), std::move(message)};
}

bool allValuesBlank(const ImportRow& row) {
    return std::all_of(row.values.begin(), row.values.end(),
                       [](const std::string& v) { return v.empty(); });
}

std::variant<FieldValue, ValidationIssue> parseField(const ImportRow& row, StatisticField field) {
    const std::string& text = row.value(field);
    switch (field) {
        case StatisticField::LastReset:
            return FieldValue{text};
        case StatisticField::MetadataId:
            if (auto parsed = common::parseInteger(text))
                return FieldValue{*parsed};
            return issue(row, ValidationKind::InvalidValue, fieldName(field),
                         std::format("Invalid value for {}: '{}' is not an integer",
                                     fieldName(field), text));
        default:
            if (auto parsed = common::parseReal(text))
                return FieldValue{*parsed};
            return issue(row, ValidationKind::InvalidValue, fieldName(field),
                         std::format("Invalid value for {}: '{}' is not a finite number",
                                     fieldName(field), text));
    }
}

// Every non-blank field, typed, in StatisticField order
std::variant<FieldSet, ValidationIssue> parsePresentFields(const ImportRow& row) {
    FieldSet fields;
    for (auto field : kStatisticFields) {
        if (row.value(field).empty())
            continue;
        auto parsed = parseField(row, field);
        if (auto* bad = std::get_if<ValidationIssue>(&parsed))
            return std::move(*bad);
        fields.push_back({field, std::get<FieldValue>(std::move(parsed))});
    }
    return fields;
}

} // namespace

Classification RowClassifier::classify(const ImportRow& row) const {
    const bool blankValues = allValuesBlank(row);

    if (row.table.empty() && row.id.empty() && blankValues) {
        return SkippedRow{row.line};
    }

    if (row.table.empty()) {
        return issue(row, ValidationKind::MissingTable, "table", "Missing table name");
    }
    auto table = metadata::statisticsTableFromName(row.table);
    if (!table) {
        return issue(row, ValidationKind::UnknownTable, "table",
                     std::format("Unknown table: {}", row.table));
    }

    if (!row.id.empty()) {
        auto id = common::parseInteger(row.id);
        if (!id) {
            return issue(row, ValidationKind::InvalidValue, "id",
                         std::format("Invalid value for id: '{}' is not an integer", row.id));
        }

        auto parsed = parsePresentFields(row);
        if (auto* bad = std::get_if<ValidationIssue>(&parsed))
            return std::move(*bad);
        auto& fields = std::get<FieldSet>(parsed);

        bool hasMeasurement = std::any_of(fields.begin(), fields.end(), [](const auto& a) {
            return isMeasurementField(a.field);
        });
        if (!hasMeasurement) {
            return MutationIntent{DeleteIntent{*table, *id, row.line}};
        }
        return MutationIntent{UpdateIntent{*table, *id, std::move(fields), row.line}};
    }

    if (blankValues) {
        return SkippedRow{row.line};
    }
    if (row.value(StatisticField::MetadataId).empty()) {
        return issue(row, ValidationKind::MissingMetadataId, "metadata_id",
                     "Insert requires metadata_id");
    }
    if (row.value(StatisticField::StartTs).empty()) {
        return issue(row, ValidationKind::MissingStartTs, "start_ts", "Insert requires start_ts");
    }

    auto parsed = parsePresentFields(row);
    if (auto* bad = std::get_if<ValidationIssue>(&parsed))
        return std::move(*bad);
    auto& values = std::get<FieldSet>(parsed);

    if (!findField(values, StatisticField::CreatedTs)) {
        const FieldValue startTs = *findField(values, StatisticField::StartTs);
        auto pos = std::find_if(values.begin(), values.end(), [](const FieldAssignment& a) {
            return a.field > StatisticField::CreatedTs;
        });
        values.insert(pos, FieldAssignment{StatisticField::CreatedTs, startTs});
    }

    spdlog::debug("Line {}: insert into {} with {} fields", row.line, row.table, values.size());
    return MutationIntent{InsertIntent{*table, std::move(values), row.line}};
}

} // namespace hastat::importer
