#include <format>
#include <hastat/import/import_types.h>

namespace hastat::importer {

std::string_view fieldName(StatisticField field) {
    switch (field) {
        case StatisticField::MetadataId:
            return "metadata_id";
        case StatisticField::CreatedTs:
            return "created_ts";
        case StatisticField::StartTs:
            return "start_ts";
        case StatisticField::Mean:
            return "mean";
        case StatisticField::Min:
            return "min";
        case StatisticField::Max:
            return "max";
        case StatisticField::LastReset:
            return "last_reset";
        case StatisticField::LastResetTs:
            return "last_reset_ts";
        case StatisticField::State:
            return "state";
        case StatisticField::Sum:
            return "sum";
    }
    return "";
}

const FieldValue* findField(const FieldSet& fields, StatisticField field) {
    for (const auto& assignment : fields) {
        if (assignment.field == field)
            return &assignment.value;
    }
    return nullptr;
}

StatisticsTable intentTable(const MutationIntent& intent) {
    return std::visit([](const auto& i) { return i.table; }, intent);
}

std::size_t intentLine(const MutationIntent& intent) {
    return std::visit([](const auto& i) { return i.line; }, intent);
}

std::string describeIntent(const MutationIntent& intent) {
    struct Describer {
        std::string operator()(const InsertIntent& i) const {
            return std::format("INSERT {} (line {})", metadata::tableName(i.table), i.line);
        }
        std::string operator()(const UpdateIntent& u) const {
            return std::format("UPDATE {} id={}", metadata::tableName(u.table), u.id);
        }
        std::string operator()(const DeleteIntent& d) const {
            return std::format("DELETE {} id={}", metadata::tableName(d.table), d.id);
        }
    };
    return std::visit(Describer{}, intent);
}

std::string_view validationKindName(ValidationKind kind) {
    switch (kind) {
        case ValidationKind::MissingTable:
            return "MissingTable";
        case ValidationKind::UnknownTable:
            return "UnknownTable";
        case ValidationKind::MissingMetadataId:
            return "MissingMetadataId";
        case ValidationKind::MissingStartTs:
            return "MissingStartTs";
        case ValidationKind::UnknownMetadataId:
            return "UnknownMetadataId";
        case ValidationKind::InvalidValue:
            return "InvalidValue";
    }
    return "Unknown";
}

} // namespace hastat::importer
