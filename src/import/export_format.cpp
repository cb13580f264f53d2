#include <hastat/common/number_format.h>
#include <hastat/import/export_format.h>
#include <hastat/metadata/schema_catalog.h>

namespace hastat::importer {

namespace {

std::string realField(const std::optional<double>& value) {
    return value ? common::formatReal(*value) : std::string{};
}

// Display-only column; the importer ignores it
std::string dateField(const std::optional<double>& startTs) {
    return startTs ? common::formatUtcTimestamp(*startTs) : std::string{};
}

} // namespace

std::vector<std::string> exportHeader() {
    auto columns = metadata::SchemaCatalog::csvColumns();
    return std::vector<std::string>(columns.begin(), columns.end());
}

std::vector<std::string> exportFields(const metadata::StatisticRecord& record,
                                      std::string_view entity) {
    return {
        std::string(metadata::tableName(record.table)),
        std::string(entity),
        dateField(record.startTs),
        std::to_string(record.id),
        record.metadataId ? std::to_string(*record.metadataId) : std::string{},
        realField(record.createdTs),
        realField(record.startTs),
        realField(record.mean),
        realField(record.min),
        realField(record.max),
        record.lastReset.value_or(std::string{}),
        realField(record.lastResetTs),
        realField(record.state),
        realField(record.sum),
    };
}

} // namespace hastat::importer
