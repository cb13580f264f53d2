#pragma once

#include <hastat/core/types.h>
#include <hastat/metadata/database.h>
#include <hastat/metadata/schema_catalog.h>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace hastat::metadata {

/**
 * @brief Row and column counts of one database table
 */
struct TableSummary {
    std::string name;
    int64_t rows = 0;
    int columns = 0;

    [[nodiscard]] int64_t records() const { return rows * columns; }
    [[nodiscard]] int64_t estimatedBytes() const { return records() * BYTES_PER_FIELD; }
};

/**
 * @brief Aggregated statistics of one entity across both statistics tables
 */
struct EntitySummary {
    MetadataId metadataId = 0;
    std::string statisticId;
    std::string unit;
    int64_t count = 0;
    std::optional<double> firstStartTs;
    std::optional<double> lastStartTs;
    double estimatedKb = 0.0;
};

struct EntityMetadata {
    MetadataId id = 0;
    std::string statisticId;
    std::string source;
    std::string unit;
};

/// Inclusive start_ts bounds
struct TimeRange {
    std::optional<double> after;
    std::optional<double> before;
};

struct ExportFilter {
    TimeRange range;
    std::optional<double> above;
    std::optional<double> below;
};

/**
 * @brief One statistics row as stored
 */
struct StatisticRecord {
    StatisticsTable table = StatisticsTable::LongTerm;
    RowId id = 0;
    std::optional<MetadataId> metadataId;
    std::optional<double> createdTs;
    std::optional<double> startTs;
    std::optional<double> mean;
    std::optional<double> min;
    std::optional<double> max;
    std::optional<std::string> lastReset;
    std::optional<double> lastResetTs;
    std::optional<double> state;
    std::optional<double> sum;
};

/**
 * @brief Batched metadata_id validation used while planning an import
 */
class IMetadataLookup {
public:
    virtual ~IMetadataLookup() = default;

    /**
     * @brief Subset of @p ids that exist in statistics_meta
     */
    virtual Result<std::set<MetadataId>> existingMetadataIds(const std::set<MetadataId>& ids) = 0;
};

/**
 * @brief Read queries against the recorder tables
 *
 * Borrows the connection; the caller owns it for the whole run.
 */
class RecorderStore : public IMetadataLookup {
public:
    explicit RecorderStore(Database& db) : db_(db) {}

    /// Every user table, sorted by name
    Result<std::vector<TableSummary>> tableSummaries();

    /**
     * @brief Per-entity counts and date ranges, ordered by metadata_id
     */
    Result<std::vector<EntitySummary>> entitySummaries(const TimeRange& range = {});

    Result<std::optional<EntityMetadata>> findMetadata(std::string_view statisticId);
    Result<std::optional<MetadataId>> findMetadataId(std::string_view statisticId);

    /**
     * @brief Batched existence check, chunked below SQLite's parameter limit
     */
    Result<std::set<MetadataId>> existingMetadataIds(const std::set<MetadataId>& ids) override;

    /**
     * @brief All rows of one entity: long-term first, then short-term, by start_ts then id
     */
    Result<std::vector<StatisticRecord>> exportRows(MetadataId metadataId,
                                                    const ExportFilter& filter = {});

    /// Point read by primary key
    Result<std::optional<StatisticRecord>> getRecord(StatisticsTable table, RowId id);

    Result<int64_t> countRows(StatisticsTable table);

private:
    Database& db_;

    Result<int> columnCount(const std::string& table);
};

} // namespace hastat::metadata
