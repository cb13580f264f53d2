#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <map>
#include <hastat/core/result_helpers.h>
#include <hastat/metadata/recorder_store.h>

namespace hastat::metadata {

namespace {

// SQLite's default SQLITE_MAX_VARIABLE_NUMBER is 999 on older builds
constexpr std::size_t kMaxParamsPerQuery = 500;

constexpr const char* kRecordColumns =
    "id, metadata_id, created_ts, start_ts, mean, min, max, last_reset, last_reset_ts, state, sum";

std::string quoteIdentifier(std::string_view name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::optional<double> optionalDouble(const Statement& stmt, int column) {
    if (stmt.isNull(column))
        return std::nullopt;
    return stmt.getDouble(column);
}

StatisticRecord readRecord(const Statement& stmt, StatisticsTable table) {
    StatisticRecord record;
    record.table = table;
    record.id = stmt.getInt64(0);
    if (!stmt.isNull(1))
        record.metadataId = stmt.getInt64(1);
    record.createdTs = optionalDouble(stmt, 2);
    record.startTs = optionalDouble(stmt, 3);
    record.mean = optionalDouble(stmt, 4);
    record.min = optionalDouble(stmt, 5);
    record.max = optionalDouble(stmt, 6);
    if (!stmt.isNull(7))
        record.lastReset = stmt.getString(7);
    record.lastResetTs = optionalDouble(stmt, 8);
    record.state = optionalDouble(stmt, 9);
    record.sum = optionalDouble(stmt, 10);
    return record;
}

struct RangeClause {
    std::string sql;
    std::vector<double> params;
};

RangeClause startTsClause(const TimeRange& range) {
    RangeClause clause;
    if (range.after) {
        clause.sql += " AND start_ts >= ?";
        clause.params.push_back(*range.after);
    }
    if (range.before) {
        clause.sql += " AND start_ts <= ?";
        clause.params.push_back(*range.before);
    }
    return clause;
}

// Any of mean/min/max inside the (exclusive) thresholds
RangeClause thresholdClause(const ExportFilter& filter) {
    RangeClause clause;
    if (filter.above && filter.below) {
        clause.sql = " AND ((mean > ? AND mean < ?) OR (min > ? AND min < ?) OR "
                     "(max > ? AND max < ?))";
        for (int i = 0; i < 3; ++i) {
            clause.params.push_back(*filter.above);
            clause.params.push_back(*filter.below);
        }
    } else if (filter.above) {
        clause.sql = " AND (mean > ? OR min > ? OR max > ?)";
        clause.params.assign(3, *filter.above);
    } else if (filter.below) {
        clause.sql = " AND (mean < ? OR min < ? OR max < ?)";
        clause.params.assign(3, *filter.below);
    }
    return clause;
}

} // namespace

Result<int> RecorderStore::columnCount(const std::string& table) {
    HASTAT_TRY_UNWRAP(stmt, db_.prepare("PRAGMA table_info(" + quoteIdentifier(table) + ")"));
    int count = 0;
    while (true) {
        HASTAT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        ++count;
    }
    return count;
}

Result<std::vector<TableSummary>> RecorderStore::tableSummaries() {
    HASTAT_TRY_UNWRAP(stmt, db_.prepare("SELECT name FROM sqlite_master WHERE type = 'table' "
                                        "AND name NOT LIKE 'sqlite_%' ORDER BY name"));
    std::vector<std::string> names;
    while (true) {
        HASTAT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        names.push_back(stmt.getString(0));
    }

    std::vector<TableSummary> summaries;
    summaries.reserve(names.size());
    for (const auto& name : names) {
        TableSummary summary;
        summary.name = name;
        HASTAT_TRY_ASSIGN(summary.columns, columnCount(name));

        HASTAT_TRY_UNWRAP(countStmt, db_.prepare("SELECT COUNT(*) FROM " + quoteIdentifier(name)));
        HASTAT_TRY_UNWRAP(hasCount, countStmt.step());
        summary.rows = hasCount ? countStmt.getInt64(0) : 0;
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

Result<std::vector<EntitySummary>> RecorderStore::entitySummaries(const TimeRange& range) {
    std::map<MetadataId, EntitySummary> aggregated;
    auto clause = startTsClause(range);

    for (auto table : kStatisticsTables) {
        std::string sql = std::format("SELECT metadata_id, MIN(start_ts), MAX(start_ts), COUNT(*) "
                                      "FROM {} WHERE metadata_id IS NOT NULL{} "
                                      "GROUP BY metadata_id",
                                      tableName(table), clause.sql);
        HASTAT_TRY_UNWRAP(stmt, db_.prepare(sql));
        int index = 1;
        for (double param : clause.params) {
            HASTAT_TRY(stmt.bind(index++, param));
        }

        while (true) {
            HASTAT_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            MetadataId id = stmt.getInt64(0);
            auto& entry = aggregated[id];
            entry.metadataId = id;
            entry.count += stmt.getInt64(3);
            if (auto first = optionalDouble(stmt, 1)) {
                entry.firstStartTs =
                    entry.firstStartTs ? std::min(*entry.firstStartTs, *first) : *first;
            }
            if (auto last = optionalDouble(stmt, 2)) {
                entry.lastStartTs = entry.lastStartTs ? std::max(*entry.lastStartTs, *last) : *last;
            }
        }
    }

    if (aggregated.empty()) {
        return std::vector<EntitySummary>{};
    }

    HASTAT_TRY_UNWRAP(cols, columnCount(std::string(tableName(StatisticsTable::LongTerm))));

    HASTAT_TRY_UNWRAP(metaStmt,
                      db_.prepare("SELECT id, statistic_id, unit_of_measurement FROM statistics_meta"));
    while (true) {
        HASTAT_TRY_UNWRAP(hasMeta, metaStmt.step());
        if (!hasMeta)
            break;
        auto it = aggregated.find(metaStmt.getInt64(0));
        if (it == aggregated.end())
            continue;
        if (!metaStmt.isNull(1))
            it->second.statisticId = metaStmt.getString(1);
        if (!metaStmt.isNull(2))
            it->second.unit = metaStmt.getString(2);
    }

    std::vector<EntitySummary> result;
    result.reserve(aggregated.size());
    for (auto& [id, entry] : aggregated) {
        double kb = static_cast<double>(entry.count) * cols * BYTES_PER_FIELD / 1024.0;
        entry.estimatedKb = std::round(kb * 10.0) / 10.0;
        result.push_back(std::move(entry));
    }
    spdlog::debug("Aggregated {} entities across statistics tables", result.size());
    return result;
}

Result<std::optional<EntityMetadata>> RecorderStore::findMetadata(std::string_view statisticId) {
    HASTAT_TRY_UNWRAP(stmt, db_.prepare("SELECT id, statistic_id, source, unit_of_measurement "
                                        "FROM statistics_meta WHERE statistic_id = ? LIMIT 1"));
    HASTAT_TRY(stmt.bind(1, statisticId));
    HASTAT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return std::optional<EntityMetadata>{};
    }

    EntityMetadata meta;
    meta.id = stmt.getInt64(0);
    meta.statisticId = stmt.getString(1);
    if (!stmt.isNull(2))
        meta.source = stmt.getString(2);
    if (!stmt.isNull(3))
        meta.unit = stmt.getString(3);
    return std::optional<EntityMetadata>{std::move(meta)};
}

Result<std::optional<MetadataId>> RecorderStore::findMetadataId(std::string_view statisticId) {
    HASTAT_TRY_UNWRAP(meta, findMetadata(statisticId));
    if (!meta) {
        return std::optional<MetadataId>{};
    }
    return std::optional<MetadataId>{meta->id};
}

Result<std::set<MetadataId>> RecorderStore::existingMetadataIds(const std::set<MetadataId>& ids) {
    std::set<MetadataId> found;
    std::vector<MetadataId> pending(ids.begin(), ids.end());

    for (std::size_t offset = 0; offset < pending.size(); offset += kMaxParamsPerQuery) {
        std::size_t chunk = std::min(kMaxParamsPerQuery, pending.size() - offset);

        std::string sql = "SELECT id FROM statistics_meta WHERE id IN (";
        for (std::size_t i = 0; i < chunk; ++i) {
            sql += (i == 0) ? "?" : ", ?";
        }
        sql += ")";

        HASTAT_TRY_UNWRAP(stmt, db_.prepare(sql));
        for (std::size_t i = 0; i < chunk; ++i) {
            HASTAT_TRY(stmt.bind(static_cast<int>(i + 1), pending[offset + i]));
        }
        while (true) {
            HASTAT_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            found.insert(stmt.getInt64(0));
        }
    }

    spdlog::debug("Metadata check: {} of {} referenced ids exist", found.size(), ids.size());
    return found;
}

Result<std::vector<StatisticRecord>> RecorderStore::exportRows(MetadataId metadataId,
                                                               const ExportFilter& filter) {
    auto range = startTsClause(filter.range);
    auto thresholds = thresholdClause(filter);

    std::vector<StatisticRecord> records;
    for (auto table : kStatisticsTables) {
        std::string sql =
            std::format("SELECT {} FROM {} WHERE metadata_id = ?{}{} ORDER BY start_ts, id",
                        kRecordColumns, tableName(table), range.sql, thresholds.sql);
        HASTAT_TRY_UNWRAP(stmt, db_.prepare(sql));

        int index = 1;
        HASTAT_TRY(stmt.bind(index++, metadataId));
        for (double param : range.params) {
            HASTAT_TRY(stmt.bind(index++, param));
        }
        for (double param : thresholds.params) {
            HASTAT_TRY(stmt.bind(index++, param));
        }

        while (true) {
            HASTAT_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            records.push_back(readRecord(stmt, table));
        }
    }
    return records;
}

Result<std::optional<StatisticRecord>> RecorderStore::getRecord(StatisticsTable table, RowId id) {
    HASTAT_TRY_UNWRAP(stmt, db_.prepare(std::format("SELECT {} FROM {} WHERE id = ?", kRecordColumns,
                                                    tableName(table))));
    HASTAT_TRY(stmt.bind(1, id));
    HASTAT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return std::optional<StatisticRecord>{};
    }
    return std::optional<StatisticRecord>{readRecord(stmt, table)};
}

Result<int64_t> RecorderStore::countRows(StatisticsTable table) {
    HASTAT_TRY_UNWRAP(stmt, db_.prepare(std::format("SELECT COUNT(*) FROM {}", tableName(table))));
    HASTAT_TRY_UNWRAP(hasRow, stmt.step());
    return hasRow ? stmt.getInt64(0) : int64_t{0};
}

} // namespace hastat::metadata
