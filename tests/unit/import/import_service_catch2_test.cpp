#include <sstream>

#include <catch2/catch_test_macros.hpp>

#include "common/recorder_fixture.h"
#include <hastat/common/csv.h>
#include <hastat/import/export_format.h>
#include <hastat/import/import_service.h>
#include <hastat/metadata/recorder_store.h>

using namespace hastat;
using namespace hastat::importer;

namespace {

struct ImportFixture : test::RecorderFixture {
    ImportFixture() {
        exec("INSERT INTO statistics (id, created_ts, metadata_id, start_ts, mean, min, max) "
             "VALUES "
             "(1, 1704067210.0, 8, 1704067200.0, 20.0, 19.0, 21.0), "
             "(2, 1704070810.0, 8, 1704070800.0, 21.0, 20.0, 22.0)");
        exec("INSERT INTO statistics (id, created_ts, metadata_id, start_ts, state, sum, "
             "last_reset, last_reset_ts) VALUES "
             "(3, 1704067210.0, 7, 1704067200.0, 10.5, 100.25, '2024-01-01 00:00:00', "
             "1704067200.0)");
        exec("INSERT INTO statistics_short_term (id, created_ts, metadata_id, start_ts, mean, "
             "min, max) VALUES (1, 1704067510.0, 8, 1704067200.0, 18.0, 17.5, 18.5)");
    }

    Result<ImportReport> runImport(const std::string& csv, ImportOptions options = {}) {
        std::istringstream in(csv);
        ImportService service(db);
        return service.run(in, options);
    }

    std::string exportEntity(MetadataId id, const std::string& entity) {
        metadata::RecorderStore store(db);
        auto rows = store.exportRows(id);
        REQUIRE(rows.has_value());

        std::ostringstream out;
        common::CsvWriter writer(out);
        writer.writeRow(exportHeader());
        for (const auto& record : rows.value()) {
            writer.writeRow(exportFields(record, entity));
        }
        return out.str();
    }
};

} // namespace

TEST_CASE("ImportService: insert with defaults", "[unit][import][service]") {
    ImportFixture fix;

    auto report = fix.runImport("table,metadata_id,start_ts,mean\n"
                             "statistics,8,1704279600.0,3198.37\n");
    REQUIRE(report.has_value());
    CHECK(report.value().inserts == 1);
    CHECK(report.value().rowsRead == 1);
    REQUIRE(report.value().insertedIds.size() == 1);

    metadata::RecorderStore store(fix.db);
    auto record = store.getRecord(StatisticsTable::LongTerm, report.value().insertedIds[0]);
    REQUIRE(record.has_value());
    REQUIRE(record.value().has_value());
    CHECK(record.value()->metadataId == 8);
    CHECK(record.value()->startTs == 1704279600.0);
    CHECK(record.value()->createdTs == 1704279600.0);
    CHECK(record.value()->mean == 3198.37);
    CHECK_FALSE(record.value()->min.has_value());
    CHECK_FALSE(record.value()->max.has_value());
    CHECK_FALSE(record.value()->lastReset.has_value());
    CHECK_FALSE(record.value()->sum.has_value());
}

TEST_CASE("ImportService: delete by id", "[unit][import][service]") {
    ImportFixture fix;

    auto report = fix.runImport("table,id\nstatistics,1\n");
    REQUIRE(report.has_value());
    CHECK(report.value().deletes == 1);
    CHECK(fix.count("statistics", "id = 1") == 0);
    // Same id in the short-term table is a different record
    CHECK(fix.count("statistics_short_term", "id = 1") == 1);
}

TEST_CASE("ImportService: sparse update", "[unit][import][service]") {
    ImportFixture fix;

    auto report = fix.runImport("table,id,metadata_id,start_ts,mean,min,max\n"
                             "statistics,2,,,,,30.5\n");
    REQUIRE(report.has_value());
    CHECK(report.value().updates == 1);
    CHECK(fix.scalar("SELECT max FROM statistics WHERE id = 2") == 30.5);
    CHECK(fix.scalar("SELECT mean FROM statistics WHERE id = 2") == 21.0);
    CHECK(fix.scalar("SELECT min FROM statistics WHERE id = 2") == 20.0);
    CHECK(fix.scalar("SELECT start_ts FROM statistics WHERE id = 2") == 1704070800.0);
}

TEST_CASE("ImportService: updates are idempotent", "[unit][import][service]") {
    ImportFixture fix;
    const std::string csv = "table,id,mean\nstatistics,2,42.0\n";

    auto first = fix.runImport(csv);
    REQUIRE(first.has_value());
    auto second = fix.runImport(csv);
    REQUIRE(second.has_value());
    CHECK(second.value().updates == 1);
    CHECK(fix.scalar("SELECT mean FROM statistics WHERE id = 2") == 42.0);
    CHECK(fix.count("statistics") == 3);
}

TEST_CASE("ImportService: dry run leaves the database unchanged", "[unit][import][service]") {
    ImportFixture fix;

    ImportOptions options;
    options.mode = ExecutionMode::DryRun;
    auto report = fix.runImport("table,id,metadata_id,start_ts,mean\n"
                             "statistics,1,,,\n"
                             "statistics,2,,,5\n"
                             "statistics_short_term,,8,1704279600,1.5\n",
                             options);
    REQUIRE(report.has_value());
    CHECK(report.value().mode == ExecutionMode::DryRun);
    CHECK(report.value().deletes == 1);
    CHECK(report.value().updates == 1);
    CHECK(report.value().inserts == 1);
    CHECK(report.value().insertedIds.empty());
    REQUIRE(report.value().statements.size() == 3);
    CHECK(report.value().statements[0] == "DELETE FROM statistics WHERE id = 1;");
    CHECK(report.value().statements[1] == "UPDATE statistics SET mean = 5.0 WHERE id = 2;");
    CHECK(report.value().statements[2] ==
          "INSERT INTO statistics_short_term (metadata_id, created_ts, start_ts, mean) "
          "VALUES (8, 1704279600.0, 1704279600.0, 1.5);");

    CHECK(fix.count("statistics") == 3);
    CHECK(fix.count("statistics_short_term") == 1);
    CHECK(fix.scalar("SELECT mean FROM statistics WHERE id = 2") == 21.0);
}

TEST_CASE("ImportService: duplicate targets, last row wins", "[unit][import][service]") {
    ImportFixture fix;

    auto report = fix.runImport("table,id,mean\n"
                             "statistics,2,1.0\n"
                             "statistics,2,2.0\n");
    REQUIRE(report.has_value());
    CHECK(report.value().updates == 1);
    REQUIRE(report.value().conflicts.size() == 1);
    CHECK(report.value().conflicts[0].overriddenLine == 2);
    CHECK(report.value().conflicts[0].winningLine == 3);
    CHECK(fix.scalar("SELECT mean FROM statistics WHERE id = 2") == 2.0);
}

TEST_CASE("ImportService: invalid rows are reported, not written", "[unit][import][service]") {
    ImportFixture fix;

    auto report = fix.runImport("table,metadata_id,start_ts,mean\n"
                             "statistics,99,1704279600,1.0\n"
                             "states,8,1704279600,1.0\n"
                             ",,,\n"
                             "statistics,8,1704279600,abc\n"
                             "statistics,8,1704283200,2.0\n");
    REQUIRE(report.has_value());
    CHECK(report.value().inserts == 1);
    CHECK(report.value().skipped == 1);
    CHECK(report.value().invalid == 3);
    REQUIRE(report.value().invalidRows.size() == 3);
    CHECK(report.value().invalidRows[0].line == 2);
    CHECK(report.value().invalidRows[0].kind == ValidationKind::UnknownMetadataId);
    CHECK(report.value().invalidRows[1].kind == ValidationKind::UnknownTable);
    CHECK(report.value().invalidRows[2].kind == ValidationKind::InvalidValue);

    CHECK(fix.count("statistics", "metadata_id = 99") == 0);
    CHECK(fix.count("statistics", "start_ts = 1704279600.0") == 0);
    CHECK(fix.count("statistics", "start_ts = 1704283200.0") == 1);
}

TEST_CASE("ImportService: structural errors abort before any write", "[unit][import][service]") {
    ImportFixture fix;

    SECTION("Ragged row") {
        auto report = fix.runImport("table,id\n"
                                 "statistics,1\n"
                                 "statistics,2,extra\n");
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == ErrorCode::InvalidData);
        CHECK(fix.count("statistics") == 3);
    }

    SECTION("No table column") {
        auto report = fix.runImport("id,mean\n1,2.0\n");
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().message == "CSV header has no 'table' column");
    }

    SECTION("Empty input") {
        auto report = fix.runImport("");
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code == ErrorCode::InvalidData);
    }
}

TEST_CASE("ImportService: execution failure rolls back", "[unit][import][service]") {
    ImportFixture fix;

    auto report = fix.runImport("table,id,mean\n"
                             "statistics,1,\n"
                             "statistics,404,1.0\n");
    REQUIRE_FALSE(report.has_value());
    CHECK(report.error().code == ErrorCode::ExecutionFailed);
    CHECK(fix.count("statistics", "id = 1") == 1);
}

TEST_CASE("ImportService: unedited export re-imports without changes", "[unit][import][service]") {
    ImportFixture fix;
    const std::string before = fix.exportEntity(7, "sensor.energy") +
                               fix.exportEntity(8, "sensor.temperature");

    std::string csv = fix.exportEntity(8, "sensor.temperature");
    auto report = fix.runImport(csv);
    REQUIRE(report.has_value());
    CHECK(report.value().updates == 3);
    CHECK(report.value().inserts == 0);
    CHECK(report.value().deletes == 0);
    CHECK(report.value().invalid == 0);

    csv = fix.exportEntity(7, "sensor.energy");
    report = fix.runImport(csv);
    REQUIRE(report.has_value());
    CHECK(report.value().updates == 1);

    const std::string after = fix.exportEntity(7, "sensor.energy") +
                              fix.exportEntity(8, "sensor.temperature");
    CHECK(after == before);
}

TEST_CASE("ImportService: exported row with cleared values deletes it", "[unit][import][service]") {
    ImportFixture fix;

    auto report = fix.runImport("table,entity,date,id,metadata_id,created_ts,start_ts,mean,min,max,"
                             "last_reset,last_reset_ts,state,sum\n"
                             "statistics,sensor.temperature,2024-01-01 00:00:00,1,8,1704067210.0,"
                             "1704067200.0,,,,,,,\n");
    REQUIRE(report.has_value());
    CHECK(report.value().deletes == 1);
    CHECK(fix.count("statistics", "id = 1") == 0);
}

TEST_CASE("ImportService: newer schema is reported", "[unit][import][service]") {
    ImportFixture fix;
    fix.exec("INSERT INTO schema_changes (schema_version, changed) VALUES (60, '2027-01-01')");

    auto report = fix.runImport("table,id\n");
    REQUIRE(report.has_value());
    CHECK_FALSE(report.value().schema.compatible);
    CHECK(report.value().schema.observedVersion == 60);
    CHECK(report.value().schema.warning.has_value());
}

TEST_CASE("ImportService: readRows maps columns by name", "[unit][import][service]") {
    std::istringstream in("mean,extra,table , id\n 1.5 ,x, statistics ,7\n");
    auto rows = ImportService::readRows(in);
    REQUIRE(rows.has_value());
    REQUIRE(rows.value().size() == 1);
    const auto& row = rows.value()[0];
    CHECK(row.line == 2);
    CHECK(row.table == "statistics");
    CHECK(row.id == "7");
    CHECK(row.value(StatisticField::Mean) == "1.5");
    CHECK(row.value(StatisticField::Sum).empty());
}
