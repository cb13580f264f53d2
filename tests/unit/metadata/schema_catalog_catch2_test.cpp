#include <algorithm>

#include <catch2/catch_test_macros.hpp>

#include "common/recorder_fixture.h"
#include <hastat/metadata/schema_catalog.h>

using namespace hastat;
using namespace hastat::metadata;

TEST_CASE("SchemaCatalog: statistics tables", "[unit][metadata][schema]") {
    CHECK(tableName(StatisticsTable::LongTerm) == "statistics");
    CHECK(tableName(StatisticsTable::ShortTerm) == "statistics_short_term");
    CHECK(statisticsTableFromName("statistics") == StatisticsTable::LongTerm);
    CHECK(statisticsTableFromName("statistics_short_term") == StatisticsTable::ShortTerm);
    CHECK_FALSE(statisticsTableFromName("statistics_meta").has_value());
    CHECK_FALSE(statisticsTableFromName("STATISTICS").has_value());
}

TEST_CASE("SchemaCatalog: describe", "[unit][metadata][schema]") {
    SECTION("Statistics tables are importable and identical in shape") {
        auto longTerm = SchemaCatalog::describe("statistics");
        REQUIRE(longTerm.has_value());
        const TableSpec& shortTerm = SchemaCatalog::describe(StatisticsTable::ShortTerm);

        CHECK(longTerm.value()->importable());
        CHECK(longTerm.value()->primaryKey == "id");
        CHECK(longTerm.value()->columns.size() == 11);
        CHECK(shortTerm.columns.size() == longTerm.value()->columns.size());
        CHECK(longTerm.value()->requiredForInsert ==
              std::vector<std::string_view>{"metadata_id", "start_ts"});
        CHECK(longTerm.value()->optionalImport.size() == 8);

        const ColumnSpec* lastReset = longTerm.value()->column("last_reset");
        REQUIRE(lastReset != nullptr);
        CHECK(lastReset->type == ColumnType::Text);
        CHECK(longTerm.value()->column("mean")->type == ColumnType::Real);
        CHECK(longTerm.value()->column("no_such_column") == nullptr);
    }

    SECTION("Metadata tables are known but not importable") {
        auto meta = SchemaCatalog::describe("statistics_meta");
        REQUIRE(meta.has_value());
        CHECK_FALSE(meta.value()->importable());
        CHECK(SchemaCatalog::tables().size() == 4);
    }

    SECTION("Unknown table") {
        auto missing = SchemaCatalog::describe("states");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == ErrorCode::UnknownTable);
    }
}

TEST_CASE("SchemaCatalog: CSV column order", "[unit][metadata][schema]") {
    auto columns = SchemaCatalog::csvColumns();
    REQUIRE(columns.size() == 14);
    CHECK(columns[0] == "table");
    CHECK(columns[1] == "entity");
    CHECK(columns[2] == "date");
    CHECK(columns[3] == "id");
    CHECK(columns[13] == "sum");
}

TEST_CASE("SchemaCatalog: schema version check", "[unit][metadata][schema]") {
    SECTION("Known or older version is compatible") {
        auto check = SchemaCatalog::checkSchemaVersion(KNOWN_SCHEMA_VERSION);
        CHECK(check.compatible);
        CHECK_FALSE(check.warning.has_value());
        CHECK(SchemaCatalog::checkSchemaVersion(43).compatible);
    }

    SECTION("Unknown version is compatible") {
        auto check = SchemaCatalog::checkSchemaVersion(std::nullopt);
        CHECK(check.compatible);
        CHECK_FALSE(check.observedVersion.has_value());
    }

    SECTION("Newer version warns") {
        auto check = SchemaCatalog::checkSchemaVersion(KNOWN_SCHEMA_VERSION + 1);
        CHECK_FALSE(check.compatible);
        REQUIRE(check.warning.has_value());
        CHECK(check.warning->find("51 > 50") != std::string::npos);
    }
}

TEST_CASE("SchemaCatalog: read schema version", "[unit][metadata][schema]") {
    test::RecorderFixture fix;

    auto version = SchemaCatalog::readSchemaVersion(fix.db);
    REQUIRE(version.has_value());
    CHECK(version.value() == 50);

    fix.exec("INSERT INTO schema_changes (schema_version, changed) VALUES (52, '2026-01-01')");
    version = SchemaCatalog::readSchemaVersion(fix.db);
    REQUIRE(version.has_value());
    CHECK(version.value() == 52);

    fix.exec("DROP TABLE schema_changes");
    version = SchemaCatalog::readSchemaVersion(fix.db);
    REQUIRE(version.has_value());
    CHECK_FALSE(version.value().has_value());
}
