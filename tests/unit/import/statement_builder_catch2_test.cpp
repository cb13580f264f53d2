#include <catch2/catch_test_macros.hpp>

#include <hastat/import/statement_builder.h>

using namespace hastat;
using namespace hastat::importer;

TEST_CASE("StatementBuilder: literal rendering", "[unit][import][sql]") {
    CHECK(renderLiteral(nullptr) == "NULL");
    CHECK(renderLiteral(int64_t{42}) == "42");
    CHECK(renderLiteral(1704279600.0) == "1704279600.0");
    CHECK(renderLiteral(3198.37) == "3198.37");
    CHECK(renderLiteral(std::string("O'Brien")) == "'O''Brien'");
}

TEST_CASE("StatementBuilder: statement shapes", "[unit][import][sql]") {
    StatementBuilder builder;

    SECTION("Insert") {
        auto stmt = builder.insertInto("statistics")
                        .value("metadata_id", int64_t{7})
                        .value("start_ts", 1704279600.0)
                        .build();
        CHECK(stmt.sql == "INSERT INTO statistics (metadata_id, start_ts) VALUES (?, ?)");
        CHECK(stmt.params.size() == 2);
        CHECK(stmt.render() ==
              "INSERT INTO statistics (metadata_id, start_ts) VALUES (7, 1704279600.0);");
    }

    SECTION("Update") {
        auto stmt = builder.update("statistics_short_term")
                        .set("mean", 2.5)
                        .set("last_reset", std::string("2024-01-01 00:00:00"))
                        .whereEquals("id", int64_t{5})
                        .build();
        CHECK(stmt.sql == "UPDATE statistics_short_term SET mean = ?, last_reset = ? WHERE id = ?");
        CHECK(stmt.render() == "UPDATE statistics_short_term SET mean = 2.5, "
                               "last_reset = '2024-01-01 00:00:00' WHERE id = 5;");
    }

    SECTION("Delete") {
        auto stmt = builder.deleteFrom("statistics").whereEquals("id", int64_t{9}).build();
        CHECK(stmt.sql == "DELETE FROM statistics WHERE id = ?");
        CHECK(stmt.render() == "DELETE FROM statistics WHERE id = 9;");
    }

    SECTION("Reset clears state") {
        builder.deleteFrom("statistics").whereEquals("id", int64_t{9});
        builder.reset();
        auto stmt = builder.build();
        CHECK(stmt.sql.empty());
        CHECK(stmt.params.empty());
    }
}

TEST_CASE("StatementBuilder: intents to statements", "[unit][import][sql]") {
    SECTION("Insert lists the given fields in column order") {
        MutationIntent intent = InsertIntent{StatisticsTable::LongTerm,
                                             {{StatisticField::MetadataId, int64_t{7}},
                                              {StatisticField::CreatedTs, 1704279600.0},
                                              {StatisticField::StartTs, 1704279600.0},
                                              {StatisticField::Mean, 3198.37}},
                                             2};
        auto stmt = buildStatement(intent);
        CHECK(stmt.sql ==
              "INSERT INTO statistics (metadata_id, created_ts, start_ts, mean) VALUES (?, ?, ?, ?)");
        CHECK(stmt.render() == "INSERT INTO statistics (metadata_id, created_ts, start_ts, mean) "
                               "VALUES (7, 1704279600.0, 1704279600.0, 3198.37);");
    }

    SECTION("Update touches only the changed fields") {
        MutationIntent intent =
            UpdateIntent{StatisticsTable::ShortTerm, 12, {{StatisticField::Sum, 0.0}}, 3};
        CHECK(buildStatement(intent).render() ==
              "UPDATE statistics_short_term SET sum = 0.0 WHERE id = 12;");
    }

    SECTION("Delete by primary key") {
        MutationIntent intent = DeleteIntent{StatisticsTable::LongTerm, 4, 5};
        CHECK(buildStatement(intent).render() == "DELETE FROM statistics WHERE id = 4;");
    }
}
