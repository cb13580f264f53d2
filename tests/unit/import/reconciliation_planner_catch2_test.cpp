#include <catch2/catch_test_macros.hpp>

#include <hastat/import/reconciliation_planner.h>

using namespace hastat;
using namespace hastat::importer;

namespace {

class FakeMetadataLookup : public metadata::IMetadataLookup {
public:
    explicit FakeMetadataLookup(std::set<MetadataId> known) : known_(std::move(known)) {}

    Result<std::set<MetadataId>> existingMetadataIds(const std::set<MetadataId>& ids) override {
        ++calls;
        lastQuery = ids;
        if (fail) {
            return Error{ErrorCode::DatabaseError, "lookup failed"};
        }
        std::set<MetadataId> found;
        for (auto id : ids) {
            if (known_.contains(id))
                found.insert(id);
        }
        return found;
    }

    int calls = 0;
    std::set<MetadataId> lastQuery;
    bool fail = false;

private:
    std::set<MetadataId> known_;
};

Classification insertRow(StatisticsTable table, MetadataId metadataId, std::size_t line) {
    return MutationIntent{InsertIntent{table,
                                       {{StatisticField::MetadataId, metadataId},
                                        {StatisticField::CreatedTs, 1704279600.0},
                                        {StatisticField::StartTs, 1704279600.0}},
                                       line}};
}

Classification updateRow(StatisticsTable table, RowId id, double mean, std::size_t line) {
    return MutationIntent{UpdateIntent{table, id, {{StatisticField::Mean, mean}}, line}};
}

Classification deleteRow(StatisticsTable table, RowId id, std::size_t line) {
    return MutationIntent{DeleteIntent{table, id, line}};
}

} // namespace

TEST_CASE("ReconciliationPlanner: execution order", "[unit][import][planner]") {
    FakeMetadataLookup lookup({7});
    ReconciliationPlanner planner(lookup);

    std::vector<Classification> input;
    input.push_back(insertRow(StatisticsTable::ShortTerm, 7, 2));
    input.push_back(updateRow(StatisticsTable::LongTerm, 1, 1.0, 3));
    input.push_back(insertRow(StatisticsTable::LongTerm, 7, 4));
    input.push_back(deleteRow(StatisticsTable::LongTerm, 2, 5));
    input.push_back(deleteRow(StatisticsTable::ShortTerm, 9, 6));
    input.push_back(updateRow(StatisticsTable::LongTerm, 3, 2.0, 7));

    auto plan = planner.plan(std::move(input));
    REQUIRE(plan.has_value());
    REQUIRE(plan.value().tables.size() == 2);

    const auto& longTerm = plan.value().tables[0];
    CHECK(longTerm.table == StatisticsTable::LongTerm);
    REQUIRE(longTerm.intents.size() == 4);
    CHECK(std::holds_alternative<DeleteIntent>(longTerm.intents[0]));
    CHECK(intentLine(longTerm.intents[1]) == 3);
    CHECK(intentLine(longTerm.intents[2]) == 7);
    CHECK(std::holds_alternative<InsertIntent>(longTerm.intents[3]));

    const auto& shortTerm = plan.value().tables[1];
    CHECK(shortTerm.table == StatisticsTable::ShortTerm);
    REQUIRE(shortTerm.intents.size() == 2);
    CHECK(std::holds_alternative<DeleteIntent>(shortTerm.intents[0]));
    CHECK(std::holds_alternative<InsertIntent>(shortTerm.intents[1]));

    auto ordered = plan.value().orderedIntents();
    REQUIRE(ordered.size() == 6);
    CHECK(plan.value().intentCount() == 6);
    CHECK(intentLine(ordered[4]) == 6);
}

TEST_CASE("ReconciliationPlanner: last write wins per target", "[unit][import][planner]") {
    FakeMetadataLookup lookup({});
    ReconciliationPlanner planner(lookup);

    std::vector<Classification> input;
    input.push_back(updateRow(StatisticsTable::LongTerm, 5, 1.0, 2));
    input.push_back(updateRow(StatisticsTable::ShortTerm, 5, 9.0, 3));
    input.push_back(updateRow(StatisticsTable::LongTerm, 5, 2.0, 4));

    auto plan = planner.plan(std::move(input));
    REQUIRE(plan.has_value());
    REQUIRE(plan.value().conflicts.size() == 1);

    const auto& conflict = plan.value().conflicts[0];
    CHECK(conflict.table == StatisticsTable::LongTerm);
    CHECK(conflict.id == 5);
    CHECK(conflict.overriddenLine == 2);
    CHECK(conflict.winningLine == 4);

    // Same id in the other table is a different record
    auto ordered = plan.value().orderedIntents();
    REQUIRE(ordered.size() == 2);
    const auto& winner = std::get<UpdateIntent>(ordered[0]);
    CHECK(winner.line == 4);
    CHECK(std::get<double>(winner.changes[0].value) == 2.0);
    CHECK(std::get<UpdateIntent>(ordered[1]).table == StatisticsTable::ShortTerm);
}

TEST_CASE("ReconciliationPlanner: delete and update on the same row", "[unit][import][planner]") {
    FakeMetadataLookup lookup({});
    ReconciliationPlanner planner(lookup);

    std::vector<Classification> input;
    input.push_back(deleteRow(StatisticsTable::LongTerm, 5, 2));
    input.push_back(updateRow(StatisticsTable::LongTerm, 5, 3.0, 3));
    input.push_back(updateRow(StatisticsTable::LongTerm, 6, 3.0, 4));
    input.push_back(deleteRow(StatisticsTable::LongTerm, 6, 5));

    auto plan = planner.plan(std::move(input));
    REQUIRE(plan.has_value());
    CHECK(plan.value().conflicts.size() == 2);

    auto ordered = plan.value().orderedIntents();
    REQUIRE(ordered.size() == 2);
    CHECK(std::get<DeleteIntent>(ordered[0]).id == 6);
    CHECK(std::get<UpdateIntent>(ordered[1]).id == 5);
}

TEST_CASE("ReconciliationPlanner: inserts never conflict", "[unit][import][planner]") {
    FakeMetadataLookup lookup({7});
    ReconciliationPlanner planner(lookup);

    std::vector<Classification> input;
    input.push_back(insertRow(StatisticsTable::LongTerm, 7, 2));
    input.push_back(insertRow(StatisticsTable::LongTerm, 7, 3));

    auto plan = planner.plan(std::move(input));
    REQUIRE(plan.has_value());
    CHECK(plan.value().conflicts.empty());
    CHECK(plan.value().intentCount() == 2);
}

TEST_CASE("ReconciliationPlanner: metadata validation", "[unit][import][planner]") {
    FakeMetadataLookup lookup({7});
    ReconciliationPlanner planner(lookup);

    SECTION("One batched lookup, unknown ids become invalid rows") {
        std::vector<Classification> input;
        input.push_back(insertRow(StatisticsTable::LongTerm, 7, 2));
        input.push_back(insertRow(StatisticsTable::LongTerm, 99, 3));
        input.push_back(MutationIntent{UpdateIntent{
            StatisticsTable::LongTerm, 4, {{StatisticField::MetadataId, int64_t{98}}}, 4}});
        input.push_back(insertRow(StatisticsTable::ShortTerm, 99, 5));

        auto plan = planner.plan(std::move(input));
        REQUIRE(plan.has_value());
        CHECK(lookup.calls == 1);
        CHECK(lookup.lastQuery == std::set<MetadataId>{7, 98, 99});

        CHECK(plan.value().intentCount() == 1);
        REQUIRE(plan.value().invalid.size() == 3);
        CHECK(plan.value().invalid[0].line == 3);
        CHECK(plan.value().invalid[0].kind == ValidationKind::UnknownMetadataId);
        CHECK(plan.value().invalid[0].message == "Unknown metadata_id: 99");
        CHECK(plan.value().invalid[1].line == 4);
        CHECK(plan.value().invalid[2].line == 5);
    }

    SECTION("Deletes and plain updates need no lookup") {
        std::vector<Classification> input;
        input.push_back(deleteRow(StatisticsTable::LongTerm, 1, 2));
        input.push_back(updateRow(StatisticsTable::LongTerm, 2, 1.0, 3));

        auto plan = planner.plan(std::move(input));
        REQUIRE(plan.has_value());
        CHECK(lookup.calls == 0);
        CHECK(plan.value().intentCount() == 2);
    }

    SECTION("Lookup failure aborts planning") {
        lookup.fail = true;
        std::vector<Classification> input;
        input.push_back(insertRow(StatisticsTable::LongTerm, 7, 2));

        auto plan = planner.plan(std::move(input));
        REQUIRE_FALSE(plan.has_value());
        CHECK(plan.error().code == ErrorCode::DatabaseError);
    }
}

TEST_CASE("ReconciliationPlanner: diagnostics are kept in line order", "[unit][import][planner]") {
    FakeMetadataLookup lookup({});
    ReconciliationPlanner planner(lookup);

    std::vector<Classification> input;
    input.push_back(SkippedRow{2});
    input.push_back(ValidationIssue{3, ValidationKind::UnknownTable, "table", "Unknown table: x"});
    input.push_back(insertRow(StatisticsTable::LongTerm, 5, 4));
    input.push_back(ValidationIssue{5, ValidationKind::MissingStartTs, "start_ts", "missing"});
    input.push_back(SkippedRow{6});

    auto plan = planner.plan(std::move(input));
    REQUIRE(plan.has_value());
    CHECK(plan.value().intentCount() == 0);
    CHECK(plan.value().tables.empty());
    REQUIRE(plan.value().skipped.size() == 2);
    CHECK(plan.value().skipped[1].line == 6);

    REQUIRE(plan.value().invalid.size() == 3);
    CHECK(plan.value().invalid[0].line == 3);
    CHECK(plan.value().invalid[1].line == 4);
    CHECK(plan.value().invalid[1].kind == ValidationKind::UnknownMetadataId);
    CHECK(plan.value().invalid[2].line == 5);
}
