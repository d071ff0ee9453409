#include "matview/service/view_operations.hpp"

#include "fake_sql_session.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace matview;
using namespace matview::service;
using matview::tests::FakeSqlSession;

namespace {

definition::ViewDefinition concurrent_definition()
{
    definition::ViewDefinition definition{};
    definition.id = 7U;
    definition.name = "mv_x";
    definition.sql = "SELECT id FROM users";
    definition.refresh_strategy = definition::RefreshStrategy::Concurrent;
    definition.unique_index_columns = {"id"};
    return definition;
}

definition::ViewDefinition regular_definition()
{
    definition::ViewDefinition definition{};
    definition.id = 8U;
    definition.name = "mv_totals";
    definition.sql = "SELECT customer_id, SUM(total) FROM orders GROUP BY customer_id;";
    return definition;
}

}  // namespace

TEST_CASE("create then concurrent refresh of a concurrent definition")
{
    FakeSqlSession session{};
    session.source_rows = 5;
    const auto definition = concurrent_definition();

    const auto created = CreateView{session, definition}.run();
    REQUIRE(created.status() == ServiceStatus::Created);
    CHECK(created.response().view == "public.mv_x");
    REQUIRE(created.response().created_indexes.has_value());
    CHECK(*created.response().created_indexes == std::vector<std::string>{"public_mv_x_uniq_id"});
    CHECK(session.count_executed("CREATE UNIQUE INDEX CONCURRENTLY \"public_mv_x_uniq_id\" ON \"public\".\"mv_x\" (\"id\")")
          == 1U);

    const auto refreshed = ConcurrentRefresh{session, definition}.run();
    CHECK(refreshed.status() == ServiceStatus::Updated);
}

TEST_CASE("create materializes the view with data")
{
    FakeSqlSession session{};
    session.source_rows = 9;
    const auto definition = regular_definition();

    const auto response = CreateView{session, definition, {false, RowCountStrategy::Exact}}.run();
    REQUIRE(response.status() == ServiceStatus::Created);
    REQUIRE(response.response().sql.size() == 1U);
    CHECK(response.response().sql.front()
          == "CREATE MATERIALIZED VIEW \"public\".\"mv_totals\" AS SELECT customer_id, SUM(total) FROM orders GROUP BY "
             "customer_id WITH DATA");
    CHECK(response.response().row_count_before == kUnknownRowCount);
    CHECK(response.response().row_count_after == 9);
    REQUIRE(response.response().created_indexes.has_value());
    CHECK(response.response().created_indexes->empty());
    CHECK(response.request().force == false);
    CHECK(response.request().row_count_strategy == RowCountStrategy::Exact);

    const auto exists = CheckViewExists{session, definition}.run();
    CHECK(exists.status() == ServiceStatus::Ok);
    CHECK(exists.response().exists == true);
}

TEST_CASE("create without force skips an existing view")
{
    FakeSqlSession session{};
    session.source_rows = 3;
    const auto definition = regular_definition();
    REQUIRE(CreateView{session, definition}.run().status() == ServiceStatus::Created);

    const auto generation = session.find_view("public", "mv_totals")->generation;
    session.source_rows = 50;
    const auto executed = session.executed.size();

    const auto second = CreateView{session, definition}.run();
    CHECK(second.status() == ServiceStatus::Skipped);
    CHECK(second.success());
    CHECK(session.executed.size() == executed);
    CHECK(session.find_view("public", "mv_totals")->generation == generation);
    CHECK(session.find_view("public", "mv_totals")->rows == 3);
}

TEST_CASE("create with force rebuilds an existing view")
{
    FakeSqlSession session{};
    session.add_view("public", "mv_totals", 3);
    const auto generation = session.find_view("public", "mv_totals")->generation;
    session.source_rows = 11;
    const auto definition = regular_definition();

    const auto response = CreateView{session, definition, {true, RowCountStrategy::Exact}}.run();
    REQUIRE(response.status() == ServiceStatus::Created);
    CHECK(response.request().force == true);
    CHECK(response.response().row_count_before == 3);
    CHECK(response.response().row_count_after == 11);
    REQUIRE(response.response().sql.size() == 2U);
    CHECK(response.response().sql[0] == "DROP MATERIALIZED VIEW IF EXISTS \"public\".\"mv_totals\"");
    CHECK(session.find_view("public", "mv_totals")->generation != generation);
    CHECK(session.find_view("public", "mv_totals")->rows == 11);
}

TEST_CASE("create validation failures never reach the database")
{
    FakeSqlSession session{};

    SECTION("invalid name")
    {
        auto definition = regular_definition();
        definition.name = "mv totals";
        const auto response = CreateView{session, definition}.run();
        REQUIRE(response.is_error());
        CHECK(response.error()->code == make_error_code(ServiceErrc::InvalidIdentifier));
    }

    SECTION("not a SELECT")
    {
        auto definition = regular_definition();
        definition.sql = "DROP TABLE orders";
        const auto response = CreateView{session, definition}.run();
        REQUIRE(response.is_error());
        CHECK(response.error()->code == make_error_code(ServiceErrc::InvalidSql));
        CHECK(response.error()->message == "SQL must start with SELECT");
    }

    SECTION("concurrent strategy without columns")
    {
        auto definition = concurrent_definition();
        definition.unique_index_columns.clear();
        const auto response = CreateView{session, definition}.run();
        REQUIRE(response.is_error());
        CHECK(response.error()->code == make_error_code(ServiceErrc::UniqueIndexColumnsRequired));
    }

    CHECK(session.executed.empty());
    CHECK(session.queries.empty());
}

TEST_CASE("create inside a transaction builds the index without CONCURRENTLY")
{
    FakeSqlSession session{};
    const auto definition = concurrent_definition();

    std::optional<ServiceResponse> response;
    session.transaction([&] { response = CreateView{session, definition}.run(); });

    REQUIRE(response.has_value());
    REQUIRE(response->status() == ServiceStatus::Created);
    CHECK(session.count_executed("CREATE UNIQUE INDEX \"public_mv_x_uniq_id\"") == 1U);
    CHECK(session.count_executed("CREATE UNIQUE INDEX CONCURRENTLY") == 0U);
}

TEST_CASE("create treats an unreadable transaction state as not idle")
{
    FakeSqlSession session{};
    session.status_unavailable = true;
    const auto definition = concurrent_definition();

    const auto response = CreateView{session, definition}.run();
    REQUIRE(response.status() == ServiceStatus::Created);
    CHECK(session.count_executed("CREATE UNIQUE INDEX CONCURRENTLY") == 0U);
}

TEST_CASE("create with row count strategy none issues no counting query")
{
    FakeSqlSession session{};
    session.add_view("public", "mv_totals", 4);
    const auto definition = regular_definition();

    const auto response = CreateView{session, definition, {true, RowCountStrategy::None}}.run();
    REQUIRE(response.status() == ServiceStatus::Created);
    CHECK(response.response().row_count_before == kUnknownRowCount);
    CHECK(response.response().row_count_after == kUnknownRowCount);
    CHECK(session.count_queries("reltuples") == 0U);
    CHECK(session.count_queries("SELECT COUNT(*) FROM \"") == 0U);
}

TEST_CASE("database failures during create become error responses")
{
    FakeSqlSession session{};
    session.fail_on("CREATE MATERIALIZED VIEW", "42P01", "relation \"users\" does not exist");
    const auto definition = concurrent_definition();

    const auto response = CreateView{session, definition}.run();
    REQUIRE(response.is_error());
    CHECK(response.error()->code == make_error_code(ServiceErrc::DatabaseError));
    CHECK(response.error()->message == "relation \"users\" does not exist");
    CHECK(response.response().view == "public.mv_x");
    CHECK_FALSE(session.has_view("public", "mv_x"));
}
