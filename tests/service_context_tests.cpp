#include "matview/service/service_context.hpp"
#include "matview/sql/sql_builder.hpp"

#include "fake_sql_session.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace matview;
using namespace matview::service;
using matview::tests::FakeSqlSession;

namespace {

definition::ViewDefinition make_definition(std::string name = "mv_orders")
{
    definition::ViewDefinition definition{};
    definition.id = 1U;
    definition.name = std::move(name);
    definition.sql = "SELECT id FROM orders";
    return definition;
}

}  // namespace

TEST_CASE("schema resolution expands $user to the session role")
{
    FakeSqlSession session{};
    session.catalog.schemas.insert("matview");
    const auto definition = make_definition();
    ViewServiceContext context{session, definition, RowCountStrategy::None};

    CHECK(context.schema() == "matview");
    CHECK(context.qualified_relation() == "\"matview\".\"mv_orders\"");
    CHECK(context.display_relation() == "matview.mv_orders");
}

TEST_CASE("schema resolution skips schemas that do not exist")
{
    FakeSqlSession session{};
    session.search_path = "missing, \"Reporting\", public";
    session.catalog.schemas.insert("Reporting");
    const auto definition = make_definition();
    ViewServiceContext context{session, definition, RowCountStrategy::None};

    CHECK(context.schema() == "Reporting");
}

TEST_CASE("schema resolution falls back to public")
{
    const auto definition = make_definition();

    SECTION("empty search path")
    {
        FakeSqlSession session{};
        session.search_path = "";
        ViewServiceContext context{session, definition, RowCountStrategy::None};
        CHECK(context.schema() == "public");
    }

    SECTION("nothing on the path exists, public included")
    {
        FakeSqlSession session{};
        session.search_path = "ghost";
        session.catalog.schemas.clear();
        ViewServiceContext context{session, definition, RowCountStrategy::None};
        CHECK(context.schema() == "public");
        CHECK(session.count_queries("pg_namespace") == 2U);
    }

    SECTION("malformed search path")
    {
        FakeSqlSession session{};
        session.search_path = "\"unterminated";
        ViewServiceContext context{session, definition, RowCountStrategy::None};
        CHECK(context.schema() == "public");
    }
}

TEST_CASE("schema and current user are resolved once per context")
{
    FakeSqlSession session{};
    const auto definition = make_definition();
    ViewServiceContext context{session, definition, RowCountStrategy::None};

    (void)context.schema();
    const auto lookups = session.queries.size();
    (void)context.schema();
    (void)context.display_relation();
    CHECK(session.queries.size() == lookups);
    CHECK(session.count_queries("current_user") == 1U);
}

TEST_CASE("existence checks read the catalog")
{
    FakeSqlSession session{};
    session.add_view("public", "mv_orders", 4);
    session.add_unique_index("public", "mv_orders", "public_mv_orders_uniq_id");
    const auto definition = make_definition();
    ViewServiceContext context{session, definition, RowCountStrategy::None};

    CHECK(context.view_exists());
    CHECK_FALSE(context.view_exists("mv_other"));
    CHECK(context.unique_index_exists());
    CHECK(context.index_exists("public_mv_orders_uniq_id"));
    CHECK_FALSE(context.index_exists("public_mv_orders_uniq_other"));
}

TEST_CASE("row count strategies")
{
    FakeSqlSession session{};
    session.add_view("public", "mv_orders", 12);
    session.catalog.views.at({"public", "mv_orders"}).estimated_rows = 10;
    const auto definition = make_definition();

    SECTION("none never queries")
    {
        ViewServiceContext context{session, definition, RowCountStrategy::None};
        (void)context.schema();
        const auto before = session.queries.size();
        CHECK(context.fetch_row_count() == kUnknownRowCount);
        CHECK(session.queries.size() == before);
    }

    SECTION("estimated reads reltuples")
    {
        ViewServiceContext context{session, definition, RowCountStrategy::Estimated};
        CHECK(context.fetch_row_count() == 10);
        CHECK(session.count_queries("reltuples") == 1U);
    }

    SECTION("exact counts rows")
    {
        ViewServiceContext context{session, definition, RowCountStrategy::Exact};
        CHECK(context.fetch_row_count() == 12);
        CHECK(session.count_queries("SELECT COUNT(*) FROM \"public\".\"mv_orders\"") == 1U);
    }

    SECTION("estimate of a missing relation is zero")
    {
        const auto other = make_definition("mv_absent");
        ViewServiceContext context{session, other, RowCountStrategy::Estimated};
        CHECK(context.fetch_row_count() == 0);
    }
}

TEST_CASE("connection_idle reflects the transaction state")
{
    FakeSqlSession session{};
    const auto definition = make_definition();
    ViewServiceContext context{session, definition, RowCountStrategy::None};

    CHECK(context.connection_idle());

    bool inside = true;
    session.transaction([&] { inside = context.connection_idle(); });
    CHECK_FALSE(inside);

    session.status_unavailable = true;
    CHECK_FALSE(context.connection_idle());
}

TEST_CASE("precondition guards raise ServiceError")
{
    FakeSqlSession session{};
    auto definition = make_definition("bad-name");
    definition.sql = "DELETE FROM orders";
    ViewServiceContext context{session, definition, RowCountStrategy::None};

    try {
        context.ensure_valid_name();
        FAIL("expected ServiceError");
    } catch (const ServiceError& error) {
        CHECK(error.code() == make_error_code(ServiceErrc::InvalidIdentifier));
        CHECK(std::string{error.what()} == "Invalid view name format: \"bad-name\"");
    }

    CHECK_THROWS_AS(context.ensure_valid_sql(), ServiceError);

    const auto missing = make_definition("mv_missing");
    ViewServiceContext missing_context{session, missing, RowCountStrategy::None};
    try {
        missing_context.ensure_view_exists();
        FAIL("expected ServiceError");
    } catch (const ServiceError& error) {
        CHECK(error.code() == make_error_code(ServiceErrc::ViewNotFound));
        CHECK(std::string{error.what()} == "Materialized view public.mv_missing does not exist");
    }

    session.add_view("public", "mv_missing");
    CHECK_NOTHROW(missing_context.ensure_view_exists());
    CHECK_THROWS_AS(missing_context.ensure_unique_index(), ServiceError);
}
