#include "matview/jobs/repositories.hpp"
#include "matview/jobs/run_errors.hpp"
#include "matview/jobs/view_jobs.hpp"
#include "matview/service/service_telemetry.hpp"

#include "fake_sql_session.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <stdexcept>
#include <system_error>
#include <vector>

using namespace matview;
using namespace matview::jobs;
using matview::tests::FakeSqlSession;

namespace {

struct RunnerHarness final {
    RunnerHarness()
    {
        ViewJobRunner::Config config{};
        config.session = &session;
        config.definitions = &definitions;
        config.runs = &runs;
        config.default_row_count_strategy = service::RowCountStrategy::Exact;
        config.telemetry = &telemetry;
        config.run_logger = [this](const RunRecord& run, const definition::ViewDefinition& definition) {
            logged.push_back(definition.name + ":" + std::string{to_string(run.status)});
        };
        config.clock = [this] {
            tick += std::chrono::milliseconds{10};
            return tick;
        };
        config.token_generator = [] { return std::string{"cafe"}; };
        runner = std::make_unique<ViewJobRunner>(std::move(config));
    }

    std::uint64_t define(std::string name,
                         definition::RefreshStrategy strategy = definition::RefreshStrategy::Regular,
                         std::vector<std::string> columns = {})
    {
        definition::ViewDefinition definition{};
        definition.name = std::move(name);
        definition.sql = "SELECT id FROM accounts";
        definition.refresh_strategy = strategy;
        definition.unique_index_columns = std::move(columns);
        REQUIRE_FALSE(definitions.insert(definition));
        return definition.id;
    }

    FakeSqlSession session{};
    InMemoryRunRepository runs{};
    InMemoryDefinitionRepository definitions{&runs};
    service::ServiceTelemetry telemetry{};
    std::vector<std::string> logged{};
    std::chrono::system_clock::time_point tick{std::chrono::seconds{1'000}};
    std::unique_ptr<ViewJobRunner> runner{};
};

}  // namespace

TEST_CASE("option helpers normalize booleanish strings")
{
    CHECK(is_truthy("1"));
    CHECK(is_truthy("TRUE"));
    CHECK(is_truthy(" yes "));
    CHECK(is_truthy("Y"));
    CHECK(is_truthy("--yes"));
    CHECK_FALSE(is_truthy("0"));
    CHECK_FALSE(is_truthy("no"));
    CHECK_FALSE(is_truthy(""));

    const JobOptions options{{"force", "yes"}, {"cascade", "false"}, {"row_count_strategy", ""}};
    CHECK(option_flag(options, "force", false));
    CHECK_FALSE(option_flag(options, "cascade", true));
    CHECK(option_flag(options, "if_exists", true));
    CHECK(option_row_count_strategy(options, service::RowCountStrategy::Exact) == service::RowCountStrategy::Exact);
    CHECK(option_row_count_strategy({{"row_count_strategy", "Estimated"}}, service::RowCountStrategy::None)
          == service::RowCountStrategy::Estimated);
    CHECK(option_row_count_strategy({{"row_count_strategy", "bogus"}}, service::RowCountStrategy::Exact)
          == service::RowCountStrategy::None);
    CHECK(option_row_count_strategy({}, service::RowCountStrategy::Estimated) == service::RowCountStrategy::Estimated);
}

TEST_CASE("runner requires its collaborators")
{
    CHECK_THROWS_AS(ViewJobRunner{ViewJobRunner::Config{}}, std::invalid_argument);
}

TEST_CASE("successful create persists a finished run")
{
    RunnerHarness harness{};
    harness.session.source_rows = 3;
    const auto id = harness.define("mv_accounts");

    const auto response = harness.runner->perform_create(id);
    CHECK(response.status() == service::ServiceStatus::Created);

    const auto history = harness.runs.list_for_definition(id);
    REQUIRE(history.size() == 1U);
    const auto& run = history.front();
    CHECK(run.operation == RunOperation::Create);
    CHECK(run.status == RunStatus::Success);
    CHECK(run.started_at == std::chrono::system_clock::time_point{std::chrono::milliseconds{1'000'010}});
    CHECK(run.finished_at == std::chrono::system_clock::time_point{std::chrono::milliseconds{1'000'020}});
    REQUIRE(run.duration_ms.has_value());
    CHECK(*run.duration_ms >= 0);
    CHECK(run.meta_json.find("\"status\"") == std::string::npos);
    CHECK(run.meta_json.find("\"row_count_strategy\":\"exact\"") != std::string::npos);
    CHECK(run.meta_json.find("\"view\":\"public.mv_accounts\"") != std::string::npos);
    CHECK_FALSE(run.error.has_value());
    CHECK(harness.logged == std::vector<std::string>{"mv_accounts:success"});
}

TEST_CASE("job options reach the operation")
{
    RunnerHarness harness{};
    const auto id = harness.define("mv_accounts");
    harness.session.add_view("public", "mv_accounts", 1);
    harness.session.source_rows = 5;

    const auto response = harness.runner->perform({JobKind::Create, id, "default", {{"force", "true"}, {"row_count_strategy", "none"}}});
    CHECK(response.status() == service::ServiceStatus::Created);
    CHECK(response.request().force == true);
    CHECK(response.request().row_count_strategy == service::RowCountStrategy::None);
    CHECK(harness.session.find_view("public", "mv_accounts")->rows == 5);
}

TEST_CASE("refresh dispatches on the declared strategy")
{
    RunnerHarness harness{};
    const auto regular = harness.define("mv_regular");
    const auto concurrent = harness.define("mv_concurrent", definition::RefreshStrategy::Concurrent, {"id"});
    const auto swap = harness.define("mv_swap", definition::RefreshStrategy::Swap);
    harness.session.add_view("public", "mv_regular");
    harness.session.add_view("public", "mv_concurrent");
    harness.session.add_unique_index("public", "mv_concurrent", "public_mv_concurrent_uniq_id");
    harness.session.add_view("public", "mv_swap");

    CHECK_FALSE(harness.runner->perform_refresh(regular).request().concurrent.has_value());
    CHECK(harness.runner->perform_refresh(concurrent).request().concurrent == true);
    CHECK(harness.runner->perform_refresh(swap).request().swap == true);

    CHECK(harness.session.count_executed("REFRESH MATERIALIZED VIEW \"public\".\"mv_regular\"") == 1U);
    CHECK(harness.session.count_executed("REFRESH MATERIALIZED VIEW CONCURRENTLY \"public\".\"mv_concurrent\"") == 1U);
    CHECK(harness.session.count_executed("CREATE MATERIALIZED VIEW \"public\".\"mv_swap__tmp_cafe\"") == 1U);

    CHECK(harness.definitions.last_refreshed_at(regular).has_value());
    CHECK(harness.definitions.last_refreshed_at(swap).has_value());
}

TEST_CASE("an error response persists a failed run before raising")
{
    RunnerHarness harness{};
    const auto id = harness.define("mv_missing");

    try {
        (void)harness.runner->perform_refresh(id);
        FAIL("expected JobFailedError");
    } catch (const JobFailedError& error) {
        CHECK(error.response().is_error());
        CHECK(std::string{error.what()} == "run " + std::to_string(error.run_id())
                                               + " failed: Materialized view public.mv_missing does not exist");

        const auto run = harness.runs.find(error.run_id());
        REQUIRE(run.has_value());
        CHECK(run->status == RunStatus::Failed);
        REQUIRE(run->error.has_value());
        CHECK(run->error->code == service::make_error_code(service::ServiceErrc::ViewNotFound));
        CHECK(run->finished_at.has_value());
    }

    CHECK_FALSE(harness.definitions.last_refreshed_at(id).has_value());
    CHECK(harness.logged == std::vector<std::string>{"mv_missing:failed"});

    const auto snapshot = harness.telemetry.snapshot();
    const auto index = static_cast<std::size_t>(service::ServiceOperation::RegularRefresh);
    CHECK(snapshot.operations[index].failures == 1U);
    CHECK(snapshot.failures.precondition_failures == 1U);
}

TEST_CASE("delete job honours cascade")
{
    RunnerHarness harness{};
    const auto id = harness.define("mv_parent");
    harness.session.add_view("public", "mv_parent");
    harness.session.add_view("public", "mv_child");
    harness.session.add_dependent("public", "mv_parent", "mv_child");

    CHECK_THROWS_AS(harness.runner->perform_delete(id), JobFailedError);
    CHECK(harness.session.has_view("public", "mv_parent"));

    const auto response = harness.runner->perform_delete(id, {{"cascade", "1"}});
    CHECK(response.status() == service::ServiceStatus::Deleted);
    CHECK_FALSE(harness.session.has_view("public", "mv_child"));

    const auto history = harness.runs.list_for_definition(id);
    REQUIRE(history.size() == 2U);
    CHECK(history[0].status == RunStatus::Success);
    CHECK(history[1].status == RunStatus::Failed);
    CHECK(history[0].operation == RunOperation::Drop);
}

TEST_CASE("unknown definitions raise before any run is recorded")
{
    RunnerHarness harness{};
    try {
        (void)harness.runner->perform_refresh(404U);
        FAIL("expected system_error");
    } catch (const std::system_error& error) {
        CHECK(error.code() == make_error_code(RunErrc::DefinitionNotFound));
    }
    CHECK(harness.runs.list_for_definition(404U).empty());
}
