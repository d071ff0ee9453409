#include "matview/jobs/repositories.hpp"
#include "matview/jobs/run_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <utility>

using namespace matview;
using namespace matview::jobs;

namespace {

definition::ViewDefinition make_definition(std::string name)
{
    definition::ViewDefinition definition{};
    definition.name = std::move(name);
    definition.sql = "SELECT 1";
    return definition;
}

}  // namespace

TEST_CASE("definition repository assigns ids and enforces unique names")
{
    InMemoryDefinitionRepository definitions{};
    auto first = make_definition("mv_a");
    auto second = make_definition("mv_b");
    REQUIRE_FALSE(definitions.insert(first));
    REQUIRE_FALSE(definitions.insert(second));
    CHECK(first.id == 1U);
    CHECK(second.id == 2U);

    auto duplicate = make_definition("mv_a");
    CHECK(definitions.insert(duplicate) == make_error_code(RunErrc::DuplicateDefinition));
    CHECK(definitions.list().size() == 2U);
}

TEST_CASE("definition repository rejects invalid definitions")
{
    InMemoryDefinitionRepository definitions{};
    auto bad_name = make_definition("mv-a");
    CHECK(definitions.insert(bad_name) == make_error_code(RunErrc::DefinitionInvalid));

    auto concurrent = make_definition("mv_c");
    concurrent.refresh_strategy = definition::RefreshStrategy::Concurrent;
    CHECK(definitions.insert(concurrent) == make_error_code(RunErrc::DefinitionInvalid));
    CHECK(definitions.list().empty());
}

TEST_CASE("find_by_name accepts schema-qualified names")
{
    InMemoryDefinitionRepository definitions{};
    auto definition = make_definition("mv_sales");
    REQUIRE_FALSE(definitions.insert(definition));

    CHECK(definitions.find_by_name("mv_sales").has_value());
    CHECK(definitions.find_by_name("reporting.mv_sales").has_value());
    CHECK_FALSE(definitions.find_by_name("mv_other").has_value());
    CHECK(unqualified_name("a.b.c") == "c");
    CHECK(unqualified_name("plain") == "plain");
}

TEST_CASE("removing a definition removes its runs")
{
    InMemoryRunRepository runs{};
    InMemoryDefinitionRepository definitions{&runs};
    auto kept = make_definition("mv_kept");
    auto removed = make_definition("mv_removed");
    REQUIRE_FALSE(definitions.insert(kept));
    REQUIRE_FALSE(definitions.insert(removed));

    auto kept_run = start_run(kept.id, RunOperation::Create, std::chrono::system_clock::now());
    auto removed_run = start_run(removed.id, RunOperation::Create, std::chrono::system_clock::now());
    REQUIRE_FALSE(runs.create(kept_run));
    REQUIRE_FALSE(runs.create(removed_run));

    REQUIRE_FALSE(definitions.remove(removed.id));
    CHECK_FALSE(definitions.find(removed.id).has_value());
    CHECK(runs.list_for_definition(removed.id).empty());
    CHECK(runs.list_for_definition(kept.id).size() == 1U);
    CHECK(definitions.remove(removed.id) == make_error_code(RunErrc::DefinitionNotFound));
}

TEST_CASE("run repository lists newest first and updates in place")
{
    InMemoryRunRepository runs{};
    auto older = start_run(1U, RunOperation::Create, std::chrono::system_clock::now());
    auto newer = start_run(1U, RunOperation::Refresh, std::chrono::system_clock::now());
    REQUIRE_FALSE(runs.create(older));
    REQUIRE_FALSE(runs.create(newer));

    const auto listed = runs.list_for_definition(1U);
    REQUIRE(listed.size() == 2U);
    CHECK(listed[0].id == newer.id);
    CHECK(listed[1].id == older.id);

    newer.status = RunStatus::Success;
    REQUIRE_FALSE(runs.update(newer));
    CHECK(runs.find(newer.id)->status == RunStatus::Success);

    RunRecord unknown{};
    unknown.id = 99U;
    CHECK(runs.update(unknown) == make_error_code(RunErrc::RunNotFound));
}

TEST_CASE("mark_refreshed records the refresh time")
{
    InMemoryDefinitionRepository definitions{};
    auto definition = make_definition("mv_a");
    REQUIRE_FALSE(definitions.insert(definition));

    const auto at = std::chrono::system_clock::time_point{std::chrono::seconds{42}};
    REQUIRE_FALSE(definitions.mark_refreshed(definition.id, at));
    CHECK(definitions.last_refreshed_at(definition.id) == at);
    CHECK(definitions.mark_refreshed(77U, at) == make_error_code(RunErrc::DefinitionNotFound));
}
