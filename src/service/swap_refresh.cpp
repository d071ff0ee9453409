#include "matview/service/view_operations.hpp"

#include "matview/sql/sql_builder.hpp"

#include <random>
#include <utility>

namespace matview::service {

std::string random_hex_token()
{
    constexpr std::size_t kTokenBytes = 8U;
    constexpr char kHex[] = "0123456789abcdef";

    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> distribution{0U, 255U};

    std::string token;
    token.reserve(kTokenBytes * 2U);
    for (std::size_t i = 0; i < kTokenBytes; ++i) {
        const auto byte = distribution(engine);
        token.push_back(kHex[(byte >> 4U) & 0x0FU]);
        token.push_back(kHex[byte & 0x0FU]);
    }
    return token;
}

SwapRefresh::SwapRefresh(sql::SqlSession& session, const definition::ViewDefinition& definition, Options options)
    : context_{session, definition, options.row_count_strategy}
    , options_{std::move(options)}
{
}

ServiceResponse SwapRefresh::run(ServiceTelemetry* telemetry)
{
    return run_service(*this, telemetry);
}

void SwapRefresh::assign_request(ServiceRequest& request)
{
    request.row_count_strategy = options_.row_count_strategy;
    request.swap = true;
}

void SwapRefresh::prepare()
{
    context_.ensure_valid_name();
    context_.ensure_view_exists();
}

ServiceStatus SwapRefresh::execute(ServicePayload& payload)
{
    payload.view = context_.display_relation();
    payload.row_count_before = context_.fetch_row_count();
    payload.sql = swap_view();
    payload.row_count_after = context_.fetch_row_count();
    return ServiceStatus::Updated;
}

std::string SwapRefresh::next_token()
{
    if (options_.token_generator) {
        return options_.token_generator();
    }
    return random_hex_token();
}

std::vector<std::string> SwapRefresh::swap_view()
{
    auto& session = context_.session();
    const auto& schema = context_.schema();
    const auto& relation = context_.relation();
    const auto& definition = context_.definition();

    const auto temporary = sql::swap_relation_name(relation, "tmp", next_token());
    const auto retired = sql::swap_relation_name(relation, "old", next_token());

    std::vector<std::string> steps;
    steps.push_back(sql::create_materialized_view(schema, temporary, definition.sql));

    std::vector<std::string> swap_steps{
        sql::rename_materialized_view(schema, relation, retired),
        sql::rename_materialized_view(schema, temporary, relation),
        sql::drop_materialized_view(schema, retired, sql::DropBehavior::Unspecified),
    };
    const auto columns = definition::normalized_unique_columns(definition);
    if (!columns.empty()) {
        swap_steps.push_back(sql::create_unique_index(sql::unique_index_name(schema, relation, columns),
                                                      schema,
                                                      relation,
                                                      columns,
                                                      false));
    }

    session.execute(steps.front());
    try {
        session.transaction([&] {
            for (const auto& step : swap_steps) {
                session.execute(step);
            }
        });
    } catch (const sql::SqlError& error) {
        const auto cleanup_failure = drop_temporary(temporary);
        if (cleanup_failure.empty()) {
            throw;
        }
        throw sql::SqlError{std::string{error.what()} + " (" + cleanup_failure + ")", error.sqlstate(), error.statement()};
    } catch (const std::exception&) {
        (void)drop_temporary(temporary);
        throw;
    }

    steps.insert(steps.end(), swap_steps.begin(), swap_steps.end());
    return steps;
}

// Returns a description of the cleanup failure, empty on success.
std::string SwapRefresh::drop_temporary(const std::string& temporary) noexcept
{
    try {
        context_.session().execute(
            sql::drop_materialized_view(context_.schema(), temporary, sql::DropBehavior::Unspecified));
        return {};
    } catch (const std::exception& error) {
        return std::string{"dropping temporary view "} + temporary + " failed: " + error.what();
    }
}

}  // namespace matview::service
