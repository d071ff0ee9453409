#include "matview/service/view_operations.hpp"

#include "matview/sql/sql_builder.hpp"

namespace matview::service {

CreateView::CreateView(sql::SqlSession& session, const definition::ViewDefinition& definition, Options options)
    : context_{session, definition, options.row_count_strategy}
    , options_{options}
{
}

ServiceResponse CreateView::run(ServiceTelemetry* telemetry)
{
    return run_service(*this, telemetry);
}

void CreateView::assign_request(ServiceRequest& request)
{
    request.force = options_.force;
    request.row_count_strategy = options_.row_count_strategy;
}

void CreateView::prepare()
{
    context_.ensure_valid_name();
    context_.ensure_valid_sql();

    const auto& definition = context_.definition();
    if (definition.refresh_strategy == definition::RefreshStrategy::Concurrent
        && definition::normalized_unique_columns(definition).empty()) {
        throw ServiceError{ServiceErrc::UniqueIndexColumnsRequired,
                           "refresh_strategy=concurrent requires unique_index_columns (non-empty)"};
    }
}

ServiceStatus CreateView::execute(ServicePayload& payload)
{
    payload.view = context_.display_relation();

    auto& session = context_.session();
    const auto& schema = context_.schema();
    const auto& relation = context_.relation();

    if (context_.view_exists()) {
        if (!options_.force) {
            payload.created_indexes = std::vector<std::string>{};
            return ServiceStatus::Skipped;
        }
        payload.row_count_before = context_.fetch_row_count();
        auto drop = sql::drop_materialized_view(schema, relation, sql::DropBehavior::Unspecified);
        payload.sql.push_back(drop);
        session.execute(drop);
    } else {
        payload.row_count_before = kUnknownRowCount;
    }

    auto create = sql::create_materialized_view(schema, relation, context_.definition().sql);
    payload.sql.push_back(create);
    session.execute(create);

    payload.created_indexes = ensure_unique_index(payload);
    payload.row_count_after = context_.fetch_row_count();
    return ServiceStatus::Created;
}

std::vector<std::string> CreateView::ensure_unique_index(ServicePayload& payload)
{
    const auto& definition = context_.definition();
    if (definition.refresh_strategy != definition::RefreshStrategy::Concurrent) {
        return {};
    }

    const auto columns = definition::normalized_unique_columns(definition);
    const auto& schema = context_.schema();
    auto index_name = sql::unique_index_name(schema, context_.relation(), columns);
    if (context_.index_exists(index_name)) {
        return {};
    }

    // CONCURRENTLY is rejected inside a transaction block.
    const auto concurrently = context_.connection_idle();
    auto statement = sql::create_unique_index(index_name, schema, context_.relation(), columns, concurrently);
    payload.sql.push_back(statement);
    context_.session().execute(statement);
    return {index_name};
}

}  // namespace matview::service
