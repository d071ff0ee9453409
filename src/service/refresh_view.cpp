#include "matview/service/view_operations.hpp"

#include "matview/sql/sql_builder.hpp"

namespace matview::service {

RegularRefresh::RegularRefresh(sql::SqlSession& session, const definition::ViewDefinition& definition, Options options)
    : context_{session, definition, options.row_count_strategy}
    , options_{options}
{
}

ServiceResponse RegularRefresh::run(ServiceTelemetry* telemetry)
{
    return run_service(*this, telemetry);
}

void RegularRefresh::assign_request(ServiceRequest& request)
{
    request.row_count_strategy = options_.row_count_strategy;
}

void RegularRefresh::prepare()
{
    context_.ensure_valid_name();
    context_.ensure_view_exists();
}

ServiceStatus RegularRefresh::execute(ServicePayload& payload)
{
    payload.view = context_.display_relation();
    payload.row_count_before = context_.fetch_row_count();

    auto statement = sql::refresh_materialized_view(context_.schema(), context_.relation(), false);
    payload.sql.push_back(statement);
    context_.session().execute(statement);

    payload.row_count_after = context_.fetch_row_count();
    return ServiceStatus::Updated;
}

ConcurrentRefresh::ConcurrentRefresh(sql::SqlSession& session,
                                     const definition::ViewDefinition& definition,
                                     Options options)
    : context_{session, definition, options.row_count_strategy}
    , options_{options}
{
}

ServiceResponse ConcurrentRefresh::run(ServiceTelemetry* telemetry)
{
    return run_service(*this, telemetry);
}

void ConcurrentRefresh::assign_request(ServiceRequest& request)
{
    request.row_count_strategy = options_.row_count_strategy;
    request.concurrent = true;
}

void ConcurrentRefresh::prepare()
{
    context_.ensure_valid_name();
    context_.ensure_view_exists();
    context_.ensure_unique_index();
}

// Lock contention surfaces as an SqlError with SQLSTATE 55006/55P03 and is classified by the
// runner as ServiceErrc::LockContention.
ServiceStatus ConcurrentRefresh::execute(ServicePayload& payload)
{
    payload.view = context_.display_relation();
    payload.row_count_before = context_.fetch_row_count();

    auto statement = sql::refresh_materialized_view(context_.schema(), context_.relation(), true);
    payload.sql.push_back(statement);
    context_.session().execute(statement);

    payload.row_count_after = context_.fetch_row_count();
    return ServiceStatus::Updated;
}

}  // namespace matview::service
