#include "matview/service/view_operations.hpp"

#include "matview/sql/sql_builder.hpp"

namespace matview::service {

DeleteView::DeleteView(sql::SqlSession& session, const definition::ViewDefinition& definition, Options options)
    : context_{session, definition, options.row_count_strategy}
    , options_{options}
{
}

ServiceResponse DeleteView::run(ServiceTelemetry* telemetry)
{
    return run_service(*this, telemetry);
}

void DeleteView::assign_request(ServiceRequest& request)
{
    request.cascade = options_.cascade;
    request.if_exists = options_.if_exists;
    request.row_count_strategy = options_.row_count_strategy;
}

void DeleteView::prepare()
{
    context_.ensure_valid_name();
    if (!options_.if_exists) {
        context_.ensure_view_exists();
    }
}

ServiceStatus DeleteView::execute(ServicePayload& payload)
{
    payload.view = context_.display_relation();

    if (!context_.view_exists()) {
        payload.row_count_before = kUnknownRowCount;
        payload.row_count_after = kUnknownRowCount;
        return ServiceStatus::Skipped;
    }

    payload.row_count_before = context_.fetch_row_count();

    const auto behavior = options_.cascade ? sql::DropBehavior::Cascade : sql::DropBehavior::Restrict;
    auto statement = sql::drop_materialized_view(context_.schema(), context_.relation(), behavior);
    payload.sql.push_back(statement);
    try {
        context_.session().execute(statement);
    } catch (const sql::SqlError& error) {
        if (!error.is_dependency_conflict()) {
            throw;
        }
        throw ServiceError{ServiceErrc::DependentObjects,
                           std::string{error.what()} + ": dependencies exist. Use cascade: true to force drop."};
    }

    payload.row_count_after = kUnknownRowCount;
    return ServiceStatus::Deleted;
}

CheckViewExists::CheckViewExists(sql::SqlSession& session, const definition::ViewDefinition& definition)
    : context_{session, definition, RowCountStrategy::None}
{
}

ServiceResponse CheckViewExists::run(ServiceTelemetry* telemetry)
{
    return run_service(*this, telemetry);
}

void CheckViewExists::assign_request(ServiceRequest&)
{
}

void CheckViewExists::prepare()
{
}

ServiceStatus CheckViewExists::execute(ServicePayload& payload)
{
    payload.view = context_.display_relation();
    payload.exists = context_.view_exists();
    return ServiceStatus::Ok;
}

}  // namespace matview::service
