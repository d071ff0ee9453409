#include "matview/service/service_errors.hpp"

#include "matview/common/backtrace.hpp"

#include <string>
#include <utility>

namespace matview::service {

namespace {

class ServiceErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "matview.service";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ServiceErrc>(condition)) {
        case ServiceErrc::Success:
            return "success";
        case ServiceErrc::InvalidIdentifier:
            return "invalid view name format";
        case ServiceErrc::InvalidSql:
            return "SQL must start with SELECT";
        case ServiceErrc::UniqueIndexColumnsRequired:
            return "refresh_strategy=concurrent requires unique_index_columns (non-empty)";
        case ServiceErrc::ViewNotFound:
            return "materialized view does not exist";
        case ServiceErrc::UniqueIndexRequired:
            return "materialized view must have a unique index for concurrent refresh";
        case ServiceErrc::LockContention:
            return "materialized view is in use by another session";
        case ServiceErrc::DependentObjects:
            return "dependent objects still exist";
        case ServiceErrc::DatabaseError:
            return "database error";
        case ServiceErrc::UnexpectedFailure:
            return "unexpected failure";
        case ServiceErrc::InvalidResponse:
            return "invalid service response";
        default:
            return "unknown service error";
        }
    }
};

const ServiceErrorCategory kCategory{};

}  // namespace

const std::error_category& service_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(ServiceErrc value) noexcept
{
    return {static_cast<int>(value), service_error_category()};
}

std::vector<std::string> default_remediation_hints(std::error_code error)
{
    if (!error) {
        return {};
    }
    if (error.category() != service_error_category()) {
        return {"Inspect database logs for additional details."};
    }

    switch (static_cast<ServiceErrc>(error.value())) {
    case ServiceErrc::Success:
        return {};
    case ServiceErrc::InvalidIdentifier:
        return {"View names must start with a letter or underscore and contain only letters, digits and underscores."};
    case ServiceErrc::InvalidSql:
        return {"Provide a query that begins with SELECT."};
    case ServiceErrc::UniqueIndexColumnsRequired:
        return {"Declare unique_index_columns or choose the regular or swap refresh strategy."};
    case ServiceErrc::ViewNotFound:
        return {"Create the materialized view before refreshing it."};
    case ServiceErrc::UniqueIndexRequired:
        return {"Create a unique index on the view or use the regular or swap refresh strategy."};
    case ServiceErrc::LockContention:
        return {"Another session holds a conflicting lock; retry the refresh later."};
    case ServiceErrc::DependentObjects:
        return {"Use cascade: true to force drop."};
    case ServiceErrc::DatabaseError:
        return {"Check the database logs for the failing statement."};
    case ServiceErrc::InvalidResponse:
        return {"Report this as a defect; a response must carry an error exactly when its status is error."};
    case ServiceErrc::UnexpectedFailure:
    default:
        return {"Inspect database logs for additional details."};
    }
}

ServiceError::ServiceError(ServiceErrc code, std::string message)
    : std::system_error{make_error_code(code), message}
    , message_{std::move(message)}
    , backtrace_{common::capture_backtrace(1U)}
{
}

}  // namespace matview::service
