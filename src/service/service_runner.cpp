#include "matview/service/service_runner.hpp"

#include "matview/common/backtrace.hpp"
#include "matview/sql/sql_session.hpp"

#include <typeinfo>

namespace matview::service {

namespace {

std::error_code classify(const sql::SqlError& error) noexcept
{
    if (error.is_lock_contention()) {
        return make_error_code(ServiceErrc::LockContention);
    }
    if (error.is_dependency_conflict()) {
        return make_error_code(ServiceErrc::DependentObjects);
    }
    return make_error_code(ServiceErrc::DatabaseError);
}

}  // namespace

SerializedError serialize_exception(const std::exception& error)
{
    SerializedError serialized{};
    serialized.error_class = common::demangle(typeid(error).name());
    serialized.message = error.what();

    if (const auto* service_error = dynamic_cast<const ServiceError*>(&error)) {
        serialized.code = service_error->code();
        serialized.backtrace = service_error->backtrace();
    } else if (const auto* sql_error = dynamic_cast<const sql::SqlError*>(&error)) {
        serialized.code = classify(*sql_error);
        serialized.backtrace = sql_error->backtrace();
    } else if (const auto* system_error = dynamic_cast<const std::system_error*>(&error)) {
        serialized.code = system_error->code();
        serialized.backtrace = common::capture_backtrace(1U);
    } else {
        serialized.code = make_error_code(ServiceErrc::UnexpectedFailure);
        serialized.backtrace = common::capture_backtrace(1U);
    }

    serialized.remediation_hints = default_remediation_hints(serialized.code);
    return serialized;
}

SerializedError serialize_unknown_exception()
{
    SerializedError serialized{};
    serialized.error_class = "unknown";
    serialized.message = "unknown exception";
    serialized.code = make_error_code(ServiceErrc::UnexpectedFailure);
    serialized.backtrace = common::capture_backtrace(1U);
    serialized.remediation_hints = default_remediation_hints(serialized.code);
    return serialized;
}

}  // namespace matview::service
