#include "matview/sql/sql_session.hpp"

#include "matview/common/backtrace.hpp"

#include <utility>

namespace matview::sql {

SqlError::SqlError(const std::string& message, std::string sqlstate, std::string statement)
    : std::runtime_error{message}
    , sqlstate_{std::move(sqlstate)}
    , statement_{std::move(statement)}
    , backtrace_{common::capture_backtrace(1U)}
{
}

bool SqlError::is_lock_contention() const noexcept
{
    return sqlstate_ == sqlstate::kObjectInUse || sqlstate_ == sqlstate::kLockNotAvailable;
}

bool SqlError::is_dependency_conflict() const noexcept
{
    return sqlstate_ == sqlstate::kDependentObjectsStillExist;
}

Value SqlSession::select_value(std::string_view statement, const Params& params)
{
    const auto rows = query(statement, params);
    if (rows.empty() || rows.front().empty()) {
        return std::nullopt;
    }
    return rows.front().front();
}

}  // namespace matview::sql
