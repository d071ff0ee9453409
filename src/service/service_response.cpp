#include "matview/service/service_response.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace matview::service {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size()
           && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                  return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
              });
}

}  // namespace

std::string_view to_string(ServiceStatus status) noexcept
{
    switch (status) {
    case ServiceStatus::Ok:
        return "ok";
    case ServiceStatus::Created:
        return "created";
    case ServiceStatus::Updated:
        return "updated";
    case ServiceStatus::Skipped:
        return "skipped";
    case ServiceStatus::Deleted:
        return "deleted";
    case ServiceStatus::Error:
    default:
        return "error";
    }
}

std::string_view to_string(RowCountStrategy strategy) noexcept
{
    switch (strategy) {
    case RowCountStrategy::Estimated:
        return "estimated";
    case RowCountStrategy::Exact:
        return "exact";
    case RowCountStrategy::None:
    default:
        return "none";
    }
}

RowCountStrategy parse_row_count_strategy(std::string_view text) noexcept
{
    constexpr std::array kStrategies{RowCountStrategy::None, RowCountStrategy::Estimated, RowCountStrategy::Exact};
    for (const auto strategy : kStrategies) {
        if (iequals(text, to_string(strategy))) {
            return strategy;
        }
    }
    return RowCountStrategy::None;
}

ServiceResponse ServiceResponse::make(ServiceStatus status,
                                      ServiceRequest request,
                                      ServicePayload payload,
                                      std::optional<SerializedError> error)
{
    if (status == ServiceStatus::Error && !error) {
        throw ServiceError{ServiceErrc::InvalidResponse, "error status requires an error"};
    }
    if (status != ServiceStatus::Error && error) {
        throw ServiceError{ServiceErrc::InvalidResponse,
                           "status " + std::string{to_string(status)} + " must not carry an error"};
    }
    return ServiceResponse{status, std::move(request), std::move(payload), std::move(error)};
}

ServiceResponse::ServiceResponse(ServiceStatus status,
                                 ServiceRequest request,
                                 ServicePayload payload,
                                 std::optional<SerializedError> error)
    : status_{status}
    , request_{std::move(request)}
    , payload_{std::move(payload)}
    , error_{std::move(error)}
{
}

}  // namespace matview::service
