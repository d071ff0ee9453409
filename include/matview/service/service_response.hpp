#pragma once

#include "matview/service/service_errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace matview::service {

enum class ServiceStatus : std::uint8_t {
    Ok = 0,
    Created,
    Updated,
    Skipped,
    Deleted,
    Error
};

enum class RowCountStrategy : std::uint8_t {
    None = 0,
    Estimated,
    Exact
};

// Reported when no count was taken.
inline constexpr std::int64_t kUnknownRowCount = -1;

[[nodiscard]] std::string_view to_string(ServiceStatus status) noexcept;
[[nodiscard]] std::string_view to_string(RowCountStrategy strategy) noexcept;

// Unrecognized names select None.
[[nodiscard]] RowCountStrategy parse_row_count_strategy(std::string_view text) noexcept;

// Normalized options an operation was invoked with. Unset fields were not part of the request.
struct ServiceRequest final {
    std::optional<RowCountStrategy> row_count_strategy{};
    std::optional<bool> force{};
    std::optional<bool> cascade{};
    std::optional<bool> if_exists{};
    std::optional<bool> concurrent{};
    std::optional<bool> swap{};
};

struct ServicePayload final {
    std::string view{};
    std::vector<std::string> sql{};
    std::optional<std::int64_t> row_count_before{};
    std::optional<std::int64_t> row_count_after{};
    std::optional<std::vector<std::string>> created_indexes{};
    std::optional<bool> exists{};
};

struct SerializedError final {
    std::string error_class{};
    std::string message{};
    std::vector<std::string> backtrace{};
    std::error_code code{};
    std::vector<std::string> remediation_hints{};
};

class ServiceResponse final {
public:
    // Throws ServiceError(InvalidResponse) unless error is present exactly when status is Error.
    static ServiceResponse make(ServiceStatus status,
                                ServiceRequest request = {},
                                ServicePayload payload = {},
                                std::optional<SerializedError> error = std::nullopt);

    [[nodiscard]] ServiceStatus status() const noexcept { return status_; }
    [[nodiscard]] const ServiceRequest& request() const noexcept { return request_; }
    [[nodiscard]] const ServicePayload& response() const noexcept { return payload_; }
    [[nodiscard]] const std::optional<SerializedError>& error() const noexcept { return error_; }

    [[nodiscard]] bool success() const noexcept { return status_ != ServiceStatus::Error; }
    [[nodiscard]] bool is_error() const noexcept { return status_ == ServiceStatus::Error; }

private:
    ServiceResponse(ServiceStatus status,
                    ServiceRequest request,
                    ServicePayload payload,
                    std::optional<SerializedError> error);

    ServiceStatus status_ = ServiceStatus::Ok;
    ServiceRequest request_{};
    ServicePayload payload_{};
    std::optional<SerializedError> error_{};
};

inline ServiceResponse make_success(ServiceStatus status, ServiceRequest request = {}, ServicePayload payload = {})
{
    return ServiceResponse::make(status, std::move(request), std::move(payload));
}

inline ServiceResponse make_error(SerializedError error, ServiceRequest request = {}, ServicePayload payload = {})
{
    return ServiceResponse::make(ServiceStatus::Error, std::move(request), std::move(payload), std::move(error));
}

}  // namespace matview::service
