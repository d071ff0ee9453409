#pragma once

#include <string>
#include <system_error>
#include <vector>

namespace matview::service {

enum class ServiceErrc {
    Success = 0,
    InvalidIdentifier,
    InvalidSql,
    UniqueIndexColumnsRequired,
    ViewNotFound,
    UniqueIndexRequired,
    LockContention,
    DependentObjects,
    DatabaseError,
    UnexpectedFailure,
    InvalidResponse
};

const std::error_category& service_error_category() noexcept;
std::error_code make_error_code(ServiceErrc value) noexcept;

std::vector<std::string> default_remediation_hints(std::error_code error);

// Raised by operations when a precondition fails. Carries the frames captured where it was thrown.
class ServiceError final : public std::system_error {
public:
    ServiceError(ServiceErrc code, std::string message);

    // The message alone, without the category text std::system_error appends.
    [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }
    [[nodiscard]] const std::vector<std::string>& backtrace() const noexcept { return backtrace_; }

private:
    std::string message_{};
    std::vector<std::string> backtrace_{};
};

}  // namespace matview::service

namespace std {

template <>
struct is_error_code_enum<matview::service::ServiceErrc> : true_type {
};

}  // namespace std
