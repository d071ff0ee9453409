#pragma once

#include "matview/service/service_response.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace matview::jobs {

enum class RunStatus : std::uint8_t {
    Running = 0,
    Success,
    Failed
};

enum class RunOperation : std::uint8_t {
    Create = 0,
    Refresh,
    Drop
};

[[nodiscard]] std::string_view to_string(RunStatus status) noexcept;
[[nodiscard]] std::string_view to_string(RunOperation operation) noexcept;
[[nodiscard]] std::optional<RunStatus> parse_run_status(std::string_view text) noexcept;
[[nodiscard]] std::optional<RunOperation> parse_run_operation(std::string_view text) noexcept;

// Audit row for one operation invocation.
struct RunRecord final {
    std::uint64_t id = 0U;
    std::uint64_t definition_id = 0U;
    RunOperation operation = RunOperation::Create;
    RunStatus status = RunStatus::Running;
    std::chrono::system_clock::time_point started_at{};
    std::optional<std::chrono::system_clock::time_point> finished_at{};
    std::optional<std::int64_t> duration_ms{};
    // {"request": {...}, "response": {...}} of the ServiceResponse, "{}" until finalized.
    std::string meta_json{"{}"};
    std::optional<service::SerializedError> error{};
};

[[nodiscard]] bool is_terminal(RunStatus status) noexcept;

// Only running -> success and running -> failed are allowed.
[[nodiscard]] bool can_transition(RunStatus from, RunStatus to) noexcept;

RunRecord start_run(std::uint64_t definition_id,
                    RunOperation operation,
                    std::chrono::system_clock::time_point started_at);

// Success or failure follows response.success(); the error is copied from the response.
std::error_code finalize_run(RunRecord& run,
                             const service::ServiceResponse& response,
                             std::chrono::system_clock::time_point finished_at,
                             std::int64_t duration_ms);

// Terminal failure for an exception that escaped the operation.
std::error_code fail_run(RunRecord& run,
                         service::SerializedError error,
                         std::chrono::system_clock::time_point finished_at,
                         std::int64_t duration_ms);

}  // namespace matview::jobs
