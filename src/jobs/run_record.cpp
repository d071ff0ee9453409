#include "matview/jobs/run_record.hpp"

#include "matview/jobs/run_errors.hpp"
#include "matview/tools/run_log_formatter.hpp"

#include <initializer_list>
#include <utility>

namespace matview::jobs {

std::string_view to_string(RunStatus status) noexcept
{
    switch (status) {
    case RunStatus::Running:
        return "running";
    case RunStatus::Success:
        return "success";
    case RunStatus::Failed:
    default:
        return "failed";
    }
}

std::string_view to_string(RunOperation operation) noexcept
{
    switch (operation) {
    case RunOperation::Create:
        return "create";
    case RunOperation::Refresh:
        return "refresh";
    case RunOperation::Drop:
    default:
        return "drop";
    }
}

std::optional<RunStatus> parse_run_status(std::string_view text) noexcept
{
    for (const auto status : {RunStatus::Running, RunStatus::Success, RunStatus::Failed}) {
        if (text == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<RunOperation> parse_run_operation(std::string_view text) noexcept
{
    for (const auto operation : {RunOperation::Create, RunOperation::Refresh, RunOperation::Drop}) {
        if (text == to_string(operation)) {
            return operation;
        }
    }
    return std::nullopt;
}

bool is_terminal(RunStatus status) noexcept
{
    return status == RunStatus::Success || status == RunStatus::Failed;
}

bool can_transition(RunStatus from, RunStatus to) noexcept
{
    return from == RunStatus::Running && is_terminal(to);
}

RunRecord start_run(std::uint64_t definition_id, RunOperation operation, std::chrono::system_clock::time_point started_at)
{
    RunRecord run{};
    run.definition_id = definition_id;
    run.operation = operation;
    run.status = RunStatus::Running;
    run.started_at = started_at;
    return run;
}

std::error_code finalize_run(RunRecord& run,
                             const service::ServiceResponse& response,
                             std::chrono::system_clock::time_point finished_at,
                             std::int64_t duration_ms)
{
    const auto target = response.success() ? RunStatus::Success : RunStatus::Failed;
    if (!can_transition(run.status, target)) {
        return make_error_code(RunErrc::InvalidTransition);
    }

    run.status = target;
    run.finished_at = finished_at;
    run.duration_ms = duration_ms;
    run.meta_json = tools::format_run_meta_json(response);
    run.error = response.error();
    return {};
}

std::error_code fail_run(RunRecord& run,
                         service::SerializedError error,
                         std::chrono::system_clock::time_point finished_at,
                         std::int64_t duration_ms)
{
    if (!can_transition(run.status, RunStatus::Failed)) {
        return make_error_code(RunErrc::InvalidTransition);
    }

    run.status = RunStatus::Failed;
    run.finished_at = finished_at;
    run.duration_ms = duration_ms;
    run.error = std::move(error);
    return {};
}

}  // namespace matview::jobs
