#include "matview/jobs/view_jobs.hpp"

#include "matview/jobs/run_errors.hpp"
#include "matview/service/service_runner.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace matview::jobs {

namespace {

std::string lowercase_trimmed(std::string_view value)
{
    std::size_t begin = 0U;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1U])) != 0) {
        --end;
    }

    std::string text{value.substr(begin, end - begin)};
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start)
{
    const auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

std::string failure_message(std::uint64_t run_id, const service::ServiceResponse& response)
{
    std::string message = "run " + std::to_string(run_id) + " failed";
    if (response.error()) {
        message += ": " + response.error()->message;
    }
    return message;
}

}  // namespace

std::string_view to_string(JobKind kind) noexcept
{
    switch (kind) {
    case JobKind::Create:
        return "create";
    case JobKind::Refresh:
        return "refresh";
    case JobKind::Delete:
    default:
        return "delete";
    }
}

RunOperation run_operation(JobKind kind) noexcept
{
    switch (kind) {
    case JobKind::Create:
        return RunOperation::Create;
    case JobKind::Refresh:
        return RunOperation::Refresh;
    case JobKind::Delete:
    default:
        return RunOperation::Drop;
    }
}

bool is_truthy(std::string_view value) noexcept
{
    const auto text = lowercase_trimmed(value);
    return text == "1" || text == "true" || text == "yes" || text == "y" || text == "--yes";
}

bool option_flag(const JobOptions& options, std::string_view key, bool fallback)
{
    const auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    return is_truthy(it->second);
}

service::RowCountStrategy option_row_count_strategy(const JobOptions& options, service::RowCountStrategy fallback)
{
    const auto it = options.find("row_count_strategy");
    if (it == options.end()) {
        return fallback;
    }
    const auto text = lowercase_trimmed(it->second);
    if (text.empty()) {
        return fallback;
    }
    return service::parse_row_count_strategy(text);
}

JobFailedError::JobFailedError(std::uint64_t run_id, service::ServiceResponse response)
    : std::runtime_error{failure_message(run_id, response)}
    , run_id_{run_id}
    , response_{std::move(response)}
{
}

ViewJobRunner::ViewJobRunner(Config config)
    : config_{std::move(config)}
{
    if (config_.session == nullptr || config_.definitions == nullptr || config_.runs == nullptr) {
        throw std::invalid_argument{"ViewJobRunner requires a session, a definition repository and a run repository"};
    }
}

service::ServiceResponse ViewJobRunner::perform(const JobRequest& request)
{
    switch (request.kind) {
    case JobKind::Create:
        return perform_create(request.definition_id, request.options);
    case JobKind::Refresh:
        return perform_refresh(request.definition_id, request.options);
    case JobKind::Delete:
    default:
        return perform_delete(request.definition_id, request.options);
    }
}

service::ServiceResponse ViewJobRunner::perform_create(std::uint64_t definition_id, const JobOptions& options)
{
    service::CreateView::Options create_options{};
    create_options.force = option_flag(options, "force", false);
    create_options.row_count_strategy = option_row_count_strategy(options, config_.default_row_count_strategy);

    return run_job(definition_id, RunOperation::Create, [&](const definition::ViewDefinition& definition) {
        service::CreateView operation{*config_.session, definition, create_options};
        return operation.run(config_.telemetry);
    });
}

service::ServiceResponse ViewJobRunner::perform_refresh(std::uint64_t definition_id, const JobOptions& options)
{
    const auto strategy = option_row_count_strategy(options, config_.default_row_count_strategy);

    return run_job(definition_id, RunOperation::Refresh, [&](const definition::ViewDefinition& definition) {
        switch (definition.refresh_strategy) {
        case definition::RefreshStrategy::Concurrent: {
            service::ConcurrentRefresh operation{*config_.session, definition, {strategy}};
            return operation.run(config_.telemetry);
        }
        case definition::RefreshStrategy::Swap: {
            service::SwapRefresh operation{*config_.session, definition, {strategy, config_.token_generator}};
            return operation.run(config_.telemetry);
        }
        case definition::RefreshStrategy::Regular:
        default: {
            service::RegularRefresh operation{*config_.session, definition, {strategy}};
            return operation.run(config_.telemetry);
        }
        }
    });
}

service::ServiceResponse ViewJobRunner::perform_delete(std::uint64_t definition_id, const JobOptions& options)
{
    service::DeleteView::Options delete_options{};
    delete_options.cascade = option_flag(options, "cascade", false);
    delete_options.if_exists = option_flag(options, "if_exists", true);
    delete_options.row_count_strategy = option_row_count_strategy(options, config_.default_row_count_strategy);

    return run_job(definition_id, RunOperation::Drop, [&](const definition::ViewDefinition& definition) {
        service::DeleteView operation{*config_.session, definition, delete_options};
        return operation.run(config_.telemetry);
    });
}

service::ServiceResponse ViewJobRunner::run_job(std::uint64_t definition_id,
                                                RunOperation operation,
                                                const Invocation& invoke)
{
    const auto definition = load_definition(definition_id);

    auto run = start_run(definition.id, operation, now());
    if (auto error = config_.runs->create(run)) {
        throw std::system_error{error, "recording run for " + definition.name};
    }

    const auto start = std::chrono::steady_clock::now();
    std::optional<service::ServiceResponse> response{};
    try {
        response.emplace(invoke(definition));
    } catch (const std::exception& error) {
        if (auto ec = fail_run(run, service::serialize_exception(error), now(), elapsed_ms(start))) {
            throw std::system_error{ec, "finalizing run " + std::to_string(run.id)};
        }
        persist(run);
        log(run, definition);
        throw;
    }

    if (auto error = finalize_run(run, *response, now(), elapsed_ms(start))) {
        throw std::system_error{error, "finalizing run " + std::to_string(run.id)};
    }
    persist(run);

    if (operation == RunOperation::Refresh && response->success()) {
        if (auto error = config_.definitions->mark_refreshed(definition.id, *run.finished_at)) {
            throw std::system_error{error, "marking " + definition.name + " refreshed"};
        }
    }
    log(run, definition);

    if (response->is_error()) {
        throw JobFailedError{run.id, *response};
    }
    return *response;
}

definition::ViewDefinition ViewJobRunner::load_definition(std::uint64_t definition_id)
{
    auto definition = config_.definitions->find(definition_id);
    if (!definition) {
        throw std::system_error{make_error_code(RunErrc::DefinitionNotFound),
                                "definition " + std::to_string(definition_id)};
    }
    return *definition;
}

void ViewJobRunner::persist(const RunRecord& run)
{
    if (auto error = config_.runs->update(run)) {
        throw std::system_error{error, "persisting run " + std::to_string(run.id)};
    }
}

void ViewJobRunner::log(const RunRecord& run, const definition::ViewDefinition& definition) const
{
    if (config_.run_logger) {
        config_.run_logger(run, definition);
    }
}

std::chrono::system_clock::time_point ViewJobRunner::now() const
{
    return config_.clock ? config_.clock() : std::chrono::system_clock::now();
}

}  // namespace matview::jobs
