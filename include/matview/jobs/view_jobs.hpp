#pragma once

#include "matview/definition/view_definition.hpp"
#include "matview/jobs/repositories.hpp"
#include "matview/jobs/run_record.hpp"
#include "matview/service/service_response.hpp"
#include "matview/service/service_telemetry.hpp"
#include "matview/service/view_operations.hpp"
#include "matview/sql/sql_session.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace matview::jobs {

enum class JobKind : std::uint8_t {
    Create = 0,
    Refresh,
    Delete
};

[[nodiscard]] std::string_view to_string(JobKind kind) noexcept;
[[nodiscard]] RunOperation run_operation(JobKind kind) noexcept;

// Raw option strings as delivered by the CLI or the queue ("force", "cascade",
// "row_count_strategy").
using JobOptions = std::map<std::string, std::string, std::less<>>;

struct JobRequest final {
    JobKind kind = JobKind::Refresh;
    std::uint64_t definition_id = 0U;
    std::string queue{"default"};
    JobOptions options{};
};

// 1, true, yes, y and --yes in any case count as true.
[[nodiscard]] bool is_truthy(std::string_view value) noexcept;
[[nodiscard]] bool option_flag(const JobOptions& options, std::string_view key, bool fallback);

// Absent or empty selects fallback; unrecognized names select None.
[[nodiscard]] service::RowCountStrategy option_row_count_strategy(const JobOptions& options,
                                                                  service::RowCountStrategy fallback);

// Raised after the failed run has been persisted so the queue sees the failure too.
class JobFailedError final : public std::runtime_error {
public:
    JobFailedError(std::uint64_t run_id, service::ServiceResponse response);

    [[nodiscard]] std::uint64_t run_id() const noexcept { return run_id_; }
    [[nodiscard]] const service::ServiceResponse& response() const noexcept { return response_; }

private:
    std::uint64_t run_id_ = 0U;
    service::ServiceResponse response_;
};

// Loads the definition, records a running run, invokes the operation and finalizes the run.
class ViewJobRunner final {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using RunLogger = std::function<void(const RunRecord&, const definition::ViewDefinition&)>;

    struct Config final {
        sql::SqlSession* session = nullptr;
        DefinitionRepository* definitions = nullptr;
        RunRepository* runs = nullptr;
        service::RowCountStrategy default_row_count_strategy = service::RowCountStrategy::Estimated;
        service::ServiceTelemetry* telemetry = nullptr;
        RunLogger run_logger{};
        Clock clock{};
        service::SwapRefresh::TokenGenerator token_generator{};
    };

    explicit ViewJobRunner(Config config);

    ViewJobRunner(const ViewJobRunner&) = delete;
    ViewJobRunner& operator=(const ViewJobRunner&) = delete;

    service::ServiceResponse perform(const JobRequest& request);
    service::ServiceResponse perform_create(std::uint64_t definition_id, const JobOptions& options = {});
    service::ServiceResponse perform_refresh(std::uint64_t definition_id, const JobOptions& options = {});
    service::ServiceResponse perform_delete(std::uint64_t definition_id, const JobOptions& options = {});

private:
    using Invocation = std::function<service::ServiceResponse(const definition::ViewDefinition&)>;

    service::ServiceResponse run_job(std::uint64_t definition_id, RunOperation operation, const Invocation& invoke);
    definition::ViewDefinition load_definition(std::uint64_t definition_id);
    void persist(const RunRecord& run);
    void log(const RunRecord& run, const definition::ViewDefinition& definition) const;
    [[nodiscard]] std::chrono::system_clock::time_point now() const;

    Config config_{};
};

}  // namespace matview::jobs
