#pragma once

#include "matview/service/service_response.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace matview::config {

enum class JobAdapter : std::uint8_t {
    Inline = 0,
    Threaded
};

[[nodiscard]] std::string_view to_string(JobAdapter adapter) noexcept;
[[nodiscard]] std::optional<JobAdapter> parse_job_adapter(std::string_view text) noexcept;

struct Configuration final {
    JobAdapter job_adapter = JobAdapter::Inline;
    std::string job_queue{"default"};
    service::RowCountStrategy default_row_count_strategy = service::RowCountStrategy::Estimated;
    std::string database_url{};
    std::size_t worker_threads = 1U;
    bool assume_yes = false;
    bool force = false;
};

using EnvironmentLookup = std::function<std::optional<std::string>(const char*)>;

// Reads the process environment.
std::optional<std::string> process_environment(const char* name);

// Applies MATVIEW_DATABASE_URL, MATVIEW_JOB_ADAPTER, MATVIEW_JOB_QUEUE,
// MATVIEW_ROW_COUNT_STRATEGY, MATVIEW_WORKER_THREADS, YES and FORCE on top of configuration.
// Returns std::errc::invalid_argument for an unknown adapter or a bad thread count; the values
// applied before the failure stay applied.
std::error_code apply_environment(Configuration& configuration, const EnvironmentLookup& lookup = process_environment);

}  // namespace matview::config
