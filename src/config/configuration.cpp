#include "matview/config/configuration.hpp"

#include "matview/jobs/view_jobs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace matview::config {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size()
           && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                  return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
              });
}

}  // namespace

std::string_view to_string(JobAdapter adapter) noexcept
{
    switch (adapter) {
    case JobAdapter::Threaded:
        return "threaded";
    case JobAdapter::Inline:
    default:
        return "inline";
    }
}

std::optional<JobAdapter> parse_job_adapter(std::string_view text) noexcept
{
    if (iequals(text, "inline")) {
        return JobAdapter::Inline;
    }
    if (iequals(text, "threaded")) {
        return JobAdapter::Threaded;
    }
    return std::nullopt;
}

std::optional<std::string> process_environment(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string{value};
}

std::error_code apply_environment(Configuration& configuration, const EnvironmentLookup& lookup)
{
    if (!lookup) {
        return {};
    }

    if (auto url = lookup("MATVIEW_DATABASE_URL"); url && !url->empty()) {
        configuration.database_url = *url;
    }
    if (auto queue = lookup("MATVIEW_JOB_QUEUE"); queue && !queue->empty()) {
        configuration.job_queue = *queue;
    }
    if (auto strategy = lookup("MATVIEW_ROW_COUNT_STRATEGY"); strategy && !strategy->empty()) {
        configuration.default_row_count_strategy = service::parse_row_count_strategy(*strategy);
    }
    if (auto yes = lookup("YES")) {
        configuration.assume_yes = jobs::is_truthy(*yes);
    }
    if (auto force = lookup("FORCE")) {
        configuration.force = jobs::is_truthy(*force);
    }

    if (auto adapter = lookup("MATVIEW_JOB_ADAPTER"); adapter && !adapter->empty()) {
        const auto parsed = parse_job_adapter(*adapter);
        if (!parsed) {
            return std::make_error_code(std::errc::invalid_argument);
        }
        configuration.job_adapter = *parsed;
    }

    if (auto threads = lookup("MATVIEW_WORKER_THREADS"); threads && !threads->empty()) {
        std::size_t count = 0U;
        const auto* begin = threads->data();
        const auto* end = begin + threads->size();
        const auto [ptr, ec] = std::from_chars(begin, end, count);
        if (ec != std::errc{} || ptr != end || count == 0U) {
            return std::make_error_code(std::errc::invalid_argument);
        }
        configuration.worker_threads = count;
    }
    return {};
}

}  // namespace matview::config
