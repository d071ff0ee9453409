#include "matview/service/service_telemetry.hpp"

namespace matview::service {

namespace {

inline std::size_t to_index(ServiceOperation operation) noexcept
{
    return static_cast<std::size_t>(operation);
}

}  // namespace

std::string_view to_string(ServiceOperation operation) noexcept
{
    switch (operation) {
    case ServiceOperation::CreateView:
        return "create_view";
    case ServiceOperation::RegularRefresh:
        return "regular_refresh";
    case ServiceOperation::ConcurrentRefresh:
        return "concurrent_refresh";
    case ServiceOperation::SwapRefresh:
        return "swap_refresh";
    case ServiceOperation::DeleteView:
        return "delete_view";
    case ServiceOperation::CheckViewExists:
        return "check_view_exists";
    case ServiceOperation::Count:
    default:
        return "unknown";
    }
}

void ServiceTelemetry::record_attempt(ServiceOperation operation) noexcept
{
    attempts_[to_index(operation)].fetch_add(1U, std::memory_order_relaxed);
}

void ServiceTelemetry::record_outcome(ServiceOperation operation, const ServiceResponse& response) noexcept
{
    const auto index = to_index(operation);
    if (response.is_error()) {
        failures_[index].fetch_add(1U, std::memory_order_relaxed);
        record_failure(response.error() ? response.error()->code : std::error_code{});
        return;
    }
    if (response.status() == ServiceStatus::Skipped) {
        skips_[index].fetch_add(1U, std::memory_order_relaxed);
        return;
    }
    successes_[index].fetch_add(1U, std::memory_order_relaxed);
}

void ServiceTelemetry::record_duration(ServiceOperation operation, std::uint64_t duration_ns) noexcept
{
    const auto index = to_index(operation);
    total_duration_ns_[index].fetch_add(duration_ns, std::memory_order_relaxed);
    last_duration_ns_[index].store(duration_ns, std::memory_order_relaxed);
}

void ServiceTelemetry::record_failure(std::error_code error) noexcept
{
    if (!error || error.category() != service_error_category()) {
        other_failures_.fetch_add(1U, std::memory_order_relaxed);
        return;
    }

    switch (static_cast<ServiceErrc>(error.value())) {
    case ServiceErrc::InvalidIdentifier:
    case ServiceErrc::InvalidSql:
    case ServiceErrc::UniqueIndexColumnsRequired:
        validation_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case ServiceErrc::ViewNotFound:
    case ServiceErrc::UniqueIndexRequired:
        precondition_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case ServiceErrc::LockContention:
        lock_contention_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case ServiceErrc::DependentObjects:
        dependency_conflicts_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case ServiceErrc::DatabaseError:
        database_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    default:
        other_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    }
}

ServiceTelemetrySnapshot ServiceTelemetry::snapshot() const noexcept
{
    ServiceTelemetrySnapshot snapshot{};
    for (std::size_t i = 0; i < operation_count; ++i) {
        snapshot.operations[i].attempts = attempts_[i].load(std::memory_order_relaxed);
        snapshot.operations[i].successes = successes_[i].load(std::memory_order_relaxed);
        snapshot.operations[i].skips = skips_[i].load(std::memory_order_relaxed);
        snapshot.operations[i].failures = failures_[i].load(std::memory_order_relaxed);
        snapshot.operations[i].total_duration_ns = total_duration_ns_[i].load(std::memory_order_relaxed);
        snapshot.operations[i].last_duration_ns = last_duration_ns_[i].load(std::memory_order_relaxed);
    }

    snapshot.failures.validation_failures = validation_failures_.load(std::memory_order_relaxed);
    snapshot.failures.precondition_failures = precondition_failures_.load(std::memory_order_relaxed);
    snapshot.failures.lock_contention = lock_contention_.load(std::memory_order_relaxed);
    snapshot.failures.dependency_conflicts = dependency_conflicts_.load(std::memory_order_relaxed);
    snapshot.failures.database_failures = database_failures_.load(std::memory_order_relaxed);
    snapshot.failures.other_failures = other_failures_.load(std::memory_order_relaxed);
    return snapshot;
}

void ServiceTelemetry::reset() noexcept
{
    for (std::size_t i = 0; i < operation_count; ++i) {
        attempts_[i].store(0U, std::memory_order_relaxed);
        successes_[i].store(0U, std::memory_order_relaxed);
        skips_[i].store(0U, std::memory_order_relaxed);
        failures_[i].store(0U, std::memory_order_relaxed);
        total_duration_ns_[i].store(0U, std::memory_order_relaxed);
        last_duration_ns_[i].store(0U, std::memory_order_relaxed);
    }

    validation_failures_.store(0U, std::memory_order_relaxed);
    precondition_failures_.store(0U, std::memory_order_relaxed);
    lock_contention_.store(0U, std::memory_order_relaxed);
    dependency_conflicts_.store(0U, std::memory_order_relaxed);
    database_failures_.store(0U, std::memory_order_relaxed);
    other_failures_.store(0U, std::memory_order_relaxed);
}

}  // namespace matview::service
