#pragma once

#include "matview/service/service_errors.hpp"
#include "matview/service/service_response.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace matview::service {

enum class ServiceOperation : std::uint8_t {
    CreateView = 0,
    RegularRefresh,
    ConcurrentRefresh,
    SwapRefresh,
    DeleteView,
    CheckViewExists,
    Count
};

[[nodiscard]] std::string_view to_string(ServiceOperation operation) noexcept;

struct OperationTelemetrySnapshot final {
    std::uint64_t attempts = 0U;
    std::uint64_t successes = 0U;
    std::uint64_t skips = 0U;
    std::uint64_t failures = 0U;
    std::uint64_t total_duration_ns = 0U;
    std::uint64_t last_duration_ns = 0U;
};

struct FailureTelemetrySnapshot final {
    std::uint64_t validation_failures = 0U;
    std::uint64_t precondition_failures = 0U;
    std::uint64_t lock_contention = 0U;
    std::uint64_t dependency_conflicts = 0U;
    std::uint64_t database_failures = 0U;
    std::uint64_t other_failures = 0U;
};

struct ServiceTelemetrySnapshot final {
    std::array<OperationTelemetrySnapshot, static_cast<std::size_t>(ServiceOperation::Count)> operations{};
    FailureTelemetrySnapshot failures{};
};

class ServiceTelemetry final {
public:
    void record_attempt(ServiceOperation operation) noexcept;
    void record_outcome(ServiceOperation operation, const ServiceResponse& response) noexcept;
    void record_duration(ServiceOperation operation, std::uint64_t duration_ns) noexcept;

    [[nodiscard]] ServiceTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    void record_failure(std::error_code error) noexcept;

    static constexpr std::size_t operation_count = static_cast<std::size_t>(ServiceOperation::Count);

    std::array<std::atomic<std::uint64_t>, operation_count> attempts_{};
    std::array<std::atomic<std::uint64_t>, operation_count> successes_{};
    std::array<std::atomic<std::uint64_t>, operation_count> skips_{};
    std::array<std::atomic<std::uint64_t>, operation_count> failures_{};
    std::array<std::atomic<std::uint64_t>, operation_count> total_duration_ns_{};
    std::array<std::atomic<std::uint64_t>, operation_count> last_duration_ns_{};

    std::atomic<std::uint64_t> validation_failures_{0U};
    std::atomic<std::uint64_t> precondition_failures_{0U};
    std::atomic<std::uint64_t> lock_contention_{0U};
    std::atomic<std::uint64_t> dependency_conflicts_{0U};
    std::atomic<std::uint64_t> database_failures_{0U};
    std::atomic<std::uint64_t> other_failures_{0U};
};

}  // namespace matview::service
