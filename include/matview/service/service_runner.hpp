#pragma once

#include "matview/service/service_response.hpp"
#include "matview/service/service_telemetry.hpp"

#include <chrono>
#include <cstdint>
#include <exception>

namespace matview::service {

// Error shape for any exception leaving an operation: demangled class, message, frames and the
// ServiceErrc it maps to (SqlError SQLSTATEs included).
SerializedError serialize_exception(const std::exception& error);
SerializedError serialize_unknown_exception();

namespace detail {

template <typename Operation>
struct OperationTrait {
    static constexpr ServiceOperation operation = Operation::kOperation;
};

}  // namespace detail

template <typename Operation>
constexpr ServiceOperation operation_kind() noexcept
{
    return detail::OperationTrait<Operation>::operation;
}

// Drives assign_request, prepare and execute in that order. Never throws: anything raised by a
// phase becomes an error response carrying the request and the payload gathered so far.
//
// Operation requirements:
//   static constexpr ServiceOperation kOperation;
//   void assign_request(ServiceRequest&);
//   void prepare();
//   ServiceStatus execute(ServicePayload&);
template <typename Operation>
ServiceResponse run_service(Operation& operation, ServiceTelemetry* telemetry = nullptr)
{
    constexpr auto kind = operation_kind<Operation>();
    if (telemetry != nullptr) {
        telemetry->record_attempt(kind);
    }
    const auto start = std::chrono::steady_clock::now();

    ServiceRequest request{};
    ServicePayload payload{};
    auto response = [&]() -> ServiceResponse {
        try {
            operation.assign_request(request);
            operation.prepare();
            const auto status = operation.execute(payload);
            return ServiceResponse::make(status, request, payload);
        } catch (const std::exception& error) {
            return make_error(serialize_exception(error), request, payload);
        } catch (...) {
            return make_error(serialize_unknown_exception(), request, payload);
        }
    }();

    if (telemetry != nullptr) {
        const auto end = std::chrono::steady_clock::now();
        const auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
        telemetry->record_duration(kind, static_cast<std::uint64_t>(duration < 0 ? 0 : duration));
        telemetry->record_outcome(kind, response);
    }
    return response;
}

}  // namespace matview::service
