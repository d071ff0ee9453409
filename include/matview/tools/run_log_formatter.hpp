#pragma once

#include "matview/jobs/run_record.hpp"
#include "matview/service/service_response.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace matview::tools {

[[nodiscard]] std::string format_json_string_array(const std::vector<std::string>& values);

[[nodiscard]] std::string format_service_request_json(const service::ServiceRequest& request);
[[nodiscard]] std::string format_service_payload_json(const service::ServicePayload& payload);
[[nodiscard]] std::string format_serialized_error_json(const service::SerializedError& error);

// {"status":..,"request":{..},"response":{..},"error":{..}|null}
[[nodiscard]] std::string format_service_response_json(const service::ServiceResponse& response);

// Stored as the run's meta column: {"request":{..},"response":{..}}
[[nodiscard]] std::string format_run_meta_json(const service::ServiceResponse& response);

// One JSON Lines record per finished run.
[[nodiscard]] std::string format_run_log_json(const jobs::RunRecord& run, const std::string& definition_name);

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp);

}  // namespace matview::tools
