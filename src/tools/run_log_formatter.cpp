#include "matview/tools/run_log_formatter.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <vector>

namespace {

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

void append_json_string_array(std::string& out, const std::vector<std::string>& values)
{
    out.push_back('[');
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0U) {
            out.push_back(',');
        }
        append_json_string(out, values[i]);
    }
    out.push_back(']');
}

// Comma bookkeeping for one JSON object under construction.
class ObjectWriter final {
public:
    explicit ObjectWriter(std::string& out)
        : out_{out}
    {
        out_.push_back('{');
    }

    void field(const char* name)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        out_.push_back('"');
        out_.append(name);
        out_.push_back('"');
        out_.push_back(':');
    }

    void string_field(const char* name, std::string_view value)
    {
        field(name);
        append_json_string(out_, value);
    }

    void bool_field(const char* name, bool value)
    {
        field(name);
        out_.append(value ? "true" : "false");
    }

    template <typename Number>
    void number_field(const char* name, Number value)
    {
        field(name);
        out_.append(std::to_string(value));
    }

    void raw_field(const char* name, std::string_view json)
    {
        field(name);
        out_.append(json);
    }

    void close() { out_.push_back('}'); }

private:
    std::string& out_;
    bool first_ = true;
};

std::string error_code_text(std::error_code code)
{
    if (!code) {
        return {};
    }
    return std::string{code.category().name()} + ":" + std::to_string(code.value());
}

}  // namespace

namespace matview::tools {

std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
#if defined(_WIN32)
    gmtime_s(&buffer, &time_value);
#else
    gmtime_r(&time_value, &buffer);
#endif

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

std::string format_json_string_array(const std::vector<std::string>& values)
{
    std::string json;
    append_json_string_array(json, values);
    return json;
}

std::string format_service_request_json(const service::ServiceRequest& request)
{
    std::string json;
    ObjectWriter object{json};
    if (request.row_count_strategy) {
        object.string_field("row_count_strategy", service::to_string(*request.row_count_strategy));
    }
    if (request.force) {
        object.bool_field("force", *request.force);
    }
    if (request.cascade) {
        object.bool_field("cascade", *request.cascade);
    }
    if (request.if_exists) {
        object.bool_field("if_exists", *request.if_exists);
    }
    if (request.concurrent) {
        object.bool_field("concurrent", *request.concurrent);
    }
    if (request.swap) {
        object.bool_field("swap", *request.swap);
    }
    object.close();
    return json;
}

std::string format_service_payload_json(const service::ServicePayload& payload)
{
    std::string json;
    ObjectWriter object{json};
    if (!payload.view.empty()) {
        object.string_field("view", payload.view);
    }
    if (!payload.sql.empty()) {
        object.field("sql");
        append_json_string_array(json, payload.sql);
    }
    if (payload.row_count_before) {
        object.number_field("row_count_before", *payload.row_count_before);
    }
    if (payload.row_count_after) {
        object.number_field("row_count_after", *payload.row_count_after);
    }
    if (payload.created_indexes) {
        object.field("created_indexes");
        append_json_string_array(json, *payload.created_indexes);
    }
    if (payload.exists) {
        object.bool_field("exists", *payload.exists);
    }
    object.close();
    return json;
}

std::string format_serialized_error_json(const service::SerializedError& error)
{
    std::string json;
    ObjectWriter object{json};
    object.string_field("class", error.error_class);
    object.string_field("message", error.message);
    object.field("backtrace");
    append_json_string_array(json, error.backtrace);
    const auto code = error_code_text(error.code);
    if (!code.empty()) {
        object.string_field("code", code);
    }
    if (!error.remediation_hints.empty()) {
        object.field("remediation_hints");
        append_json_string_array(json, error.remediation_hints);
    }
    object.close();
    return json;
}

std::string format_service_response_json(const service::ServiceResponse& response)
{
    std::string json;
    json.reserve(512U);
    ObjectWriter object{json};
    object.string_field("status", service::to_string(response.status()));
    object.raw_field("request", format_service_request_json(response.request()));
    object.raw_field("response", format_service_payload_json(response.response()));
    if (response.error()) {
        object.raw_field("error", format_serialized_error_json(*response.error()));
    } else {
        object.raw_field("error", "null");
    }
    object.close();
    return json;
}

std::string format_run_meta_json(const service::ServiceResponse& response)
{
    std::string json;
    ObjectWriter object{json};
    object.raw_field("request", format_service_request_json(response.request()));
    object.raw_field("response", format_service_payload_json(response.response()));
    object.close();
    return json;
}

std::string format_run_log_json(const jobs::RunRecord& run, const std::string& definition_name)
{
    std::string json;
    json.reserve(512U);
    ObjectWriter object{json};
    object.number_field("run_id", run.id);
    object.number_field("definition_id", run.definition_id);
    object.string_field("definition", definition_name);
    object.string_field("operation", jobs::to_string(run.operation));
    object.string_field("status", jobs::to_string(run.status));

    const auto started = format_timestamp_iso(run.started_at);
    object.field("started_at");
    if (started.empty()) {
        json.append("null");
    } else {
        append_json_string(json, started);
    }

    object.field("finished_at");
    const auto finished = run.finished_at ? format_timestamp_iso(*run.finished_at) : std::string{};
    if (finished.empty()) {
        json.append("null");
    } else {
        append_json_string(json, finished);
    }

    object.field("duration_ms");
    if (run.duration_ms) {
        json.append(std::to_string(*run.duration_ms));
    } else {
        json.append("null");
    }

    object.raw_field("meta", run.meta_json.empty() ? std::string_view{"{}"} : std::string_view{run.meta_json});
    if (run.error) {
        object.raw_field("error", format_serialized_error_json(*run.error));
    } else {
        object.raw_field("error", "null");
    }
    object.close();
    return json;
}

}  // namespace matview::tools
