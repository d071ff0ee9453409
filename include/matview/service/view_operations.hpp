#pragma once

#include "matview/definition/view_definition.hpp"
#include "matview/service/service_context.hpp"
#include "matview/service/service_response.hpp"
#include "matview/service/service_runner.hpp"
#include "matview/service/service_telemetry.hpp"
#include "matview/sql/sql_session.hpp"

#include <functional>
#include <string>
#include <vector>

namespace matview::service {

// Materializes the definition WITH DATA. An existing view is left alone (Skipped) unless force
// is set, in which case it is dropped first. Concurrent definitions also get their unique index.
class CreateView final {
public:
    static constexpr ServiceOperation kOperation = ServiceOperation::CreateView;

    struct Options final {
        bool force = false;
        RowCountStrategy row_count_strategy = RowCountStrategy::Estimated;
    };

    CreateView(sql::SqlSession& session, const definition::ViewDefinition& definition, Options options = {});

    ServiceResponse run(ServiceTelemetry* telemetry = nullptr);

    void assign_request(ServiceRequest& request);
    void prepare();
    ServiceStatus execute(ServicePayload& payload);

private:
    std::vector<std::string> ensure_unique_index(ServicePayload& payload);

    ViewServiceContext context_;
    Options options_{};
};

// REFRESH MATERIALIZED VIEW; blocks readers for the duration.
class RegularRefresh final {
public:
    static constexpr ServiceOperation kOperation = ServiceOperation::RegularRefresh;

    struct Options final {
        RowCountStrategy row_count_strategy = RowCountStrategy::Estimated;
    };

    RegularRefresh(sql::SqlSession& session, const definition::ViewDefinition& definition, Options options = {});

    ServiceResponse run(ServiceTelemetry* telemetry = nullptr);

    void assign_request(ServiceRequest& request);
    void prepare();
    ServiceStatus execute(ServicePayload& payload);

private:
    ViewServiceContext context_;
    Options options_{};
};

// REFRESH MATERIALIZED VIEW CONCURRENTLY; needs a unique index on the view.
class ConcurrentRefresh final {
public:
    static constexpr ServiceOperation kOperation = ServiceOperation::ConcurrentRefresh;

    struct Options final {
        RowCountStrategy row_count_strategy = RowCountStrategy::Estimated;
    };

    ConcurrentRefresh(sql::SqlSession& session, const definition::ViewDefinition& definition, Options options = {});

    ServiceResponse run(ServiceTelemetry* telemetry = nullptr);

    void assign_request(ServiceRequest& request);
    void prepare();
    ServiceStatus execute(ServicePayload& payload);

private:
    ViewServiceContext context_;
    Options options_{};
};

// Builds a replacement view under a temporary name, then renames it into place, drops the
// previous one and recreates the declared unique index inside one transaction.
class SwapRefresh final {
public:
    static constexpr ServiceOperation kOperation = ServiceOperation::SwapRefresh;

    using TokenGenerator = std::function<std::string()>;

    struct Options final {
        RowCountStrategy row_count_strategy = RowCountStrategy::Estimated;
        // Random hex suffix source for the temporary and retired names.
        TokenGenerator token_generator{};
    };

    SwapRefresh(sql::SqlSession& session, const definition::ViewDefinition& definition, Options options = {});

    ServiceResponse run(ServiceTelemetry* telemetry = nullptr);

    void assign_request(ServiceRequest& request);
    void prepare();
    ServiceStatus execute(ServicePayload& payload);

private:
    std::vector<std::string> swap_view();
    std::string next_token();
    std::string drop_temporary(const std::string& temporary) noexcept;

    ViewServiceContext context_;
    Options options_{};
};

// DROP MATERIALIZED VIEW IF EXISTS ... RESTRICT|CASCADE. Missing views are Skipped when
// if_exists is set and an existence error otherwise.
class DeleteView final {
public:
    static constexpr ServiceOperation kOperation = ServiceOperation::DeleteView;

    struct Options final {
        bool cascade = false;
        bool if_exists = true;
        RowCountStrategy row_count_strategy = RowCountStrategy::Estimated;
    };

    DeleteView(sql::SqlSession& session, const definition::ViewDefinition& definition, Options options = {});

    ServiceResponse run(ServiceTelemetry* telemetry = nullptr);

    void assign_request(ServiceRequest& request);
    void prepare();
    ServiceStatus execute(ServicePayload& payload);

private:
    ViewServiceContext context_;
    Options options_{};
};

class CheckViewExists final {
public:
    static constexpr ServiceOperation kOperation = ServiceOperation::CheckViewExists;

    CheckViewExists(sql::SqlSession& session, const definition::ViewDefinition& definition);

    ServiceResponse run(ServiceTelemetry* telemetry = nullptr);

    void assign_request(ServiceRequest& request);
    void prepare();
    ServiceStatus execute(ServicePayload& payload);

private:
    ViewServiceContext context_;
};

// 8 random bytes as lowercase hex.
std::string random_hex_token();

}  // namespace matview::service
