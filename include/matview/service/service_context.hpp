#pragma once

#include "matview/definition/view_definition.hpp"
#include "matview/service/service_response.hpp"
#include "matview/sql/sql_session.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matview::service {

// Shared state and catalog helpers for one operation invocation over one definition.
// Schema and current user are resolved at most once per context.
class ViewServiceContext final {
public:
    ViewServiceContext(sql::SqlSession& session,
                       const definition::ViewDefinition& definition,
                       RowCountStrategy row_count_strategy);

    [[nodiscard]] sql::SqlSession& session() noexcept { return session_; }
    [[nodiscard]] const definition::ViewDefinition& definition() const noexcept { return definition_; }
    [[nodiscard]] RowCountStrategy row_count_strategy() const noexcept { return row_count_strategy_; }
    [[nodiscard]] const std::string& relation() const noexcept { return definition_.name; }

    // First schema of the search path that exists, public otherwise.
    const std::string& schema();
    std::string qualified_relation();
    std::string display_relation();

    std::string first_existing_schema();
    const std::string& current_user();
    bool schema_exists(std::string_view name);

    bool view_exists();
    bool view_exists(std::string_view relation);
    bool unique_index_exists();
    bool index_exists(std::string_view index_name);

    // Count per the configured strategy; kUnknownRowCount for None without touching the session.
    std::int64_t fetch_row_count();
    std::int64_t estimated_row_count();
    std::int64_t exact_row_count();

    // False when the session is inside a transaction or its state cannot be read.
    bool connection_idle() noexcept;

    void ensure_valid_name() const;
    void ensure_valid_sql() const;
    void ensure_view_exists();
    void ensure_unique_index();

private:
    std::vector<std::string> search_path_candidates();

    sql::SqlSession& session_;
    const definition::ViewDefinition& definition_;
    RowCountStrategy row_count_strategy_ = RowCountStrategy::Estimated;
    std::optional<std::string> schema_{};
    std::optional<std::string> current_user_{};
};

}  // namespace matview::service
