#include "matview/service/service_context.hpp"

#include "matview/definition/definition_validation.hpp"
#include "matview/sql/search_path.hpp"
#include "matview/sql/sql_builder.hpp"

#include <algorithm>
#include <charconv>

namespace matview::service {

namespace {

constexpr std::string_view kDefaultSchema = "public";

std::int64_t to_count(const sql::Value& value) noexcept
{
    if (!value || value->empty()) {
        return 0;
    }
    std::int64_t count = 0;
    const auto* begin = value->data();
    const auto* end = begin + value->size();
    const auto [ptr, ec] = std::from_chars(begin, end, count);
    if (ec != std::errc{}) {
        return 0;
    }
    return count;
}

bool to_bool(const sql::Value& value) noexcept
{
    if (!value) {
        return false;
    }
    return *value == "t" || *value == "true" || *value == "1";
}

}  // namespace

ViewServiceContext::ViewServiceContext(sql::SqlSession& session,
                                       const definition::ViewDefinition& definition,
                                       RowCountStrategy row_count_strategy)
    : session_{session}
    , definition_{definition}
    , row_count_strategy_{row_count_strategy}
{
}

const std::string& ViewServiceContext::schema()
{
    if (!schema_) {
        schema_ = first_existing_schema();
    }
    return *schema_;
}

std::string ViewServiceContext::qualified_relation()
{
    return sql::qualified_name(schema(), relation());
}

std::string ViewServiceContext::display_relation()
{
    return sql::display_name(schema(), relation());
}

std::vector<std::string> ViewServiceContext::search_path_candidates()
{
    auto raw = session_.schema_search_path();
    if (raw.empty()) {
        raw = kDefaultSchema;
    }

    std::vector<std::string> candidates;
    for (auto& entry : sql::search_path_schemas(raw)) {
        if (sql::is_user_placeholder(entry)) {
            const auto& user = current_user();
            if (!user.empty()) {
                candidates.push_back(user);
            }
            continue;
        }
        candidates.push_back(std::move(entry));
    }

    if (std::find(candidates.begin(), candidates.end(), kDefaultSchema) == candidates.end()) {
        candidates.emplace_back(kDefaultSchema);
    }
    return candidates;
}

std::string ViewServiceContext::first_existing_schema()
{
    for (const auto& candidate : search_path_candidates()) {
        if (schema_exists(candidate)) {
            return candidate;
        }
    }
    return std::string{kDefaultSchema};
}

const std::string& ViewServiceContext::current_user()
{
    if (!current_user_) {
        current_user_ = session_.select_value(sql::catalog::kCurrentUser).value_or(std::string{});
    }
    return *current_user_;
}

bool ViewServiceContext::schema_exists(std::string_view name)
{
    return to_bool(session_.select_value(sql::catalog::kSchemaExists, {std::string{name}}));
}

bool ViewServiceContext::view_exists()
{
    return view_exists(relation());
}

bool ViewServiceContext::view_exists(std::string_view relation)
{
    const auto count = to_count(session_.select_value(sql::catalog::kMatviewExists, {schema(), std::string{relation}}));
    return count > 0;
}

bool ViewServiceContext::unique_index_exists()
{
    const auto count = to_count(session_.select_value(sql::catalog::kUniqueIndexExists, {schema(), relation()}));
    return count > 0;
}

bool ViewServiceContext::index_exists(std::string_view index_name)
{
    const auto count = to_count(
        session_.select_value(sql::catalog::kIndexExists, {schema(), relation(), std::string{index_name}}));
    return count > 0;
}

std::int64_t ViewServiceContext::fetch_row_count()
{
    switch (row_count_strategy_) {
    case RowCountStrategy::Estimated:
        return estimated_row_count();
    case RowCountStrategy::Exact:
        return exact_row_count();
    case RowCountStrategy::None:
    default:
        return kUnknownRowCount;
    }
}

std::int64_t ViewServiceContext::estimated_row_count()
{
    return to_count(session_.select_value(sql::catalog::kEstimatedRowCount, {schema(), relation()}));
}

std::int64_t ViewServiceContext::exact_row_count()
{
    return to_count(session_.select_value(sql::exact_row_count(schema(), relation())));
}

bool ViewServiceContext::connection_idle() noexcept
{
    try {
        return session_.transaction_status() == sql::TransactionStatus::Idle;
    } catch (const std::exception&) {
        return false;
    }
}

void ViewServiceContext::ensure_valid_name() const
{
    if (!definition::is_valid_view_name(relation())) {
        throw ServiceError{ServiceErrc::InvalidIdentifier, "Invalid view name format: \"" + relation() + "\""};
    }
}

void ViewServiceContext::ensure_valid_sql() const
{
    if (!definition::is_select_statement(definition_.sql)) {
        throw ServiceError{ServiceErrc::InvalidSql, "SQL must start with SELECT"};
    }
}

void ViewServiceContext::ensure_view_exists()
{
    if (!view_exists()) {
        throw ServiceError{ServiceErrc::ViewNotFound, "Materialized view " + display_relation() + " does not exist"};
    }
}

void ViewServiceContext::ensure_unique_index()
{
    if (!unique_index_exists()) {
        throw ServiceError{ServiceErrc::UniqueIndexRequired,
                           "Materialized view " + display_relation() + " must have a unique index for concurrent refresh"};
    }
}

}  // namespace matview::service
