#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace matview::sql {

// NAMEDATALEN - 1; longer identifiers are silently truncated by the server.
inline constexpr std::size_t kMaxIdentifierLength = 63U;

enum class DropBehavior : std::uint8_t {
    Restrict = 0,
    Cascade,
    Unspecified
};

[[nodiscard]] std::string quote_identifier(std::string_view name);
[[nodiscard]] std::string qualified_name(std::string_view schema, std::string_view relation);
[[nodiscard]] std::string display_name(std::string_view schema, std::string_view relation);
[[nodiscard]] std::string bounded_identifier(std::string_view name);

[[nodiscard]] std::string create_materialized_view(std::string_view schema,
                                                   std::string_view relation,
                                                   std::string_view select_sql);
[[nodiscard]] std::string refresh_materialized_view(std::string_view schema, std::string_view relation, bool concurrently);
[[nodiscard]] std::string drop_materialized_view(std::string_view schema, std::string_view relation, DropBehavior behavior);
[[nodiscard]] std::string rename_materialized_view(std::string_view schema,
                                                   std::string_view relation,
                                                   std::string_view new_name);
[[nodiscard]] std::string create_unique_index(std::string_view index_name,
                                              std::string_view schema,
                                              std::string_view relation,
                                              std::span<const std::string> columns,
                                              bool concurrently);
[[nodiscard]] std::string exact_row_count(std::string_view schema, std::string_view relation);

// <schema>_<relation>_uniq_<col>..., bounded to kMaxIdentifierLength.
[[nodiscard]] std::string unique_index_name(std::string_view schema,
                                            std::string_view relation,
                                            std::span<const std::string> columns);

// <relation>__<role>_<token>, shortening the relation part so the result stays within
// kMaxIdentifierLength and keeps the random token intact.
[[nodiscard]] std::string swap_relation_name(std::string_view relation, std::string_view role, std::string_view token);

// Catalog lookups. All take their identifiers as bind parameters.
namespace catalog {

inline constexpr std::string_view kCurrentUser = "SELECT current_user";

inline constexpr std::string_view kSchemaExists =
    "SELECT EXISTS (SELECT 1 FROM pg_namespace WHERE nspname = $1)";

inline constexpr std::string_view kMatviewExists =
    "SELECT COUNT(*) FROM pg_matviews WHERE schemaname = $1 AND matviewname = $2";

inline constexpr std::string_view kUniqueIndexExists =
    "SELECT COUNT(*) FROM pg_index i "
    "JOIN pg_class c ON c.oid = i.indrelid "
    "JOIN pg_namespace n ON n.oid = c.relnamespace "
    "WHERE n.nspname = $1 AND c.relname = $2 AND i.indisunique = TRUE";

inline constexpr std::string_view kIndexExists =
    "SELECT COUNT(*) FROM pg_indexes WHERE schemaname = $1 AND tablename = $2 AND indexname = $3";

inline constexpr std::string_view kEstimatedRowCount =
    "SELECT COALESCE(c.reltuples::bigint, 0) FROM pg_class c "
    "JOIN pg_namespace n ON n.oid = c.relnamespace "
    "WHERE c.relkind IN ('m', 'r', 'p') AND n.nspname = $1 AND c.relname = $2 LIMIT 1";

}  // namespace catalog

}  // namespace matview::sql
