#include "matview/sql/sql_builder.hpp"

#include <cctype>

namespace matview::sql {

namespace {

// Trailing whitespace and statement terminators would land in front of WITH DATA.
std::string_view strip_statement_terminators(std::string_view text)
{
    std::size_t end = text.size();
    while (end > 0U) {
        const auto ch = static_cast<unsigned char>(text[end - 1U]);
        if (std::isspace(ch) != 0 || ch == ';') {
            --end;
            continue;
        }
        break;
    }

    std::size_t begin = 0U;
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    return text.substr(begin, end - begin);
}

std::string quoted_column_list(std::span<const std::string> columns)
{
    std::string list;
    for (std::size_t index = 0U; index < columns.size(); ++index) {
        if (index > 0U) {
            list.append(", ");
        }
        list.append(quote_identifier(columns[index]));
    }
    return list;
}

}  // namespace

std::string quote_identifier(std::string_view name)
{
    std::string quoted;
    quoted.reserve(name.size() + 2U);
    quoted.push_back('"');
    for (char ch : name) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

std::string qualified_name(std::string_view schema, std::string_view relation)
{
    return quote_identifier(schema) + "." + quote_identifier(relation);
}

std::string display_name(std::string_view schema, std::string_view relation)
{
    std::string name{schema};
    name.push_back('.');
    name.append(relation);
    return name;
}

std::string bounded_identifier(std::string_view name)
{
    return std::string{name.substr(0U, kMaxIdentifierLength)};
}

std::string create_materialized_view(std::string_view schema, std::string_view relation, std::string_view select_sql)
{
    return "CREATE MATERIALIZED VIEW " + qualified_name(schema, relation) + " AS "
           + std::string{strip_statement_terminators(select_sql)} + " WITH DATA";
}

std::string refresh_materialized_view(std::string_view schema, std::string_view relation, bool concurrently)
{
    std::string statement = "REFRESH MATERIALIZED VIEW ";
    if (concurrently) {
        statement.append("CONCURRENTLY ");
    }
    statement.append(qualified_name(schema, relation));
    return statement;
}

std::string drop_materialized_view(std::string_view schema, std::string_view relation, DropBehavior behavior)
{
    std::string statement = "DROP MATERIALIZED VIEW IF EXISTS " + qualified_name(schema, relation);
    switch (behavior) {
    case DropBehavior::Cascade:
        statement.append(" CASCADE");
        break;
    case DropBehavior::Restrict:
        statement.append(" RESTRICT");
        break;
    case DropBehavior::Unspecified:
    default:
        break;
    }
    return statement;
}

std::string rename_materialized_view(std::string_view schema, std::string_view relation, std::string_view new_name)
{
    return "ALTER MATERIALIZED VIEW " + qualified_name(schema, relation) + " RENAME TO " + quote_identifier(new_name);
}

std::string create_unique_index(std::string_view index_name,
                                std::string_view schema,
                                std::string_view relation,
                                std::span<const std::string> columns,
                                bool concurrently)
{
    std::string statement = "CREATE UNIQUE INDEX ";
    if (concurrently) {
        statement.append("CONCURRENTLY ");
    }
    statement.append(quote_identifier(index_name));
    statement.append(" ON ");
    statement.append(qualified_name(schema, relation));
    statement.append(" (");
    statement.append(quoted_column_list(columns));
    statement.push_back(')');
    return statement;
}

std::string exact_row_count(std::string_view schema, std::string_view relation)
{
    return "SELECT COUNT(*) FROM " + qualified_name(schema, relation);
}

std::string unique_index_name(std::string_view schema, std::string_view relation, std::span<const std::string> columns)
{
    std::string name{schema};
    name.push_back('_');
    name.append(relation);
    name.append("_uniq");
    for (const auto& column : columns) {
        name.push_back('_');
        name.append(column);
    }
    return bounded_identifier(name);
}

std::string swap_relation_name(std::string_view relation, std::string_view role, std::string_view token)
{
    std::string suffix = "__";
    suffix.append(role);
    suffix.push_back('_');
    suffix.append(token);

    if (suffix.size() >= kMaxIdentifierLength) {
        return bounded_identifier(suffix);
    }
    const auto room = kMaxIdentifierLength - suffix.size();
    std::string name{relation.substr(0U, room)};
    name.append(suffix);
    return name;
}

}  // namespace matview::sql
