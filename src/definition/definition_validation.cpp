#include "matview/definition/definition_validation.hpp"

#include <cctype>

namespace matview::definition {

namespace {

// ASCII only; locale-dependent classification would admit letters PostgreSQL folds differently.
bool is_identifier_start(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

bool is_identifier_char(char ch) noexcept
{
    return is_identifier_start(ch) || (ch >= '0' && ch <= '9');
}

}  // namespace

bool is_valid_view_name(std::string_view name) noexcept
{
    if (name.empty()) {
        return false;
    }
    if (!is_identifier_start(name.front())) {
        return false;
    }
    for (char ch : name) {
        if (!is_identifier_char(ch)) {
            return false;
        }
    }
    return true;
}

bool is_select_statement(std::string_view sql) noexcept
{
    std::size_t offset = 0U;
    while (offset < sql.size() && std::isspace(static_cast<unsigned char>(sql[offset])) != 0) {
        ++offset;
    }

    constexpr std::string_view kSelect = "SELECT";
    if (sql.size() - offset < kSelect.size()) {
        return false;
    }
    for (std::size_t index = 0U; index < kSelect.size(); ++index) {
        const auto ch = static_cast<char>(std::toupper(static_cast<unsigned char>(sql[offset + index])));
        if (ch != kSelect[index]) {
            return false;
        }
    }
    return true;
}

std::error_code validate_view_name(std::string_view name) noexcept
{
    if (is_valid_view_name(name)) {
        return {};
    }
    return service::make_error_code(service::ServiceErrc::InvalidIdentifier);
}

std::error_code validate_select_statement(std::string_view sql) noexcept
{
    if (is_select_statement(sql)) {
        return {};
    }
    return service::make_error_code(service::ServiceErrc::InvalidSql);
}

std::error_code validate_definition(const ViewDefinition& definition)
{
    if (auto ec = validate_view_name(definition.name)) {
        return ec;
    }
    if (auto ec = validate_select_statement(definition.sql)) {
        return ec;
    }
    if (definition.refresh_strategy == RefreshStrategy::Concurrent && normalized_unique_columns(definition).empty()) {
        return service::make_error_code(service::ServiceErrc::UniqueIndexColumnsRequired);
    }
    return {};
}

}  // namespace matview::definition
