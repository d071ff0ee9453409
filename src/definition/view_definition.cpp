#include "matview/definition/view_definition.hpp"

#include <algorithm>
#include <cctype>

namespace matview::definition {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t index = 0U; index < lhs.size(); ++index) {
        const auto left = std::tolower(static_cast<unsigned char>(lhs[index]));
        const auto right = std::tolower(static_cast<unsigned char>(rhs[index]));
        if (left != right) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string_view to_string(RefreshStrategy strategy) noexcept
{
    switch (strategy) {
    case RefreshStrategy::Regular:
        return "regular";
    case RefreshStrategy::Concurrent:
        return "concurrent";
    case RefreshStrategy::Swap:
        return "swap";
    default:
        return "regular";
    }
}

std::optional<RefreshStrategy> parse_refresh_strategy(std::string_view text) noexcept
{
    if (iequals(text, "regular")) {
        return RefreshStrategy::Regular;
    }
    if (iequals(text, "concurrent")) {
        return RefreshStrategy::Concurrent;
    }
    if (iequals(text, "swap")) {
        return RefreshStrategy::Swap;
    }
    return std::nullopt;
}

std::vector<std::string> normalized_unique_columns(const ViewDefinition& definition)
{
    std::vector<std::string> columns;
    columns.reserve(definition.unique_index_columns.size());
    for (const auto& column : definition.unique_index_columns) {
        if (column.empty()) {
            continue;
        }
        if (std::find(columns.begin(), columns.end(), column) != columns.end()) {
            continue;
        }
        columns.push_back(column);
    }
    return columns;
}

}  // namespace matview::definition
