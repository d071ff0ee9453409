#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matview::sql {

struct SearchPathEntry final {
    std::string name{};
    bool quoted = false;
};

struct SearchPathParseResult final {
    std::vector<SearchPathEntry> entries{};
    std::optional<std::string> error{};

    [[nodiscard]] bool success() const noexcept { return !error.has_value(); }
};

// Parses the value of SHOW search_path: comma separated, optionally double-quoted entries.
SearchPathParseResult parse_search_path(std::string_view input);

// Entry names in order with quoting removed, skipping entries that are empty after trimming.
std::vector<std::string> search_path_schemas(std::string_view input);

// True for the $user placeholder that resolves to the session user.
[[nodiscard]] bool is_user_placeholder(std::string_view entry) noexcept;

}  // namespace matview::sql
