#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matview::definition {

enum class RefreshStrategy : std::uint8_t {
    Regular = 0,
    Concurrent,
    Swap
};

// Declared materialized view. Persisted by the management layer; operations only read it.
struct ViewDefinition final {
    std::uint64_t id = 0U;
    std::string name{};
    std::string sql{};
    RefreshStrategy refresh_strategy = RefreshStrategy::Regular;
    std::vector<std::string> unique_index_columns{};
    std::vector<std::string> dependencies{};
    std::string schedule_cron{};
};

[[nodiscard]] std::string_view to_string(RefreshStrategy strategy) noexcept;
[[nodiscard]] std::optional<RefreshStrategy> parse_refresh_strategy(std::string_view text) noexcept;

// Declared unique-index columns with blanks and repeats removed, first occurrence order kept.
[[nodiscard]] std::vector<std::string> normalized_unique_columns(const ViewDefinition& definition);

}  // namespace matview::definition
