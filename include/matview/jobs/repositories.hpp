#pragma once

#include "matview/definition/view_definition.hpp"
#include "matview/jobs/run_record.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace matview::jobs {

class DefinitionRepository {
public:
    virtual ~DefinitionRepository() = default;

    virtual std::optional<definition::ViewDefinition> find(std::uint64_t id) = 0;
    // Accepts "name" or "schema.name"; the schema part is ignored.
    virtual std::optional<definition::ViewDefinition> find_by_name(std::string_view name) = 0;
    virtual std::vector<definition::ViewDefinition> list() = 0;

    // Validates, rejects duplicate names and assigns definition.id.
    virtual std::error_code insert(definition::ViewDefinition& definition) = 0;
    // Removes the definition and its runs.
    virtual std::error_code remove(std::uint64_t id) = 0;
    virtual std::error_code mark_refreshed(std::uint64_t id, std::chrono::system_clock::time_point refreshed_at) = 0;
};

class RunRepository {
public:
    virtual ~RunRepository() = default;

    // Assigns run.id.
    virtual std::error_code create(RunRecord& run) = 0;
    virtual std::error_code update(const RunRecord& run) = 0;
    // Newest first.
    virtual std::vector<RunRecord> list_for_definition(std::uint64_t definition_id) = 0;
};

// Strips an optional "schema." qualifier.
[[nodiscard]] std::string_view unqualified_name(std::string_view name) noexcept;

// Validation shared by repository implementations.
std::error_code check_definition(const definition::ViewDefinition& definition);

class InMemoryRunRepository;

class InMemoryDefinitionRepository final : public DefinitionRepository {
public:
    explicit InMemoryDefinitionRepository(InMemoryRunRepository* runs = nullptr);

    std::optional<definition::ViewDefinition> find(std::uint64_t id) override;
    std::optional<definition::ViewDefinition> find_by_name(std::string_view name) override;
    std::vector<definition::ViewDefinition> list() override;
    std::error_code insert(definition::ViewDefinition& definition) override;
    std::error_code remove(std::uint64_t id) override;
    std::error_code mark_refreshed(std::uint64_t id, std::chrono::system_clock::time_point refreshed_at) override;

    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> last_refreshed_at(std::uint64_t id) const;

private:
    struct Entry final {
        definition::ViewDefinition definition{};
        std::optional<std::chrono::system_clock::time_point> last_refreshed_at{};
    };

    InMemoryRunRepository* runs_ = nullptr;
    mutable std::mutex mutex_{};
    std::map<std::uint64_t, Entry> entries_{};
    std::uint64_t next_id_ = 1U;
};

class InMemoryRunRepository final : public RunRepository {
public:
    std::error_code create(RunRecord& run) override;
    std::error_code update(const RunRecord& run) override;
    std::vector<RunRecord> list_for_definition(std::uint64_t definition_id) override;

    void remove_for_definition(std::uint64_t definition_id);
    [[nodiscard]] std::optional<RunRecord> find(std::uint64_t id) const;

private:
    mutable std::mutex mutex_{};
    std::map<std::uint64_t, RunRecord> runs_{};
    std::uint64_t next_id_ = 1U;
};

}  // namespace matview::jobs
