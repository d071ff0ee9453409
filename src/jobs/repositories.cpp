#include "matview/jobs/repositories.hpp"

#include "matview/definition/definition_validation.hpp"
#include "matview/jobs/run_errors.hpp"

#include <algorithm>

namespace matview::jobs {

std::string_view unqualified_name(std::string_view name) noexcept
{
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos) {
        return name;
    }
    return name.substr(dot + 1U);
}

std::error_code check_definition(const definition::ViewDefinition& definition)
{
    if (definition::validate_definition(definition)) {
        return make_error_code(RunErrc::DefinitionInvalid);
    }
    return {};
}

InMemoryDefinitionRepository::InMemoryDefinitionRepository(InMemoryRunRepository* runs)
    : runs_{runs}
{
}

std::optional<definition::ViewDefinition> InMemoryDefinitionRepository::find(std::uint64_t id)
{
    std::lock_guard guard(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.definition;
}

std::optional<definition::ViewDefinition> InMemoryDefinitionRepository::find_by_name(std::string_view name)
{
    const auto relation = unqualified_name(name);
    std::lock_guard guard(mutex_);
    for (const auto& [_, entry] : entries_) {
        if (entry.definition.name == relation) {
            return entry.definition;
        }
    }
    return std::nullopt;
}

std::vector<definition::ViewDefinition> InMemoryDefinitionRepository::list()
{
    std::lock_guard guard(mutex_);
    std::vector<definition::ViewDefinition> definitions;
    definitions.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) {
        definitions.push_back(entry.definition);
    }
    return definitions;
}

std::error_code InMemoryDefinitionRepository::insert(definition::ViewDefinition& definition)
{
    if (auto error = check_definition(definition)) {
        return error;
    }

    std::lock_guard guard(mutex_);
    const auto duplicate = std::any_of(entries_.begin(), entries_.end(), [&](const auto& item) {
        return item.second.definition.name == definition.name;
    });
    if (duplicate) {
        return make_error_code(RunErrc::DuplicateDefinition);
    }

    definition.id = next_id_++;
    entries_.emplace(definition.id, Entry{definition, std::nullopt});
    return {};
}

std::error_code InMemoryDefinitionRepository::remove(std::uint64_t id)
{
    {
        std::lock_guard guard(mutex_);
        if (entries_.erase(id) == 0U) {
            return make_error_code(RunErrc::DefinitionNotFound);
        }
    }
    if (runs_ != nullptr) {
        runs_->remove_for_definition(id);
    }
    return {};
}

std::error_code InMemoryDefinitionRepository::mark_refreshed(std::uint64_t id,
                                                             std::chrono::system_clock::time_point refreshed_at)
{
    std::lock_guard guard(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return make_error_code(RunErrc::DefinitionNotFound);
    }
    it->second.last_refreshed_at = refreshed_at;
    return {};
}

std::optional<std::chrono::system_clock::time_point> InMemoryDefinitionRepository::last_refreshed_at(std::uint64_t id) const
{
    std::lock_guard guard(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.last_refreshed_at;
}

std::error_code InMemoryRunRepository::create(RunRecord& run)
{
    std::lock_guard guard(mutex_);
    run.id = next_id_++;
    runs_.emplace(run.id, run);
    return {};
}

std::error_code InMemoryRunRepository::update(const RunRecord& run)
{
    std::lock_guard guard(mutex_);
    const auto it = runs_.find(run.id);
    if (it == runs_.end()) {
        return make_error_code(RunErrc::RunNotFound);
    }
    it->second = run;
    return {};
}

std::vector<RunRecord> InMemoryRunRepository::list_for_definition(std::uint64_t definition_id)
{
    std::lock_guard guard(mutex_);
    std::vector<RunRecord> runs;
    for (auto it = runs_.rbegin(); it != runs_.rend(); ++it) {
        if (it->second.definition_id == definition_id) {
            runs.push_back(it->second);
        }
    }
    return runs;
}

void InMemoryRunRepository::remove_for_definition(std::uint64_t definition_id)
{
    std::lock_guard guard(mutex_);
    std::erase_if(runs_, [&](const auto& item) { return item.second.definition_id == definition_id; });
}

std::optional<RunRecord> InMemoryRunRepository::find(std::uint64_t id) const
{
    std::lock_guard guard(mutex_);
    const auto it = runs_.find(id);
    if (it == runs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace matview::jobs
