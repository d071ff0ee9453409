#pragma once

#include "matview/jobs/repositories.hpp"

#include <memory>
#include <string>

namespace matview::jobs {

// Bookkeeping tables mat_view_definitions and mat_view_runs over libpqxx. Each call runs in
// its own transaction on a connection owned by the store.
class PqRepositoryStore final {
public:
    struct Config final {
        std::string connection_string{};
    };

    explicit PqRepositoryStore(Config config);
    ~PqRepositoryStore();

    PqRepositoryStore(const PqRepositoryStore&) = delete;
    PqRepositoryStore& operator=(const PqRepositoryStore&) = delete;

    // CREATE TABLE IF NOT EXISTS for both tables and their indexes.
    void install();

    [[nodiscard]] DefinitionRepository& definitions() noexcept;
    [[nodiscard]] RunRepository& runs() noexcept;

private:
    struct Impl;
    class Definitions;
    class Runs;

    std::unique_ptr<Impl> impl_;
    std::unique_ptr<Definitions> definitions_;
    std::unique_ptr<Runs> runs_;
};

}  // namespace matview::jobs
