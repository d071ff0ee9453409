#include "matview/jobs/pq_repositories.hpp"

#include "matview/jobs/run_errors.hpp"
#include "matview/service/service_errors.hpp"
#include "matview/sql/pq_session.hpp"
#include "matview/tools/run_log_formatter.hpp"

#include <pqxx/pqxx>

#include <charconv>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace matview::jobs {

namespace {

constexpr const char* kInstallStatements[] = {
    "CREATE TABLE IF NOT EXISTS mat_view_definitions ("
    "id BIGSERIAL PRIMARY KEY, "
    "name TEXT NOT NULL, "
    "sql TEXT NOT NULL, "
    "refresh_strategy INTEGER NOT NULL DEFAULT 0, "
    "schedule_cron TEXT, "
    "unique_index_columns JSONB NOT NULL DEFAULT '[]'::jsonb, "
    "dependencies JSONB NOT NULL DEFAULT '[]'::jsonb, "
    "last_refreshed_at TIMESTAMPTZ, "
    "created_at TIMESTAMPTZ NOT NULL DEFAULT now(), "
    "updated_at TIMESTAMPTZ NOT NULL DEFAULT now())",
    "CREATE UNIQUE INDEX IF NOT EXISTS index_mat_view_definitions_on_name ON mat_view_definitions (name)",
    "CREATE TABLE IF NOT EXISTS mat_view_runs ("
    "id BIGSERIAL PRIMARY KEY, "
    "mat_view_definition_id BIGINT NOT NULL REFERENCES mat_view_definitions (id) ON DELETE CASCADE, "
    "status INTEGER NOT NULL DEFAULT 0, "
    "operation INTEGER NOT NULL DEFAULT 0, "
    "started_at TIMESTAMPTZ, "
    "finished_at TIMESTAMPTZ, "
    "duration_ms INTEGER, "
    "error JSONB, "
    "meta JSONB NOT NULL DEFAULT '{}'::jsonb, "
    "created_at TIMESTAMPTZ NOT NULL DEFAULT now(), "
    "updated_at TIMESTAMPTZ NOT NULL DEFAULT now())",
    "CREATE INDEX IF NOT EXISTS index_mat_view_runs_on_definition ON mat_view_runs (mat_view_definition_id)",
    "CREATE INDEX IF NOT EXISTS index_mat_view_runs_on_operation ON mat_view_runs (operation)",
};

// Arrays come back joined with the unit separator so identifiers never collide with it.
constexpr const char* kDefinitionColumns =
    "SELECT id, name, sql, refresh_strategy, COALESCE(schedule_cron, ''), "
    "array_to_string(ARRAY(SELECT jsonb_array_elements_text(unique_index_columns)), chr(31)), "
    "array_to_string(ARRAY(SELECT jsonb_array_elements_text(dependencies)), chr(31)) "
    "FROM mat_view_definitions";

constexpr const char* kRunColumns =
    "SELECT id, mat_view_definition_id, status, operation, "
    "(EXTRACT(EPOCH FROM started_at) * 1000)::bigint, "
    "(EXTRACT(EPOCH FROM finished_at) * 1000)::bigint, "
    "duration_ms, meta::text, "
    "error ->> 'class', error ->> 'message', error ->> 'code', "
    "array_to_string(ARRAY(SELECT jsonb_array_elements_text(COALESCE(error -> 'backtrace', '[]'::jsonb))), chr(31)), "
    "array_to_string(ARRAY(SELECT jsonb_array_elements_text(COALESCE(error -> 'remediation_hints', '[]'::jsonb))), chr(31)) "
    "FROM mat_view_runs";

constexpr char kSeparator = '\x1f';

std::vector<std::string> split_joined(const std::string& joined)
{
    std::vector<std::string> values;
    if (joined.empty()) {
        return values;
    }
    std::size_t begin = 0U;
    while (true) {
        const auto end = joined.find(kSeparator, begin);
        values.push_back(joined.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
        if (end == std::string::npos) {
            break;
        }
        begin = end + 1U;
    }
    return values;
}

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms)
{
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

// "matview.service:6" -> error_code in the matching category.
std::error_code parse_error_code(const std::string& text)
{
    const auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        return {};
    }
    int value = 0;
    const auto* begin = text.data() + colon + 1U;
    const auto [ptr, ec] = std::from_chars(begin, text.data() + text.size(), value);
    if (ec != std::errc{}) {
        return {};
    }
    const auto category = std::string_view{text}.substr(0U, colon);
    if (category == service::service_error_category().name()) {
        return {value, service::service_error_category()};
    }
    if (category == run_error_category().name()) {
        return {value, run_error_category()};
    }
    return {};
}

definition::ViewDefinition to_definition(const pqxx::row& row)
{
    definition::ViewDefinition definition{};
    definition.id = row[0].as<std::uint64_t>();
    definition.name = row[1].as<std::string>();
    definition.sql = row[2].as<std::string>();
    const auto strategy = row[3].as<int>();
    definition.refresh_strategy = strategy == 1   ? definition::RefreshStrategy::Concurrent
                                  : strategy == 2 ? definition::RefreshStrategy::Swap
                                                  : definition::RefreshStrategy::Regular;
    definition.schedule_cron = row[4].as<std::string>();
    definition.unique_index_columns = split_joined(row[5].as<std::string>());
    definition.dependencies = split_joined(row[6].as<std::string>());
    return definition;
}

RunRecord to_run(const pqxx::row& row)
{
    RunRecord run{};
    run.id = row[0].as<std::uint64_t>();
    run.definition_id = row[1].as<std::uint64_t>();
    run.status = static_cast<RunStatus>(row[2].as<int>());
    run.operation = static_cast<RunOperation>(row[3].as<int>());
    if (!row[4].is_null()) {
        run.started_at = from_epoch_ms(row[4].as<std::int64_t>());
    }
    if (!row[5].is_null()) {
        run.finished_at = from_epoch_ms(row[5].as<std::int64_t>());
    }
    if (!row[6].is_null()) {
        run.duration_ms = row[6].as<std::int64_t>();
    }
    run.meta_json = row[7].is_null() ? std::string{"{}"} : row[7].as<std::string>();
    if (!row[8].is_null()) {
        service::SerializedError error{};
        error.error_class = row[8].as<std::string>();
        error.message = row[9].is_null() ? std::string{} : row[9].as<std::string>();
        error.code = row[10].is_null() ? std::error_code{} : parse_error_code(row[10].as<std::string>());
        error.backtrace = split_joined(row[11].as<std::string>());
        error.remediation_hints = split_joined(row[12].as<std::string>());
        run.error = std::move(error);
    }
    return run;
}

std::optional<std::string> error_json(const RunRecord& run)
{
    if (!run.error) {
        return std::nullopt;
    }
    return tools::format_serialized_error_json(*run.error);
}

std::optional<std::int64_t> finished_ms(const RunRecord& run)
{
    if (!run.finished_at) {
        return std::nullopt;
    }
    return to_epoch_ms(*run.finished_at);
}

}  // namespace

struct PqRepositoryStore::Impl final {
    explicit Impl(const std::string& connection_string)
        : connection{connection_string}
    {
    }

    template <typename Fn>
    auto with_transaction(const char* statement, Fn&& fn) -> decltype(fn(std::declval<pqxx::work&>()))
    {
        std::lock_guard guard(mutex);
        try {
            pqxx::work txn{connection};
            if constexpr (std::is_void_v<decltype(fn(txn))>) {
                fn(txn);
                txn.commit();
            } else {
                auto result = fn(txn);
                txn.commit();
                return result;
            }
        } catch (const pqxx::failure&) {
            sql::rethrow_as_sql_error(statement);
        }
    }

    std::mutex mutex{};
    pqxx::connection connection;
};

class PqRepositoryStore::Definitions final : public DefinitionRepository {
public:
    explicit Definitions(Impl& impl)
        : impl_{impl}
    {
    }

    std::optional<definition::ViewDefinition> find(std::uint64_t id) override
    {
        const std::string query = std::string{kDefinitionColumns} + " WHERE id = $1";
        return impl_.with_transaction(query.c_str(), [&](pqxx::work& txn) -> std::optional<definition::ViewDefinition> {
            const auto result = txn.exec_params(query, id);
            if (result.empty()) {
                return std::nullopt;
            }
            return to_definition(result[0]);
        });
    }

    std::optional<definition::ViewDefinition> find_by_name(std::string_view name) override
    {
        const std::string query = std::string{kDefinitionColumns} + " WHERE name = $1";
        const std::string relation{unqualified_name(name)};
        return impl_.with_transaction(query.c_str(), [&](pqxx::work& txn) -> std::optional<definition::ViewDefinition> {
            const auto result = txn.exec_params(query, relation);
            if (result.empty()) {
                return std::nullopt;
            }
            return to_definition(result[0]);
        });
    }

    std::vector<definition::ViewDefinition> list() override
    {
        const std::string query = std::string{kDefinitionColumns} + " ORDER BY name";
        return impl_.with_transaction(query.c_str(), [&](pqxx::work& txn) {
            std::vector<definition::ViewDefinition> definitions;
            for (const auto& row : txn.exec(query)) {
                definitions.push_back(to_definition(row));
            }
            return definitions;
        });
    }

    std::error_code insert(definition::ViewDefinition& definition) override
    {
        if (auto error = check_definition(definition)) {
            return error;
        }
        if (find_by_name(definition.name)) {
            return make_error_code(RunErrc::DuplicateDefinition);
        }

        constexpr const char* query =
            "INSERT INTO mat_view_definitions "
            "(name, sql, refresh_strategy, schedule_cron, unique_index_columns, dependencies) "
            "VALUES ($1, $2, $3, NULLIF($4, ''), $5::jsonb, $6::jsonb) RETURNING id";
        definition.id = impl_.with_transaction(query, [&](pqxx::work& txn) {
            const auto result = txn.exec_params(query,
                                                definition.name,
                                                definition.sql,
                                                static_cast<int>(definition.refresh_strategy),
                                                definition.schedule_cron,
                                                tools::format_json_string_array(definition.unique_index_columns),
                                                tools::format_json_string_array(definition.dependencies));
            return result[0][0].as<std::uint64_t>();
        });
        return {};
    }

    std::error_code remove(std::uint64_t id) override
    {
        constexpr const char* query = "DELETE FROM mat_view_definitions WHERE id = $1";
        const auto affected = impl_.with_transaction(query, [&](pqxx::work& txn) {
            return txn.exec_params(query, id).affected_rows();
        });
        if (affected == 0) {
            return make_error_code(RunErrc::DefinitionNotFound);
        }
        return {};
    }

    std::error_code mark_refreshed(std::uint64_t id, std::chrono::system_clock::time_point refreshed_at) override
    {
        constexpr const char* query =
            "UPDATE mat_view_definitions SET last_refreshed_at = to_timestamp($2::double precision / 1000.0), "
            "updated_at = now() WHERE id = $1";
        const auto affected = impl_.with_transaction(query, [&](pqxx::work& txn) {
            return txn.exec_params(query, id, to_epoch_ms(refreshed_at)).affected_rows();
        });
        if (affected == 0) {
            return make_error_code(RunErrc::DefinitionNotFound);
        }
        return {};
    }

private:
    Impl& impl_;
};

class PqRepositoryStore::Runs final : public RunRepository {
public:
    explicit Runs(Impl& impl)
        : impl_{impl}
    {
    }

    std::error_code create(RunRecord& run) override
    {
        constexpr const char* query =
            "INSERT INTO mat_view_runs (mat_view_definition_id, status, operation, started_at, meta) "
            "VALUES ($1, $2, $3, to_timestamp($4::double precision / 1000.0), $5::jsonb) RETURNING id";
        run.id = impl_.with_transaction(query, [&](pqxx::work& txn) {
            const auto result = txn.exec_params(query,
                                                run.definition_id,
                                                static_cast<int>(run.status),
                                                static_cast<int>(run.operation),
                                                to_epoch_ms(run.started_at),
                                                run.meta_json);
            return result[0][0].as<std::uint64_t>();
        });
        return {};
    }

    std::error_code update(const RunRecord& run) override
    {
        constexpr const char* query =
            "UPDATE mat_view_runs SET status = $2, "
            "finished_at = to_timestamp($3::double precision / 1000.0), "
            "duration_ms = $4, meta = $5::jsonb, error = $6::jsonb, updated_at = now() "
            "WHERE id = $1";
        const auto affected = impl_.with_transaction(query, [&](pqxx::work& txn) {
            return txn
                .exec_params(query,
                             run.id,
                             static_cast<int>(run.status),
                             finished_ms(run),
                             run.duration_ms,
                             run.meta_json,
                             error_json(run))
                .affected_rows();
        });
        if (affected == 0) {
            return make_error_code(RunErrc::RunNotFound);
        }
        return {};
    }

    std::vector<RunRecord> list_for_definition(std::uint64_t definition_id) override
    {
        const std::string query = std::string{kRunColumns} + " WHERE mat_view_definition_id = $1 ORDER BY id DESC";
        return impl_.with_transaction(query.c_str(), [&](pqxx::work& txn) {
            std::vector<RunRecord> runs;
            for (const auto& row : txn.exec_params(query, definition_id)) {
                runs.push_back(to_run(row));
            }
            return runs;
        });
    }

private:
    Impl& impl_;
};

PqRepositoryStore::PqRepositoryStore(Config config)
{
    try {
        impl_ = std::make_unique<Impl>(config.connection_string);
    } catch (const pqxx::failure&) {
        sql::rethrow_as_sql_error("connect");
    }
    definitions_ = std::make_unique<Definitions>(*impl_);
    runs_ = std::make_unique<Runs>(*impl_);
}

PqRepositoryStore::~PqRepositoryStore() = default;

void PqRepositoryStore::install()
{
    impl_->with_transaction("install", [](pqxx::work& txn) {
        for (const auto* statement : kInstallStatements) {
            txn.exec(statement);
        }
    });
}

DefinitionRepository& PqRepositoryStore::definitions() noexcept
{
    return *definitions_;
}

RunRepository& PqRepositoryStore::runs() noexcept
{
    return *runs_;
}

}  // namespace matview::jobs
