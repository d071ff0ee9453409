#include "matview/config/configuration.hpp"
#include "matview/definition/view_definition.hpp"
#include "matview/jobs/job_backend.hpp"
#include "matview/jobs/pq_repositories.hpp"
#include "matview/jobs/run_errors.hpp"
#include "matview/jobs/view_jobs.hpp"
#include "matview/service/service_telemetry.hpp"
#include "matview/service/view_operations.hpp"
#include "matview/sql/pq_session.hpp"
#include "matview/tools/run_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using matview::definition::ViewDefinition;
using matview::jobs::JobKind;
using matview::jobs::JobOptions;
using matview::jobs::JobRequest;

namespace {

struct GlobalOptions final {
    std::string database_url{};
    std::string job_adapter{};
    std::string job_queue{};
    std::string row_count_strategy{};
    std::size_t worker_threads = 0U;
    bool assume_yes = false;
    std::string log_json_path{};
};

// One of --name, --id or --all.
struct TargetOptions final {
    std::string name{};
    std::uint64_t id = 0U;
    bool all = false;
};

matview::config::Configuration resolve_configuration(const GlobalOptions& options)
{
    matview::config::Configuration configuration{};
    if (const auto ec = matview::config::apply_environment(configuration); ec) {
        throw std::system_error(ec, "invalid MATVIEW_* environment");
    }

    if (!options.database_url.empty()) {
        configuration.database_url = options.database_url;
    }
    if (!options.job_adapter.empty()) {
        const auto adapter = matview::config::parse_job_adapter(options.job_adapter);
        if (!adapter) {
            throw std::invalid_argument("unknown job adapter '" + options.job_adapter + "'");
        }
        configuration.job_adapter = *adapter;
    }
    if (!options.job_queue.empty()) {
        configuration.job_queue = options.job_queue;
    }
    if (!options.row_count_strategy.empty()) {
        configuration.default_row_count_strategy =
            matview::service::parse_row_count_strategy(options.row_count_strategy);
    }
    if (options.worker_threads != 0U) {
        configuration.worker_threads = options.worker_threads;
    }
    if (options.assume_yes) {
        configuration.assume_yes = true;
    }

    if (configuration.database_url.empty()) {
        throw std::invalid_argument("no database given; pass --database-url or set MATVIEW_DATABASE_URL");
    }
    return configuration;
}

bool confirm(const matview::config::Configuration& configuration, const std::string& summary)
{
    std::cerr << "[matview] " << summary << '\n';
    if (configuration.assume_yes) {
        return true;
    }

    replxx::Replxx repl;
    const char* line = repl.input("Proceed? [y/N] ");
    if (line == nullptr) {
        std::cerr << '\n';
        return false;
    }
    return matview::jobs::is_truthy(line);
}

std::vector<ViewDefinition> select_targets(matview::jobs::DefinitionRepository& definitions,
                                           const TargetOptions& target)
{
    if (target.all) {
        return definitions.list();
    }

    std::optional<ViewDefinition> definition;
    if (!target.name.empty()) {
        definition = definitions.find_by_name(target.name);
    } else if (target.id != 0U) {
        definition = definitions.find(target.id);
    } else {
        throw std::invalid_argument("one of --name, --id or --all is required");
    }

    if (!definition) {
        throw std::system_error(matview::jobs::make_error_code(matview::jobs::RunErrc::DefinitionNotFound),
                                target.name.empty() ? std::to_string(target.id) : target.name);
    }
    return {*definition};
}

std::string describe_targets(std::string_view verb, const std::vector<ViewDefinition>& targets)
{
    std::string summary{verb};
    if (targets.size() == 1U) {
        summary += " materialized view '" + targets.front().name + "'";
    } else {
        summary += " " + std::to_string(targets.size()) + " materialized views";
    }
    return summary;
}

void add_target_options(CLI::App* command, TargetOptions& target, bool allow_all = true)
{
    auto* name = command->add_option("-n,--name", target.name, "Definition name (schema.name accepted)");
    auto* id = command->add_option("-i,--id", target.id, "Definition id");
    name->excludes(id);
    if (allow_all) {
        auto* all = command->add_flag("-a,--all", target.all, "Every stored definition");
        all->excludes(name);
        all->excludes(id);
    }
}

void print_definition(const ViewDefinition& definition)
{
    std::cout << definition.id << '\t' << definition.name << '\t'
              << matview::definition::to_string(definition.refresh_strategy) << '\t'
              << matview::tools::format_json_string_array(definition.unique_index_columns);
    if (!definition.schedule_cron.empty()) {
        std::cout << '\t' << definition.schedule_cron;
    }
    std::cout << '\n';
}

// Runs the queued jobs for targets. Returns the number of failed jobs.
class JobSession final {
public:
    JobSession(const matview::config::Configuration& configuration,
               matview::jobs::PqRepositoryStore& store,
               std::ostream* log_stream)
        : configuration_{configuration}
        , store_{store}
        , log_stream_{log_stream}
    {
        backend_ = matview::jobs::make_job_backend(
            configuration_,
            [this]() { return make_handler(); },
            [this](const JobRequest& request, const std::string& message) { report_failure(request, message); });
    }

    void enqueue(JobKind kind, std::uint64_t definition_id, JobOptions options)
    {
        JobRequest request{};
        request.kind = kind;
        request.definition_id = definition_id;
        request.queue = configuration_.job_queue;
        request.options = std::move(options);

        // Inline handlers raise straight into this frame.
        try {
            backend_->enqueue(request);
        } catch (const std::exception& error) {
            report_failure(request, error.what());
        }
    }

    std::size_t finish()
    {
        backend_->drain();
        std::lock_guard<std::mutex> guard{mutex_};
        std::cerr << "[matview] " << completed_ << " job(s) succeeded, " << failures_ << " failed\n";
        return failures_;
    }

private:
    matview::jobs::JobHandler make_handler()
    {
        auto session = std::make_shared<matview::sql::PqSession>(
            matview::sql::PqSession::Config{configuration_.database_url, "matviewctl"});

        matview::jobs::ViewJobRunner::Config runner_config{};
        runner_config.session = session.get();
        runner_config.definitions = &store_.definitions();
        runner_config.runs = &store_.runs();
        runner_config.default_row_count_strategy = configuration_.default_row_count_strategy;
        runner_config.telemetry = &telemetry_;
        runner_config.run_logger = [this](const matview::jobs::RunRecord& run, const ViewDefinition& definition) {
            log_run(run, definition);
        };
        auto runner = std::make_shared<matview::jobs::ViewJobRunner>(std::move(runner_config));

        return [session, runner](const JobRequest& request) { (void)runner->perform(request); };
    }

    void log_run(const matview::jobs::RunRecord& run, const ViewDefinition& definition)
    {
        std::lock_guard<std::mutex> guard{mutex_};
        std::cerr << "[matview] " << matview::jobs::to_string(run.operation) << " '" << definition.name
                  << "' run " << run.id << ": " << matview::jobs::to_string(run.status);
        if (run.duration_ms) {
            std::cerr << " in " << *run.duration_ms << " ms";
        }
        std::cerr << '\n';
        if (run.status == matview::jobs::RunStatus::Success) {
            ++completed_;
        }
        if (log_stream_ != nullptr) {
            (*log_stream_) << matview::tools::format_run_log_json(run, definition.name) << '\n';
            log_stream_->flush();
        }
    }

    void report_failure(const JobRequest& request, const std::string& message)
    {
        std::lock_guard<std::mutex> guard{mutex_};
        ++failures_;
        std::cerr << "error: " << matview::jobs::to_string(request.kind) << " job for definition "
                  << request.definition_id << " failed: " << message << '\n';
    }

    const matview::config::Configuration& configuration_;
    matview::jobs::PqRepositoryStore& store_;
    std::ostream* log_stream_ = nullptr;
    matview::service::ServiceTelemetry telemetry_{};
    std::mutex mutex_{};
    std::size_t completed_ = 0U;
    std::size_t failures_ = 0U;
    std::unique_ptr<matview::jobs::JobBackend> backend_{};
};

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Materialized view lifecycle tooling for PostgreSQL"};
    app.require_subcommand(1);

    GlobalOptions global{};
    app.add_option("-d,--database-url", global.database_url, "libpq connection string (MATVIEW_DATABASE_URL)");
    app.add_option("--job-adapter", global.job_adapter, "inline or threaded (MATVIEW_JOB_ADAPTER)")
        ->check(CLI::IsMember({"inline", "threaded"}));
    app.add_option("-q,--queue", global.job_queue, "Job queue name (MATVIEW_JOB_QUEUE)");
    app.add_option("--row-count-strategy", global.row_count_strategy, "none, estimated or exact")
        ->check(CLI::IsMember({"none", "estimated", "exact"}));
    app.add_option("-w,--workers", global.worker_threads, "Worker threads for the threaded adapter")
        ->check(CLI::PositiveNumber);
    app.add_flag("-y,--yes", global.assume_yes, "Do not ask for confirmation (YES)");
    app.add_option("--log-json", global.log_json_path, "Append JSON run logs to a file (use '-' for stdout)");

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::optional<matview::config::Configuration> configuration;
    std::unique_ptr<matview::jobs::PqRepositoryStore> store;
    int exit_code = EXIT_SUCCESS;

    auto open = [&]() -> matview::jobs::PqRepositoryStore& {
        configuration = resolve_configuration(global);
        if (!global.log_json_path.empty() && log_stream == nullptr) {
            if (global.log_json_path == "-") {
                log_stream = &std::cout;
            } else {
                auto file = std::make_unique<std::ofstream>(global.log_json_path, std::ios::out | std::ios::app);
                if (!file->is_open()) {
                    throw std::runtime_error("failed to open log file '" + global.log_json_path + "'");
                }
                log_stream = file.get();
                log_file = std::move(file);
            }
        }
        store = std::make_unique<matview::jobs::PqRepositoryStore>(
            matview::jobs::PqRepositoryStore::Config{configuration->database_url});
        return *store;
    };

    auto* install = app.add_subcommand("install", "Create the bookkeeping tables");
    install->callback([&]() {
        open().install();
        std::cerr << "[matview] bookkeeping tables installed\n";
    });

    ViewDefinition define_input{};
    std::string define_strategy{"regular"};
    auto* define = app.add_subcommand("define", "Store a materialized view definition");
    define->add_option("-n,--name", define_input.name, "View name")->required();
    define->add_option("-s,--sql", define_input.sql, "Defining SELECT statement")->required();
    define->add_option("--strategy", define_strategy, "regular, concurrent or swap")
        ->check(CLI::IsMember({"regular", "concurrent", "swap"}));
    define->add_option("-u,--unique-columns", define_input.unique_index_columns, "Unique index columns")
        ->delimiter(',');
    define->add_option("--dependencies", define_input.dependencies, "Relations the view reads")->delimiter(',');
    define->add_option("--schedule", define_input.schedule_cron, "Cron expression kept for schedulers");
    define->callback([&]() {
        auto& definitions = open().definitions();
        define_input.refresh_strategy =
            matview::definition::parse_refresh_strategy(define_strategy).value_or(
                matview::definition::RefreshStrategy::Regular);
        if (const auto ec = definitions.insert(define_input); ec) {
            throw std::system_error(ec, "definition '" + define_input.name + "' rejected");
        }
        std::cerr << "[matview] defined '" << define_input.name << "' as id " << define_input.id << '\n';
    });

    TargetOptions undefine_target{};
    auto* undefine = app.add_subcommand("undefine", "Remove a definition and its run history");
    add_target_options(undefine, undefine_target, false);
    undefine->callback([&]() {
        auto& definitions = open().definitions();
        const auto targets = select_targets(definitions, undefine_target);
        if (!confirm(*configuration, describe_targets("forget", targets))) {
            std::cerr << "[matview] aborted\n";
            return;
        }
        for (const auto& definition : targets) {
            if (const auto ec = definitions.remove(definition.id); ec) {
                throw std::system_error(ec, "failed to remove '" + definition.name + "'");
            }
        }
    });

    auto* list = app.add_subcommand("list", "List stored definitions");
    list->callback([&]() {
        for (const auto& definition : open().definitions().list()) {
            print_definition(definition);
        }
    });

    TargetOptions create_target{};
    bool create_force = false;
    auto* create = app.add_subcommand("create", "Create materialized views from their definitions");
    add_target_options(create, create_target);
    create->add_flag("-f,--force", create_force, "Drop and recreate existing views (FORCE)");
    create->callback([&]() {
        auto& repository = open();
        const bool force = create_force || configuration->force;
        const auto targets = select_targets(repository.definitions(), create_target);
        if (force && !confirm(*configuration, describe_targets("recreate", targets))) {
            std::cerr << "[matview] aborted\n";
            return;
        }
        JobSession jobs{*configuration, repository, log_stream};
        for (const auto& definition : targets) {
            jobs.enqueue(JobKind::Create, definition.id, {{"force", force ? "true" : "false"}});
        }
        if (jobs.finish() != 0U) {
            exit_code = EXIT_FAILURE;
        }
    });

    TargetOptions refresh_target{};
    std::string refresh_row_count;
    auto* refresh = app.add_subcommand("refresh", "Refresh materialized views with their declared strategy");
    add_target_options(refresh, refresh_target);
    refresh->add_option("--row-count-strategy", refresh_row_count, "none, estimated or exact");
    refresh->callback([&]() {
        auto& repository = open();
        const auto targets = select_targets(repository.definitions(), refresh_target);
        if (!confirm(*configuration, describe_targets("refresh", targets))) {
            std::cerr << "[matview] aborted\n";
            return;
        }
        JobSession jobs{*configuration, repository, log_stream};
        for (const auto& definition : targets) {
            JobOptions options;
            if (!refresh_row_count.empty()) {
                options.emplace("row_count_strategy", refresh_row_count);
            }
            jobs.enqueue(JobKind::Refresh, definition.id, std::move(options));
        }
        if (jobs.finish() != 0U) {
            exit_code = EXIT_FAILURE;
        }
    });

    TargetOptions delete_target{};
    bool delete_cascade = false;
    auto* drop = app.add_subcommand("delete", "Drop materialized views");
    add_target_options(drop, delete_target);
    drop->add_flag("--cascade", delete_cascade, "Drop dependent objects too");
    drop->callback([&]() {
        auto& repository = open();
        const auto targets = select_targets(repository.definitions(), delete_target);
        if (!confirm(*configuration, describe_targets(delete_cascade ? "drop (cascade)" : "drop", targets))) {
            std::cerr << "[matview] aborted\n";
            return;
        }
        JobSession jobs{*configuration, repository, log_stream};
        for (const auto& definition : targets) {
            jobs.enqueue(JobKind::Delete, definition.id, {{"cascade", delete_cascade ? "true" : "false"}});
        }
        if (jobs.finish() != 0U) {
            exit_code = EXIT_FAILURE;
        }
    });

    TargetOptions exists_target{};
    auto* exists = app.add_subcommand("exists", "Report whether materialized views exist in the database");
    add_target_options(exists, exists_target);
    exists->callback([&]() {
        auto& repository = open();
        matview::sql::PqSession session{{configuration->database_url, "matviewctl"}};
        for (const auto& definition : select_targets(repository.definitions(), exists_target)) {
            const auto response = matview::service::CheckViewExists{session, definition}.run();
            std::cout << matview::tools::format_service_response_json(response) << '\n';
            if (!response.success()) {
                exit_code = EXIT_FAILURE;
            }
        }
    });

    TargetOptions runs_target{};
    std::size_t runs_limit = 20U;
    auto* runs = app.add_subcommand("runs", "Show recent runs of a definition as JSON lines");
    add_target_options(runs, runs_target, false);
    runs->add_option("-l,--limit", runs_limit, "Maximum runs to show");
    runs->callback([&]() {
        auto& repository = open();
        const auto targets = select_targets(repository.definitions(), runs_target);
        const auto& definition = targets.front();
        const auto history = repository.runs().list_for_definition(definition.id);
        std::size_t shown = 0U;
        for (const auto& run : history) {
            if (shown++ == runs_limit) {
                break;
            }
            std::cout << matview::tools::format_run_log_json(run, definition.name) << '\n';
        }
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return exit_code;
}
