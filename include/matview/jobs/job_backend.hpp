#pragma once

#include "matview/config/configuration.hpp"
#include "matview/jobs/view_jobs.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace matview::jobs {

using JobHandler = std::function<void(const JobRequest&)>;

class JobBackend {
public:
    virtual ~JobBackend() = default;

    virtual void enqueue(JobRequest request) = 0;
    // Blocks until every accepted request has been handled.
    virtual void drain() = 0;
};

// Handles each request on the caller's thread; handler exceptions reach the caller.
class InlineJobBackend final : public JobBackend {
public:
    explicit InlineJobBackend(JobHandler handler);

    void enqueue(JobRequest request) override;
    void drain() override;

private:
    JobHandler handler_;
};

// Serves one named queue with a fixed set of worker threads. Each worker obtains its own
// handler from the factory so handlers need not be thread safe.
class ThreadedJobBackend final : public JobBackend {
public:
    using HandlerFactory = std::function<JobHandler()>;
    using FailureCallback = std::function<void(const JobRequest&, const std::string&)>;

    struct Config final {
        std::string queue{"default"};
        std::size_t worker_threads = 1U;
        HandlerFactory handler_factory{};
        FailureCallback on_failure{};
    };

    explicit ThreadedJobBackend(Config config);
    ~ThreadedJobBackend() override;

    ThreadedJobBackend(const ThreadedJobBackend&) = delete;
    ThreadedJobBackend& operator=(const ThreadedJobBackend&) = delete;
    ThreadedJobBackend(ThreadedJobBackend&&) = delete;
    ThreadedJobBackend& operator=(ThreadedJobBackend&&) = delete;

    void start();
    void stop();

    void enqueue(JobRequest request) override;
    void drain() override;

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] const std::string& queue() const noexcept { return config_.queue; }
    [[nodiscard]] std::uint64_t completed() const noexcept;
    [[nodiscard]] std::uint64_t failed() const noexcept;

private:
    void run_worker();
    void report_failure(const JobRequest& request, const std::string& message);

    Config config_{};
    std::vector<std::thread> threads_{};
    mutable std::mutex mutex_{};
    std::condition_variable cv_{};
    std::condition_variable idle_cv_{};
    std::deque<JobRequest> pending_{};
    std::size_t in_flight_ = 0U;
    bool running_ = false;
    bool stop_requested_ = false;
    std::uint64_t completed_ = 0U;
    std::uint64_t failed_ = 0U;
};

// Builds requests for the configured queue and hands them to the backend.
class JobQueueClient final {
public:
    JobQueueClient(JobBackend& backend, std::string queue);

    void enqueue_create(std::uint64_t definition_id, bool force);
    void enqueue_refresh(std::uint64_t definition_id,
                         std::optional<service::RowCountStrategy> row_count_strategy = std::nullopt);
    void enqueue_delete(std::uint64_t definition_id, bool cascade);

private:
    JobBackend& backend_;
    std::string queue_{};
};

// Selected once from configuration.job_adapter. Threaded backends are returned started.
std::unique_ptr<JobBackend> make_job_backend(const config::Configuration& configuration,
                                             ThreadedJobBackend::HandlerFactory handler_factory,
                                             ThreadedJobBackend::FailureCallback on_failure = {});

}  // namespace matview::jobs
