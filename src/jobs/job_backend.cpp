#include "matview/jobs/job_backend.hpp"

#include <stdexcept>
#include <utility>

namespace matview::jobs {

InlineJobBackend::InlineJobBackend(JobHandler handler)
    : handler_{std::move(handler)}
{
    if (!handler_) {
        throw std::invalid_argument{"InlineJobBackend requires a handler"};
    }
}

void InlineJobBackend::enqueue(JobRequest request)
{
    handler_(request);
}

void InlineJobBackend::drain()
{
}

ThreadedJobBackend::ThreadedJobBackend(Config config)
    : config_{std::move(config)}
{
    if (!config_.handler_factory) {
        throw std::invalid_argument{"ThreadedJobBackend requires a handler factory"};
    }
    if (config_.worker_threads == 0U) {
        config_.worker_threads = 1U;
    }
}

ThreadedJobBackend::~ThreadedJobBackend()
{
    stop();
}

void ThreadedJobBackend::start()
{
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }

    stop_requested_ = false;
    running_ = true;
    threads_.reserve(config_.worker_threads);
    for (std::size_t i = 0; i < config_.worker_threads; ++i) {
        threads_.emplace_back([this]() { run_worker(); });
    }
}

// Pending requests are handled before the workers exit.
void ThreadedJobBackend::stop()
{
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
        cv_.notify_all();
    }

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    std::lock_guard lock(mutex_);
    running_ = false;
    stop_requested_ = false;
    idle_cv_.notify_all();
}

void ThreadedJobBackend::enqueue(JobRequest request)
{
    std::lock_guard lock(mutex_);
    if (stop_requested_) {
        throw std::logic_error{"queue " + config_.queue + " is stopping"};
    }
    pending_.push_back(std::move(request));
    cv_.notify_one();
}

void ThreadedJobBackend::drain()
{
    std::unique_lock lock(mutex_);
    if (!running_) {
        return;
    }
    idle_cv_.wait(lock, [this]() { return !running_ || (pending_.empty() && in_flight_ == 0U); });
}

bool ThreadedJobBackend::running() const noexcept
{
    std::lock_guard lock(mutex_);
    return running_;
}

std::uint64_t ThreadedJobBackend::completed() const noexcept
{
    std::lock_guard lock(mutex_);
    return completed_;
}

std::uint64_t ThreadedJobBackend::failed() const noexcept
{
    std::lock_guard lock(mutex_);
    return failed_;
}

void ThreadedJobBackend::report_failure(const JobRequest& request, const std::string& message)
{
    if (config_.on_failure) {
        config_.on_failure(request, message);
    }
}

void ThreadedJobBackend::run_worker()
{
    JobHandler handler;
    try {
        handler = config_.handler_factory();
    } catch (const std::exception& error) {
        report_failure(JobRequest{}, std::string{"worker setup failed: "} + error.what());
    }

    std::unique_lock lock(mutex_);
    while (true) {
        cv_.wait(lock, [this]() { return stop_requested_ || !pending_.empty(); });
        if (pending_.empty()) {
            break;
        }

        auto request = std::move(pending_.front());
        pending_.pop_front();
        ++in_flight_;
        lock.unlock();

        bool ok = false;
        std::string failure;
        if (!handler) {
            failure = "no handler available for queue " + config_.queue;
        } else {
            try {
                handler(request);
                ok = true;
            } catch (const std::exception& error) {
                failure = error.what();
            }
        }
        if (!ok) {
            report_failure(request, failure);
        }

        lock.lock();
        --in_flight_;
        if (ok) {
            ++completed_;
        } else {
            ++failed_;
        }
        if (pending_.empty() && in_flight_ == 0U) {
            idle_cv_.notify_all();
        }
    }
}

JobQueueClient::JobQueueClient(JobBackend& backend, std::string queue)
    : backend_{backend}
    , queue_{std::move(queue)}
{
}

void JobQueueClient::enqueue_create(std::uint64_t definition_id, bool force)
{
    JobRequest request{};
    request.kind = JobKind::Create;
    request.definition_id = definition_id;
    request.queue = queue_;
    request.options.emplace("force", force ? "true" : "false");
    backend_.enqueue(std::move(request));
}

void JobQueueClient::enqueue_refresh(std::uint64_t definition_id, std::optional<service::RowCountStrategy> row_count_strategy)
{
    JobRequest request{};
    request.kind = JobKind::Refresh;
    request.definition_id = definition_id;
    request.queue = queue_;
    if (row_count_strategy) {
        request.options.emplace("row_count_strategy", std::string{service::to_string(*row_count_strategy)});
    }
    backend_.enqueue(std::move(request));
}

void JobQueueClient::enqueue_delete(std::uint64_t definition_id, bool cascade)
{
    JobRequest request{};
    request.kind = JobKind::Delete;
    request.definition_id = definition_id;
    request.queue = queue_;
    request.options.emplace("cascade", cascade ? "true" : "false");
    backend_.enqueue(std::move(request));
}

std::unique_ptr<JobBackend> make_job_backend(const config::Configuration& configuration,
                                             ThreadedJobBackend::HandlerFactory handler_factory,
                                             ThreadedJobBackend::FailureCallback on_failure)
{
    switch (configuration.job_adapter) {
    case config::JobAdapter::Threaded: {
        ThreadedJobBackend::Config threaded{};
        threaded.queue = configuration.job_queue;
        threaded.worker_threads = configuration.worker_threads;
        threaded.handler_factory = std::move(handler_factory);
        threaded.on_failure = std::move(on_failure);
        auto backend = std::make_unique<ThreadedJobBackend>(std::move(threaded));
        backend->start();
        return backend;
    }
    case config::JobAdapter::Inline:
    default:
        if (!handler_factory) {
            throw std::invalid_argument{"job backend requires a handler factory"};
        }
        return std::make_unique<InlineJobBackend>(handler_factory());
    }
}

}  // namespace matview::jobs
