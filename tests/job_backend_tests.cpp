#include "matview/config/configuration.hpp"
#include "matview/jobs/job_backend.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace matview;
using namespace matview::jobs;

TEST_CASE("inline backend handles requests on the caller's thread")
{
    std::vector<JobRequest> handled;
    InlineJobBackend backend{[&](const JobRequest& request) { handled.push_back(request); }};
    JobQueueClient client{backend, "reports"};

    client.enqueue_create(1U, true);
    client.enqueue_refresh(2U, service::RowCountStrategy::Exact);
    client.enqueue_refresh(3U);
    client.enqueue_delete(4U, false);
    backend.drain();

    REQUIRE(handled.size() == 4U);
    CHECK(handled[0].kind == JobKind::Create);
    CHECK(handled[0].queue == "reports");
    CHECK(handled[0].options.at("force") == "true");
    CHECK(handled[1].options.at("row_count_strategy") == "exact");
    CHECK(handled[2].options.empty());
    CHECK(handled[3].kind == JobKind::Delete);
    CHECK(handled[3].definition_id == 4U);
    CHECK(handled[3].options.at("cascade") == "false");
}

TEST_CASE("inline backend lets handler failures reach the caller")
{
    InlineJobBackend backend{[](const JobRequest&) { throw std::runtime_error{"refresh failed"}; }};
    JobQueueClient client{backend, "default"};
    CHECK_THROWS_AS(client.enqueue_refresh(1U), std::runtime_error);
    CHECK_THROWS_AS(InlineJobBackend{JobHandler{}}, std::invalid_argument);
}

TEST_CASE("threaded backend serves every request and reports failures")
{
    std::atomic<int> factories{0};
    std::mutex mutex;
    std::set<std::uint64_t> handled;
    std::vector<std::string> failures;

    ThreadedJobBackend::Config config{};
    config.queue = "bulk";
    config.worker_threads = 3U;
    config.handler_factory = [&]() -> JobHandler {
        ++factories;
        return [&](const JobRequest& request) {
            if (request.definition_id % 5U == 0U) {
                throw std::runtime_error{"definition " + std::to_string(request.definition_id) + " failed"};
            }
            std::lock_guard guard{mutex};
            handled.insert(request.definition_id);
        };
    };
    config.on_failure = [&](const JobRequest&, const std::string& message) {
        std::lock_guard guard{mutex};
        failures.push_back(message);
    };

    ThreadedJobBackend backend{config};
    backend.start();
    CHECK(backend.running());
    CHECK(backend.queue() == "bulk");

    JobQueueClient client{backend, backend.queue()};
    for (std::uint64_t id = 1U; id <= 20U; ++id) {
        client.enqueue_refresh(id);
    }
    backend.drain();

    CHECK(backend.completed() == 16U);
    CHECK(backend.failed() == 4U);
    {
        std::lock_guard guard{mutex};
        CHECK(handled.size() == 16U);
        CHECK(failures.size() == 4U);
    }

    backend.stop();
    CHECK_FALSE(backend.running());
    CHECK(factories.load() == 3);
}

TEST_CASE("threaded backend finishes pending work when stopped")
{
    std::atomic<int> handled{0};
    ThreadedJobBackend::Config config{};
    config.handler_factory = [&]() -> JobHandler { return [&](const JobRequest&) { ++handled; }; };

    ThreadedJobBackend backend{config};
    backend.start();
    for (std::uint64_t id = 1U; id <= 10U; ++id) {
        JobRequest request{};
        request.definition_id = id;
        backend.enqueue(request);
    }
    backend.stop();
    CHECK(handled.load() == 10);
    CHECK_THROWS_AS(ThreadedJobBackend{ThreadedJobBackend::Config{}}, std::invalid_argument);
}

TEST_CASE("make_job_backend follows the configured adapter")
{
    std::atomic<int> handled{0};
    auto factory = [&]() -> JobHandler { return [&](const JobRequest&) { ++handled; }; };

    config::Configuration inline_config{};
    auto inline_backend = make_job_backend(inline_config, factory);
    CHECK(dynamic_cast<InlineJobBackend*>(inline_backend.get()) != nullptr);
    inline_backend->enqueue(JobRequest{});
    CHECK(handled.load() == 1);

    config::Configuration threaded_config{};
    threaded_config.job_adapter = config::JobAdapter::Threaded;
    threaded_config.job_queue = "nightly";
    threaded_config.worker_threads = 2U;
    auto threaded_backend = make_job_backend(threaded_config, factory);
    auto* threaded = dynamic_cast<ThreadedJobBackend*>(threaded_backend.get());
    REQUIRE(threaded != nullptr);
    CHECK(threaded->running());
    CHECK(threaded->queue() == "nightly");
    threaded_backend->enqueue(JobRequest{});
    threaded_backend->drain();
    CHECK(handled.load() == 2);
}
