/**
 * End-to-end adapter tests on the memory backend
 *
 * - EXECUTION: success, retry/backoff, unregistered names, countdown, routing
 * - STATUS: before execution, unknown ids
 * - CANCEL: queued, running then succeeding, running then failing
 * - LIFECYCLE: registration rules, idempotent start, bounded stop, broadcast shutdown
 * - OBSERVABILITY: metrics and health checks
 * - ASYNC: futures
 */

#include "test_helpers.hpp"
#include "taskproc/adapter_factory.hpp"
#include "taskproc/errors.hpp"
#include "taskproc/memory_task_adapter.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace taskproc;

namespace {

std::unique_ptr<MemoryTaskAdapter> make_adapter(const TaskProcessorConfig& config) {
    auto adapter = std::make_unique<MemoryTaskAdapter>(config);
    adapter->initialize(config);
    return adapter;
}

nlohmann::json add_handler(const nlohmann::json& args, const nlohmann::json&) {
    return args[0].get<int>() + args[1].get<int>();
}

bool reaches(TaskProcessorAdapter& adapter, const std::string& id, TaskStatus status,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    return wait_until([&] { return adapter.get_task_status_sync(id).status == status; }, timeout);
}

} // namespace

// ============================================================================
// Execution
// ============================================================================

TEST(test_add_task_succeeds) {
    auto config = memory_config();
    config.queue_name = "math";
    auto adapter = make_adapter(config);
    auto release = std::make_shared<std::atomic<bool>>(false);

    adapter->register_task_handle([release](const nlohmann::json& args, const nlohmann::json& kwargs) {
        while (!release->load()) std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return add_handler(args, kwargs);
    }, "add");

    auto submitted = adapter->enqueue_task_sync("add", {2, 3});
    ASSERT_EQ(submitted.status, TaskStatus::PENDING, "Submitted as PENDING");
    ASSERT(submitted.created_at.has_value(), "created_at set on submit");
    ASSERT_EQ(adapter->get_task_status_sync(submitted.id).status, TaskStatus::PENDING, "PENDING while queued");

    adapter->start_consumer();
    ASSERT_EQ(adapter->worker_identity().rfind("math@", 0), 0u, "Consumer bound to the math queue");
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::STARTED), "STARTED while the handler runs");
    ASSERT(!adapter->get_task_status_sync(submitted.id).result.has_value(), "No result while running");

    release->store(true);
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::SUCCESS), "Task reached SUCCESS");
    auto status = adapter->get_task_status_sync(submitted.id);
    ASSERT(status.result.has_value(), "Result present");
    ASSERT_EQ(*status.result, 5, "2 + 3 = 5");

    ASSERT(adapter->stop_consumer(std::chrono::seconds(2)), "Consumer stopped");
}

TEST(test_flaky_task_fails_after_max_retries) {
    auto adapter = make_adapter(memory_config(2));
    auto attempts = std::make_shared<std::atomic<int>>(0);

    adapter->register_task_handle([attempts](const nlohmann::json&, const nlohmann::json&) -> nlohmann::json {
        attempts->fetch_add(1);
        throw TransientTaskError("flaky dependency");
    }, "flaky");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_sync("flaky");
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::FAILURE), "Task reached FAILURE");
    ASSERT_EQ(attempts->load(), 3, "One attempt plus exactly 2 retries");

    auto status = adapter->get_task_status_sync(submitted.id);
    ASSERT_EQ((*status.result)["exc_type"], "TransientTaskError", "Exception type recorded");
    ASSERT_EQ((*status.result)["exc_message"], "flaky dependency", "Exception message recorded");

    adapter->stop_consumer(std::chrono::seconds(2));
}

TEST(test_retry_then_success) {
    auto adapter = make_adapter(memory_config(3));
    auto attempts = std::make_shared<std::atomic<int>>(0);

    adapter->register_task_handle([attempts](const nlohmann::json&, const nlohmann::json&) -> nlohmann::json {
        if (attempts->fetch_add(1) == 0) {
            throw std::runtime_error("first call fails");
        }
        return "recovered";
    }, "recovering");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_sync("recovering");
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::SUCCESS), "Recovered after a retry");
    ASSERT_EQ(attempts->load(), 2, "Exactly one retry");
    ASSERT_EQ(*adapter->get_task_status_sync(submitted.id).result, "recovered", "Result of the retry");

    adapter->stop_consumer(std::chrono::seconds(2));
}

TEST(test_backoff_spaces_retries) {
    auto adapter = make_adapter(memory_config(2, std::chrono::milliseconds(50)));
    auto times = std::make_shared<std::vector<std::chrono::steady_clock::time_point>>();
    auto mutex = std::make_shared<std::mutex>();

    adapter->register_task_handle([times, mutex](const nlohmann::json&, const nlohmann::json&) -> nlohmann::json {
        std::lock_guard<std::mutex> lock(*mutex);
        times->push_back(std::chrono::steady_clock::now());
        throw TransientTaskError("again");
    }, "timed");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_sync("timed");
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::FAILURE), "Exhausted");

    std::lock_guard<std::mutex> lock(*mutex);
    ASSERT_EQ(times->size(), 3u, "Three attempts");
    ASSERT((*times)[1] - (*times)[0] >= std::chrono::milliseconds(50), "First retry waits one unit");
    ASSERT((*times)[2] - (*times)[1] >= std::chrono::milliseconds(100), "Second retry waits two units");

    adapter->stop_consumer(std::chrono::seconds(2));
}

TEST(test_unregistered_task_fails) {
    auto adapter = make_adapter(memory_config());
    adapter->register_task_handle(add_handler, "add");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_sync("does_not_exist");
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::FAILURE), "Unregistered task fails");
    ASSERT_EQ((*adapter->get_task_status_sync(submitted.id).result)["exc_type"], "NotRegistered",
              "Reported as NotRegistered");

    adapter->stop_consumer(std::chrono::seconds(2));
}

TEST(test_countdown_and_options) {
    auto adapter = make_adapter(memory_config());
    adapter->register_task_handle(add_handler, "add");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_sync("add", {1, 1}, nlohmann::json::object(),
                                                {{"countdown", 0.3}, {"task_id", "fixed-id"}, {"priority", 9}});
    ASSERT_EQ(submitted.id, "fixed-id", "Caller-chosen id");

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_EQ(adapter->get_task_status_sync("fixed-id").status, TaskStatus::PENDING, "Held back by countdown");
    ASSERT(reaches(*adapter, "fixed-id", TaskStatus::SUCCESS), "Runs after countdown");

    ASSERT_THROWS(adapter->enqueue_task_sync("add", {1, 1}, nlohmann::json::object(), {{"countdown", -1}}),
                  TaskProcessorError, "Negative countdown rejected");
    ASSERT_THROWS(adapter->enqueue_task_sync("add", {{"a", 1}}), TaskProcessorError, "Args must be an array");

    adapter->stop_consumer(std::chrono::seconds(2));
}

TEST(test_queue_routing) {
    auto adapter = make_adapter(memory_config());
    adapter->register_task_handle(add_handler, "add");

    ConsumerOptions options;
    options.queues = {"priority"};
    options.concurrency = 1;
    adapter->start_consumer(options);

    auto routed = adapter->enqueue_task_sync("add", {1, 2}, nlohmann::json::object(), {{"queue", "priority"}});
    auto default_queue = adapter->enqueue_task_sync("add", {1, 2});

    ASSERT(reaches(*adapter, routed.id, TaskStatus::SUCCESS), "Routed task consumed");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_EQ(adapter->get_task_status_sync(default_queue.id).status, TaskStatus::PENDING,
              "Default queue not consumed");

    adapter->stop_consumer(std::chrono::seconds(2));
}

// ============================================================================
// Status
// ============================================================================

TEST(test_status_before_execution) {
    auto adapter = make_adapter(memory_config());
    adapter->register_task_handle(add_handler, "add");

    auto submitted = adapter->enqueue_task_sync("add", {2, 3});
    auto status = adapter->get_task_status_sync(submitted.id);
    ASSERT_EQ(status.status, TaskStatus::PENDING, "PENDING before any consumer runs");
    ASSERT(status.created_at.has_value(), "created_at available");
    ASSERT(!status.result.has_value(), "No result yet");

    auto unknown = adapter->get_task_status_sync("never-submitted");
    ASSERT_EQ(unknown.status, TaskStatus::PENDING, "Unknown id reports PENDING");
    ASSERT_EQ(unknown.id, "never-submitted", "Id echoed");
    ASSERT_EQ(unknown.to_json()["status"], "PENDING", "Status string at the boundary");
}

// ============================================================================
// Cancellation
// ============================================================================

TEST(test_cancel_queued_task) {
    auto adapter = make_adapter(memory_config());
    auto ran = std::make_shared<std::atomic<bool>>(false);
    adapter->register_task_handle([ran](const nlohmann::json&, const nlohmann::json&) {
        ran->store(true);
        return nlohmann::json();
    }, "side_effect");

    auto submitted = adapter->enqueue_task_sync("side_effect");
    ASSERT(adapter->cancel_task(submitted.id), "Cancel accepted");
    ASSERT_EQ(adapter->get_task_status_sync(submitted.id).status, TaskStatus::REVOKED, "REVOKED");

    adapter->start_consumer();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT(!ran->load(), "Revoked task never runs");

    ASSERT(!adapter->cancel_task(submitted.id), "Terminal task not cancellable");
    ASSERT(!adapter->cancel_task("unknown-id"), "Unknown task not cancellable");

    adapter->stop_consumer(std::chrono::seconds(2));
}

TEST(test_cancel_running_task_that_succeeds) {
    auto adapter = make_adapter(memory_config());
    auto started = std::make_shared<std::atomic<bool>>(false);
    auto release = std::make_shared<std::atomic<bool>>(false);

    adapter->register_task_handle([started, release](const nlohmann::json&, const nlohmann::json&) {
        started->store(true);
        while (!release->load()) std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return nlohmann::json("done");
    }, "gated");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_sync("gated");
    ASSERT(wait_until([&] { return started->load(); }), "Handler running");
    ASSERT_EQ(adapter->get_task_status_sync(submitted.id).status, TaskStatus::STARTED, "STARTED while running");

    ASSERT(adapter->cancel_task(submitted.id), "Cancel of a running task accepted");
    release->store(true);

    ASSERT(reaches(*adapter, submitted.id, TaskStatus::SUCCESS), "Successful attempt keeps SUCCESS");
    adapter->stop_consumer(std::chrono::seconds(2));
}

TEST(test_cancel_running_task_that_fails) {
    auto adapter = make_adapter(memory_config(3));
    auto attempts = std::make_shared<std::atomic<int>>(0);
    auto release = std::make_shared<std::atomic<bool>>(false);

    adapter->register_task_handle([attempts, release](const nlohmann::json&, const nlohmann::json&) -> nlohmann::json {
        attempts->fetch_add(1);
        while (!release->load()) std::this_thread::sleep_for(std::chrono::milliseconds(2));
        throw TransientTaskError("would be retried");
    }, "doomed");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_sync("doomed");
    ASSERT(wait_until([&] { return attempts->load() == 1; }), "Handler running");
    ASSERT(adapter->cancel_task(submitted.id), "Cancel accepted");
    release->store(true);

    ASSERT(reaches(*adapter, submitted.id, TaskStatus::REVOKED), "Failed attempt of a revoked task ends REVOKED");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_EQ(attempts->load(), 1, "No retry after revocation");

    adapter->stop_consumer(std::chrono::seconds(2));
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST(test_register_while_running_rejected) {
    auto adapter = make_adapter(memory_config());
    adapter->register_task_handle(add_handler, "add");
    adapter->start_consumer();

    ASSERT_THROWS(adapter->register_task_handle(add_handler, "late"), TaskProcessorError,
                  "Registration refused while consuming");

    adapter->stop_consumer(std::chrono::seconds(2));
    ASSERT_EQ(adapter->register_task_handle(add_handler, "late"), "late", "Allowed again once stopped");
}

TEST(test_start_consumer_idempotent) {
    auto adapter = make_adapter(memory_config());
    adapter->register_task_handle(add_handler, "add");

    adapter->start_consumer();
    std::string identity = adapter->worker_identity();
    ASSERT(!identity.empty(), "Identity assigned");
    ASSERT_EQ(identity.rfind("tests@", 0), 0u, "Identity derived from the queue name");

    adapter->start_consumer();
    ASSERT_EQ(adapter->worker_identity(), identity, "Second start keeps the same consumer");

    ASSERT(adapter->stop_consumer(std::chrono::seconds(2)), "Stopped");
    ASSERT(!adapter->is_consumer_running(), "Not running");
    ASSERT(adapter->worker_identity().empty(), "Identity released");

    adapter->start_consumer();
    ASSERT_NE(adapter->worker_identity(), identity, "Restart gets a fresh identity");
    adapter->stop_consumer(std::chrono::seconds(2));
}

TEST(test_stop_consumer_is_bounded) {
    // unit = 100ms; handler sleeps one unit, stop must finish within five
    auto unit = std::chrono::milliseconds(100);
    auto adapter = make_adapter(memory_config(3, unit));
    auto started = std::make_shared<std::atomic<bool>>(false);

    adapter->register_task_handle([started, unit](const nlohmann::json&, const nlohmann::json&) {
        started->store(true);
        std::this_thread::sleep_for(unit);
        return nlohmann::json("slept");
    }, "sleepy");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_sync("sleepy");
    ASSERT(wait_until([&] { return started->load(); }), "Handler running");

    auto begin = std::chrono::steady_clock::now();
    bool stopped = adapter->stop_consumer(unit * 5);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    ASSERT(stopped, "Consumer exited in time");
    ASSERT(elapsed < unit * 5, "stop_consumer returned within five units");
    ASSERT_EQ(adapter->get_task_status_sync(submitted.id).status, TaskStatus::SUCCESS,
              "Task in hand finished before exit");
}

TEST(test_stop_right_after_start) {
    auto unit = std::chrono::milliseconds(100);
    auto adapter = make_adapter(memory_config(3, unit));
    adapter->register_task_handle(add_handler, "add");

    for (int i = 0; i < 10; ++i) {
        adapter->start_consumer();
        auto begin = std::chrono::steady_clock::now();
        bool stopped = adapter->stop_consumer(unit * 5);
        auto elapsed = std::chrono::steady_clock::now() - begin;

        ASSERT(stopped, "Consumer stopped without waiting for it to come up");
        ASSERT(elapsed < unit * 5, "Stopped within five units");
        ASSERT_EQ(adapter->consumer_state(), ConsumerState::STOPPED, "STOPPED");
    }

    ASSERT(wait_until([&] { return adapter->health_check().empty(); }), "No worker left behind");
    auto submitted = adapter->enqueue_task_sync("add", {1, 1});
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_EQ(adapter->get_task_status_sync(submitted.id).status, TaskStatus::PENDING, "Nothing consumes after stop");
}

TEST(test_shutdown_right_after_start) {
    auto adapter = make_adapter(memory_config());
    adapter->register_task_handle(add_handler, "add");

    for (int i = 0; i < 10; ++i) {
        adapter->start_consumer();
        adapter->shutdown();
        ASSERT_EQ(adapter->consumer_state(), ConsumerState::STOPPED, "Handle released");
    }

    ASSERT(wait_until([&] { return adapter->health_check().empty(); }), "Every worker exited");
    auto submitted = adapter->enqueue_task_sync("add", {1, 1});
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_EQ(adapter->get_task_status_sync(submitted.id).status, TaskStatus::PENDING, "Nothing consumes after shutdown");

    adapter->start_consumer();
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::SUCCESS), "Fresh consumer ignores the old broadcasts");
    adapter->stop_consumer(std::chrono::seconds(2));
}

TEST(test_stop_timeout_only_warns) {
    auto adapter = make_adapter(memory_config());
    auto started = std::make_shared<std::atomic<bool>>(false);
    auto release = std::make_shared<std::atomic<bool>>(false);

    adapter->register_task_handle([started, release](const nlohmann::json&, const nlohmann::json&) {
        started->store(true);
        while (!release->load()) std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return nlohmann::json();
    }, "stuck");
    adapter->start_consumer();
    adapter->enqueue_task_sync("stuck");
    ASSERT(wait_until([&] { return started->load(); }), "Handler running");

    bool stopped = adapter->stop_consumer(std::chrono::milliseconds(50));
    ASSERT(!stopped, "Reported as not stopped in time");
    ASSERT_EQ(adapter->consumer_state(), ConsumerState::STOPPED, "Handle released anyway");

    release->store(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

TEST(test_shutdown_broadcasts_to_all_workers) {
    auto config = memory_config();
    auto first = make_adapter(config);
    auto second = make_adapter(config);
    first->register_task_handle(add_handler, "add");
    second->register_task_handle(add_handler, "add");

    first->start_consumer();
    second->start_consumer();
    ASSERT(wait_until([&] { return first->health_check().size() == 2; }), "Both workers alive");

    first->shutdown();
    ASSERT_EQ(first->consumer_state(), ConsumerState::STOPPED, "Local handle released at once");
    ASSERT(wait_until([&] { return !second->is_consumer_running(); }), "Other worker stopped by the broadcast");
    ASSERT(wait_until([&] { return first->health_check().empty(); }), "No live worker left");

    // The exited consumer is reaped on the next start
    second->start_consumer();
    ASSERT(second->is_consumer_running(), "Restarted after broadcast");
    auto submitted = second->enqueue_task_sync("add", {20, 22});
    ASSERT(reaches(*second, submitted.id, TaskStatus::SUCCESS), "Restarted worker ignores the old broadcast");
    second->stop_consumer(std::chrono::seconds(2));
}

// ============================================================================
// Metrics and health
// ============================================================================

TEST(test_metrics_and_health) {
    auto adapter = make_adapter(memory_config(3, std::chrono::milliseconds(10), 3));
    adapter->register_task_handle(add_handler, "add");

    ASSERT(adapter->health_check().empty(), "No worker before start");
    ASSERT(adapter->get_metrics().empty(), "No metrics before start");

    adapter->start_consumer();
    std::string identity = adapter->worker_identity();

    auto submitted = adapter->enqueue_task_sync("add", {1, 2});
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::SUCCESS), "Task ran");

    ASSERT(wait_until([&] {
        auto metrics = adapter->get_metrics();
        return metrics.contains(identity) && metrics[identity].value("succeeded", 0) >= 1;
    }), "Counters reported with the heartbeat");

    auto metrics = adapter->get_metrics();
    ASSERT_EQ(metrics[identity]["concurrency"], 3, "Concurrency reported");
    ASSERT_EQ(metrics[identity]["queues"][0], "tests", "Queues reported");

    auto health = adapter->health_check();
    ASSERT_EQ(health.size(), 1u, "One reply");
    ASSERT_EQ(health[0][identity]["ok"], "pong", "pong from the worker");

    adapter->stop_consumer(std::chrono::seconds(2));
    ASSERT(adapter->health_check().empty(), "Stopped worker unregistered");
}

// ============================================================================
// Async
// ============================================================================

TEST(test_async_forms) {
    auto adapter = make_adapter(memory_config());
    adapter->register_task_handle(add_handler, "add");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_async("add", {4, 5}).get();
    ASSERT_EQ(submitted.status, TaskStatus::PENDING, "Async submit");
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::SUCCESS), "Executed");

    auto status = adapter->get_task_status_async(submitted.id).get();
    ASSERT_EQ(*status.result, 9, "Async status carries the result");

    auto failed = adapter->enqueue_task_async("");
    ASSERT_THROWS(failed.get(), TaskProcessorError, "Errors travel through the future");

    adapter->stop_consumer(std::chrono::seconds(2));
}

TEST(test_factory_adapter_end_to_end) {
    auto adapter = make_task_adapter(memory_config());
    adapter->register_task_handle(add_handler, "add");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_sync("add", {2, 3});
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::SUCCESS), "Works through the contract");
    ASSERT_EQ(*adapter->get_task_status_sync(submitted.id).result, 5, "2 + 3 = 5");
    ASSERT(adapter->stop_consumer(std::chrono::seconds(2)), "Stopped");
}

int main() {
    spdlog::set_level(spdlog::level::err);

    RUN_TEST(test_add_task_succeeds);
    RUN_TEST(test_flaky_task_fails_after_max_retries);
    RUN_TEST(test_retry_then_success);
    RUN_TEST(test_backoff_spaces_retries);
    RUN_TEST(test_unregistered_task_fails);
    RUN_TEST(test_countdown_and_options);
    RUN_TEST(test_queue_routing);
    RUN_TEST(test_status_before_execution);
    RUN_TEST(test_cancel_queued_task);
    RUN_TEST(test_cancel_running_task_that_succeeds);
    RUN_TEST(test_cancel_running_task_that_fails);
    RUN_TEST(test_register_while_running_rejected);
    RUN_TEST(test_start_consumer_idempotent);
    RUN_TEST(test_stop_consumer_is_bounded);
    RUN_TEST(test_stop_right_after_start);
    RUN_TEST(test_shutdown_right_after_start);
    RUN_TEST(test_stop_timeout_only_warns);
    RUN_TEST(test_shutdown_broadcasts_to_all_workers);
    RUN_TEST(test_metrics_and_health);
    RUN_TEST(test_async_forms);
    RUN_TEST(test_factory_adapter_end_to_end);

    return print_summary("memory_adapter_test");
}
