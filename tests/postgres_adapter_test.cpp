/**
 * PostgreSQL adapter tests
 *
 * The first tests need no database. The rest run against the server given
 * by PG_HOST / PG_PORT / PG_DB / PG_USER / PG_PASSWORD and are skipped when
 * PG_HOST is not set.
 */

#include "test_helpers.hpp"
#include "taskproc/adapter_factory.hpp"
#include "taskproc/errors.hpp"
#include "taskproc/postgres_broker.hpp"
#include "taskproc/postgres_task_adapter.hpp"
#include <atomic>
#include <cstdlib>
#include <memory>

using namespace taskproc;

namespace {

std::string env_or(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

bool postgres_configured() {
    if (!std::getenv("PG_HOST")) {
        std::cout << " ⚠️  skipped (set PG_HOST)";
        return false;
    }
    return true;
}

TaskProcessorConfig postgres_config(int max_retries = 2) {
    PostgresAdapterConfig pg;
    pg.broker_url = "host=" + env_or("PG_HOST", "localhost") +
                    " port=" + env_or("PG_PORT", "5432") +
                    " dbname=" + env_or("PG_DB", "postgres") +
                    " user=" + env_or("PG_USER", "postgres") +
                    " password=" + env_or("PG_PASSWORD", "postgres") +
                    " connect_timeout=5";
    pg.worker_concurrency = 2;
    pg.transport_options = {
        {"visibility_timeout", 5},
        {"polling_interval", 0.02},
        {"heartbeat_interval", 0.2}
    };

    TaskProcessorConfig config;
    // Private queue per run so parallel runs do not steal each other's tasks
    config.queue_name = "pgtest-" + generate_task_id().substr(24);
    config.max_retries = max_retries;
    config.retry_backoff_unit = std::chrono::milliseconds(20);
    config.backend = pg;
    return config;
}

nlohmann::json add_handler(const nlohmann::json& args, const nlohmann::json&) {
    return args[0].get<int>() + args[1].get<int>();
}

bool reaches(TaskProcessorAdapter& adapter, const std::string& id, TaskStatus status) {
    return wait_until([&] { return adapter.get_task_status_sync(id).status == status; },
                      std::chrono::milliseconds(10000));
}

} // namespace

// ============================================================================
// Without a database
// ============================================================================

TEST(test_async_forms_unsupported) {
    PostgresTaskAdapter adapter(postgres_config());

    bool rejected = false;
    try {
        adapter.enqueue_task_async("add", {1, 2});
    } catch (const UnsupportedOperationError& e) {
        rejected = e.operation() == "enqueue_task_async";
    }
    ASSERT(rejected, "Async enqueue rejected explicitly");

    ASSERT_THROWS(adapter.get_task_status_async("some-id"), UnsupportedOperationError,
                  "Async status rejected explicitly");
}

TEST(test_connection_failure_is_fatal) {
    auto config = postgres_config();
    auto& pg = std::get<PostgresAdapterConfig>(config.backend);
    pg.broker_url = "host=127.0.0.1 port=1 dbname=none user=none connect_timeout=1";
    pg.transport_options["pool_size"] = 1;

    ASSERT_THROWS(make_task_adapter(config), BrokerError, "Unreachable broker fails at initialize");
}

TEST(test_postgres_settings) {
    PostgresAdapterConfig pg;
    PostgresBroker broker(pg);
    ASSERT_EQ(broker.settings().visibility_timeout.count(), 60000, "Default visibility timeout");
    ASSERT_EQ(broker.settings().polling_interval.count(), 200, "Default polling interval");
    ASSERT_EQ(broker.name(), "postgres", "Broker name");
    ASSERT_THROWS(broker.get_state("x"), BrokerError, "Unconnected broker refuses calls");
}

// ============================================================================
// Against PostgreSQL
// ============================================================================

TEST(test_pg_add_task_succeeds) {
    if (!postgres_configured()) return;

    auto adapter = make_task_adapter(postgres_config());
    adapter->register_task_handle(add_handler, "add");

    auto submitted = adapter->enqueue_task_sync("add", {2, 3});
    ASSERT_EQ(adapter->get_task_status_sync(submitted.id).status, TaskStatus::PENDING, "PENDING before consuming");

    adapter->start_consumer();
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::SUCCESS), "Reached SUCCESS");
    auto status = adapter->get_task_status_sync(submitted.id);
    ASSERT_EQ(*status.result, 5, "2 + 3 = 5");
    ASSERT(status.created_at.has_value(), "created_at stored");

    ASSERT(adapter->stop_consumer(std::chrono::seconds(5)), "Stopped");
}

TEST(test_pg_flaky_task_fails_after_retries) {
    if (!postgres_configured()) return;

    auto adapter = make_task_adapter(postgres_config(2));
    auto attempts = std::make_shared<std::atomic<int>>(0);
    adapter->register_task_handle([attempts](const nlohmann::json&, const nlohmann::json&) -> nlohmann::json {
        attempts->fetch_add(1);
        throw TransientTaskError("flaky");
    }, "flaky");
    adapter->start_consumer();

    auto submitted = adapter->enqueue_task_sync("flaky");
    ASSERT(reaches(*adapter, submitted.id, TaskStatus::FAILURE), "Reached FAILURE");
    ASSERT_EQ(attempts->load(), 3, "Exactly 2 retries");
    ASSERT_EQ((*adapter->get_task_status_sync(submitted.id).result)["exc_type"], "TransientTaskError",
              "Exception type stored");

    adapter->stop_consumer(std::chrono::seconds(5));
}

TEST(test_pg_cancel_and_unknown) {
    if (!postgres_configured()) return;

    auto adapter = make_task_adapter(postgres_config());
    adapter->register_task_handle(add_handler, "add");

    auto submitted = adapter->enqueue_task_sync("add", {1, 1}, nlohmann::json::object(), {{"countdown", 60}});
    ASSERT(adapter->cancel_task(submitted.id), "Queued task cancelled");
    ASSERT_EQ(adapter->get_task_status_sync(submitted.id).status, TaskStatus::REVOKED, "REVOKED");
    ASSERT(!adapter->cancel_task(submitted.id), "Second cancel refused");

    ASSERT_EQ(adapter->get_task_status_sync(generate_task_id()).status, TaskStatus::PENDING,
              "Unknown id reports PENDING");
}

TEST(test_pg_metrics_and_shutdown) {
    if (!postgres_configured()) return;

    auto adapter = make_task_adapter(postgres_config());
    adapter->register_task_handle(add_handler, "add");
    adapter->start_consumer();

    auto* concrete = dynamic_cast<PostgresTaskAdapter*>(adapter.get());
    ASSERT(concrete != nullptr, "Factory built a PostgresTaskAdapter");
    std::string identity = concrete->worker_identity();

    ASSERT(wait_until([&] {
        for (const auto& reply : adapter->health_check()) {
            if (reply.contains(identity)) return true;
        }
        return false;
    }, std::chrono::milliseconds(5000)), "Worker answers health checks");
    ASSERT(adapter->get_metrics().contains(identity), "Worker reports metrics");

    adapter->stop_consumer(std::chrono::seconds(5));
    ASSERT(!adapter->get_metrics().contains(identity), "Stopped worker unregistered");
}

TEST(test_pg_stop_right_after_start) {
    if (!postgres_configured()) return;

    auto adapter = make_task_adapter(postgres_config());
    adapter->register_task_handle(add_handler, "add");
    auto* concrete = dynamic_cast<PostgresTaskAdapter*>(adapter.get());
    ASSERT(concrete != nullptr, "Factory built a PostgresTaskAdapter");

    for (int i = 0; i < 3; ++i) {
        adapter->start_consumer();
        std::string identity = concrete->worker_identity();

        auto begin = std::chrono::steady_clock::now();
        ASSERT(adapter->stop_consumer(std::chrono::seconds(5)), "Stopped before coming up");
        ASSERT(std::chrono::steady_clock::now() - begin < std::chrono::seconds(5), "Within the timeout");
        ASSERT(wait_until([&] { return !adapter->get_metrics().contains(identity); }),
               "No worker left registered");
    }

    auto submitted = adapter->enqueue_task_sync("add", {1, 1});
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    ASSERT_EQ(adapter->get_task_status_sync(submitted.id).status, TaskStatus::PENDING, "Nothing consumes after stop");
    ASSERT(adapter->cancel_task(submitted.id), "Cleanup");
}

int main() {
    spdlog::set_level(spdlog::level::err);

    RUN_TEST(test_async_forms_unsupported);
    RUN_TEST(test_connection_failure_is_fatal);
    RUN_TEST(test_postgres_settings);
    RUN_TEST(test_pg_add_task_succeeds);
    RUN_TEST(test_pg_flaky_task_fails_after_retries);
    RUN_TEST(test_pg_cancel_and_unknown);
    RUN_TEST(test_pg_metrics_and_shutdown);
    RUN_TEST(test_pg_stop_right_after_start);

    return print_summary("postgres_adapter_test");
}
