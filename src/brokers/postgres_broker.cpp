#include "taskproc/postgres_broker.hpp"
#include "taskproc/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace taskproc {

namespace {

// Advisory lock serializing schema creation across processes
constexpr int64_t SCHEMA_LOCK_ID = 737101;

const char* BROKER_SCHEMA_SQL = R"(
    CREATE SCHEMA IF NOT EXISTS taskproc;

    CREATE TABLE IF NOT EXISTS taskproc.messages (
        id TEXT PRIMARY KEY,
        name TEXT NOT NULL,
        queue TEXT NOT NULL,
        args JSONB NOT NULL DEFAULT '[]',
        kwargs JSONB NOT NULL DEFAULT '{}',
        options JSONB NOT NULL DEFAULT '{}',
        retries INTEGER NOT NULL DEFAULT 0,
        redeliveries INTEGER NOT NULL DEFAULT 0,
        revoked BOOLEAN NOT NULL DEFAULT FALSE,
        created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
        eta TIMESTAMPTZ NOT NULL DEFAULT NOW(),
        worker_id TEXT,
        lease_expires_at TIMESTAMPTZ
    );

    CREATE INDEX IF NOT EXISTS idx_messages_deliverable
        ON taskproc.messages (queue, eta, created_at)
        WHERE lease_expires_at IS NULL AND NOT revoked;

    CREATE INDEX IF NOT EXISTS idx_messages_lease
        ON taskproc.messages (worker_id, lease_expires_at)
        WHERE lease_expires_at IS NOT NULL;

    CREATE TABLE IF NOT EXISTS taskproc.control (
        seq BIGSERIAL PRIMARY KEY,
        command TEXT NOT NULL,
        destination TEXT,
        created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
    );

    CREATE TABLE IF NOT EXISTS taskproc.workers (
        worker_id TEXT PRIMARY KEY,
        stats JSONB NOT NULL DEFAULT '{}',
        started_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
        last_heartbeat TIMESTAMPTZ NOT NULL DEFAULT NOW()
    );
)";

const char* RESULT_SCHEMA_SQL = R"(
    CREATE SCHEMA IF NOT EXISTS taskproc;

    CREATE TABLE IF NOT EXISTS taskproc.results (
        task_id TEXT PRIMARY KEY,
        name TEXT,
        status TEXT NOT NULL,
        result JSONB,
        retries INTEGER NOT NULL DEFAULT 0,
        worker_id TEXT,
        created_at TIMESTAMPTZ,
        date_done TIMESTAMPTZ
    );
)";

std::string epoch_param(std::chrono::system_clock::time_point tp) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6) << to_epoch_seconds(tp);
    return ss.str();
}

std::string millis_param(std::chrono::milliseconds ms) {
    return std::to_string(ms.count());
}

// Runs a query and turns any failure into BrokerError
QueryResult run(DatabasePool& pool,
                const std::string& sql,
                const std::vector<std::string>& params,
                const char* context) {
    PGresult* raw = nullptr;
    try {
        raw = params.empty() ? pool.query(sql) : pool.query_params(sql, params);
    } catch (const std::exception& e) {
        throw BrokerError(std::string("[") + context + "] " + e.what());
    }

    QueryResult result(raw);
    if (!result.is_success()) {
        throw BrokerError(std::string("[") + context + "] " + result.error_message());
    }
    return result;
}

QueryResult run(DatabaseConnection& conn,
                const std::string& sql,
                const std::vector<std::string>& params,
                const char* context) {
    QueryResult result(conn.exec_params(sql, params));
    if (!result.is_success()) {
        throw BrokerError(std::string("[") + context + "] " +
                          (result.is_valid() ? result.error_message() : conn.last_error()));
    }
    return result;
}

// Checks out a connection for a multi-statement transaction
std::unique_ptr<ScopedConnection> checkout(DatabasePool& pool, const char* context) {
    try {
        return std::make_unique<ScopedConnection>(&pool);
    } catch (const std::exception& e) {
        throw BrokerError(std::string("[") + context + "] " + e.what());
    }
}

TaskMessage message_from_row(const QueryResult& result, int row) {
    TaskMessage msg;
    msg.id = result.get_value(row, "id");
    msg.name = result.get_value(row, "name");
    msg.queue = result.get_value(row, "queue");
    msg.args = nlohmann::json::parse(result.get_value(row, "args"));
    msg.kwargs = nlohmann::json::parse(result.get_value(row, "kwargs"));
    msg.options = nlohmann::json::parse(result.get_value(row, "options"));
    msg.retries = std::stoi(result.get_value(row, "retries"));
    msg.redeliveries = std::stoi(result.get_value(row, "redeliveries"));
    msg.revoked = result.get_value(row, "revoked") == "t";
    msg.created_at = from_epoch_seconds(std::stod(result.get_value(row, "created_epoch")));
    msg.eta = from_epoch_seconds(std::stod(result.get_value(row, "eta_epoch")));
    return msg;
}

} // namespace

BrokerSettings PostgresBroker::default_settings() {
    BrokerSettings settings;
    settings.visibility_timeout = std::chrono::milliseconds(60000);
    settings.polling_interval = std::chrono::milliseconds(200);
    settings.heartbeat_interval = std::chrono::milliseconds(2000);
    return settings;
}

PostgresBroker::PostgresBroker(const PostgresAdapterConfig& config)
    : config_(config),
      settings_(BrokerSettings::from_transport_options(config.transport_options, default_settings())) {
    const auto& options = config_.transport_options;
    // Execution slots + control loop + caller-side calls
    pool_size_ = options.value("pool_size", static_cast<size_t>(config_.worker_concurrency + 2));
    statement_timeout_ms_ = options.value("statement_timeout", 30000);
    lock_timeout_ms_ = options.value("lock_timeout", 10000);
    acquisition_timeout_ms_ = options.value("pool_acquisition_timeout", 10000);
}

PostgresBroker::~PostgresBroker() {
    close();
}

std::shared_ptr<DatabasePool> PostgresBroker::make_pool(const std::string& url) const {
    try {
        return std::make_shared<DatabasePool>(url, pool_size_, acquisition_timeout_ms_,
                                              statement_timeout_ms_, lock_timeout_ms_);
    } catch (const std::exception& e) {
        throw BrokerError(std::string("Cannot connect to PostgreSQL: ") + e.what());
    }
}

void PostgresBroker::connect() {
    auto broker = make_pool(config_.broker_url);
    auto results = (config_.backend_url.empty() || config_.backend_url == config_.broker_url)
        ? broker
        : make_pool(config_.backend_url);

    {
        std::lock_guard<std::mutex> lock(pools_mutex_);
        broker_pool_ = broker;
        result_pool_ = results;
    }

    initialize_schema();
    spdlog::info("[PostgresBroker] Connected (pool_size={}, visibility_timeout={}ms, separate_result_store={})",
                 pool_size_, settings_.visibility_timeout.count(), broker != results);
}

void PostgresBroker::close() {
    std::lock_guard<std::mutex> lock(pools_mutex_);
    if (broker_pool_) {
        spdlog::info("[PostgresBroker] Closing connection pools");
    }
    broker_pool_.reset();
    result_pool_.reset();
}

std::shared_ptr<DatabasePool> PostgresBroker::broker_pool() const {
    std::lock_guard<std::mutex> lock(pools_mutex_);
    if (!broker_pool_) {
        throw BrokerError("PostgreSQL broker is not connected");
    }
    return broker_pool_;
}

std::shared_ptr<DatabasePool> PostgresBroker::result_pool() const {
    std::lock_guard<std::mutex> lock(pools_mutex_);
    if (!result_pool_) {
        throw BrokerError("PostgreSQL result store is not connected");
    }
    return result_pool_;
}

void PostgresBroker::initialize_schema() {
    auto create = [](DatabasePool& pool, const char* ddl, const char* context) {
        auto scoped = checkout(pool, context);
        DatabaseConnection& conn = **scoped;
        if (!conn.begin_transaction()) {
            throw BrokerError(std::string("[") + context + "] BEGIN failed: " + conn.last_error());
        }
        try {
            run(conn, "SELECT pg_advisory_xact_lock($1::bigint)", {std::to_string(SCHEMA_LOCK_ID)}, context);
            QueryResult ddl_result(conn.exec(ddl));
            if (!ddl_result.is_success()) {
                throw BrokerError(std::string("[") + context + "] " + ddl_result.error_message());
            }
            if (!conn.commit_transaction()) {
                throw BrokerError(std::string("[") + context + "] COMMIT failed: " + conn.last_error());
            }
        } catch (...) {
            conn.rollback_transaction();
            throw;
        }
    };

    auto broker = broker_pool();
    auto results = result_pool();
    create(*broker, BROKER_SCHEMA_SQL, "broker schema");
    create(*results, RESULT_SCHEMA_SQL, "result schema");
    spdlog::debug("[PostgresBroker] Schema ready");
}

void PostgresBroker::store_state(const TaskState& state) {
    // Terminal rows are only overwritten by another terminal write
    static const std::string sql = R"(
        INSERT INTO taskproc.results (task_id, name, status, result, retries, worker_id, created_at, date_done)
        VALUES ($1, $2, $3::text, NULLIF($4, '')::jsonb, $5::int, NULLIF($6, ''),
                CASE WHEN $7 = '' THEN NULL ELSE to_timestamp($7::float8) END,
                CASE WHEN $3::text IN ('SUCCESS', 'FAILURE', 'REVOKED') THEN NOW() END)
        ON CONFLICT (task_id) DO UPDATE SET
            name = COALESCE(EXCLUDED.name, taskproc.results.name),
            status = EXCLUDED.status,
            result = EXCLUDED.result,
            retries = EXCLUDED.retries,
            worker_id = COALESCE(EXCLUDED.worker_id, taskproc.results.worker_id),
            created_at = COALESCE(EXCLUDED.created_at, taskproc.results.created_at),
            date_done = EXCLUDED.date_done
        WHERE EXCLUDED.status IN ('SUCCESS', 'FAILURE', 'REVOKED')
           OR taskproc.results.status NOT IN ('SUCCESS', 'FAILURE', 'REVOKED')
    )";

    run(*result_pool(), sql, {
        state.task_id,
        state.name,
        to_string(state.status),
        state.result ? state.result->dump() : "",
        std::to_string(state.retries),
        state.worker_id,
        state.created_at ? epoch_param(*state.created_at) : ""
    }, "store state");
}

void PostgresBroker::publish(const TaskMessage& message) {
    // A reused id may restart a finished task but never resets a live one
    static const std::string pending_sql = R"(
        INSERT INTO taskproc.results (task_id, name, status, created_at)
        VALUES ($1, $2, 'PENDING', to_timestamp($3::float8))
        ON CONFLICT (task_id) DO UPDATE SET
            name = EXCLUDED.name,
            status = 'PENDING',
            result = NULL,
            retries = 0,
            worker_id = NULL,
            created_at = EXCLUDED.created_at,
            date_done = NULL
        WHERE taskproc.results.status IN ('SUCCESS', 'FAILURE', 'REVOKED')
    )";

    static const std::string message_sql = R"(
        INSERT INTO taskproc.messages (id, name, queue, args, kwargs, options, retries, created_at, eta)
        VALUES ($1, $2, $3, $4::jsonb, $5::jsonb, $6::jsonb, $7::int,
                to_timestamp($8::float8), to_timestamp($9::float8))
        ON CONFLICT (id) DO NOTHING
        RETURNING id
    )";

    run(*result_pool(), pending_sql, {message.id, message.name, epoch_param(message.created_at)}, "publish state");

    auto inserted = run(*broker_pool(), message_sql, {
        message.id,
        message.name,
        message.queue,
        message.args.dump(),
        message.kwargs.dump(),
        message.options.dump(),
        std::to_string(message.retries),
        epoch_param(message.created_at),
        epoch_param(message.eta)
    }, "publish");

    if (inserted.num_rows() == 0) {
        throw BrokerError("Task id already queued: " + message.id);
    }
}

std::optional<TaskMessage> PostgresBroker::reserve(const std::vector<std::string>& queues,
                                                   const std::string& worker_id) {
    static const std::string sql = R"(
        UPDATE taskproc.messages m
        SET worker_id = $2,
            lease_expires_at = NOW() + ($3::bigint * INTERVAL '1 millisecond')
        WHERE m.id = (
            SELECT id FROM taskproc.messages
            WHERE queue IN (SELECT jsonb_array_elements_text($1::jsonb))
              AND lease_expires_at IS NULL
              AND NOT revoked
              AND eta <= NOW()
            ORDER BY eta, created_at
            LIMIT 1
            FOR UPDATE SKIP LOCKED
        )
        RETURNING m.id, m.name, m.queue, m.args, m.kwargs, m.options, m.retries, m.redeliveries, m.revoked,
                  EXTRACT(EPOCH FROM m.created_at) AS created_epoch,
                  EXTRACT(EPOCH FROM m.eta) AS eta_epoch
    )";

    auto result = run(*broker_pool(), sql, {
        nlohmann::json(queues).dump(),
        worker_id,
        millis_param(settings_.visibility_timeout)
    }, "reserve");

    if (result.num_rows() == 0) {
        return std::nullopt;
    }

    TaskMessage msg = message_from_row(result, 0);

    TaskState state;
    state.task_id = msg.id;
    state.name = msg.name;
    state.status = TaskStatus::STARTED;
    state.retries = msg.retries;
    state.worker_id = worker_id;
    state.created_at = msg.created_at;
    store_state(state);

    return msg;
}

void PostgresBroker::complete(const TaskMessage& message,
                              TaskStatus status,
                              const nlohmann::json& result,
                              const std::string& worker_id) {
    TaskState state;
    state.task_id = message.id;
    state.name = message.name;
    state.status = status;
    state.result = result;
    state.retries = message.retries;
    state.worker_id = worker_id;
    state.created_at = message.created_at;
    store_state(state);

    auto acked = run(*broker_pool(),
                     "DELETE FROM taskproc.messages WHERE id = $1 AND worker_id = $2",
                     {message.id, worker_id}, "ack");
    if (acked.affected_rows() == 0) {
        spdlog::warn("[PostgresBroker] Task {} completed by {} after its lease was lost", message.id, worker_id);
    }
}

void PostgresBroker::retry(const TaskMessage& message,
                           std::chrono::system_clock::time_point eta,
                           const nlohmann::json& error,
                           const std::string& worker_id) {
    TaskState state;
    state.task_id = message.id;
    state.name = message.name;
    state.status = TaskStatus::RETRY;
    state.retries = message.retries + 1;
    state.worker_id = worker_id;
    state.created_at = message.created_at;
    store_state(state);

    auto requeued = run(*broker_pool(), R"(
        UPDATE taskproc.messages
        SET retries = $3::int,
            eta = to_timestamp($4::float8),
            worker_id = NULL,
            lease_expires_at = NULL
        WHERE id = $1 AND worker_id = $2
    )", {message.id, worker_id, std::to_string(message.retries + 1), epoch_param(eta)}, "retry");

    if (requeued.affected_rows() == 0) {
        spdlog::warn("[PostgresBroker] Task {} retry skipped, lease no longer held by {}", message.id, worker_id);
        return;
    }
    spdlog::debug("[PostgresBroker] Task {} scheduled for retry {}: {}", message.id, message.retries + 1, error.dump());
}

int PostgresBroker::extend_leases(const std::string& worker_id) {
    auto result = run(*broker_pool(), R"(
        UPDATE taskproc.messages
        SET lease_expires_at = NOW() + ($2::bigint * INTERVAL '1 millisecond')
        WHERE worker_id = $1 AND lease_expires_at IS NOT NULL
    )", {worker_id, millis_param(settings_.visibility_timeout)}, "extend leases");
    return result.affected_rows();
}

int PostgresBroker::reclaim_expired_leases() {
    auto pool = broker_pool();

    // Revoked while running and then abandoned: never run again
    auto dropped = run(*pool, R"(
        DELETE FROM taskproc.messages
        WHERE revoked AND lease_expires_at < NOW()
        RETURNING id, name, retries, EXTRACT(EPOCH FROM created_at) AS created_epoch
    )", {}, "reclaim revoked");

    for (int row = 0; row < dropped.num_rows(); ++row) {
        TaskState state;
        state.task_id = dropped.get_value(row, "id");
        state.name = dropped.get_value(row, "name");
        state.status = TaskStatus::REVOKED;
        state.result = make_error_result("TaskRevokedError", "revoked before redelivery");
        state.retries = std::stoi(dropped.get_value(row, "retries"));
        state.created_at = from_epoch_seconds(std::stod(dropped.get_value(row, "created_epoch")));
        store_state(state);
    }

    auto requeued = run(*pool, R"(
        UPDATE taskproc.messages m
        SET worker_id = NULL,
            lease_expires_at = NULL,
            redeliveries = m.redeliveries + 1
        WHERE m.id IN (
            SELECT id FROM taskproc.messages
            WHERE lease_expires_at < NOW()
            FOR UPDATE SKIP LOCKED
        )
        RETURNING m.id, m.name, m.retries, EXTRACT(EPOCH FROM m.created_at) AS created_epoch
    )", {}, "reclaim");

    for (int row = 0; row < requeued.num_rows(); ++row) {
        TaskState state;
        state.task_id = requeued.get_value(row, "id");
        state.name = requeued.get_value(row, "name");
        state.status = TaskStatus::PENDING;
        state.retries = std::stoi(requeued.get_value(row, "retries"));
        state.created_at = from_epoch_seconds(std::stod(requeued.get_value(row, "created_epoch")));
        store_state(state);
        spdlog::warn("[PostgresBroker] Lease of task {} expired, requeued", state.task_id);
    }

    prune();
    return requeued.num_rows();
}

void PostgresBroker::prune() {
    int64_t now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    int64_t last = last_prune_ms_.load();
    if (now_ms - last < PRUNE_INTERVAL_MS || !last_prune_ms_.compare_exchange_strong(last, now_ms)) {
        return;
    }

    auto pool = broker_pool();
    auto control = run(*pool, "DELETE FROM taskproc.control WHERE created_at < NOW() - INTERVAL '1 hour'", {}, "prune control");
    auto workers = run(*pool, "DELETE FROM taskproc.workers WHERE last_heartbeat < NOW() - INTERVAL '1 hour'", {}, "prune workers");
    if (control.affected_rows() > 0 || workers.affected_rows() > 0) {
        spdlog::debug("[PostgresBroker] Pruned {} control messages, {} dead workers",
                      control.affected_rows(), workers.affected_rows());
    }
}

bool PostgresBroker::revoke(const std::string& task_id) {
    auto pool = broker_pool();
    bool drop_message = false;
    std::string name;
    int retries = 0;

    {
        auto scoped = checkout(*pool, "revoke");
        DatabaseConnection& conn = **scoped;
        if (!conn.begin_transaction()) {
            throw BrokerError("[revoke] BEGIN failed: " + conn.last_error());
        }

        try {
            // Row lock excludes a concurrent reserve() of the same message
            auto row = run(conn, R"(
                SELECT lease_expires_at IS NOT NULL AS leased, name, retries
                FROM taskproc.messages WHERE id = $1 FOR UPDATE
            )", {task_id}, "revoke");

            if (row.num_rows() == 0) {
                conn.rollback_transaction();
                return false;
            }

            name = row.get_value(0, "name");
            retries = std::stoi(row.get_value(0, "retries"));
            if (row.get_value(0, "leased") == "t") {
                run(conn, "UPDATE taskproc.messages SET revoked = TRUE WHERE id = $1", {task_id}, "revoke running");
            } else {
                run(conn, "DELETE FROM taskproc.messages WHERE id = $1", {task_id}, "revoke queued");
                drop_message = true;
            }

            if (!conn.commit_transaction()) {
                throw BrokerError("[revoke] COMMIT failed: " + conn.last_error());
            }
        } catch (...) {
            conn.rollback_transaction();
            throw;
        }
    }

    if (drop_message) {
        TaskState state;
        state.task_id = task_id;
        state.name = name;
        state.status = TaskStatus::REVOKED;
        state.result = make_error_result("TaskRevokedError", "revoked");
        state.retries = retries;
        store_state(state);
    }
    return true;
}

bool PostgresBroker::is_revoked(const std::string& task_id) {
    auto result = run(*broker_pool(), "SELECT revoked FROM taskproc.messages WHERE id = $1", {task_id}, "is revoked");
    return result.num_rows() > 0 && result.get_value(0, 0) == "t";
}

std::optional<TaskState> PostgresBroker::get_state(const std::string& task_id) {
    auto result = run(*result_pool(), R"(
        SELECT task_id, COALESCE(name, '') AS name, status, result::text AS result, retries,
               COALESCE(worker_id, '') AS worker_id,
               EXTRACT(EPOCH FROM created_at) AS created_epoch,
               EXTRACT(EPOCH FROM date_done) AS done_epoch
        FROM taskproc.results WHERE task_id = $1
    )", {task_id}, "get state");

    if (result.num_rows() == 0) {
        return std::nullopt;
    }

    TaskState state;
    state.task_id = result.get_value(0, "task_id");
    state.name = result.get_value(0, "name");
    state.status = status_from_string(result.get_value(0, "status"));
    state.retries = std::stoi(result.get_value(0, "retries"));
    state.worker_id = result.get_value(0, "worker_id");
    if (!result.is_null(0, "result")) {
        state.result = nlohmann::json::parse(result.get_value(0, "result"));
    }
    if (!result.is_null(0, "created_epoch")) {
        state.created_at = from_epoch_seconds(std::stod(result.get_value(0, "created_epoch")));
    }
    if (!result.is_null(0, "done_epoch")) {
        state.date_done = from_epoch_seconds(std::stod(result.get_value(0, "done_epoch")));
    }
    return state;
}

void PostgresBroker::send_control(const std::string& command, const std::string& destination) {
    run(*broker_pool(),
        "INSERT INTO taskproc.control (command, destination) VALUES ($1, NULLIF($2, ''))",
        {command, destination}, "send control");
}

std::vector<ControlMessage> PostgresBroker::poll_control(const std::string& worker_id, int64_t after_sequence) {
    auto result = run(*broker_pool(), R"(
        SELECT seq, command, COALESCE(destination, '') AS destination,
               EXTRACT(EPOCH FROM created_at) AS created_epoch
        FROM taskproc.control
        WHERE seq > $1::bigint AND (destination IS NULL OR destination = $2)
        ORDER BY seq
    )", {std::to_string(after_sequence), worker_id}, "poll control");

    std::vector<ControlMessage> messages;
    messages.reserve(result.num_rows());
    for (int row = 0; row < result.num_rows(); ++row) {
        ControlMessage msg;
        msg.sequence = std::stoll(result.get_value(row, "seq"));
        msg.command = result.get_value(row, "command");
        msg.destination = result.get_value(row, "destination");
        msg.created_at = from_epoch_seconds(std::stod(result.get_value(row, "created_epoch")));
        messages.push_back(msg);
    }
    return messages;
}

int64_t PostgresBroker::latest_control_sequence() {
    auto result = run(*broker_pool(), "SELECT COALESCE(MAX(seq), 0) FROM taskproc.control", {}, "control sequence");
    return std::stoll(result.get_value(0, 0));
}

void PostgresBroker::heartbeat(const std::string& worker_id, const nlohmann::json& stats) {
    run(*broker_pool(), R"(
        INSERT INTO taskproc.workers (worker_id, stats, last_heartbeat)
        VALUES ($1, $2::jsonb, NOW())
        ON CONFLICT (worker_id) DO UPDATE SET stats = EXCLUDED.stats, last_heartbeat = NOW()
    )", {worker_id, stats.dump()}, "heartbeat");
}

void PostgresBroker::unregister_worker(const std::string& worker_id) {
    run(*broker_pool(), "DELETE FROM taskproc.workers WHERE worker_id = $1", {worker_id}, "unregister worker");
}

std::vector<WorkerInfo> PostgresBroker::live_workers() {
    auto result = run(*broker_pool(), R"(
        SELECT worker_id, stats::text AS stats, EXTRACT(EPOCH FROM last_heartbeat) AS heartbeat_epoch
        FROM taskproc.workers
        WHERE last_heartbeat > NOW() - ($1::bigint * INTERVAL '1 millisecond')
        ORDER BY worker_id
    )", {millis_param(settings_.liveness_threshold())}, "live workers");

    std::vector<WorkerInfo> workers;
    workers.reserve(result.num_rows());
    for (int row = 0; row < result.num_rows(); ++row) {
        WorkerInfo info;
        info.worker_id = result.get_value(row, "worker_id");
        info.stats = nlohmann::json::parse(result.get_value(row, "stats"));
        info.last_heartbeat = from_epoch_seconds(std::stod(result.get_value(row, "heartbeat_epoch")));
        workers.push_back(info);
    }
    return workers;
}

} // namespace taskproc
