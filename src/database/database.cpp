#include "taskproc/database.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

namespace taskproc {

// DatabaseConnection Implementation
DatabaseConnection::DatabaseConnection(const std::string& connection_string,
                                       int statement_timeout_ms,
                                       int lock_timeout_ms,
                                       int idle_in_transaction_timeout_ms)
    : conn_(nullptr) {
    conn_ = PQconnectdb(connection_string.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("Failed to connect to database: " + error);
    }

    PQsetClientEncoding(conn_, "UTF8");

    // Timeouts go through SET so they also apply behind PgBouncer
    std::string set_timeouts =
        "SET statement_timeout = " + std::to_string(statement_timeout_ms) + "; " +
        "SET lock_timeout = " + std::to_string(lock_timeout_ms) + "; " +
        "SET idle_in_transaction_session_timeout = " + std::to_string(idle_in_transaction_timeout_ms) + ";";

    PGresult* result = PQexec(conn_, set_timeouts.c_str());
    if (PQresultStatus(result) != PGRES_COMMAND_OK) {
        std::string error = PQerrorMessage(conn_);
        PQclear(result);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("Failed to set session timeouts: " + error);
    }
    PQclear(result);
}

DatabaseConnection::~DatabaseConnection() {
    if (conn_) {
        PQfinish(conn_);
    }
}

DatabaseConnection::DatabaseConnection(DatabaseConnection&& other) noexcept
    : conn_(other.conn_) {
    other.conn_ = nullptr;
}

DatabaseConnection& DatabaseConnection::operator=(DatabaseConnection&& other) noexcept {
    if (this != &other) {
        if (conn_) PQfinish(conn_);
        conn_ = other.conn_;
        other.conn_ = nullptr;
    }
    return *this;
}

bool DatabaseConnection::is_valid() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

PGresult* DatabaseConnection::exec(const std::string& query) {
    if (!is_valid()) return nullptr;
    return PQexec(conn_, query.c_str());
}

PGresult* DatabaseConnection::exec_params(const std::string& query, const std::vector<std::string>& params) {
    if (!is_valid()) return nullptr;

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& param : params) {
        param_values.push_back(param.c_str());
    }

    return PQexecParams(conn_, query.c_str(), static_cast<int>(params.size()),
                        nullptr, param_values.data(), nullptr, nullptr, 0);
}

std::string DatabaseConnection::last_error() const {
    return conn_ ? PQerrorMessage(conn_) : "connection closed";
}

bool DatabaseConnection::begin_transaction() {
    return QueryResult(exec("BEGIN")).is_success();
}

bool DatabaseConnection::commit_transaction() {
    return QueryResult(exec("COMMIT")).is_success();
}

bool DatabaseConnection::rollback_transaction() {
    return QueryResult(exec("ROLLBACK")).is_success();
}

// DatabasePool Implementation
DatabasePool::DatabasePool(const std::string& connection_string,
                           size_t pool_size,
                           int acquisition_timeout_ms,
                           int statement_timeout_ms,
                           int lock_timeout_ms,
                           int idle_in_transaction_timeout_ms)
    : connection_string_(connection_string),
      pool_size_(pool_size),
      current_size_(0),
      acquisition_timeout_ms_(acquisition_timeout_ms),
      statement_timeout_ms_(statement_timeout_ms),
      lock_timeout_ms_(lock_timeout_ms),
      idle_in_transaction_timeout_ms_(idle_in_transaction_timeout_ms) {

    std::string last_error;
    for (size_t i = 0; i < pool_size_; ++i) {
        try {
            auto conn = create_connection();
            if (conn && conn->is_valid()) {
                available_connections_.push(std::move(conn));
                ++current_size_;
            }
        } catch (const std::exception& e) {
            last_error = e.what();
            spdlog::error("[DatabasePool] Failed to create initial connection: {}", e.what());
            // The first failure usually means the server is unreachable; don't retry pool_size times
            if (current_size_ == 0) break;
        }
    }

    if (current_size_ == 0) {
        throw std::runtime_error("Failed to create any database connections: " + last_error);
    }

    spdlog::info("[DatabasePool] Initialized with {}/{} connections (acquisition timeout: {}ms, statement timeout: {}ms)",
                 current_size_, pool_size_, acquisition_timeout_ms_, statement_timeout_ms_);
}

DatabasePool::~DatabasePool() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!available_connections_.empty()) {
        available_connections_.pop();
    }
}

std::unique_ptr<DatabaseConnection> DatabasePool::create_connection() {
    return std::make_unique<DatabaseConnection>(connection_string_,
                                                statement_timeout_ms_,
                                                lock_timeout_ms_,
                                                idle_in_transaction_timeout_ms_);
}

std::unique_ptr<DatabaseConnection> DatabasePool::get_connection() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!condition_.wait_for(lock, std::chrono::milliseconds(acquisition_timeout_ms_),
                             [this] { return !available_connections_.empty(); })) {
        // Pool exhausted or every connection was dropped: try a fresh one so we recover
        // once the database is back
        spdlog::warn("[DatabasePool] Acquisition timeout, creating a new connection (pool: {}/{})",
                     current_size_, pool_size_);
        lock.unlock();
        std::unique_ptr<DatabaseConnection> new_conn;
        try {
            new_conn = create_connection();
        } catch (const std::exception& e) {
            spdlog::error("[DatabasePool] Failed to create connection on timeout: {}", e.what());
            throw std::runtime_error("Database connection pool timeout (waited " +
                                     std::to_string(acquisition_timeout_ms_) + "ms)");
        }
        lock.lock();
        ++current_size_;
        return new_conn;
    }

    auto conn = std::move(available_connections_.front());
    available_connections_.pop();

    if (!conn->is_valid()) {
        spdlog::warn("[DatabasePool] Dropping broken connection and replacing it");
        --current_size_;
        lock.unlock();
        auto new_conn = create_connection();
        lock.lock();
        ++current_size_;
        return new_conn;
    }

    return conn;
}

void DatabasePool::return_connection(std::unique_ptr<DatabaseConnection> conn) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->is_valid()) {
        available_connections_.push(std::move(conn));
        condition_.notify_one();
        return;
    }

    spdlog::warn("[DatabasePool] Connection returned broken, replacing it");
    --current_size_;
    try {
        auto new_conn = create_connection();
        available_connections_.push(std::move(new_conn));
        ++current_size_;
        spdlog::info("[DatabasePool] Replaced broken connection, pool at {}/{}", current_size_, pool_size_);
    } catch (const std::exception& e) {
        spdlog::error("[DatabasePool] Replacement failed: {} - pool now {}/{}", e.what(), current_size_, pool_size_);
    }
    condition_.notify_one();
}

PGresult* DatabasePool::query(const std::string& sql) {
    ScopedConnection conn(this);
    return conn->exec(sql);
}

PGresult* DatabasePool::query_params(const std::string& sql, const std::vector<std::string>& params) {
    ScopedConnection conn(this);
    return conn->exec_params(sql, params);
}

// ScopedConnection Implementation
ScopedConnection::ScopedConnection(DatabasePool* pool) : pool_(pool) {
    if (!pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    conn_ = pool_->get_connection();
}

ScopedConnection::~ScopedConnection() {
    if (pool_ && conn_) {
        pool_->return_connection(std::move(conn_));
    }
}

} // namespace taskproc
