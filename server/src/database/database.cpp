#include "chronicle/database.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

namespace chronicle {

// DatabaseConnection Implementation
DatabaseConnection::DatabaseConnection(const std::string& connection_string,
                                       int statement_timeout_ms,
                                       int lock_timeout_ms,
                                       int idle_in_transaction_timeout_ms)
    : conn_(nullptr), in_use_(false) {
    conn_ = PQconnectdb(connection_string.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("Failed to connect to database: " + error);
    }

    PQsetClientEncoding(conn_, "UTF8");

    // Session timeouts via SET so they also work behind PgBouncer
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
        throw std::runtime_error("Failed to set timeout parameters: " + error);
    }
    PQclear(result);
}

DatabaseConnection::~DatabaseConnection() {
    if (conn_) {
        PQfinish(conn_);
    }
}

DatabaseConnection::DatabaseConnection(DatabaseConnection&& other) noexcept
    : conn_(other.conn_), in_use_(other.in_use_) {
    other.conn_ = nullptr;
    other.in_use_ = false;
}

DatabaseConnection& DatabaseConnection::operator=(DatabaseConnection&& other) noexcept {
    if (this != &other) {
        if (conn_) PQfinish(conn_);
        conn_ = other.conn_;
        in_use_ = other.in_use_;
        other.conn_ = nullptr;
        other.in_use_ = false;
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

bool DatabaseConnection::begin_transaction() {
    auto result = QueryResult(exec("BEGIN"));
    return result.is_success();
}

bool DatabaseConnection::commit_transaction() {
    auto result = QueryResult(exec("COMMIT"));
    return result.is_success();
}

bool DatabaseConnection::rollback_transaction() {
    auto result = QueryResult(exec("ROLLBACK"));
    return result.is_success();
}

// DatabasePool Implementation
DatabasePool::DatabasePool(const DatabaseConfig& config)
    : connection_string_(config.connection_string()),
      pool_size_(static_cast<size_t>(config.pool_size > 0 ? config.pool_size : 1)),
      current_size_(0),
      acquisition_timeout_ms_(config.pool_acquisition_timeout),
      statement_timeout_ms_(config.statement_timeout),
      lock_timeout_ms_(config.lock_timeout),
      idle_in_transaction_timeout_ms_(config.idle_timeout) {

    for (size_t i = 0; i < pool_size_; ++i) {
        try {
            auto conn = create_connection();
            if (conn && conn->is_valid()) {
                available_connections_.push(std::move(conn));
                ++current_size_;
            }
        } catch (const std::exception& e) {
            spdlog::error("Failed to create initial database connection: {}", e.what());
        }
    }

    if (current_size_ == 0) {
        throw std::runtime_error("Failed to create any database connections");
    }

    spdlog::info("Database pool initialized with {}/{} connections (acquisition timeout: {}ms, statement timeout: {}ms)",
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
        // Pool exhausted or database was down: try a fresh connection before failing
        spdlog::warn("Pool timeout - attempting to create new connection (pool: {}/{})", current_size_, pool_size_);
        lock.unlock();
        std::unique_ptr<DatabaseConnection> new_conn;
        try {
            new_conn = create_connection();
        } catch (const std::exception& e) {
            spdlog::error("Failed to create connection on timeout: {}", e.what());
            throw std::runtime_error("Database connection pool timeout (waited " +
                                     std::to_string(acquisition_timeout_ms_) + "ms)");
        }
        lock.lock();
        ++current_size_;
        new_conn->set_in_use(true);
        spdlog::info("Created new connection during timeout, pool now {}/{}", current_size_, pool_size_);
        return new_conn;
    }

    auto conn = std::move(available_connections_.front());
    available_connections_.pop();

    if (!conn->is_valid()) {
        spdlog::warn("Invalid connection found in pool, replacing it");
        --current_size_;
        lock.unlock();
        std::unique_ptr<DatabaseConnection> new_conn;
        try {
            new_conn = create_connection();
        } catch (const std::exception& e) {
            spdlog::error("Exception creating replacement connection: {}", e.what());
            throw;
        }
        lock.lock();
        ++current_size_;
        new_conn->set_in_use(true);
        return new_conn;
    }

    conn->set_in_use(true);
    return conn;
}

void DatabasePool::return_connection(std::unique_ptr<DatabaseConnection> conn) {
    if (!conn) return;

    conn->set_in_use(false);

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->is_valid()) {
        available_connections_.push(std::move(conn));
        condition_.notify_one();
        return;
    }

    spdlog::warn("Returned invalid connection to pool, attempting to create replacement");
    --current_size_;
    try {
        auto new_conn = create_connection();
        available_connections_.push(std::move(new_conn));
        ++current_size_;
        spdlog::info("Successfully replaced invalid connection, pool at {}/{}", current_size_, pool_size_);
    } catch (const std::exception& e) {
        spdlog::error("Exception creating replacement connection: {} - pool size now {}/{}",
                      e.what(), current_size_, pool_size_);
    }
    condition_.notify_one();
}

size_t DatabasePool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_size_;
}

size_t DatabasePool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_connections_.size();
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

// QueryResult Implementation
void QueryResult::check(const std::string& context) const {
    if (!is_success()) {
        throw std::runtime_error(context + ": " + error_message());
    }
}

} // namespace chronicle
