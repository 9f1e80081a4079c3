#include "storage/mysql/connection_pool.hpp"

#include "common/logger.hpp"

#include <chrono>

namespace sessionguard {
namespace storage {

ConnectionPool::ConnectionPool(Options options): options_(std::move(options)) {
    if (options_.pool_size == 0) {
        options_.pool_size = 1;
    }
}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)), broken_(other.broken_) {
    other.pool_ = nullptr;
    other.broken_ = false;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        broken_ = other.broken_;
        other.pool_ = nullptr;
        other.broken_ = false;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::Release() {
    if (pool_ && connection_) {
        pool_->Return(std::move(connection_), broken_);
    }
    pool_ = nullptr;
    broken_ = false;
}

common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        // 有空闲连接: 取出并确认仍然可用
        if (!idle_.empty()) {
            auto connection = std::move(idle_.front());
            idle_.pop_front();
            lock.unlock();
            if (mysql_ping(connection->Raw()) == 0) {
                return common::StatusOr<Lease>(Lease(this, std::move(connection)));
            }
            SESSIONGUARD_LOG_WARN("[ConnectionPool] dropping stale connection");
            connection.reset();
            lock.lock();
            --total_connections_;
            continue;
        }

        // 未达上限: 新建连接, 建连期间不持有锁
        if (total_connections_ < options_.pool_size) {
            ++total_connections_;
            lock.unlock();
            auto created = Connection::Create(options_);
            if (!created.IsOk()) {
                std::lock_guard<std::mutex> guard(mutex_);
                --total_connections_;
                cv_.notify_one();
                return created.GetStatus();
            }
            return common::StatusOr<Lease>(Lease(this, std::move(created.Value())));
        }

        // 已达上限: 等待归还
        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && total_connections_ >= options_.pool_size) {
            return common::Status::Unavailable("Acquire connection timeout");
        }
    }
}

std::size_t ConnectionPool::IdleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::size_t ConnectionPool::TotalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_connections_;
}

void ConnectionPool::Return(std::unique_ptr<Connection> connection, bool broken) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken) {
            --total_connections_;
        } else {
            idle_.push_back(std::move(connection));
        }
    }
    cv_.notify_one();
}

} // namespace storage
} // namespace sessionguard
