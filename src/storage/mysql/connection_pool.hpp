#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/connection.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace sessionguard {
namespace storage {

// 固定上限的连接池, 连接按需创建
class ConnectionPool {
public:
    explicit ConnectionPool(Options options);

    // 连接租约, 析构时自动归还
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Connection* operator->() noexcept { return connection_.get(); }
        Connection& operator*() noexcept { return *connection_; }
        MYSQL* Raw() const noexcept { return connection_ ? connection_->Raw() : nullptr; }
        explicit operator bool() const noexcept { return connection_ != nullptr; }

        // 连接已损坏, 归还时直接丢弃
        void Discard() noexcept { broken_ = true; }
    private:
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        void Release();

        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<Connection> connection_;
        bool broken_ = false;
    };

    // 获取连接, 池满时最多等待 acquire_timeout, 超时返回 Unavailable
    common::StatusOr<Lease> Acquire();

    // 空闲连接数 / 已创建连接总数
    std::size_t IdleCount() const;
    std::size_t TotalCount() const;

private:
    void Return(std::unique_ptr<Connection> connection, bool broken);

    Options options_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<Connection>> idle_;
    std::size_t total_connections_ = 0;
};

} // namespace storage
} // namespace sessionguard
