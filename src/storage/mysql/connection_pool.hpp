#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/connection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace session {
namespace storage {

// 有上限的 MySQL 连接池
class ConnectionPool {
public:
    explicit ConnectionPool(Options options);

    // 连接租约, 析构时归还连接
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Connection* operator->() noexcept { return connection_.get(); }
        Connection& operator*() noexcept { return *connection_; }
        MYSQL* Raw() const noexcept { return connection_ ? connection_->Raw() : nullptr; }
        explicit operator bool() const noexcept { return connection_ != nullptr; }

    private:
        void Release() noexcept;

        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<Connection> connection_;
    };

    // 优先复用空闲连接, 未达上限时新建, 否则等待 acquire_timeout
    common::StatusOr<Lease> Acquire();

    const Options& GetOptions() const noexcept { return options_; }

private:
    void Return(std::unique_ptr<Connection> connection);

    Options options_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<Connection>> idle_;
    std::size_t total_connections_ = 0;
};

} // namespace storage
} // namespace session
