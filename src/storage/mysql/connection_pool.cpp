#include "storage/mysql/connection_pool.hpp"

#include "common/logger.hpp"

namespace session {
namespace storage {

ConnectionPool::ConnectionPool(Options options) : options_(std::move(options)) {
    if (options_.pool_size == 0) {
        options_.pool_size = 1;
    }
}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::Release() noexcept {
    if (pool_ != nullptr && connection_) {
        pool_->Return(std::move(connection_));
    }
    pool_ = nullptr;
}

common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (idle_.empty() && total_connections_ >= options_.pool_size) {
        // 连接已用满, 等待归还
        if (!cv_.wait_for(lock, options_.acquire_timeout, [this] {
                return !idle_.empty() || total_connections_ < options_.pool_size;
            })) {
            return common::Status::Unavailable("timed out waiting for a mysql connection");
        }
    }

    if (!idle_.empty()) {
        auto connection = std::move(idle_.front());
        idle_.pop();
        return common::StatusOr<Lease>(Lease(this, std::move(connection)));
    }

    // 先占位再在锁外建连
    ++total_connections_;
    lock.unlock();
    auto created = Connection::Create(options_);
    if (!created.IsOk()) {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            --total_connections_;
        }
        cv_.notify_one();
        SESSION_LOG_WARN("[MySQL] failed to open connection: {}", created.GetStatus().Message());
        return created.GetStatus();
    }
    return common::StatusOr<Lease>(Lease(this, std::move(created.Value())));
}

void ConnectionPool::Return(std::unique_ptr<Connection> connection) {
    // 断开的连接直接丢弃
    const bool alive = connection->Alive();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (alive) {
            idle_.push(std::move(connection));
        } else {
            --total_connections_;
        }
    }
    cv_.notify_one();
}

} // namespace storage
} // namespace session
