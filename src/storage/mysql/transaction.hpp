#pragma once

#include "common/status.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace session {
namespace storage {

// 在一个租用连接上执行的事务, 未提交时析构自动回滚
class Transaction {
public:
    explicit Transaction(std::shared_ptr<ConnectionPool> pool);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    common::Status Begin();
    // 执行一条写语句, affected_rows 可为空
    common::Status Execute(const std::string& sql, std::uint64_t* affected_rows = nullptr);
    common::Status Commit();
    common::Status Rollback();

    bool Active() const noexcept { return active_; }
    MYSQL* Raw() const noexcept { return lease_.Raw(); }

private:
    std::shared_ptr<ConnectionPool> pool_;
    ConnectionPool::Lease lease_;
    bool active_ = false;
};

} // namespace storage
} // namespace session
