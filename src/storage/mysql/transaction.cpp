#include "storage/mysql/transaction.hpp"

#include "common/logger.hpp"

namespace session {
namespace storage {

Transaction::Transaction(std::shared_ptr<ConnectionPool> pool) : pool_(std::move(pool)) {}

Transaction::~Transaction() {
    if (active_) {
        auto status = Rollback();
        if (!status.IsOk()) {
            SESSION_LOG_WARN("[MySQL] rollback on destruction failed: {}", status.Message());
        }
    }
}

common::Status Transaction::Begin() {
    if (active_) {
        return common::Status::InvalidArgument("transaction already started");
    }
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    lease_ = std::move(lease.Value());
    if (mysql_autocommit(lease_.Raw(), 0) != 0) {
        return MySqlError("mysql_autocommit(0) failed", lease_.Raw());
    }
    active_ = true;
    return common::Status::OK();
}

common::Status Transaction::Execute(const std::string& sql, std::uint64_t* affected_rows) {
    if (!active_) {
        return common::Status::InvalidArgument("transaction is not active");
    }
    MYSQL* conn = lease_.Raw();
    if (mysql_real_query(conn, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
        return MySqlError("mysql_real_query failed", conn);
    }
    if (affected_rows != nullptr) {
        *affected_rows = static_cast<std::uint64_t>(mysql_affected_rows(conn));
    }
    return common::Status::OK();
}

common::Status Transaction::Commit() {
    if (!active_) {
        return common::Status::OK();
    }
    MYSQL* conn = lease_.Raw();
    if (mysql_commit(conn) != 0) {
        return MySqlError("mysql_commit failed", conn);
    }
    mysql_autocommit(conn, 1);
    active_ = false;
    lease_ = ConnectionPool::Lease();
    return common::Status::OK();
}

common::Status Transaction::Rollback() {
    if (!active_) {
        return common::Status::OK();
    }
    MYSQL* conn = lease_.Raw();
    active_ = false;
    common::Status status = common::Status::OK();
    if (mysql_rollback(conn) != 0) {
        status = MySqlError("mysql_rollback failed", conn);
    }
    mysql_autocommit(conn, 1);
    lease_ = ConnectionPool::Lease();
    return status;
}

} // namespace storage
} // namespace session
