#include "storage/mysql/session_store.hpp"

#include "common/logger.hpp"
#include "storage/mysql/transaction.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace session {
namespace storage {

namespace {

common::Status MapMySqlError(MYSQL* conn) {
    const unsigned int err = mysql_errno(conn);
    if (err == 1062) { // duplicate key
        return common::Status::AlreadyExists("session token already exists");
    }
    return common::Status::Internal(mysql_error(conn));
}

common::Status RunQuery(MYSQL* conn, const std::string& sql) {
    if (mysql_real_query(conn, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
        return MapMySqlError(conn);
    }
    return common::Status::OK();
}

// 按列类型取出 uid 的原始值
core::FieldValue ReadUidField(const MYSQL_FIELD& field, const char* data, unsigned long length) {
    std::string text(data, length);
    switch (field.type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_LONGLONG:
            // INT UNSIGNED 可能超出 int32 范围, 统一按 int64 读取
            try {
                return static_cast<std::int64_t>(std::stoll(text));
            } catch (const std::exception&) {
                return text;
            }
        default:
            return text;
    }
}

} // namespace

MySqlSessionStore::MySqlSessionStore(std::shared_ptr<ConnectionPool> pool) : pool_(std::move(pool)) {
    if (!pool_) {
        throw std::invalid_argument("MySqlSessionStore requires a connection pool");
    }
}

common::Status MySqlSessionStore::CreateSession(const core::SessionRecord& record) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    std::string created_at = "NOW()";
    if (record.created_at > 0) {
        created_at = fmt::format("FROM_UNIXTIME({})", record.created_at);
    }
    const auto sql = fmt::format(
        "INSERT INTO session_db (session_id, uid, created_at) VALUES ('{}', {}, {})",
        lease->Escape(record.token),
        record.user_id,
        created_at);
    return RunQuery(lease.Raw(), sql);
}

common::StatusOr<core::UserId> MySqlSessionStore::LookupUserId(const std::string& token) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    const auto sql = fmt::format(
        "SELECT uid FROM session_db WHERE session_id = '{}' LIMIT 1",
        lease->Escape(token));
    auto status = RunQuery(conn, sql);
    if (!status.IsOk()) {
        return status;
    }

    MYSQL_RES* res = mysql_store_result(conn);
    if (res == nullptr) {
        if (mysql_field_count(conn) != 0) {
            return MapMySqlError(conn);
        }
        return common::Status::NotFound("session not found");
    }
    auto cleanup = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>(res, mysql_free_result);

    MYSQL_ROW row = mysql_fetch_row(res);
    if (row == nullptr || row[0] == nullptr) {
        return common::Status::NotFound("session not found");
    }
    const unsigned long* lengths = mysql_fetch_lengths(res);
    const MYSQL_FIELD* field = mysql_fetch_field_direct(res, 0);
    const auto uid = core::DecodeUserId(ReadUidField(*field, row[0], lengths[0]));
    if (!uid) {
        SESSION_LOG_WARN("[MySQL] session row has an unusable uid value");
        return common::Status::NotFound("session has no valid uid");
    }
    return common::StatusOr<core::UserId>(*uid);
}

common::Status MySqlSessionStore::DeleteSession(const std::string& token) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    const auto sql = fmt::format(
        "DELETE FROM session_db WHERE session_id = '{}'",
        lease->Escape(token));
    // 影响行数为 0 同样视为成功
    return RunQuery(lease.Raw(), sql);
}

common::Status MySqlSessionStore::PurgeCreatedBefore(std::int64_t cutoff_unix_seconds) {
    Transaction tx(pool_);
    auto status = tx.Begin();
    if (!status.IsOk()) {
        return status;
    }
    const auto sql = fmt::format(
        "DELETE FROM session_db WHERE created_at < FROM_UNIXTIME({})",
        cutoff_unix_seconds);
    std::uint64_t removed = 0;
    status = tx.Execute(sql, &removed);
    if (!status.IsOk()) {
        return status;
    }
    status = tx.Commit();
    if (!status.IsOk()) {
        return status;
    }
    SESSION_LOG_INFO("[MySQL] purged {} expired sessions", removed);
    return common::Status::OK();
}

} // namespace storage
} // namespace session
