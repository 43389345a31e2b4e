#pragma once

#include "core/session/session_store.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>
#include <string>

namespace session {
namespace storage {

// 基于 session_db 表的会话存储
//   session_id VARCHAR 主键, uid BIGINT, created_at DATETIME
class MySqlSessionStore : public core::SessionStore {
public:
    explicit MySqlSessionStore(std::shared_ptr<ConnectionPool> pool);

    common::Status CreateSession(const core::SessionRecord& record) override;
    common::StatusOr<core::UserId> LookupUserId(const std::string& token) override;
    common::Status DeleteSession(const std::string& token) override;
    common::Status PurgeCreatedBefore(std::int64_t cutoff_unix_seconds) override;

private:
    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace session
