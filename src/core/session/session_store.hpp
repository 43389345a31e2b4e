#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/session_types.hpp"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace session {
namespace core {

// 会话的权威存储
class SessionStore {
public:
    virtual ~SessionStore() = default;

    // 写入新会话, 不检查令牌是否已存在
    virtual common::Status CreateSession(const SessionRecord& record) = 0;

    // 查询令牌对应的用户ID.
    // 无记录、空行、值无法解析或非正时返回 kNotFound; 基础设施错误返回其它错误码
    virtual common::StatusOr<UserId> LookupUserId(const std::string& token) = 0;

    // 删除会话, 记录不存在也视为成功
    virtual common::Status DeleteSession(const std::string& token) = 0;

    // 批量删除 created_at 早于 cutoff (Unix 秒) 的会话.
    // 同步执行, 返回时删除已提交或已失败
    virtual common::Status PurgeCreatedBefore(std::int64_t cutoff_unix_seconds) = 0;
};

// 内存实现, MySQL 未启用时使用
class InMemorySessionStore : public SessionStore {
public:
    common::Status CreateSession(const SessionRecord& record) override;
    common::StatusOr<UserId> LookupUserId(const std::string& token) override;
    common::Status DeleteSession(const std::string& token) override;
    common::Status PurgeCreatedBefore(std::int64_t cutoff_unix_seconds) override;

    // 以任意列值形式写入记录, 模拟存储端返回的不同表示
    void PutRaw(const std::string& token, FieldValue uid, std::int64_t created_at = 0);

    std::size_t Size() const;

private:
    struct Row {
        FieldValue uid;
        std::int64_t created_at = 0;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Row> rows_;
};

} // namespace core
} // namespace session
