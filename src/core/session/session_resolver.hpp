#pragma once

#include "cache/local_cache.hpp"
#include "cache/remote_cache.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/session_store.hpp"
#include "core/session/session_types.hpp"

#include <memory>
#include <string>

namespace session {
namespace core {

struct ResolverOptions {
    // 写入远程缓存的 TTL, 与本地缓存 TTL 相互独立
    int remote_ttl_seconds = 3600;
    std::string key_prefix = "session:session:";
};

// 令牌解析: 本地缓存 -> 远程缓存 -> 权威存储, 并负责写路径上的缓存维护
class SessionResolver {
public:
    // remote 可以为空, 此时跳过远程缓存这一层
    SessionResolver(std::shared_ptr<cache::LocalCache> local,
                    std::shared_ptr<cache::RemoteCache> remote,
                    std::shared_ptr<SessionStore> store,
                    ResolverOptions options = ResolverOptions());

    // 解析令牌. 无效或不存在返回 kNotFound; 存储故障时返回存储的错误.
    // 任何失败都会在两层缓存中写入无效标记
    common::StatusOr<UserId> Resolve(const std::string& token);

    // 只写权威存储, 不预填缓存
    common::Status Create(const std::string& token, UserId user_id);

    // 先删存储; 成功后两层缓存都覆盖为无效标记 (而不是删除)
    common::Status Invalidate(const std::string& token);

    std::string KeyForToken(const std::string& token) const;

private:
    bool HasRemote() const { return static_cast<bool>(remote_); }

    // 远程缓存查询; 未命中、出错或内容无法解析时返回 nullopt
    std::optional<CachedUid> RemoteGet(const std::string& token);
    void RemotePut(const std::string& token, const CachedUid& value);

    // 两层缓存写入相同的值
    void CacheEverywhere(const std::string& token, const CachedUid& value);

    std::shared_ptr<cache::LocalCache> local_;
    std::shared_ptr<cache::RemoteCache> remote_;
    std::shared_ptr<SessionStore> store_;
    ResolverOptions options_;
};

} // namespace core
} // namespace session
