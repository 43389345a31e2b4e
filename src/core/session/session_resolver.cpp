#include "core/session/session_resolver.hpp"

#include "common/logger.hpp"

#include <stdexcept>

namespace session {
namespace core {

namespace {

common::Status InvalidSessionStatus() {
    return common::Status::NotFound("Invalid session");
}

} // namespace

SessionResolver::SessionResolver(std::shared_ptr<cache::LocalCache> local,
                                 std::shared_ptr<cache::RemoteCache> remote,
                                 std::shared_ptr<SessionStore> store,
                                 ResolverOptions options)
    : local_(std::move(local))
    , remote_(std::move(remote))
    , store_(std::move(store))
    , options_(std::move(options)) {
    if (!local_ || !store_) {
        throw std::invalid_argument("SessionResolver requires a local cache and a session store");
    }
}

std::string SessionResolver::KeyForToken(const std::string& token) const {
    return options_.key_prefix + token;
}

common::StatusOr<UserId> SessionResolver::Resolve(const std::string& token) {
    // 1. 本地缓存
    if (auto cached = local_->Get(token)) {
        if (IsInvalid(*cached)) {
            return InvalidSessionStatus();
        }
        return common::StatusOr<UserId>(std::get<UserId>(*cached));
    }

    // 2. 远程缓存, 命中后回填本地
    if (auto remote = RemoteGet(token)) {
        local_->Set(token, *remote);
        if (IsInvalid(*remote)) {
            return InvalidSessionStatus();
        }
        return common::StatusOr<UserId>(std::get<UserId>(*remote));
    }

    // 3. 权威存储; 任何失败都按无效会话处理并写入负缓存
    auto stored = store_->LookupUserId(token);
    if (!stored.IsOk()) {
        const auto& status = stored.GetStatus();
        if (status.Code() != common::StatusCode::kNotFound) {
            SESSION_LOG_WARN("[SessionResolver] store lookup failed: {}", status.ToString());
        }
        CacheEverywhere(token, CachedUid(InvalidSession{}));
        if (status.Code() == common::StatusCode::kNotFound) {
            return InvalidSessionStatus();
        }
        return status;
    }

    const UserId user_id = stored.Value();
    CacheEverywhere(token, CachedUid(user_id));
    return common::StatusOr<UserId>(user_id);
}

common::Status SessionResolver::Create(const std::string& token, UserId user_id) {
    SessionRecord record;
    record.token = token;
    record.user_id = user_id;
    auto status = store_->CreateSession(record);
    if (!status.IsOk()) {
        SESSION_LOG_ERROR("[SessionResolver] create failed: {}", status.ToString());
    }
    return status;
}

common::Status SessionResolver::Invalidate(const std::string& token) {
    auto status = store_->DeleteSession(token);
    if (!status.IsOk()) {
        SESSION_LOG_ERROR("[SessionResolver] delete failed: {}", status.ToString());
        return status;
    }
    // 覆盖而不是删除: 避免旧的远程缓存值再被回填到本地
    CacheEverywhere(token, CachedUid(InvalidSession{}));
    return common::Status::OK();
}

std::optional<CachedUid> SessionResolver::RemoteGet(const std::string& token) {
    if (!HasRemote()) {
        return std::nullopt;
    }
    auto resp = remote_->Get(KeyForToken(token));
    if (!resp.IsOk()) {
        if (resp.GetStatus().Code() != common::StatusCode::kNotFound) {
            SESSION_LOG_WARN("[SessionResolver] remote get failed: {}", resp.GetStatus().Message());
        }
        return std::nullopt;
    }
    auto parsed = ParseCachedUid(resp.Value());
    if (!parsed) {
        SESSION_LOG_WARN("[SessionResolver] ignoring malformed remote value for {}", KeyForToken(token));
    }
    return parsed;
}

void SessionResolver::RemotePut(const std::string& token, const CachedUid& value) {
    if (!HasRemote()) {
        return;
    }
    auto status = remote_->SetEx(KeyForToken(token), EncodeCachedUid(value), options_.remote_ttl_seconds);
    if (!status.IsOk()) {
        SESSION_LOG_WARN("[SessionResolver] remote put failed: {}", status.Message());
    }
}

void SessionResolver::CacheEverywhere(const std::string& token, const CachedUid& value) {
    RemotePut(token, value);
    local_->Set(token, value);
}

} // namespace core
} // namespace session
