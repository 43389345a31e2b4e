#pragma once

// 项目头文件
#include "cache/local_cache.hpp"
#include "cache/redis_client.hpp"
#include "common/config.hpp"
#include "core/session/session_resolver.hpp"
#include "core/session/session_store.hpp"

// C++ 标准库
#include <memory>

namespace session {
namespace server {

cache::LocalCacheOptions LocalCacheOptionsFromConfig(const common::LocalCacheConfig& config);
core::ResolverOptions ResolverOptionsFromConfig(const common::RedisConfig& config);

// Redis 未启用或连接失败时返回空指针, 解析器随即跳过远程缓存
std::shared_ptr<cache::RedisClient> CreateRedisClient(const common::RedisConfig& config);

// MySQL 未启用或首个连接建立失败时退回内存存储
std::shared_ptr<core::SessionStore> CreateSessionStore(const common::MysqlConfig& config);

} // namespace server
} // namespace session
