#include "server/session_bootstrap.hpp"

#include "common/logger.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/options.hpp"
#include "storage/mysql/session_store.hpp"

#include <algorithm>

namespace session {
namespace server {

cache::LocalCacheOptions LocalCacheOptionsFromConfig(const common::LocalCacheConfig& config) {
    cache::LocalCacheOptions options;
    options.ttl = std::chrono::seconds(config.ttl_seconds);
    options.max_size = static_cast<std::size_t>(std::max(config.max_size, 1));
    options.cleanup_interval = std::chrono::seconds(config.cleanup_interval_seconds);
    return options;
}

core::ResolverOptions ResolverOptionsFromConfig(const common::RedisConfig& config) {
    core::ResolverOptions options;
    options.remote_ttl_seconds = config.ttl_seconds;
    return options;
}

std::shared_ptr<cache::RedisClient> CreateRedisClient(const common::RedisConfig& config) {
    if (!config.enabled) {
        SESSION_LOG_INFO("[Bootstrap] Redis disabled; remote cache tier is skipped");
        return nullptr;
    }
    auto client = std::make_shared<cache::RedisClient>(config);
    auto status = client->Connect();
    if (status.IsOk()) {
        status = client->Ping();
    }
    if (!status.IsOk()) {
        SESSION_LOG_WARN("[Bootstrap] Redis init failed, fallback to no remote cache: {}", status.Message());
        return nullptr;
    }
    SESSION_LOG_INFO("[Bootstrap] Redis connected to {}:{}", config.host, config.port);
    return client;
}

std::shared_ptr<core::SessionStore> CreateSessionStore(const common::MysqlConfig& config) {
    if (!config.enabled) {
        SESSION_LOG_WARN("[Bootstrap] MySQL backend disabled; using in-memory session store");
        return std::make_shared<core::InMemorySessionStore>();
    }

    auto pool = std::make_shared<storage::ConnectionPool>(storage::OptionsFromConfig(config));
    {
        // 启动时探测一次连接, 租约随作用域归还
        auto probe = pool->Acquire();
        if (!probe.IsOk()) {
            SESSION_LOG_ERROR("[Bootstrap] Failed to initialize MySQL connection: {}",
                              probe.GetStatus().Message());
            return std::make_shared<core::InMemorySessionStore>();
        }
    }
    SESSION_LOG_INFO("[Bootstrap] MySQL connection pool initialized ({}:{}/{})",
                     config.host, config.port, config.database);
    return std::make_shared<storage::MySqlSessionStore>(std::move(pool));
}

} // namespace server
} // namespace session
