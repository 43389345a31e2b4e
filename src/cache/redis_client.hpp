#pragma once

#include "cache/remote_cache.hpp"
#include "common/config.hpp"

// Redis++库头文件
#include <sw/redis++/redis++.h>

#include <memory>
#include <mutex>
#include <string>

namespace session {
namespace cache {

// 基于 redis-plus-plus 的远程缓存
class RedisClient : public RemoteCache {
public:
    explicit RedisClient(const common::RedisConfig& config);
    ~RedisClient() override;

    // 建立连接池, 已连接时直接返回 OK
    common::Status Connect();

    common::StatusOr<std::string> Get(const std::string& key) override;
    common::Status SetEx(const std::string& key, const std::string& value, int ttl_seconds) override;

    common::Status Ping();

private:
    common::RedisConfig config_;
    std::mutex connect_mutex_;
    std::shared_ptr<sw::redis::Redis> redis_;
};

} // namespace cache
} // namespace session
