#include "cache/redis_client.hpp"

// 标准库头文件
#include <chrono>

namespace session {
namespace cache {

namespace {

common::Status RedisError(const std::string& context, const sw::redis::Error& err) {
    return common::Status::Unavailable(context + ": " + err.what());
}

} // namespace

RedisClient::RedisClient(const common::RedisConfig& config)
    : config_(config) {}

RedisClient::~RedisClient() = default;

common::Status RedisClient::Connect() {
    if (!config_.enabled) {
        return common::Status::Unavailable("Redis is disabled in the configuration.");
    }
    std::lock_guard<std::mutex> lock(connect_mutex_);
    if (redis_) {
        return common::Status::OK();
    }

    try {
        sw::redis::ConnectionOptions opts;
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<std::size_t>(config_.pool_size > 0 ? config_.pool_size : 1);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        redis_ = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return RedisError("Failed to connect to Redis", err);
    }
}

common::StatusOr<std::string> RedisClient::Get(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        auto val = redis_->get(key);
        if (!val) {
            return common::Status::NotFound("Key not found in Redis: " + key);
        }
        return common::StatusOr<std::string>(std::move(*val));
    } catch (const sw::redis::Error& err) {
        return RedisError("Failed to get key from Redis", err);
    }
}

common::Status RedisClient::SetEx(const std::string& key, const std::string& value, int ttl_seconds) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    if (ttl_seconds <= 0) {
        return common::Status::InvalidArgument("Redis TTL must be positive");
    }
    try {
        redis_->set(key, value, std::chrono::seconds(ttl_seconds));
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return RedisError("Failed to set key with expiration in Redis", err);
    }
}

common::Status RedisClient::Ping() {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        redis_->ping();
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return RedisError("Redis ping failed", err);
    }
}

} // namespace cache
} // namespace session
