#pragma once

#include <string>

namespace session {
namespace common {

// gRPC 服务配置
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50051;
    bool log_calls = false; // 每次调用打印一行日志
};

// 日志配置
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
};

// 进程内缓存配置
struct LocalCacheConfig {
    int ttl_seconds = 300;
    int max_size = 100000;
    int cleanup_interval_seconds = 60;
};

// Redis 配置
struct RedisConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int socket_timeout_ms = 500;
    int ttl_seconds = 3600; // 会话键在 Redis 中的固定 TTL
};

struct CacheConfig {
    LocalCacheConfig local;
    RedisConfig redis;
};

// Mysql 配置
struct MysqlConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "dev";
    std::string password = "";
    std::string database = "session";
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
};

struct StorageConfig {
    MysqlConfig mysql;
};

// 会话过期清理配置
struct SessionConfig {
    int expire_hours = 720;
    int clean_interval_minutes = 60;
    int startup_delay_seconds = 10;
    bool cleaner_enabled = true;
};

// 应用配置
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    CacheConfig cache;
    StorageConfig storage;
    SessionConfig session;
};

} // namespace common
} // namespace session
