#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace session {
namespace common {

std::string ConfigLoader::DetectConfigPath() {
    if (const char* env = std::getenv("SESSION_SERVER_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    try {
        return FromJson(json);
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("Invalid config file " + path + ": " + ex.what());
    }
}

AppConfig ConfigLoader::LoadFromString(const std::string& content) {
    try {
        return FromJson(nlohmann::json::parse(content, nullptr, true, true));
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("Invalid config: ") + ex.what());
    }
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    try {
        return nlohmann::json::parse(ifs, nullptr, true, true);
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("Invalid config file " + path + ": " + ex.what());
    }
}

// 从JSON对象构建配置结构体, 缺省字段保留默认值
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    if (j.contains("server")) {
        const auto& server = j["server"];
        cfg.server.host = server.value("host", cfg.server.host);
        cfg.server.port = server.value("port", cfg.server.port);
        cfg.server.log_calls = server.value("log_calls", cfg.server.log_calls);
    }
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
    }
    if (j.contains("cache")) {
        const auto& cache = j["cache"];
        if (cache.contains("local")) {
            const auto& local = cache["local"];
            auto& out = cfg.cache.local;
            out.ttl_seconds = local.value("ttl_seconds", out.ttl_seconds);
            out.max_size = local.value("max_size", out.max_size);
            out.cleanup_interval_seconds = local.value("cleanup_interval_seconds", out.cleanup_interval_seconds);
        }
        if (cache.contains("redis")) {
            const auto& redis = cache["redis"];
            auto& out = cfg.cache.redis;
            out.enabled = redis.value("enabled", out.enabled);
            out.host = redis.value("host", out.host);
            out.port = redis.value("port", out.port);
            out.password = redis.value("password", out.password);
            out.db = redis.value("db", out.db);
            out.pool_size = redis.value("pool_size", out.pool_size);
            out.connection_timeout_ms = redis.value("connection_timeout_ms", out.connection_timeout_ms);
            out.socket_timeout_ms = redis.value("socket_timeout_ms", out.socket_timeout_ms);
            out.ttl_seconds = redis.value("ttl_seconds", out.ttl_seconds);
        }
    }
    if (j.contains("storage") && j["storage"].contains("mysql")) {
        const auto& mysql = j["storage"]["mysql"];
        auto& out = cfg.storage.mysql;
        out.enabled = mysql.value("enabled", out.enabled);
        out.host = mysql.value("host", out.host);
        out.port = mysql.value("port", out.port);
        out.user = mysql.value("user", out.user);
        out.password = mysql.value("password", out.password);
        out.database = mysql.value("database", out.database);
        out.pool_size = mysql.value("pool_size", out.pool_size);
        out.connection_timeout_ms = mysql.value("connection_timeout_ms", out.connection_timeout_ms);
        out.read_timeout_ms = mysql.value("read_timeout_ms", out.read_timeout_ms);
        out.write_timeout_ms = mysql.value("write_timeout_ms", out.write_timeout_ms);
    }
    if (j.contains("session")) {
        const auto& session = j["session"];
        auto& out = cfg.session;
        out.expire_hours = session.value("expire_hours", out.expire_hours);
        out.clean_interval_minutes = session.value("clean_interval_minutes", out.clean_interval_minutes);
        out.startup_delay_seconds = session.value("startup_delay_seconds", out.startup_delay_seconds);
        out.cleaner_enabled = session.value("cleaner_enabled", out.cleaner_enabled);
    }
    // 过期时长和清理间隔必须为正, 否则清理会删除新会话或高频执行
    if (cfg.session.expire_hours <= 0) {
        throw std::runtime_error("session.expire_hours must be positive, got " +
                                 std::to_string(cfg.session.expire_hours));
    }
    if (cfg.session.clean_interval_minutes <= 0) {
        throw std::runtime_error("session.clean_interval_minutes must be positive, got " +
                                 std::to_string(cfg.session.clean_interval_minutes));
    }
    return cfg;
}

ConfigStore::ConfigStore(std::string path, AppConfig initial)
    : path_(std::move(path)), config_(std::move(initial)) {}

AppConfig ConfigStore::Current() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_;
}

Status ConfigStore::Reload() {
    AppConfig fresh;
    try {
        fresh = ConfigLoader::Load(path_);
    } catch (const std::exception& ex) {
        return Status::InvalidArgument(ex.what());
    }
    Replace(std::move(fresh));
    return Status::OK();
}

void ConfigStore::Replace(AppConfig config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    config_ = std::move(config);
}

} // namespace common
} // namespace session
