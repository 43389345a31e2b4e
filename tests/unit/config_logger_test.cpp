#include "common/config_loader.hpp"
#include "common/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {
std::filesystem::path TempPath(const std::string& suffix) {
    auto base = std::filesystem::temp_directory_path();
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("session_server_test_" + suffix + "_" + std::to_string(now));
}
} // namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!temp_file_.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_file_, ec);
        }
    }

    std::filesystem::path WriteTempConfig(const std::string& content) {
        if (temp_file_.empty()) {
            temp_file_ = TempPath("config.json");
        }
        std::ofstream ofs(temp_file_, std::ios::trunc);
        ofs << content;
        ofs.flush();
        return temp_file_;
    }

private:
    std::filesystem::path temp_file_;
};

TEST_F(ConfigLoaderTest, LoadsAllSections) {
    const std::string config_json = R"({
        // 注释允许出现在配置中
        "server": {"host": "127.0.0.1", "port": 6000, "log_calls": true},
        "logging": {
            "level": "debug",
            "pattern": "[%H:%M:%S] %v",
            "console": false,
            "file": "temp/logs/server.log"
        },
        "cache": {
            "local": {"ttl_seconds": 30, "max_size": 10, "cleanup_interval_seconds": 5},
            "redis": {"enabled": true, "host": "redis", "port": 6380, "db": 2, "ttl_seconds": 120}
        },
        "storage": {
            "mysql": {"enabled": true, "host": "db", "user": "svc", "database": "sessions", "pool_size": 8}
        },
        "session": {"expire_hours": 24, "clean_interval_minutes": 15, "startup_delay_seconds": 1, "cleaner_enabled": false}
    })";
    auto config_path = WriteTempConfig(config_json);

    auto cfg = session::common::ConfigLoader::Load(config_path.string());
    EXPECT_EQ(cfg.server.host, "127.0.0.1");
    EXPECT_EQ(cfg.server.port, 6000);
    EXPECT_TRUE(cfg.server.log_calls);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.pattern, "[%H:%M:%S] %v");
    EXPECT_FALSE(cfg.logging.console);
    EXPECT_EQ(cfg.logging.file, "temp/logs/server.log");
    EXPECT_EQ(cfg.cache.local.ttl_seconds, 30);
    EXPECT_EQ(cfg.cache.local.max_size, 10);
    EXPECT_EQ(cfg.cache.local.cleanup_interval_seconds, 5);
    EXPECT_TRUE(cfg.cache.redis.enabled);
    EXPECT_EQ(cfg.cache.redis.host, "redis");
    EXPECT_EQ(cfg.cache.redis.port, 6380);
    EXPECT_EQ(cfg.cache.redis.db, 2);
    EXPECT_EQ(cfg.cache.redis.ttl_seconds, 120);
    EXPECT_TRUE(cfg.storage.mysql.enabled);
    EXPECT_EQ(cfg.storage.mysql.host, "db");
    EXPECT_EQ(cfg.storage.mysql.user, "svc");
    EXPECT_EQ(cfg.storage.mysql.database, "sessions");
    EXPECT_EQ(cfg.storage.mysql.pool_size, 8);
    EXPECT_EQ(cfg.session.expire_hours, 24);
    EXPECT_EQ(cfg.session.clean_interval_minutes, 15);
    EXPECT_EQ(cfg.session.startup_delay_seconds, 1);
    EXPECT_FALSE(cfg.session.cleaner_enabled);
}

TEST_F(ConfigLoaderTest, MissingFieldsKeepDefaults) {
    auto cfg = session::common::ConfigLoader::LoadFromString("{}");
    EXPECT_EQ(cfg.server.port, 50051);
    EXPECT_FALSE(cfg.server.log_calls);
    EXPECT_EQ(cfg.cache.local.ttl_seconds, 300);
    EXPECT_EQ(cfg.cache.local.max_size, 100000);
    EXPECT_EQ(cfg.cache.local.cleanup_interval_seconds, 60);
    EXPECT_FALSE(cfg.cache.redis.enabled);
    EXPECT_EQ(cfg.cache.redis.ttl_seconds, 3600);
    EXPECT_FALSE(cfg.storage.mysql.enabled);
    EXPECT_EQ(cfg.session.expire_hours, 720);
    EXPECT_EQ(cfg.session.clean_interval_minutes, 60);
    EXPECT_TRUE(cfg.session.cleaner_enabled);
}

TEST_F(ConfigLoaderTest, InvalidInputThrows) {
    EXPECT_THROW(session::common::ConfigLoader::LoadFromString("{ not json"), std::runtime_error);
    EXPECT_THROW(session::common::ConfigLoader::LoadFromString(R"({"server": {"port": "abc"}})"),
                 std::runtime_error);
    EXPECT_THROW(session::common::ConfigLoader::Load("/nonexistent/session_server.json"), std::runtime_error);
}

TEST_F(ConfigLoaderTest, NonPositiveCleanerSettingsAreRejected) {
    using session::common::ConfigLoader;
    EXPECT_THROW(ConfigLoader::LoadFromString(R"({"session": {"expire_hours": 0}})"), std::runtime_error);
    EXPECT_THROW(ConfigLoader::LoadFromString(R"({"session": {"expire_hours": -1}})"), std::runtime_error);
    EXPECT_THROW(ConfigLoader::LoadFromString(R"({"session": {"clean_interval_minutes": 0}})"), std::runtime_error);
    EXPECT_THROW(ConfigLoader::LoadFromString(R"({"session": {"clean_interval_minutes": -5}})"),
                 std::runtime_error);

    auto cfg = ConfigLoader::LoadFromString(R"({"session": {"expire_hours": 1, "clean_interval_minutes": 1}})");
    EXPECT_EQ(cfg.session.expire_hours, 1);
    EXPECT_EQ(cfg.session.clean_interval_minutes, 1);
}

TEST_F(ConfigLoaderTest, ConfigStoreReloadRejectsNonPositiveInterval) {
    auto path = WriteTempConfig(R"({"session": {"expire_hours": 10, "clean_interval_minutes": 30}})");
    session::common::ConfigStore store(path.string(), session::common::ConfigLoader::Load(path.string()));

    WriteTempConfig(R"({"session": {"expire_hours": 10, "clean_interval_minutes": 0}})");
    auto status = store.Reload();
    EXPECT_EQ(status.Code(), session::common::StatusCode::kInvalidArgument);
    EXPECT_EQ(store.Current().session.clean_interval_minutes, 30);
}

TEST_F(ConfigLoaderTest, ConfigStoreReloadKeepsOldConfigOnFailure) {
    auto path = WriteTempConfig(R"({"session": {"expire_hours": 10}})");
    session::common::ConfigStore store(path.string(), session::common::ConfigLoader::Load(path.string()));
    EXPECT_EQ(store.Current().session.expire_hours, 10);

    WriteTempConfig(R"({"session": {"expire_hours": 20}})");
    ASSERT_TRUE(store.Reload().IsOk());
    EXPECT_EQ(store.Current().session.expire_hours, 20);

    WriteTempConfig("{ broken");
    auto status = store.Reload();
    EXPECT_FALSE(status.IsOk());
    EXPECT_EQ(status.Code(), session::common::StatusCode::kInvalidArgument);
    EXPECT_EQ(store.Current().session.expire_hours, 20);
}

TEST_F(ConfigLoaderTest, DetectConfigPathPrefersEnvironment) {
    ::setenv("SESSION_SERVER_CONFIG", "/tmp/custom_session.json", 1);
    EXPECT_EQ(session::common::ConfigLoader::DetectConfigPath(), "/tmp/custom_session.json");
    ::unsetenv("SESSION_SERVER_CONFIG");
    auto fallback = session::common::ConfigLoader::DetectConfigPath();
    EXPECT_NE(fallback.find("app.example.json"), std::string::npos);
}

class LoggerInitTest : public ::testing::Test {
protected:
    void TearDown() override {
        session::common::ShutdownLogger();
        if (!temp_dir_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(temp_dir_, ec);
        }
    }

    std::filesystem::path PrepareLogPath(const std::string& filename) {
        temp_dir_ = TempPath("logs");
        return temp_dir_ / "logs" / filename;
    }

    std::filesystem::path temp_dir_;
};

TEST_F(LoggerInitTest, CreatesDirectories) {
    auto log_file = PrepareLogPath("session.log");

    session::common::LoggingConfig config;
    config.console = false;
    config.level = "warning";
    config.pattern = "[test] %v";
    config.file = log_file.string();

    session::common::InitLogger(config);

    auto logger = session::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    EXPECT_TRUE(std::filesystem::exists(log_file.parent_path()));

    // 触发一次日志写入，确保文件被创建
    SESSION_LOG_WARN("logger integration test");

    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerInitTest, InvalidLevelFallsBackToInfo) {
    session::common::LoggingConfig config;
    config.console = false;
    config.level = "not-a-level";

    session::common::InitLogger(config);

    auto logger = session::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::info);
}

TEST_F(LoggerInitTest, LoggingAfterShutdownIsSafe) {
    session::common::LoggingConfig config;
    config.console = false;
    session::common::InitLogger(config);
    session::common::ShutdownLogger();

    SESSION_LOG_INFO("dropped after shutdown");
    EXPECT_NE(session::common::GetLogger(), nullptr);
}
