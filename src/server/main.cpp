// 项目头文件
#include "cache/local_cache.hpp"
#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "core/session/expiry_sweeper.hpp"
#include "core/session/reload_coordinator.hpp"
#include "core/session/session_resolver.hpp"
#include "server/session_bootstrap.hpp"
#include "server/session_service_impl.hpp"

// 第三方库
#include <grpcpp/grpcpp.h>

// C++ 标准库
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = argc > 1 ? argv[1] : session::common::ConfigLoader::DetectConfigPath();

    session::common::AppConfig config;
    try {
        config = session::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    session::common::InitLogger(config.logging);
    SESSION_LOG_INFO("Session server starting with config {}", config_path);

    auto config_store = std::make_shared<session::common::ConfigStore>(config_path, config);

    // 本地缓存参数每次实时读取, 热更新后立即生效
    auto local_cache = std::make_shared<session::cache::LocalCache>(
        session::cache::LocalCache::OptionsProvider([config_store] {
            return session::server::LocalCacheOptionsFromConfig(config_store->Current().cache.local);
        }));
    local_cache->StartJanitor();

    auto redis = session::server::CreateRedisClient(config.cache.redis);
    auto store = session::server::CreateSessionStore(config.storage.mysql);
    auto resolver = std::make_shared<session::core::SessionResolver>(
        local_cache, redis, store, session::server::ResolverOptionsFromConfig(config.cache.redis));

    auto coordinator = std::make_shared<session::core::ReloadCoordinator>(
        config_store,
        [store](const session::common::SessionConfig& session_config) {
            return std::make_unique<session::core::ExpirySweeper>(
                store, session::core::SweeperOptionsFromConfig(session_config));
        });
    coordinator->Start();

    session::server::SessionServiceImpl session_service(
        resolver,
        coordinator,
        session::core::GenerateSessionToken,
        [config_store] { return config_store->Current().server.log_calls; });

    grpc::ServerBuilder builder;
    std::string address = config.server.host + ":" + std::to_string(config.server.port);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&session_service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        SESSION_LOG_ERROR("Failed to start gRPC server on {}", address);
        coordinator->Shutdown();
        local_cache->StopJanitor();
        session::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    SESSION_LOG_INFO("Session server listening on {}", address);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread shutdown_thread([&server]() {
        while (g_stop_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        SESSION_LOG_WARN("Signal {} received, shutting down gRPC server...", g_stop_signal);
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    shutdown_thread.join();

    coordinator->Shutdown();
    local_cache->StopJanitor();
    SESSION_LOG_INFO("Session server stopped");
    session::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
