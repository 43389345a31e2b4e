#pragma once

// 项目头文件
#include "core/session/reload_coordinator.hpp"
#include "core/session/session_resolver.hpp"
#include "core/session/token_generator.hpp"

// gRPC 生成的头文件
#include "session.grpc.pb.h"

// 第三方库
#include <grpcpp/grpcpp.h>

// C++ 标准库
#include <functional>
#include <memory>

namespace session {
namespace server {

// 业务结果码, 写入 Result.code; gRPC 状态始终为 OK
enum ResultCode : int {
    kResultOk = 0,
    kResultFailure = 1,
    kResultPersistFailure = 2, // 仅 Set 使用
};

class SessionServiceImpl final : public SessionService::Service {
public:
    // log_calls 每次调用时读取, 以便随配置热更新
    SessionServiceImpl(std::shared_ptr<core::SessionResolver> resolver,
                       std::shared_ptr<core::ReloadCoordinator> coordinator,
                       core::TokenGenerator token_generator = core::GenerateSessionToken,
                       std::function<bool()> log_calls = nullptr);

    grpc::Status Set(grpc::ServerContext* context
                    , const SetRequest* request
                    , SetResponse* response) override;

    grpc::Status Get(grpc::ServerContext* context
                    , const GetRequest* request
                    , GetResponse* response) override;

    grpc::Status Del(grpc::ServerContext* context
                    , const DelRequest* request
                    , DelResponse* response) override;

    grpc::Status Reload(grpc::ServerContext* context
                       , const ReloadRequest* request
                       , ReloadResponse* response) override;

    grpc::Status Ping(grpc::ServerContext* context
                     , const PingRequest* request
                     , Pong* response) override;

private:
    void LogCall(const char* op) const;

    std::shared_ptr<core::SessionResolver> resolver_;
    std::shared_ptr<core::ReloadCoordinator> coordinator_;
    core::TokenGenerator token_generator_;
    std::function<bool()> log_calls_;
};

} // namespace server
} // namespace session
