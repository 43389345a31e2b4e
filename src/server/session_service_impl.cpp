// 主服务头文件
#include "server/session_service_impl.hpp"
#include "common/logger.hpp"

#include <stdexcept>

namespace session {
namespace server {

namespace {

void FillResult(Result* result, int code, const std::string& msg) {
    result->set_code(code);
    result->set_msg(msg);
}

} // namespace

SessionServiceImpl::SessionServiceImpl(std::shared_ptr<core::SessionResolver> resolver,
                                       std::shared_ptr<core::ReloadCoordinator> coordinator,
                                       core::TokenGenerator token_generator,
                                       std::function<bool()> log_calls)
    : resolver_(std::move(resolver)),
      coordinator_(std::move(coordinator)),
      token_generator_(std::move(token_generator)),
      log_calls_(std::move(log_calls)) {
    if (!resolver_ || !coordinator_ || !token_generator_) {
        throw std::invalid_argument("SessionServiceImpl requires a resolver, a coordinator and a token generator");
    }
}

void SessionServiceImpl::LogCall(const char* op) const {
    if (log_calls_ && log_calls_()) {
        SESSION_LOG_INFO("[SessionService] Call {}", op);
    }
}

grpc::Status SessionServiceImpl::Set(grpc::ServerContext*, const SetRequest* request, SetResponse* response) {
    LogCall("Set");
    auto token = token_generator_();
    if (!token.IsOk()) {
        SESSION_LOG_ERROR("[SessionService] token generation failed: {}", token.GetStatus().Message());
        FillResult(response->mutable_result(), kResultFailure, "Failed to generate session");
        return grpc::Status::OK;
    }

    auto status = resolver_->Create(token.Value(), request->uid());
    if (!status.IsOk()) {
        SESSION_LOG_ERROR("[SessionService] failed to save session for uid {}: {}", request->uid(), status.Message());
        FillResult(response->mutable_result(), kResultPersistFailure, "Failed to save session");
        return grpc::Status::OK;
    }

    FillResult(response->mutable_result(), kResultOk, "");
    response->set_session(token.Value());
    return grpc::Status::OK;
}

grpc::Status SessionServiceImpl::Get(grpc::ServerContext*, const GetRequest* request, GetResponse* response) {
    LogCall("Get");
    auto uid = resolver_->Resolve(request->session());
    if (!uid.IsOk()) {
        FillResult(response->mutable_result(), kResultFailure, "Session not found");
        response->set_uid(0);
        return grpc::Status::OK;
    }
    FillResult(response->mutable_result(), kResultOk, "");
    response->set_uid(uid.Value());
    return grpc::Status::OK;
}

grpc::Status SessionServiceImpl::Del(grpc::ServerContext*, const DelRequest* request, DelResponse* response) {
    LogCall("Del");
    auto status = resolver_->Invalidate(request->session());
    if (!status.IsOk()) {
        SESSION_LOG_ERROR("[SessionService] failed to delete session: {}", status.Message());
        FillResult(response->mutable_result(), kResultFailure, "Failed to delete session");
        return grpc::Status::OK;
    }
    FillResult(response->mutable_result(), kResultOk, "");
    return grpc::Status::OK;
}

grpc::Status SessionServiceImpl::Reload(grpc::ServerContext*, const ReloadRequest*, ReloadResponse* response) {
    SESSION_LOG_INFO("[SessionService] Received reload request");
    // 异步执行, 不阻塞调用方
    coordinator_->RequestReload();
    FillResult(response->mutable_result(), kResultOk, "");
    return grpc::Status::OK;
}

grpc::Status SessionServiceImpl::Ping(grpc::ServerContext*, const PingRequest*, Pong*) {
    LogCall("Ping");
    return grpc::Status::OK;
}

} // namespace server
} // namespace session
