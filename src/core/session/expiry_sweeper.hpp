#pragma once

#include "common/cancellation.hpp"
#include "common/status.hpp"
#include "core/session/session_store.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace session {
namespace core {

struct SweeperOptions {
    std::chrono::seconds expire_age{std::chrono::hours(720)};
    std::chrono::milliseconds clean_interval{std::chrono::minutes(60)};
    std::chrono::milliseconds startup_delay{std::chrono::seconds(10)};
    // 每次清理结束后回调, 参数为批量删除请求的结果
    std::function<void(const common::Status&)> on_sweep;
};

// 后台定期清理过期会话.
// 启动延迟后立即清理一次, 之后按固定间隔执行; 失败只记录日志
class ExpirySweeper {
public:
    ExpirySweeper(std::shared_ptr<SessionStore> store, SweeperOptions options);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    // 已在运行时为空操作
    void Start();
    // 幂等; 未启动时也可调用. 正在执行的清理会先完成再返回
    void Stop();
    bool Running() const;

    // 同步执行一次清理
    common::Status SweepOnce();

    const SweeperOptions& Options() const noexcept { return options_; }

private:
    void Loop(std::shared_ptr<common::CancellationToken> token);

    std::shared_ptr<SessionStore> store_;
    SweeperOptions options_;

    mutable std::mutex mutex_;
    std::shared_ptr<common::CancellationToken> stop_;
    std::thread worker_;
};

} // namespace core
} // namespace session
