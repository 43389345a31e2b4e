#pragma once

#include "common/config.hpp"
#include "common/config_loader.hpp"
#include "common/status.hpp"
#include "core/session/expiry_sweeper.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace session {
namespace core {

SweeperOptions SweeperOptionsFromConfig(const common::SessionConfig& config);

// 清理器是否启用: 配置开关, 且未设置环境变量 SESSION_SERVER_DISABLE_CLEANER
bool CleanerEnabled(const common::SessionConfig& config);

// 配置热更新. Reload 互斥执行; 仅当清理参数 (过期小时数、清理间隔) 变化时重建清理器,
// 清理器被禁用时停止正在运行的清理器. 缓存参数由 LocalCache 实时读取, 不参与比较.
// 停止清理器会等待进行中的批量删除完成, 这段时间内 Reload 与 SweeperRunning 等状态查询会阻塞
class ReloadCoordinator {
public:
    using SweeperFactory = std::function<std::unique_ptr<ExpirySweeper>(const common::SessionConfig&)>;

    ReloadCoordinator(std::shared_ptr<common::ConfigStore> config, SweeperFactory factory);
    ~ReloadCoordinator();

    ReloadCoordinator(const ReloadCoordinator&) = delete;
    ReloadCoordinator& operator=(const ReloadCoordinator&) = delete;

    // 启动初始清理器与后台重载线程
    void Start();

    // 同步重载; 配置读取失败时保留旧配置与清理器
    common::Status Reload();

    // 异步重载, 立即返回; 多个未处理的请求会合并
    void RequestReload();

    // 停止重载线程与清理器, 幂等
    void Shutdown();

    bool SweeperRunning() const;
    // 已创建的清理器数量
    std::size_t SweeperGeneration() const;
    // 已完成的 Reload 次数 (含失败)
    std::size_t CompletedReloads() const;

private:
    void StopSweeperLocked();
    void ReplaceSweeperLocked(const common::SessionConfig& config);
    void ReloadLoop();

    std::shared_ptr<common::ConfigStore> config_;
    SweeperFactory factory_;

    mutable std::mutex reload_mutex_;
    std::unique_ptr<ExpirySweeper> sweeper_;
    std::size_t generation_ = 0;
    std::size_t completed_reloads_ = 0;

    std::mutex request_mutex_;
    std::condition_variable request_cv_;
    bool pending_ = false;
    bool stopping_ = false;
    std::thread reload_thread_;
};

} // namespace core
} // namespace session
