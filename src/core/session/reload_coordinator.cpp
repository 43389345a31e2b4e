#include "core/session/reload_coordinator.hpp"

#include "common/logger.hpp"

#include <cstdlib>
#include <stdexcept>

namespace session {
namespace core {

SweeperOptions SweeperOptionsFromConfig(const common::SessionConfig& config) {
    SweeperOptions options;
    options.expire_age = std::chrono::hours(config.expire_hours);
    options.clean_interval = std::chrono::minutes(config.clean_interval_minutes);
    options.startup_delay = std::chrono::seconds(config.startup_delay_seconds);
    return options;
}

bool CleanerEnabled(const common::SessionConfig& config) {
    const char* env = std::getenv("SESSION_SERVER_DISABLE_CLEANER");
    if (env != nullptr && *env != '\0') {
        return false;
    }
    return config.cleaner_enabled;
}

ReloadCoordinator::ReloadCoordinator(std::shared_ptr<common::ConfigStore> config, SweeperFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
    if (!config_ || !factory_) {
        throw std::invalid_argument("ReloadCoordinator requires a config store and a sweeper factory");
    }
}

ReloadCoordinator::~ReloadCoordinator() {
    Shutdown();
}

void ReloadCoordinator::Start() {
    {
        std::lock_guard<std::mutex> lock(reload_mutex_);
        const auto session = config_->Current().session;
        if (!sweeper_) {
            if (CleanerEnabled(session)) {
                ReplaceSweeperLocked(session);
            } else {
                SESSION_LOG_INFO("[Reload] session cleaner is disabled");
            }
        }
    }
    std::lock_guard<std::mutex> lock(request_mutex_);
    if (!reload_thread_.joinable() && !stopping_) {
        reload_thread_ = std::thread([this] { ReloadLoop(); });
    }
}

common::Status ReloadCoordinator::Reload() {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    SESSION_LOG_INFO("[Reload] reloading config from {}", config_->Path());

    const auto before = config_->Current().session;
    auto status = config_->Reload();
    ++completed_reloads_;
    if (!status.IsOk()) {
        SESSION_LOG_ERROR("[Reload] reload failed, keeping previous config: {}", status.Message());
        return status;
    }
    const auto after = config_->Current().session;

    const bool changed = before.expire_hours != after.expire_hours ||
                         before.clean_interval_minutes != after.clean_interval_minutes;
    if (!CleanerEnabled(after)) {
        if (sweeper_) {
            SESSION_LOG_INFO("[Reload] cleaner disabled, stopping running cleaner");
            StopSweeperLocked();
        }
    } else if (changed || !sweeper_) {
        SESSION_LOG_INFO("[Reload] cleaner parameters changed, rebuilding cleaner");
        ReplaceSweeperLocked(after);
    }
    SESSION_LOG_INFO("[Reload] reload completed");
    return common::Status::OK();
}

void ReloadCoordinator::RequestReload() {
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        pending_ = true;
    }
    request_cv_.notify_one();
}

void ReloadCoordinator::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        stopping_ = true;
    }
    request_cv_.notify_all();
    if (reload_thread_.joinable()) {
        reload_thread_.join();
    }

    std::lock_guard<std::mutex> lock(reload_mutex_);
    StopSweeperLocked();
}

bool ReloadCoordinator::SweeperRunning() const {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    return sweeper_ && sweeper_->Running();
}

std::size_t ReloadCoordinator::SweeperGeneration() const {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    return generation_;
}

std::size_t ReloadCoordinator::CompletedReloads() const {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    return completed_reloads_;
}

// 以下两个函数的调用方需持有 reload_mutex_.
// Stop 会等待进行中的清理完成, 期间其它 Reload 被阻塞
void ReloadCoordinator::StopSweeperLocked() {
    if (sweeper_) {
        sweeper_->Stop();
        sweeper_.reset();
    }
}

void ReloadCoordinator::ReplaceSweeperLocked(const common::SessionConfig& config) {
    StopSweeperLocked();
    sweeper_ = factory_(config);
    ++generation_;
    if (sweeper_) {
        sweeper_->Start();
    }
}

void ReloadCoordinator::ReloadLoop() {
    std::unique_lock<std::mutex> lock(request_mutex_);
    while (true) {
        request_cv_.wait(lock, [this] { return pending_ || stopping_; });
        if (stopping_) {
            return;
        }
        pending_ = false;
        lock.unlock();
        // 结果已在 Reload 中记录
        Reload();
        lock.lock();
    }
}

} // namespace core
} // namespace session
