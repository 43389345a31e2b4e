#include "core/session/expiry_sweeper.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace session {
namespace core {

namespace {

constexpr std::chrono::milliseconds kMinInterval{10};

std::int64_t CutoffUnixSeconds(std::chrono::seconds expire_age) {
    const auto cutoff = std::chrono::system_clock::now() - expire_age;
    return std::chrono::duration_cast<std::chrono::seconds>(cutoff.time_since_epoch()).count();
}

} // namespace

ExpirySweeper::ExpirySweeper(std::shared_ptr<SessionStore> store, SweeperOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
    if (!store_) {
        throw std::invalid_argument("ExpirySweeper requires a session store");
    }
}

ExpirySweeper::~ExpirySweeper() {
    Stop();
}

void ExpirySweeper::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        SESSION_LOG_INFO("[Sweeper] already running");
        return;
    }
    stop_ = std::make_shared<common::CancellationToken>();
    worker_ = std::thread([this, token = stop_] { Loop(token); });
    SESSION_LOG_INFO("[Sweeper] started (expire_age={}s, interval={}ms, delay={}ms)",
                     options_.expire_age.count(),
                     options_.clean_interval.count(),
                     options_.startup_delay.count());
}

void ExpirySweeper::Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!worker_.joinable()) {
        return;
    }
    SESSION_LOG_INFO("[Sweeper] stopping");
    stop_->Cancel();
    worker_.join();
    stop_.reset();
    SESSION_LOG_INFO("[Sweeper] stopped");
}

bool ExpirySweeper::Running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable();
}

common::Status ExpirySweeper::SweepOnce() {
    const auto cutoff = CutoffUnixSeconds(options_.expire_age);
    SESSION_LOG_INFO("[Sweeper] purging sessions created before {}", cutoff);
    auto status = store_->PurgeCreatedBefore(cutoff);
    if (!status.IsOk()) {
        SESSION_LOG_ERROR("[Sweeper] purge request failed: {}", status.ToString());
    }
    if (options_.on_sweep) {
        options_.on_sweep(status);
    }
    return status;
}

void ExpirySweeper::Loop(std::shared_ptr<common::CancellationToken> token) {
    if (token->WaitFor(options_.startup_delay)) {
        return;
    }
    const auto interval = std::max(options_.clean_interval, kMinInterval);
    while (true) {
        // 清理结果已在 SweepOnce 中记录, 不影响调度
        SweepOnce();
        if (token->WaitFor(interval)) {
            return;
        }
    }
}

} // namespace core
} // namespace session
