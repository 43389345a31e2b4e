#pragma once

#include <chrono>
#include <memory>
#include <mutex>

namespace session {
namespace common {

// 单调时钟抽象, 测试中可替换为手动推进的时钟
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint Now() const override {
        return std::chrono::steady_clock::now();
    }
};

// 进程共享的默认时钟
inline std::shared_ptr<Clock> DefaultClock() {
    static const std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>();
    return clock;
}

// 手动时钟, 只在 Advance 时前进
class ManualClock : public Clock {
public:
    ManualClock() : now_(std::chrono::steady_clock::now()) {}

    TimePoint Now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void Advance(std::chrono::steady_clock::duration delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace common
} // namespace session
