#include "cache/local_cache.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <iterator>

namespace session {
namespace cache {

namespace {

constexpr std::chrono::milliseconds kMinCleanupInterval{10};

std::size_t EffectiveMaxSize(const LocalCacheOptions& options) {
    return std::max<std::size_t>(options.max_size, 1);
}

} // namespace

LocalCache::LocalCache(LocalCacheOptions options, std::shared_ptr<common::Clock> clock)
    : LocalCache(OptionsProvider([options]() { return options; }), std::move(clock)) {}

LocalCache::LocalCache(OptionsProvider provider, std::shared_ptr<common::Clock> clock)
    : options_(std::move(provider))
    , clock_(clock ? std::move(clock) : common::DefaultClock())
    , rng_(std::random_device{}()) {}

LocalCache::~LocalCache() {
    StopJanitor();
}

std::optional<LocalCache::Value> LocalCache::Get(const std::string& key) const {
    const auto now = clock_->Now();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end() || now >= it->second.expires_at) {
        return std::nullopt;
    }
    return it->second.value;
}

void LocalCache::Set(const std::string& key, Value value) {
    const auto options = options_();
    const auto expires_at = clock_->Now() + options.ttl;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it != items_.end()) {
        // 覆盖已有键: 不淘汰, 只刷新值和过期时间
        it->second = Entry{std::move(value), expires_at};
        return;
    }
    const auto max_size = EffectiveMaxSize(options);
    // 配置缩小后可能超出上限, 逐个淘汰直到能放下新键
    while (items_.size() >= max_size) {
        EvictRandomLocked();
    }
    items_.emplace(key, Entry{std::move(value), expires_at});
}

void LocalCache::Delete(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    items_.erase(key);
}

std::size_t LocalCache::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return items_.size();
}

// 调用方需持有写锁
void LocalCache::EvictRandomLocked() {
    if (items_.empty()) {
        return;
    }
    std::uniform_int_distribution<std::size_t> dist(0, items_.size() - 1);
    auto victim = std::next(items_.begin(), static_cast<std::ptrdiff_t>(dist(rng_)));
    items_.erase(victim);
}

std::size_t LocalCache::DeleteExpired() {
    const auto now = clock_->Now();
    const auto expired = CollectExpired(now);
    if (expired.empty()) {
        return 0;
    }
    return RemoveExpired(expired, now);
}

std::vector<std::string> LocalCache::CollectExpired(common::Clock::TimePoint now) const {
    std::vector<std::string> expired;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    expired.reserve(items_.size() / 10);
    for (const auto& [key, entry] : items_) {
        if (now >= entry.expires_at) {
            expired.push_back(key);
        }
    }
    return expired;
}

std::size_t LocalCache::RemoveExpired(const std::vector<std::string>& keys, common::Clock::TimePoint now) {
    std::size_t removed = 0;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& key : keys) {
        auto it = items_.find(key);
        if (it != items_.end() && now >= it->second.expires_at) {
            items_.erase(it);
            ++removed;
        }
    }
    return removed;
}

void LocalCache::StartJanitor() {
    std::lock_guard<std::mutex> lock(janitor_mutex_);
    if (janitor_.joinable()) {
        return;
    }
    janitor_stop_ = std::make_shared<common::CancellationToken>();
    janitor_ = std::thread([this, token = janitor_stop_] { JanitorLoop(token); });
}

void LocalCache::StopJanitor() {
    std::lock_guard<std::mutex> lock(janitor_mutex_);
    if (!janitor_.joinable()) {
        return;
    }
    janitor_stop_->Cancel();
    janitor_.join();
    janitor_stop_.reset();
}

void LocalCache::JanitorLoop(std::shared_ptr<common::CancellationToken> token) {
    if (token->WaitFor(options_().janitor_delay)) {
        return;
    }
    while (true) {
        const auto removed = DeleteExpired();
        if (removed > 0) {
            SESSION_LOG_DEBUG("[LocalCache] janitor removed {} expired entries", removed);
        }
        if (token->WaitFor(std::max(options_().cleanup_interval, kMinCleanupInterval))) {
            return;
        }
    }
}

} // namespace cache
} // namespace session
