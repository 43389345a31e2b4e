#pragma once

#include "common/cancellation.hpp"
#include "common/clock.hpp"
#include "core/session/session_types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace session {
namespace cache {

struct LocalCacheOptions {
    std::chrono::milliseconds ttl{std::chrono::seconds(300)};
    std::size_t max_size = 100000;
    std::chrono::milliseconds cleanup_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds janitor_delay{std::chrono::seconds(1)};
};

// 进程内有界 TTL 缓存.
// 满容量插入新键时随机淘汰一个已有键; 过期在读取时惰性判断, 由后台 janitor 批量清除
class LocalCache {
public:
    using Value = core::CachedUid;
    // 每次写入/容量检查/清理周期都会重新读取, 以便配置热更新
    using OptionsProvider = std::function<LocalCacheOptions()>;

    explicit LocalCache(LocalCacheOptions options,
                        std::shared_ptr<common::Clock> clock = common::DefaultClock());
    explicit LocalCache(OptionsProvider provider,
                        std::shared_ptr<common::Clock> clock = common::DefaultClock());
    ~LocalCache();

    LocalCache(const LocalCache&) = delete;
    LocalCache& operator=(const LocalCache&) = delete;

    // 键不存在或已过期时返回 nullopt
    std::optional<Value> Get(const std::string& key) const;
    void Set(const std::string& key, Value value);
    void Delete(const std::string& key);

    // 当前持有的键数量 (含尚未清除的过期项)
    std::size_t Size() const;

    // 执行一次两阶段过期清理, 返回删除的数量
    std::size_t DeleteExpired();

    // 清理的两个阶段. 阶段一在读锁下收集 now 时已过期的键;
    // 阶段二在写锁下删除其中仍然过期的键, 两阶段之间被刷新的键保留
    std::vector<std::string> CollectExpired(common::Clock::TimePoint now) const;
    std::size_t RemoveExpired(const std::vector<std::string>& keys, common::Clock::TimePoint now);

    // 启动/停止后台 janitor; Stop 幂等
    void StartJanitor();
    void StopJanitor();

private:
    struct Entry {
        Value value;
        common::Clock::TimePoint expires_at;
    };

    void EvictRandomLocked();
    void JanitorLoop(std::shared_ptr<common::CancellationToken> token);

    OptionsProvider options_;
    std::shared_ptr<common::Clock> clock_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> items_;
    std::mt19937_64 rng_; // 受 mutex_ 写锁保护

    std::mutex janitor_mutex_;
    std::shared_ptr<common::CancellationToken> janitor_stop_;
    std::thread janitor_;
};

} // namespace cache
} // namespace session
