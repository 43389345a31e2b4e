#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <string>

namespace session {
namespace cache {

// 进程外的共享键值缓存
class RemoteCache {
public:
    virtual ~RemoteCache() = default;

    // 键不存在时返回 kNotFound
    virtual common::StatusOr<std::string> Get(const std::string& key) = 0;

    // 写入并设置过期时间 (秒)
    virtual common::Status SetEx(const std::string& key, const std::string& value, int ttl_seconds) = 0;
};

} // namespace cache
} // namespace session
