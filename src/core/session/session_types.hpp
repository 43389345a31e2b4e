#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace session {
namespace core {

// 用户ID, 合法值恒为正
using UserId = std::int64_t;

// 负缓存标记: 该令牌已知无效
struct InvalidSession {
    bool operator==(const InvalidSession&) const { return true; }
    bool operator!=(const InvalidSession&) const { return false; }
};

// 缓存值: 无效标记或有效用户ID
using CachedUid = std::variant<InvalidSession, UserId>;

inline bool IsInvalid(const CachedUid& value) {
    return std::holds_alternative<InvalidSession>(value);
}

// Redis 中负缓存的文本形式
constexpr std::string_view kInvalidSessionText = "-1";

// 编码为 Redis 中保存的十进制文本
std::string EncodeCachedUid(const CachedUid& value);

// 解析 Redis 中的文本; 非整数或非正且非 -1 的值返回 nullopt
std::optional<CachedUid> ParseCachedUid(std::string_view text);

// 会话记录 (持久化存储中的权威数据)
struct SessionRecord {
    std::string token;
    UserId user_id = 0;
    std::int64_t created_at = 0; // Unix 秒, 0 表示由存储端取当前时间
};

// 存储端返回的列值, 可能是窄整数、宽整数或数字字符串
using FieldValue = std::variant<std::int32_t, std::int64_t, std::string>;

// 在存储边界统一转换为 UserId; 无法解析或非正时返回 nullopt
std::optional<UserId> DecodeUserId(const FieldValue& value);

} // namespace core
} // namespace session
