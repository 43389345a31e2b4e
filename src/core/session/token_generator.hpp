#pragma once

#include "common/status_or.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace session {
namespace core {

// 令牌熵长度 (字节), 十六进制后为 32 个字符
constexpr std::size_t kSessionTokenBytes = 16;

using TokenGenerator = std::function<common::StatusOr<std::string>()>;

// 使用 OpenSSL 安全随机数生成小写十六进制令牌
common::StatusOr<std::string> GenerateSessionToken();

} // namespace core
} // namespace session
