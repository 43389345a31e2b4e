#include "core/session/session_types.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <type_traits>

namespace session {
namespace core {

namespace {

// 严格解析十进制整数, 不接受前后空白或多余字符
std::optional<std::int64_t> ParseInt64(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (std::isspace(static_cast<unsigned char>(text.front())) || text.front() == '+') {
        return std::nullopt;
    }
    std::string buffer(text);
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(buffer.c_str(), &end, 10);
    if (errno == ERANGE || end != buffer.c_str() + buffer.size()) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(parsed);
}

} // namespace

std::string EncodeCachedUid(const CachedUid& value) {
    if (IsInvalid(value)) {
        return std::string(kInvalidSessionText);
    }
    return std::to_string(std::get<UserId>(value));
}

std::optional<CachedUid> ParseCachedUid(std::string_view text) {
    auto parsed = ParseInt64(text);
    if (!parsed) {
        return std::nullopt;
    }
    if (*parsed == -1) {
        return CachedUid(InvalidSession{});
    }
    if (*parsed <= 0) {
        return std::nullopt;
    }
    return CachedUid(static_cast<UserId>(*parsed));
}

std::optional<UserId> DecodeUserId(const FieldValue& value) {
    std::optional<std::int64_t> raw = std::visit(
        [](const auto& v) -> std::optional<std::int64_t> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return ParseInt64(v);
            } else {
                return static_cast<std::int64_t>(v);
            }
        },
        value);
    if (!raw || *raw <= 0) {
        return std::nullopt;
    }
    return static_cast<UserId>(*raw);
}

} // namespace core
} // namespace session
