#pragma once

#include "common/status.hpp"

#include <optional>
#include <type_traits>
#include <utility>

namespace session {
namespace common {

// 值或错误状态. 值用 optional 保存, T 不必可默认构造
template <typename T>
class StatusOr {
public:
    StatusOr(const Status& status) : status_(status) {}
    StatusOr(Status&& status) : status_(std::move(status)) {}

    template <class U = T,
              std::enable_if_t<std::is_constructible_v<T, U&&> &&
                               !std::is_same_v<std::decay_t<U>, Status>, int> = 0>
    explicit StatusOr(U&& value)
        : status_(Status::OK()), value_(std::forward<U>(value)) {}

    bool IsOk() const {
        return status_.IsOk();
    }
    const Status& GetStatus() const {
        return status_;
    }

    // 仅在 IsOk() 时调用
    T& Value() & {
        return *value_;
    }
    T&& Value() && {
        return std::move(*value_);
    }
    const T& Value() const& {
        return *value_;
    }
    const T&& Value() const&& = delete;

    // 出错时返回 fallback
    T ValueOr(T fallback) const& {
        return IsOk() ? *value_ : std::move(fallback);
    }

private:
    Status status_;
    std::optional<T> value_;
};

} // namespace common
} // namespace session
