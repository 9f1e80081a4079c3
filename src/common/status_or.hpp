#pragma once

#include "common/status.hpp"

#include <type_traits>
#include <utility>

namespace sessionguard {
namespace common {

// 状态或值, 存储层接口统一使用
// 只有 IsOk() 为 true 时 Value() 才有意义
template <typename T>
class StatusOr {
public:
    StatusOr(const Status& status) : status_(status) {}
    StatusOr(Status&& status) : status_(std::move(status)) {}

    template <class U = T, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    explicit StatusOr(U&& value)
        : status_(Status::OK()), value_(std::forward<U>(value)) {}

    bool IsOk() const {
        return status_.IsOk();
    }
    StatusCode Code() const {
        return status_.Code();
    }
    const Status& GetStatus() const {
        return status_;
    }

    T& Value() & {
        return value_;
    }
    T&& Value() && {
        return std::move(value_);
    }
    const T& Value() const& {
        return value_;
    }
    const T&& Value() const&& = delete;

    // 失败时返回给定的替代值
    template <class U>
    T ValueOr(U&& fallback) const& {
        return IsOk() ? value_ : static_cast<T>(std::forward<U>(fallback));
    }

private:
    Status status_;
    T value_{};
};

}
}
