#pragma once

#include "common/status.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace sessionguard {
namespace common {

// 调用上下文: 携带调用方的取消信号和截止时间
// 拷贝共享同一个取消标志
class CallContext {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    CallContext();

    static CallContext Background();
    static CallContext WithDeadline(TimePoint deadline);
    static CallContext WithTimeout(std::chrono::milliseconds timeout);

    void Cancel() const;
    bool IsCancelled() const;
    bool IsExpired() const;

    // 已取消返回 Cancelled, 超过截止时间返回 DeadlineExceeded, 否则 OK
    Status Check() const;

    const std::optional<TimePoint>& Deadline() const { return deadline_; }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::optional<TimePoint> deadline_;
};

}
}
