#pragma once

#include <chrono>
#include <cstdint>

namespace sessionguard {
namespace common {

// 时间源接口, 以便测试中注入可控时钟
class Clock {
public:
    virtual ~Clock() = default;
    // 当前Unix时间戳(秒)
    virtual std::int64_t NowSeconds() const = 0;
};

class SystemClock : public Clock {
public:
    std::int64_t NowSeconds() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

constexpr std::int64_t kSecondsPerDay = 24 * 60 * 60;

}
}
