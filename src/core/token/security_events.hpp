#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace sessionguard {
namespace core {

enum class EventSeverity {
    kInfo = 0,
    kWarning,
    kCritical,
};

enum class SecurityEventType {
    kTokenReuseDetected = 0, // 已吊销令牌被再次使用
    kTokenExpired,           // 使用了过期令牌
    kDeviceMismatch,         // 设备指纹不匹配
    kSessionRevoked,         // 用户吊销单个会话
    kAllSessionsRevoked,     // 用户吊销全部会话
    kFamilyRevoked,          // 管理员吊销令牌族
    kTokenRevoked,           // 单个令牌登出
    kSessionLimitEnforced,   // 超出会话上限, 最早的会话被挤出
};

const char* EventSeverityToString(EventSeverity severity);
const char* SecurityEventTypeToString(SecurityEventType type);

// 结构化的安全事实, 由下游决定如何存储和告警
struct SecurityEvent {
    SecurityEventType type = SecurityEventType::kTokenReuseDetected;
    EventSeverity severity = EventSeverity::kInfo;
    std::string user_id;
    std::string tenant_id;
    std::string token_family;
    std::string reason;
    std::string actor_ip;
    std::int64_t occurred_at = 0;
    std::size_t revoked_count = 0;
};

nlohmann::json ToJson(const SecurityEvent& event);

// 安全事件接收端
class SecurityEventSink {
public:
    virtual ~SecurityEventSink() = default;
    virtual void Report(const SecurityEvent& event) = 0;
};

// 以单行JSON写入日志, 严重级别映射为日志级别
class LoggingSecurityEventSink : public SecurityEventSink {
public:
    void Report(const SecurityEvent& event) override;
};

}
}
