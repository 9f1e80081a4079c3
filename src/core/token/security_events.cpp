#include "core/token/security_events.hpp"

#include "common/logger.hpp"

namespace sessionguard {
namespace core {

const char* EventSeverityToString(EventSeverity severity) {
    switch (severity) {
        case EventSeverity::kInfo:
            return "info";
        case EventSeverity::kWarning:
            return "warning";
        case EventSeverity::kCritical:
            return "critical";
    }
    return "unknown";
}

const char* SecurityEventTypeToString(SecurityEventType type) {
    switch (type) {
        case SecurityEventType::kTokenReuseDetected:
            return "token_reuse_detected";
        case SecurityEventType::kTokenExpired:
            return "token_expired";
        case SecurityEventType::kDeviceMismatch:
            return "device_mismatch";
        case SecurityEventType::kSessionRevoked:
            return "session_revoked";
        case SecurityEventType::kAllSessionsRevoked:
            return "all_sessions_revoked";
        case SecurityEventType::kFamilyRevoked:
            return "family_revoked";
        case SecurityEventType::kTokenRevoked:
            return "token_revoked";
        case SecurityEventType::kSessionLimitEnforced:
            return "session_limit_enforced";
    }
    return "unknown";
}

nlohmann::json ToJson(const SecurityEvent& event) {
    return nlohmann::json{
        {"type", SecurityEventTypeToString(event.type)},
        {"severity", EventSeverityToString(event.severity)},
        {"user_id", event.user_id},
        {"tenant_id", event.tenant_id},
        {"token_family", event.token_family},
        {"reason", event.reason},
        {"actor_ip", event.actor_ip},
        {"occurred_at", event.occurred_at},
        {"revoked_count", event.revoked_count},
    };
}

void LoggingSecurityEventSink::Report(const SecurityEvent& event) {
    const auto payload = ToJson(event).dump();
    switch (event.severity) {
        case EventSeverity::kInfo:
            SESSIONGUARD_LOG_INFO("[SecurityEvent] {}", payload);
            break;
        case EventSeverity::kWarning:
            SESSIONGUARD_LOG_WARN("[SecurityEvent] {}", payload);
            break;
        case EventSeverity::kCritical:
            SESSIONGUARD_LOG_ERROR("[SecurityEvent] {}", payload);
            break;
    }
}

}
}
