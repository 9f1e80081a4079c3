#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sessionguard {
namespace core {

enum class RevocationReason {
    kRotated = 0,           // 正常轮换, 已被后继令牌替代
    kTheftDetected,         // 检测到重用, 整个令牌族被吊销
    kManualRevoke,          // 用户或管理员主动吊销
    kSessionLimitReached,   // 超过并发会话上限, 最早的会话被挤出
    kDeviceMismatch,        // 设备指纹不匹配
    kRotationAborted,       // 轮换中途失败, 孤立的后继令牌被回收
};

const char* RevocationReasonToString(RevocationReason reason);
std::optional<RevocationReason> ParseRevocationReason(const std::string& text);

// 请求方的设备信息, 仅用于展示与可选的绑定校验
struct DeviceInfo {
    std::string ip;
    std::string user_agent;
    std::string device_fingerprint;
    std::string device_name;
};

// 吊销字段, 一次性整体写入, 之后不可清除
struct Revocation {
    std::int64_t revoked_at = 0;
    std::string revoked_by_ip;
    RevocationReason reason = RevocationReason::kManualRevoke;
    std::string replaced_by_token; // 仅轮换时设置
};

struct RefreshToken {
    std::string id;
    std::string value;          // 令牌密文, 全局唯一
    std::string user_id;
    std::string tenant_id;      // 可为空
    std::string token_family;   // 同一次登录派生的所有令牌共享
    std::int64_t created_at = 0;
    std::int64_t expires_at = 0;

    std::string created_by_ip;
    std::string user_agent;
    std::string device_fingerprint;
    std::string device_name;

    std::optional<Revocation> revocation;

    bool IsExpired(std::int64_t now) const { return now >= expires_at; }
    bool IsRevoked() const { return revocation.has_value(); }
    bool IsActive(std::int64_t now) const { return !IsExpired(now) && !IsRevoked(); }
    // 令牌族的有效期长度, 轮换时沿用
    std::int64_t LifetimeSeconds() const { return expires_at - created_at; }
};

// 构造一个新令牌
RefreshToken MakeRefreshToken(std::string id,
                              std::string value,
                              std::string user_id,
                              std::string tenant_id,
                              std::string token_family,
                              const DeviceInfo& device,
                              std::int64_t created_at,
                              std::int64_t lifetime_seconds);

// 纯状态转换: 返回已吊销的副本, 已吊销的令牌返回 FailedPrecondition
common::StatusOr<RefreshToken> Revoke(const RefreshToken& token, Revocation revocation);

// 轮换时继承设备信息: 请求中非空的字段覆盖旧值
DeviceInfo MergeDeviceInfo(const RefreshToken& predecessor, const DeviceInfo& fresh);

}
}
