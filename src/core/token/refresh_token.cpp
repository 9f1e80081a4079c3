#include "core/token/refresh_token.hpp"

#include <utility>

namespace sessionguard {
namespace core {

const char* RevocationReasonToString(RevocationReason reason) {
    switch (reason) {
        case RevocationReason::kRotated:
            return "Rotated";
        case RevocationReason::kTheftDetected:
            return "TheftDetected";
        case RevocationReason::kManualRevoke:
            return "ManualRevoke";
        case RevocationReason::kSessionLimitReached:
            return "SessionLimitReached";
        case RevocationReason::kDeviceMismatch:
            return "DeviceMismatch";
        case RevocationReason::kRotationAborted:
            return "RotationAborted";
    }
    return "Unknown";
}

std::optional<RevocationReason> ParseRevocationReason(const std::string& text) {
    static constexpr RevocationReason kAll[] = {
        RevocationReason::kRotated,
        RevocationReason::kTheftDetected,
        RevocationReason::kManualRevoke,
        RevocationReason::kSessionLimitReached,
        RevocationReason::kDeviceMismatch,
        RevocationReason::kRotationAborted,
    };
    for (auto reason : kAll) {
        if (text == RevocationReasonToString(reason)) {
            return reason;
        }
    }
    return std::nullopt;
}

RefreshToken MakeRefreshToken(std::string id,
                              std::string value,
                              std::string user_id,
                              std::string tenant_id,
                              std::string token_family,
                              const DeviceInfo& device,
                              std::int64_t created_at,
                              std::int64_t lifetime_seconds) {
    RefreshToken token;
    token.id = std::move(id);
    token.value = std::move(value);
    token.user_id = std::move(user_id);
    token.tenant_id = std::move(tenant_id);
    token.token_family = std::move(token_family);
    token.created_at = created_at;
    token.expires_at = created_at + lifetime_seconds;
    token.created_by_ip = device.ip;
    token.user_agent = device.user_agent;
    token.device_fingerprint = device.device_fingerprint;
    token.device_name = device.device_name;
    return token;
}

common::StatusOr<RefreshToken> Revoke(const RefreshToken& token, Revocation revocation) {
    if (token.IsRevoked()) {
        return common::Status::FailedPrecondition("Refresh token already revoked");
    }
    RefreshToken revoked = token;
    revoked.revocation = std::move(revocation);
    return common::StatusOr<RefreshToken>(std::move(revoked));
}

DeviceInfo MergeDeviceInfo(const RefreshToken& predecessor, const DeviceInfo& fresh) {
    DeviceInfo merged;
    merged.ip = fresh.ip.empty() ? predecessor.created_by_ip : fresh.ip;
    merged.user_agent = fresh.user_agent.empty() ? predecessor.user_agent : fresh.user_agent;
    merged.device_fingerprint = fresh.device_fingerprint.empty()
        ? predecessor.device_fingerprint : fresh.device_fingerprint;
    merged.device_name = fresh.device_name.empty() ? predecessor.device_name : fresh.device_name;
    return merged;
}

}
}
