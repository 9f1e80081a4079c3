#include "core/token/rotation_engine.hpp"

#include "common/logger.hpp"
#include "core/token/access_token_signer.hpp"
#include "core/token/token_generator.hpp"
#include "core/token/token_store.hpp"

#include <fmt/format.h>

#include <unordered_set>
#include <utility>
#include <vector>

namespace sessionguard {
namespace core {

RotationConfig MakeRotationConfig(const common::AppConfig& config) {
    RotationConfig result;
    result.lifetime_days = config.token.lifetime_days;
    result.max_concurrent_sessions = config.token.max_concurrent_sessions;
    result.enforce_device_binding = config.token.enforce_device_binding;
    result.max_generate_attempts = config.token.max_generate_attempts;
    result.report_expired = config.events.log_expired;
    return result;
}

RotationEngine::RotationEngine(RotationConfig config,
                               std::shared_ptr<TokenStore> store,
                               std::shared_ptr<TokenGenerator> generator,
                               std::shared_ptr<common::Clock> clock,
                               std::shared_ptr<AccessTokenSigner> signer,
                               std::shared_ptr<SecurityEventSink> events)
    : config_(std::move(config))
    , store_(std::move(store))
    , generator_(std::move(generator))
    , clock_(std::move(clock))
    , signer_(std::move(signer))
    , events_(std::move(events)) {
    if (!store_) {
        store_ = std::make_shared<InMemoryTokenStore>();
    }
    if (!generator_) {
        generator_ = std::make_shared<SecureTokenGenerator>();
    }
    if (!clock_) {
        clock_ = std::make_shared<common::SystemClock>();
    }
    if (!events_) {
        events_ = std::make_shared<LoggingSecurityEventSink>();
    }
    if (config_.max_generate_attempts <= 0) {
        config_.max_generate_attempts = 1;
    }
}

TokenResult<IssuedToken> RotationEngine::IssueInitial(const IssueCommand& command,
                                                      const common::CallContext& ctx) {
    if (command.user_id.empty()) {
        return TokenStatus(TokenErrorCode::kInvalidArgument, "User ID cannot be empty.");
    }
    if (command.lifetime_days < 0) {
        return TokenStatus(TokenErrorCode::kInvalidArgument, "Token lifetime cannot be negative.");
    }
    const int lifetime_days = command.lifetime_days > 0 ? command.lifetime_days : config_.lifetime_days;
    const std::int64_t now = clock_->NowSeconds();

    RefreshToken draft = MakeRefreshToken("", "", command.user_id, command.tenant_id,
                                          generator_->GenerateId(), command.device, now,
                                          static_cast<std::int64_t>(lifetime_days) * common::kSecondsPerDay);

    auto inserted = InsertWithFreshValue(std::move(draft), ctx);
    if (!inserted.IsOk()) {
        return inserted.GetStatus();
    }
    const RefreshToken& token = inserted.Value();

    // 新会话已落库后再挤出旧会话, 写入失败不会误伤现有会话
    if (config_.max_concurrent_sessions > 0) {
        EnforceSessionLimit(token, now);
    }

    SESSIONGUARD_LOG_INFO("[RotationEngine] issued family={} user={} expires_at={}",
                          token.token_family, token.user_id, token.expires_at);

    IssuedToken issued;
    issued.value = token.value;
    issued.token_id = token.id;
    issued.token_family = token.token_family;
    issued.expires_at = token.expires_at;
    return TokenResult<IssuedToken>(std::move(issued));
}

TokenResult<RotatedTokenPair> RotationEngine::Rotate(const RotateCommand& command,
                                                     const common::CallContext& ctx) {
    auto ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }
    if (command.presented_value.empty()) {
        return TokenStatus(TokenErrorCode::kInvalidToken, "Refresh token is required.");
    }

    const std::int64_t now = clock_->NowSeconds();
    const std::string& actor_ip = command.device.ip;

    // 1. 查找提交的令牌
    auto found = store_->FindByValue(command.presented_value);
    if (!found.IsOk()) {
        if (found.Code() == common::StatusCode::kNotFound) {
            return TokenStatus(TokenErrorCode::kInvalidToken, "Refresh token not found.");
        }
        return FromStoreStatus(found.GetStatus());
    }
    const RefreshToken presented = std::move(found.Value());

    // 2. 已吊销: 无论原因, 再次提交都视为盗用
    if (presented.IsRevoked()) {
        return HandleReuse(presented, actor_ip, now);
    }

    // 3. 已过期: 良性失败, 不做令牌族级别的处理
    if (presented.IsExpired(now)) {
        if (config_.report_expired) {
            Emit(SecurityEventType::kTokenExpired, EventSeverity::kInfo, presented,
                 "expired refresh token presented", actor_ip, now);
        }
        return TokenStatus(TokenErrorCode::kTokenExpired, "Refresh token expired.");
    }

    ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }

    if (config_.enforce_device_binding && !DeviceMatches(presented, command.device.device_fingerprint)) {
        Revocation revocation;
        revocation.revoked_at = now;
        revocation.revoked_by_ip = actor_ip;
        revocation.reason = RevocationReason::kDeviceMismatch;
        auto status = store_->UpdateRevocation(presented.value, revocation);
        if (status.Code() == common::StatusCode::kFailedPrecondition) {
            return HandleReuse(presented, actor_ip, now);
        }
        if (!status.IsOk()) {
            return FromStoreStatus(status);
        }
        Emit(SecurityEventType::kDeviceMismatch, EventSeverity::kWarning, presented,
             "device fingerprint mismatch", actor_ip, now, 1);
        return TokenStatus(TokenErrorCode::kDeviceMismatch, "Device fingerprint mismatch.");
    }

    // 先签发访问令牌, 失败时不产生任何写入
    std::string access_token;
    if (signer_) {
        auto signed_token = signer_->Sign(presented.user_id, presented.tenant_id);
        if (!signed_token.IsOk()) {
            SESSIONGUARD_LOG_ERROR("[RotationEngine] access token signing failed: {}",
                                   signed_token.GetStatus().Message());
            return FromStoreStatus(signed_token.GetStatus());
        }
        access_token = std::move(signed_token.Value());
    }

    // 4. 先写入后继令牌, 再条件吊销当前令牌
    RefreshToken draft = MakeRefreshToken("", "", presented.user_id, presented.tenant_id,
                                          presented.token_family,
                                          MergeDeviceInfo(presented, command.device),
                                          now, presented.LifetimeSeconds());
    auto inserted = InsertWithFreshValue(std::move(draft), ctx);
    if (!inserted.IsOk()) {
        return inserted.GetStatus();
    }
    const RefreshToken successor = std::move(inserted.Value());

    // 后继令牌已写入, 此后不再响应取消, 保证两次写入成对完成
    Revocation revocation;
    revocation.revoked_at = now;
    revocation.revoked_by_ip = actor_ip;
    revocation.reason = RevocationReason::kRotated;
    revocation.replaced_by_token = successor.value;
    auto status = store_->UpdateRevocation(presented.value, revocation);
    if (!status.IsOk()) {
        if (status.Code() == common::StatusCode::kFailedPrecondition) {
            // 并发轮换中落败: 另一个调用已经消费了该令牌
            SESSIONGUARD_LOG_WARN("[RotationEngine] concurrent rotation lost, family={}",
                                  presented.token_family);
            return HandleReuse(presented, actor_ip, now);
        }
        AbortOrphan(successor, actor_ip, now);
        if (status.Code() == common::StatusCode::kNotFound) {
            return TokenStatus(TokenErrorCode::kInvalidToken, "Refresh token not found.");
        }
        return FromStoreStatus(status);
    }

    SESSIONGUARD_LOG_DEBUG("[RotationEngine] rotated family={} user={}",
                           successor.token_family, successor.user_id);

    RotatedTokenPair pair;
    pair.access_token = std::move(access_token);
    pair.refresh_token = successor.value;
    pair.token_id = successor.id;
    pair.token_family = successor.token_family;
    pair.user_id = successor.user_id;
    pair.tenant_id = successor.tenant_id;
    pair.expires_at = successor.expires_at;
    return TokenResult<RotatedTokenPair>(std::move(pair));
}

TokenResult<RefreshToken> RotationEngine::Validate(const std::string& value,
                                                   const std::string& device_fingerprint,
                                                   const common::CallContext& ctx) {
    auto ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }
    auto found = store_->FindByValue(value);
    if (!found.IsOk()) {
        if (found.Code() == common::StatusCode::kNotFound) {
            return TokenStatus(TokenErrorCode::kInvalidToken, "Refresh token not found.");
        }
        return FromStoreStatus(found.GetStatus());
    }
    const std::int64_t now = clock_->NowSeconds();
    const RefreshToken& token = found.Value();
    if (token.IsRevoked()) {
        return TokenStatus(TokenErrorCode::kInvalidToken, "Refresh token revoked.");
    }
    if (token.IsExpired(now)) {
        return TokenStatus(TokenErrorCode::kTokenExpired, "Refresh token expired.");
    }
    if (config_.enforce_device_binding && !DeviceMatches(token, device_fingerprint)) {
        return TokenStatus(TokenErrorCode::kDeviceMismatch, "Device fingerprint mismatch.");
    }
    return TokenResult<RefreshToken>(token);
}

TokenResult<RefreshToken> RotationEngine::InsertWithFreshValue(RefreshToken draft,
                                                               const common::CallContext& ctx) {
    for (int attempt = 1; attempt <= config_.max_generate_attempts; ++attempt) {
        auto ctx_status = ctx.Check();
        if (!ctx_status.IsOk()) {
            return FromContextStatus(ctx_status);
        }
        draft.id = generator_->GenerateId();
        draft.value = generator_->Generate();
        auto status = store_->Insert(draft);
        if (status.IsOk()) {
            return TokenResult<RefreshToken>(std::move(draft));
        }
        if (status.Code() != common::StatusCode::kAlreadyExists) {
            return FromStoreStatus(status);
        }
        SESSIONGUARD_LOG_WARN("[RotationEngine] generated token value collided, attempt {}/{}",
                              attempt, config_.max_generate_attempts);
    }
    SESSIONGUARD_LOG_ERROR("[RotationEngine] token generation exhausted after {} attempts",
                           config_.max_generate_attempts);
    return TokenStatus(TokenErrorCode::kInternal, "Unable to generate a unique refresh token.");
}

TokenStatus RotationEngine::HandleReuse(const RefreshToken& presented,
                                        const std::string& actor_ip,
                                        std::int64_t now) {
    Revocation revocation;
    revocation.revoked_at = now;
    revocation.revoked_by_ip = actor_ip;
    revocation.reason = RevocationReason::kTheftDetected;
    auto revoked = store_->RevokeActiveInFamily(presented.token_family, revocation, now);

    std::string previous = presented.IsRevoked()
        ? RevocationReasonToString(presented.revocation->reason)
        : "concurrent rotation";
    Emit(SecurityEventType::kTokenReuseDetected, EventSeverity::kCritical, presented,
         fmt::format("revoked refresh token presented again (previous: {})", previous),
         actor_ip, now, revoked.ValueOr(0));

    if (!revoked.IsOk()) {
        // 令牌族未能全部吊销, 交给调用方重试; 再次提交仍会进入本分支
        SESSIONGUARD_LOG_ERROR("[RotationEngine] family revocation failed, family={}: {}",
                               presented.token_family, revoked.GetStatus().Message());
        return FromStoreStatus(revoked.GetStatus());
    }
    return TokenStatus(TokenErrorCode::kTokenReuseDetected, "Refresh token reuse detected.");
}

void RotationEngine::EnforceSessionLimit(const RefreshToken& issued, std::int64_t now) {
    auto active = store_->FindActiveByUser(issued.user_id, now);
    if (!active.IsOk()) {
        SESSIONGUARD_LOG_WARN("[RotationEngine] session limit check skipped: {}",
                              active.GetStatus().Message());
        return;
    }

    // 按最新成员从新到旧排列的令牌族, 新签发的令牌族总是保留
    std::vector<const RefreshToken*> families;
    std::unordered_set<std::string> seen{issued.token_family};
    for (const auto& token : active.Value()) {
        if (seen.insert(token.token_family).second) {
            families.push_back(&token);
        }
    }

    const auto keep = static_cast<std::size_t>(config_.max_concurrent_sessions) - 1;
    if (families.size() <= keep) {
        return;
    }

    Revocation revocation;
    revocation.revoked_at = now;
    revocation.revoked_by_ip = issued.created_by_ip;
    revocation.reason = RevocationReason::kSessionLimitReached;
    for (std::size_t i = keep; i < families.size(); ++i) {
        const RefreshToken& oldest = *families[i];
        auto revoked = store_->RevokeActiveInFamily(oldest.token_family, revocation, now);
        if (!revoked.IsOk()) {
            SESSIONGUARD_LOG_WARN("[RotationEngine] failed to evict family={}: {}",
                                  oldest.token_family, revoked.GetStatus().Message());
            continue;
        }
        Emit(SecurityEventType::kSessionLimitEnforced, EventSeverity::kInfo, oldest,
             "session limit reached", issued.created_by_ip, now, revoked.Value());
    }
}

void RotationEngine::AbortOrphan(const RefreshToken& orphan, const std::string& actor_ip, std::int64_t now) {
    Revocation revocation;
    revocation.revoked_at = now;
    revocation.revoked_by_ip = actor_ip;
    revocation.reason = RevocationReason::kRotationAborted;
    auto status = store_->UpdateRevocation(orphan.value, revocation);
    if (!status.IsOk()) {
        SESSIONGUARD_LOG_ERROR("[RotationEngine] orphaned successor left active, family={}: {}",
                               orphan.token_family, status.Message());
    }
}

bool RotationEngine::DeviceMatches(const RefreshToken& token, const std::string& device_fingerprint) const {
    // 签发时没有记录指纹的令牌不做绑定
    if (token.device_fingerprint.empty()) {
        return true;
    }
    return token.device_fingerprint == device_fingerprint;
}

void RotationEngine::Emit(SecurityEventType type, EventSeverity severity, const RefreshToken& token,
                          std::string reason, const std::string& actor_ip, std::int64_t now,
                          std::size_t revoked_count) {
    SecurityEvent event;
    event.type = type;
    event.severity = severity;
    event.user_id = token.user_id;
    event.tenant_id = token.tenant_id;
    event.token_family = token.token_family;
    event.reason = std::move(reason);
    event.actor_ip = actor_ip;
    event.occurred_at = now;
    event.revoked_count = revoked_count;
    events_->Report(event);
}

}
}
