#include "core/token/revocation_controller.hpp"

#include "common/logger.hpp"
#include "core/token/token_store.hpp"

#include <utility>
#include <vector>

namespace sessionguard {
namespace core {

namespace {

Revocation MakeRevocation(RevocationReason reason, const std::string& actor_ip, std::int64_t now) {
    Revocation revocation;
    revocation.revoked_at = now;
    revocation.revoked_by_ip = actor_ip;
    revocation.reason = reason;
    return revocation;
}

}

RevocationController::RevocationController(std::shared_ptr<TokenStore> store,
                                           std::shared_ptr<common::Clock> clock,
                                           std::shared_ptr<SecurityEventSink> events)
    : store_(std::move(store)), clock_(std::move(clock)), events_(std::move(events)) {
    if (!store_) {
        store_ = std::make_shared<InMemoryTokenStore>();
    }
    if (!clock_) {
        clock_ = std::make_shared<common::SystemClock>();
    }
    if (!events_) {
        events_ = std::make_shared<LoggingSecurityEventSink>();
    }
}

TokenStatus RevocationController::RevokeSession(const std::string& user_id,
                                                const std::string& family_id,
                                                const std::string& actor_ip,
                                                const common::CallContext& ctx) {
    if (user_id.empty() || family_id.empty()) {
        return TokenStatus(TokenErrorCode::kInvalidArgument, "User ID and session ID are required.");
    }
    auto ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }

    auto family = store_->FindByFamily(family_id);
    if (!family.IsOk()) {
        return FromStoreStatus(family.GetStatus());
    }
    const auto& tokens = family.Value();
    if (tokens.empty()) {
        return TokenStatus(TokenErrorCode::kNotFound, "Session not found.");
    }
    for (const auto& token : tokens) {
        if (token.user_id != user_id) {
            SESSIONGUARD_LOG_WARN("[RevocationController] user={} tried to revoke family={} owned by another user",
                                  user_id, family_id);
            return TokenStatus(TokenErrorCode::kForbidden, "Session belongs to another user.");
        }
    }

    ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }
    const std::int64_t now = clock_->NowSeconds();
    auto revoked = store_->RevokeActiveInFamily(
        family_id, MakeRevocation(RevocationReason::kManualRevoke, actor_ip, now), now);
    if (!revoked.IsOk()) {
        return FromStoreStatus(revoked.GetStatus());
    }

    if (revoked.Value() > 0) {
        Emit(SecurityEventType::kSessionRevoked, user_id, tokens.front().tenant_id, family_id,
             "session revoked by user", actor_ip, now, revoked.Value());
    }
    return TokenStatus::OK();
}

TokenResult<std::size_t> RevocationController::RevokeAllSessions(const std::string& user_id,
                                                                 const std::optional<std::string>& except_family_id,
                                                                 const std::string& actor_ip,
                                                                 const common::CallContext& ctx) {
    if (user_id.empty()) {
        return TokenStatus(TokenErrorCode::kInvalidArgument, "User ID cannot be empty.");
    }
    auto ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }

    const std::int64_t now = clock_->NowSeconds();
    auto active = store_->FindActiveByUser(user_id, now);
    if (!active.IsOk()) {
        return FromStoreStatus(active.GetStatus());
    }

    std::vector<RefreshToken> targets;
    for (auto& token : active.Value()) {
        if (except_family_id && token.token_family == *except_family_id) {
            continue;
        }
        targets.push_back(std::move(token));
    }
    if (targets.empty()) {
        return TokenResult<std::size_t>(std::size_t{0});
    }

    ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }
    auto revoked = RevokeEach(*store_, targets,
                              MakeRevocation(RevocationReason::kManualRevoke, actor_ip, now), now);
    if (!revoked.IsOk()) {
        return FromStoreStatus(revoked.GetStatus());
    }

    SESSIONGUARD_LOG_INFO("[RevocationController] user={} revoked {} tokens, kept family={}",
                          user_id, revoked.Value(), except_family_id.value_or("<none>"));
    // 目标令牌已被并发吊销时不重复上报
    if (revoked.Value() > 0) {
        Emit(SecurityEventType::kAllSessionsRevoked, user_id, targets.front().tenant_id,
             except_family_id.value_or(""), "all sessions revoked by user", actor_ip, now, revoked.Value());
    }
    return TokenResult<std::size_t>(revoked.Value());
}

TokenResult<std::size_t> RevocationController::RevokeFamily(const std::string& family_id,
                                                            RevocationReason reason,
                                                            const std::string& actor_ip,
                                                            const common::CallContext& ctx) {
    if (family_id.empty()) {
        return TokenStatus(TokenErrorCode::kInvalidArgument, "Session ID cannot be empty.");
    }
    auto ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }

    auto family = store_->FindByFamily(family_id);
    if (!family.IsOk()) {
        return FromStoreStatus(family.GetStatus());
    }
    if (family.Value().empty()) {
        return TokenStatus(TokenErrorCode::kNotFound, "Session not found.");
    }

    ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }
    const std::int64_t now = clock_->NowSeconds();
    auto revoked = store_->RevokeActiveInFamily(family_id, MakeRevocation(reason, actor_ip, now), now);
    if (!revoked.IsOk()) {
        return FromStoreStatus(revoked.GetStatus());
    }

    const RefreshToken& newest = family.Value().front();
    Emit(SecurityEventType::kFamilyRevoked, newest.user_id, newest.tenant_id, family_id,
         RevocationReasonToString(reason), actor_ip, now, revoked.Value());
    return TokenResult<std::size_t>(revoked.Value());
}

TokenStatus RevocationController::RevokeToken(const std::string& value,
                                              const std::string& actor_ip,
                                              const common::CallContext& ctx) {
    auto ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }
    if (value.empty()) {
        return TokenStatus::OK();
    }

    auto found = store_->FindByValue(value);
    if (!found.IsOk()) {
        if (found.Code() == common::StatusCode::kNotFound) {
            return TokenStatus::OK();
        }
        return FromStoreStatus(found.GetStatus());
    }
    const RefreshToken& token = found.Value();
    if (token.IsRevoked()) {
        return TokenStatus::OK();
    }

    ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }
    const std::int64_t now = clock_->NowSeconds();
    auto status = store_->UpdateRevocation(value, MakeRevocation(RevocationReason::kManualRevoke, actor_ip, now));
    if (status.Code() == common::StatusCode::kFailedPrecondition ||
        status.Code() == common::StatusCode::kNotFound) {
        return TokenStatus::OK();
    }
    if (!status.IsOk()) {
        return FromStoreStatus(status);
    }

    Emit(SecurityEventType::kTokenRevoked, token.user_id, token.tenant_id, token.token_family,
         "refresh token revoked", actor_ip, now, 1);
    return TokenStatus::OK();
}

void RevocationController::Emit(SecurityEventType type, const std::string& user_id,
                                const std::string& tenant_id, const std::string& family_id,
                                std::string reason, const std::string& actor_ip,
                                std::int64_t now, std::size_t revoked_count) {
    SecurityEvent event;
    event.type = type;
    event.severity = EventSeverity::kInfo;
    event.user_id = user_id;
    event.tenant_id = tenant_id;
    event.token_family = family_id;
    event.reason = std::move(reason);
    event.actor_ip = actor_ip;
    event.occurred_at = now;
    event.revoked_count = revoked_count;
    events_->Report(event);
}

}
}
