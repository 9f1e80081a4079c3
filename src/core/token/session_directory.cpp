#include "core/token/session_directory.hpp"

#include "common/logger.hpp"
#include "core/token/token_store.hpp"

#include <algorithm>
#include <unordered_map>

namespace sessionguard {
namespace core {

SessionDirectory::SessionDirectory(std::shared_ptr<TokenStore> store, std::shared_ptr<common::Clock> clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
    if (!store_) {
        store_ = std::make_shared<InMemoryTokenStore>();
    }
    if (!clock_) {
        clock_ = std::make_shared<common::SystemClock>();
    }
}

TokenResult<std::vector<SessionView>> SessionDirectory::ListSessions(const std::string& user_id,
                                                                     const std::string& current_token,
                                                                     const common::CallContext& ctx) {
    auto ctx_status = ctx.Check();
    if (!ctx_status.IsOk()) {
        return FromContextStatus(ctx_status);
    }
    if (user_id.empty()) {
        return TokenStatus(TokenErrorCode::kInvalidArgument, "User ID cannot be empty.");
    }

    auto active = store_->FindActiveByUser(user_id, clock_->NowSeconds());
    if (!active.IsOk()) {
        return FromStoreStatus(active.GetStatus());
    }

    std::vector<SessionView> sessions;
    std::unordered_map<std::string, std::size_t> index_by_family;
    for (const auto& token : active.Value()) {
        const bool is_current = !current_token.empty() && token.value == current_token;
        auto it = index_by_family.find(token.token_family);
        if (it != index_by_family.end()) {
            // 同一令牌族出现多个活跃令牌属于数据异常, 只保留最新的一条用于展示
            SESSIONGUARD_LOG_WARN("[SessionDirectory] family={} has more than one active token",
                                  token.token_family);
            SessionView& existing = sessions[it->second];
            existing.is_current = existing.is_current || is_current;
            if (token.created_at > existing.created_at) {
                existing.device_name = token.device_name;
                existing.user_agent = token.user_agent;
                existing.ip_address = token.created_by_ip;
                existing.created_at = token.created_at;
                existing.expires_at = token.expires_at;
            }
            continue;
        }

        SessionView view;
        view.session_id = token.token_family;
        view.device_name = token.device_name;
        view.user_agent = token.user_agent;
        view.ip_address = token.created_by_ip;
        view.created_at = token.created_at;
        view.expires_at = token.expires_at;
        view.is_current = is_current;
        index_by_family.emplace(token.token_family, sessions.size());
        sessions.push_back(std::move(view));
    }

    std::stable_sort(sessions.begin(), sessions.end(), [](const SessionView& lhs, const SessionView& rhs) {
        if (lhs.is_current != rhs.is_current) {
            return lhs.is_current;
        }
        return lhs.created_at > rhs.created_at;
    });
    return TokenResult<std::vector<SessionView>>(std::move(sessions));
}

TokenResult<std::size_t> SessionDirectory::CountActiveSessions(const std::string& user_id,
                                                               const common::CallContext& ctx) {
    auto sessions = ListSessions(user_id, "", ctx);
    if (!sessions.IsOk()) {
        return sessions.GetStatus();
    }
    return TokenResult<std::size_t>(sessions.Value().size());
}

}
}
