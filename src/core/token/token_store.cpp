#include "core/token/token_store.hpp"

#include <algorithm>
#include <mutex>

namespace sessionguard {
namespace core {

common::StatusOr<std::size_t> TokenStore::RevokeActiveInFamily(const std::string& token_family,
                                                               const Revocation& revocation,
                                                               std::int64_t now) {
    auto family = FindByFamily(token_family);
    if (!family.IsOk()) {
        return family.GetStatus();
    }
    return RevokeEach(*this, family.Value(), revocation, now);
}

common::StatusOr<std::size_t> RevokeEach(TokenStore& store,
                                         const std::vector<RefreshToken>& tokens,
                                         const Revocation& revocation,
                                         std::int64_t now) {
    std::size_t revoked = 0;
    for (const auto& token : tokens) {
        if (!token.IsActive(now)) {
            continue;
        }
        auto status = store.UpdateRevocation(token.value, revocation);
        if (status.IsOk()) {
            ++revoked;
            continue;
        }
        // 并发吊销或已被清理, 目标状态已经达成
        if (status.Code() == common::StatusCode::kFailedPrecondition ||
            status.Code() == common::StatusCode::kNotFound) {
            continue;
        }
        return status;
    }
    return common::StatusOr<std::size_t>(revoked);
}

common::Status InMemoryTokenStore::Insert(const RefreshToken& token) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (tokens_.count(token.value) > 0) {
        return common::Status::AlreadyExists("Refresh token value already exists");
    }
    Entry entry;
    entry.token = token;
    entry.sequence = next_sequence_++;
    tokens_.emplace(token.value, std::move(entry));
    by_user_[token.user_id].push_back(token.value);
    by_family_[token.token_family].push_back(token.value);
    return common::Status::OK();
}

common::StatusOr<RefreshToken> InMemoryTokenStore::FindByValue(const std::string& value) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(value);
    if (it == tokens_.end()) {
        return common::Status::NotFound("Refresh token not found");
    }
    return common::StatusOr<RefreshToken>(it->second.token);
}

common::StatusOr<std::vector<RefreshToken>> InMemoryTokenStore::FindActiveByUser(const std::string& user_id,
                                                                                 std::int64_t now) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_user_.find(user_id);
    if (it == by_user_.end()) {
        return common::StatusOr<std::vector<RefreshToken>>(std::vector<RefreshToken>{});
    }
    return common::StatusOr<std::vector<RefreshToken>>(CollectNewestFirst(it->second, true, now));
}

common::StatusOr<std::vector<RefreshToken>> InMemoryTokenStore::FindByFamily(const std::string& token_family) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_family_.find(token_family);
    if (it == by_family_.end()) {
        return common::StatusOr<std::vector<RefreshToken>>(std::vector<RefreshToken>{});
    }
    return common::StatusOr<std::vector<RefreshToken>>(CollectNewestFirst(it->second, false, 0));
}

// 比较并设置: 在写锁内重新检查吊销状态
common::Status InMemoryTokenStore::UpdateRevocation(const std::string& value, const Revocation& revocation) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(value);
    if (it == tokens_.end()) {
        return common::Status::NotFound("Refresh token not found");
    }
    auto revoked = Revoke(it->second.token, revocation);
    if (!revoked.IsOk()) {
        return revoked.GetStatus();
    }
    it->second.token = std::move(revoked.Value());
    return common::Status::OK();
}

std::size_t InMemoryTokenStore::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tokens_.size();
}

std::vector<RefreshToken> InMemoryTokenStore::CollectNewestFirst(const std::vector<std::string>& values,
                                                                 bool active_only,
                                                                 std::int64_t now) const {
    std::vector<const Entry*> entries;
    entries.reserve(values.size());
    for (const auto& value : values) {
        auto it = tokens_.find(value);
        if (it == tokens_.end()) {
            continue;
        }
        if (active_only && !it->second.token.IsActive(now)) {
            continue;
        }
        entries.push_back(&it->second);
    }
    std::sort(entries.begin(), entries.end(), [](const Entry* lhs, const Entry* rhs) {
        if (lhs->token.created_at != rhs->token.created_at) {
            return lhs->token.created_at > rhs->token.created_at;
        }
        return lhs->sequence > rhs->sequence;
    });

    std::vector<RefreshToken> result;
    result.reserve(entries.size());
    for (const auto* entry : entries) {
        result.push_back(entry->token);
    }
    return result;
}

}
}
