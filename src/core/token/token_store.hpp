#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/token/refresh_token.hpp"

#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sessionguard {
namespace core {

// 刷新令牌存储接口
// 所有操作要么整体完成要么整体失败; 单条记录需提供读己之写一致性
class TokenStore {
public:
    virtual ~TokenStore() = default;

    // 插入新令牌, 令牌值已存在时返回 AlreadyExists
    virtual common::Status Insert(const RefreshToken& token) = 0;

    // 按令牌值查找, 不存在返回 NotFound
    virtual common::StatusOr<RefreshToken> FindByValue(const std::string& value) = 0;

    // 用户所有未吊销且未过期的令牌, 按创建时间从新到旧
    virtual common::StatusOr<std::vector<RefreshToken>> FindActiveByUser(const std::string& user_id,
                                                                         std::int64_t now) = 0;

    // 令牌族中的所有令牌, 按创建时间从新到旧
    virtual common::StatusOr<std::vector<RefreshToken>> FindByFamily(const std::string& token_family) = 0;

    // 条件写: 仅当令牌当前未吊销时写入吊销字段
    // 已吊销返回 FailedPrecondition, 不存在返回 NotFound
    virtual common::Status UpdateRevocation(const std::string& value, const Revocation& revocation) = 0;

    // 吊销令牌族中所有仍有效的令牌, 返回本次实际吊销的数量
    // 默认实现逐条条件写, 各条独立但最终状态收敛
    virtual common::StatusOr<std::size_t> RevokeActiveInFamily(const std::string& token_family,
                                                               const Revocation& revocation,
                                                               std::int64_t now);
};

// 对给定令牌逐条执行条件吊销, 已被并发吊销的令牌视为成功跳过
common::StatusOr<std::size_t> RevokeEach(TokenStore& store,
                                         const std::vector<RefreshToken>& tokens,
                                         const Revocation& revocation,
                                         std::int64_t now);

// 基于内存的参考实现, 线程安全
class InMemoryTokenStore : public TokenStore {
public:
    common::Status Insert(const RefreshToken& token) override;
    common::StatusOr<RefreshToken> FindByValue(const std::string& value) override;
    common::StatusOr<std::vector<RefreshToken>> FindActiveByUser(const std::string& user_id,
                                                                 std::int64_t now) override;
    common::StatusOr<std::vector<RefreshToken>> FindByFamily(const std::string& token_family) override;
    common::Status UpdateRevocation(const std::string& value, const Revocation& revocation) override;

    std::size_t Size() const;

private:
    struct Entry {
        RefreshToken token;
        std::uint64_t sequence = 0; // 插入顺序, 创建时间相同时用于排序
    };

    std::vector<RefreshToken> CollectNewestFirst(const std::vector<std::string>& values,
                                                 bool active_only,
                                                 std::int64_t now) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> tokens_;                     // value -> entry
    std::unordered_map<std::string, std::vector<std::string>> by_user_;   // user_id -> values
    std::unordered_map<std::string, std::vector<std::string>> by_family_; // family -> values
    std::uint64_t next_sequence_ = 1;
};

}
}
