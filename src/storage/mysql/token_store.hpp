#pragma once

#include "core/token/token_store.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sessionguard {
namespace storage {

// 基于 MySQL 的刷新令牌存储, 表结构见 sql/schema.sql
// 条件吊销依赖 "revoked_at IS NULL" 的单行 UPDATE 保证原子性
class MySqlTokenStore : public core::TokenStore {
public:
    explicit MySqlTokenStore(std::shared_ptr<ConnectionPool> pool);

    common::Status Insert(const core::RefreshToken& token) override;
    common::StatusOr<core::RefreshToken> FindByValue(const std::string& value) override;
    common::StatusOr<std::vector<core::RefreshToken>> FindActiveByUser(const std::string& user_id,
                                                                       std::int64_t now) override;
    common::StatusOr<std::vector<core::RefreshToken>> FindByFamily(const std::string& token_family) override;
    common::Status UpdateRevocation(const std::string& value, const core::Revocation& revocation) override;
    // 单条 UPDATE 完成整个令牌族的吊销
    common::StatusOr<std::size_t> RevokeActiveInFamily(const std::string& token_family,
                                                       const core::Revocation& revocation,
                                                       std::int64_t now) override;

private:
    common::StatusOr<std::vector<core::RefreshToken>> Query(ConnectionPool::Lease& lease, const std::string& sql);

    std::shared_ptr<ConnectionPool> pool_;
};

}
}
