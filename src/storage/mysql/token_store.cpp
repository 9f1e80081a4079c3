#include "storage/mysql/token_store.hpp"

#include "common/logger.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <memory>

namespace sessionguard {
namespace storage {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, token_value, user_id, tenant_id, token_family, created_at, expires_at, "
    "created_by_ip, user_agent, device_fingerprint, device_name, "
    "revoked_at, revoked_by_ip, reason_revoked, replaced_by_token FROM refresh_tokens";

std::string Column(MYSQL_ROW row, unsigned long* lengths, int index) {
    if (row[index] == nullptr) {
        return "";
    }
    return std::string(row[index], lengths[index]);
}

std::int64_t IntColumn(MYSQL_ROW row, int index) {
    return row[index] ? std::strtoll(row[index], nullptr, 10) : 0;
}

// 空字符串写成 NULL
std::string NullableLiteral(Connection& conn, const std::string& value) {
    if (value.empty()) {
        return "NULL";
    }
    return fmt::format("'{}'", conn.Escape(value));
}

std::string RevocationAssignments(Connection& conn, const core::Revocation& revocation) {
    return fmt::format("revoked_at = {}, revoked_by_ip = {}, reason_revoked = '{}', replaced_by_token = {}",
                       revocation.revoked_at,
                       NullableLiteral(conn, revocation.revoked_by_ip),
                       core::RevocationReasonToString(revocation.reason),
                       NullableLiteral(conn, revocation.replaced_by_token));
}

core::RefreshToken ParseRow(MYSQL_ROW row, unsigned long* lengths) {
    core::RefreshToken token;
    token.id = Column(row, lengths, 0);
    token.value = Column(row, lengths, 1);
    token.user_id = Column(row, lengths, 2);
    token.tenant_id = Column(row, lengths, 3);
    token.token_family = Column(row, lengths, 4);
    token.created_at = IntColumn(row, 5);
    token.expires_at = IntColumn(row, 6);
    token.created_by_ip = Column(row, lengths, 7);
    token.user_agent = Column(row, lengths, 8);
    token.device_fingerprint = Column(row, lengths, 9);
    token.device_name = Column(row, lengths, 10);
    if (row[11] != nullptr) {
        core::Revocation revocation;
        revocation.revoked_at = IntColumn(row, 11);
        revocation.revoked_by_ip = Column(row, lengths, 12);
        auto reason = core::ParseRevocationReason(Column(row, lengths, 13));
        if (!reason) {
            SESSIONGUARD_LOG_WARN("[MySqlTokenStore] unknown revocation reason '{}' for token id={}",
                                  Column(row, lengths, 13), token.id);
        }
        revocation.reason = reason.value_or(core::RevocationReason::kManualRevoke);
        revocation.replaced_by_token = Column(row, lengths, 14);
        token.revocation = std::move(revocation);
    }
    return token;
}

// 断线或超时的连接不再放回连接池
void DiscardIfBroken(ConnectionPool::Lease& lease, const common::Status& status) {
    if (status.Code() == common::StatusCode::kUnavailable) {
        lease.Discard();
    }
}

} // namespace

MySqlTokenStore::MySqlTokenStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

common::Status MySqlTokenStore::Insert(const core::RefreshToken& token) {
    if (token.value.empty() || token.user_id.empty() || token.token_family.empty()) {
        return common::Status::InvalidArgument("Token value, user ID and family are required");
    }
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    Connection& conn = *lease;

    auto sql = fmt::format(
        "INSERT INTO refresh_tokens (id, token_value, user_id, tenant_id, token_family, created_at, expires_at, "
        "created_by_ip, user_agent, device_fingerprint, device_name) "
        "VALUES ('{}', '{}', '{}', {}, '{}', {}, {}, {}, {}, {}, {})",
        conn.Escape(token.id),
        conn.Escape(token.value),
        conn.Escape(token.user_id),
        NullableLiteral(conn, token.tenant_id),
        conn.Escape(token.token_family),
        token.created_at,
        token.expires_at,
        NullableLiteral(conn, token.created_by_ip),
        NullableLiteral(conn, token.user_agent),
        NullableLiteral(conn, token.device_fingerprint),
        NullableLiteral(conn, token.device_name));
    auto result = conn.Execute(sql);
    if (!result.IsOk()) {
        DiscardIfBroken(lease, result.GetStatus());
        return result.GetStatus();
    }
    return common::Status::OK();
}

common::StatusOr<core::RefreshToken> MySqlTokenStore::FindByValue(const std::string& value) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto sql = fmt::format("{} WHERE token_value = '{}' LIMIT 1", kSelectColumns, lease->Escape(value));
    auto rows = Query(lease, sql);
    if (!rows.IsOk()) {
        return rows.GetStatus();
    }
    if (rows.Value().empty()) {
        return common::Status::NotFound("Refresh token not found");
    }
    return common::StatusOr<core::RefreshToken>(std::move(rows.Value().front()));
}

common::StatusOr<std::vector<core::RefreshToken>> MySqlTokenStore::FindActiveByUser(const std::string& user_id,
                                                                                    std::int64_t now) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto sql = fmt::format(
        "{} WHERE user_id = '{}' AND revoked_at IS NULL AND expires_at > {} "
        "ORDER BY created_at DESC, row_id DESC",
        kSelectColumns, lease->Escape(user_id), now);
    return Query(lease, sql);
}

common::StatusOr<std::vector<core::RefreshToken>> MySqlTokenStore::FindByFamily(const std::string& token_family) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto sql = fmt::format("{} WHERE token_family = '{}' ORDER BY created_at DESC, row_id DESC",
                           kSelectColumns, lease->Escape(token_family));
    return Query(lease, sql);
}

common::Status MySqlTokenStore::UpdateRevocation(const std::string& value, const core::Revocation& revocation) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    Connection& conn = *lease;

    const std::string escaped = conn.Escape(value);
    auto sql = fmt::format("UPDATE refresh_tokens SET {} WHERE token_value = '{}' AND revoked_at IS NULL",
                           RevocationAssignments(conn, revocation), escaped);
    auto affected = conn.Execute(sql);
    if (!affected.IsOk()) {
        DiscardIfBroken(lease, affected.GetStatus());
        return affected.GetStatus();
    }
    if (affected.Value() > 0) {
        return common::Status::OK();
    }

    // 没有行被更新: 区分令牌不存在和已被吊销
    auto exists_sql = fmt::format("SELECT 1 FROM refresh_tokens WHERE token_value = '{}' LIMIT 1", escaped);
    if (mysql_real_query(conn.Raw(), exists_sql.c_str(), exists_sql.size()) != 0) {
        auto status = MakeMySqlStatus(conn.Raw(), "existence check failed");
        DiscardIfBroken(lease, status);
        return status;
    }
    MYSQL_RES* res = mysql_store_result(conn.Raw());
    if (res == nullptr) {
        return MakeMySqlStatus(conn.Raw(), "mysql_store_result failed");
    }
    auto cleanup = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>(res, mysql_free_result);
    if (mysql_num_rows(res) == 0) {
        return common::Status::NotFound("Refresh token not found");
    }
    return common::Status::FailedPrecondition("Refresh token already revoked");
}

common::StatusOr<std::size_t> MySqlTokenStore::RevokeActiveInFamily(const std::string& token_family,
                                                                     const core::Revocation& revocation,
                                                                     std::int64_t now) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    Connection& conn = *lease;

    // 令牌族吊销不记录后继令牌
    core::Revocation family_revocation = revocation;
    family_revocation.replaced_by_token.clear();
    auto sql = fmt::format(
        "UPDATE refresh_tokens SET {} WHERE token_family = '{}' AND revoked_at IS NULL AND expires_at > {}",
        RevocationAssignments(conn, family_revocation), conn.Escape(token_family), now);
    auto affected = conn.Execute(sql);
    if (!affected.IsOk()) {
        DiscardIfBroken(lease, affected.GetStatus());
        return affected.GetStatus();
    }
    return common::StatusOr<std::size_t>(static_cast<std::size_t>(affected.Value()));
}

common::StatusOr<std::vector<core::RefreshToken>> MySqlTokenStore::Query(ConnectionPool::Lease& lease,
                                                                         const std::string& sql) {
    MYSQL* conn = lease.Raw();
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        auto status = MakeMySqlStatus(conn, "query failed");
        DiscardIfBroken(lease, status);
        return status;
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (res == nullptr) {
        auto status = MakeMySqlStatus(conn, "mysql_store_result failed");
        DiscardIfBroken(lease, status);
        return status;
    }
    auto cleanup = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>(res, mysql_free_result);

    std::vector<core::RefreshToken> tokens;
    tokens.reserve(static_cast<std::size_t>(mysql_num_rows(res)));
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        unsigned long* lengths = mysql_fetch_lengths(res);
        tokens.push_back(ParseRow(row, lengths));
    }
    return common::StatusOr<std::vector<core::RefreshToken>>(std::move(tokens));
}

} // namespace storage
} // namespace sessionguard
