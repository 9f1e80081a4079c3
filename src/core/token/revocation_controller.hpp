#pragma once

#include "common/call_context.hpp"
#include "common/clock.hpp"
#include "core/token/errors.hpp"
#include "core/token/refresh_token.hpp"
#include "core/token/security_events.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace sessionguard {
namespace core {

class TokenStore;

// 用户与管理员发起的吊销操作, 所有操作均可重复执行
class RevocationController {
public:
    RevocationController(std::shared_ptr<TokenStore> store,
                         std::shared_ptr<common::Clock> clock = nullptr,
                         std::shared_ptr<SecurityEventSink> events = nullptr);

    // 吊销用户自己的一个会话(令牌族)
    // 令牌族不存在返回 NotFound, 属于其他用户返回 Forbidden
    TokenStatus RevokeSession(const std::string& user_id,
                              const std::string& family_id,
                              const std::string& actor_ip,
                              const common::CallContext& ctx = common::CallContext::Background());

    // 吊销用户全部会话, 可保留一个令牌族(通常是当前会话)
    TokenResult<std::size_t> RevokeAllSessions(const std::string& user_id,
                                               const std::optional<std::string>& except_family_id,
                                               const std::string& actor_ip,
                                               const common::CallContext& ctx = common::CallContext::Background());

    // 管理员吊销整个令牌族, 不做所有者校验
    TokenResult<std::size_t> RevokeFamily(const std::string& family_id,
                                          RevocationReason reason,
                                          const std::string& actor_ip,
                                          const common::CallContext& ctx = common::CallContext::Background());

    // 登出: 吊销单个令牌, 未知或已吊销的令牌视为成功
    TokenStatus RevokeToken(const std::string& value,
                            const std::string& actor_ip,
                            const common::CallContext& ctx = common::CallContext::Background());

private:
    void Emit(SecurityEventType type, const std::string& user_id, const std::string& tenant_id,
              const std::string& family_id, std::string reason, const std::string& actor_ip,
              std::int64_t now, std::size_t revoked_count);

    std::shared_ptr<TokenStore> store_;
    std::shared_ptr<common::Clock> clock_;
    std::shared_ptr<SecurityEventSink> events_;
};

}
}
