#pragma once

#include "common/call_context.hpp"
#include "common/clock.hpp"
#include "core/token/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sessionguard {
namespace core {

class TokenStore;

// 面向用户的会话视图, 一个令牌族对应一个会话
struct SessionView {
    std::string session_id;     // 令牌族ID, 用于吊销
    std::string device_name;
    std::string user_agent;
    std::string ip_address;
    std::int64_t created_at = 0;
    std::int64_t expires_at = 0;
    bool is_current = false;    // 是否为发起本次请求的会话
};

class SessionDirectory {
public:
    SessionDirectory(std::shared_ptr<TokenStore> store, std::shared_ptr<common::Clock> clock = nullptr);

    // 列出用户的活跃会话: 当前会话在前, 其余按创建时间从新到旧
    // current_token 为调用方自己持有的刷新令牌, 可为空
    TokenResult<std::vector<SessionView>> ListSessions(const std::string& user_id,
                                                       const std::string& current_token = "",
                                                       const common::CallContext& ctx = common::CallContext::Background());

    // 活跃会话(令牌族)数量
    TokenResult<std::size_t> CountActiveSessions(const std::string& user_id,
                                                 const common::CallContext& ctx = common::CallContext::Background());

private:
    std::shared_ptr<TokenStore> store_;
    std::shared_ptr<common::Clock> clock_;
};

}
}
