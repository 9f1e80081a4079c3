#pragma once

#include "common/call_context.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "core/token/errors.hpp"
#include "core/token/refresh_token.hpp"
#include "core/token/security_events.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace sessionguard {
namespace core {

class TokenStore;
class TokenGenerator;
class AccessTokenSigner;

struct RotationConfig {
    int lifetime_days = 7;               // IssueInitial 未指定时的默认有效期
    int max_concurrent_sessions = 0;     // 0 表示不限制
    bool enforce_device_binding = false; // 默认设备绑定仅作参考
    int max_generate_attempts = 3;
    bool report_expired = true;          // 过期令牌的使用是否上报事件
};

RotationConfig MakeRotationConfig(const common::AppConfig& config);

struct IssueCommand {
    std::string user_id;
    std::string tenant_id;
    DeviceInfo device;
    int lifetime_days = 0; // 0 使用配置中的默认值
};

struct IssuedToken {
    std::string value;
    std::string token_id;
    std::string token_family;
    std::int64_t expires_at = 0;
};

struct RotateCommand {
    std::string presented_value;
    DeviceInfo device;
};

struct RotatedTokenPair {
    std::string access_token;
    std::string refresh_token;
    std::string token_id;
    std::string token_family;
    std::string user_id;
    std::string tenant_id;
    std::int64_t expires_at = 0;
};

// 刷新令牌的签发与轮换, 负责重用检测
// 自身不持有调用之间共享的可变状态, 并发安全依赖存储的条件写
class RotationEngine {
public:
    RotationEngine(RotationConfig config,
                   std::shared_ptr<TokenStore> store,
                   std::shared_ptr<TokenGenerator> generator,
                   std::shared_ptr<common::Clock> clock,
                   std::shared_ptr<AccessTokenSigner> signer,
                   std::shared_ptr<SecurityEventSink> events);

    // 登录时签发: 新建令牌族并写入第一个令牌
    TokenResult<IssuedToken> IssueInitial(const IssueCommand& command,
                                          const common::CallContext& ctx = common::CallContext::Background());

    // 轮换: 校验提交的令牌, 签发后继令牌并吊销当前令牌
    TokenResult<RotatedTokenPair> Rotate(const RotateCommand& command,
                                         const common::CallContext& ctx = common::CallContext::Background());

    // 只读校验, 不产生任何写入
    TokenResult<RefreshToken> Validate(const std::string& value,
                                       const std::string& device_fingerprint,
                                       const common::CallContext& ctx = common::CallContext::Background());

private:
    // 生成令牌值并写入, 值冲突时重新生成
    TokenResult<RefreshToken> InsertWithFreshValue(RefreshToken draft, const common::CallContext& ctx);
    // 已吊销令牌被再次提交: 吊销整个令牌族并上报
    TokenStatus HandleReuse(const RefreshToken& presented, const std::string& actor_ip, std::int64_t now);
    // 超出会话上限时吊销最早的令牌族
    void EnforceSessionLimit(const RefreshToken& issued, std::int64_t now);
    // 回收轮换失败留下的后继令牌
    void AbortOrphan(const RefreshToken& orphan, const std::string& actor_ip, std::int64_t now);
    bool DeviceMatches(const RefreshToken& token, const std::string& device_fingerprint) const;
    void Emit(SecurityEventType type, EventSeverity severity, const RefreshToken& token,
              std::string reason, const std::string& actor_ip, std::int64_t now,
              std::size_t revoked_count = 0);

    RotationConfig config_;
    std::shared_ptr<TokenStore> store_;
    std::shared_ptr<TokenGenerator> generator_;
    std::shared_ptr<common::Clock> clock_;
    std::shared_ptr<AccessTokenSigner> signer_;
    std::shared_ptr<SecurityEventSink> events_;
};

}
}
