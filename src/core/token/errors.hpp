#pragma once

#include "common/status.hpp"

#include <string>
#include <type_traits>
#include <utility>

namespace sessionguard {
namespace core {

enum class TokenErrorCode {
    kOk = 0,
    kInvalidToken = 1,       // 令牌不存在, 需要重新登录
    kTokenExpired = 2,       // 令牌过期, 需要重新登录
    kTokenReuseDetected = 3, // 已轮换令牌被再次使用, 整个令牌族已吊销
    kForbidden = 4,          // 吊销请求与会话所有者不匹配
    kConflict = 5,           // 生成的令牌值冲突, 仅内部使用
    kNotFound = 6,           // 会话(令牌族)不存在
    kDeviceMismatch = 7,     // 设备指纹不匹配
    kUnavailable = 8,        // 存储不可用或超时
    kCancelled = 9,          // 调用方取消或超过截止时间
    kInternal = 10,
    kInvalidArgument = 11,
};

inline const char* TokenErrorCodeToString(TokenErrorCode code) {
    switch (code) {
        case TokenErrorCode::kOk:
            return "Ok";
        case TokenErrorCode::kInvalidToken:
            return "InvalidToken";
        case TokenErrorCode::kTokenExpired:
            return "TokenExpired";
        case TokenErrorCode::kTokenReuseDetected:
            return "TokenReuseDetected";
        case TokenErrorCode::kForbidden:
            return "Forbidden";
        case TokenErrorCode::kConflict:
            return "Conflict";
        case TokenErrorCode::kNotFound:
            return "NotFound";
        case TokenErrorCode::kDeviceMismatch:
            return "DeviceMismatch";
        case TokenErrorCode::kUnavailable:
            return "Unavailable";
        case TokenErrorCode::kCancelled:
            return "Cancelled";
        case TokenErrorCode::kInternal:
            return "Internal";
        case TokenErrorCode::kInvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}

// 令牌操作的结果状态
class TokenStatus {
public:
    TokenStatus() = default;
    TokenStatus(TokenErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static TokenStatus OK() {
        return TokenStatus(TokenErrorCode::kOk, "");
    }

    bool IsOk() const {
        return code_ == TokenErrorCode::kOk;
    }
    TokenErrorCode Code() const {
        return code_;
    }
    const std::string& Message() const {
        return message_;
    }
private:
    TokenErrorCode code_ = TokenErrorCode::kOk;
    std::string message_;
};

// 包含令牌错误或值的结果
template <typename T>
class TokenResult {
public:
    TokenResult(const TokenStatus& status) : status_(status) {}
    TokenResult(TokenStatus&& status) : status_(std::move(status)) {}
    TokenResult(TokenErrorCode code, std::string message)
        : status_(code, std::move(message)) {}

    template <class U = T, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    explicit TokenResult(U&& value)
        : status_(TokenStatus::OK()), value_(std::forward<U>(value)) {}

    bool IsOk() const {
        return status_.IsOk();
    }
    TokenErrorCode Error() const {
        return status_.Code();
    }
    const TokenStatus& GetStatus() const {
        return status_;
    }

    T& Value() & {
        return value_;
    }
    T&& Value() && {
        return std::move(value_);
    }
    const T& Value() const& {
        return value_;
    }
    const T&& Value() const&& = delete;
private:
    TokenStatus status_;
    T value_{};
};

// 调用上下文检查失败(取消或截止时间)转换为令牌错误
inline TokenStatus FromContextStatus(const common::Status& status) {
    if (status.IsOk()) {
        return TokenStatus::OK();
    }
    return TokenStatus(TokenErrorCode::kCancelled, status.Message());
}

// 将令牌错误转换为通用 Status
// 过期与重用都映射为 Unauthenticated, 对外不区分
inline common::Status FromTokenError(const TokenStatus& status) {
    using common::Status;
    const std::string& message = status.Message();
    switch (status.Code()) {
        case TokenErrorCode::kOk:
            return Status::OK();
        case TokenErrorCode::kInvalidToken:
        case TokenErrorCode::kTokenExpired:
        case TokenErrorCode::kTokenReuseDetected:
        case TokenErrorCode::kDeviceMismatch:
            return Status::Unauthenticated("Refresh token is invalid or expired");
        case TokenErrorCode::kForbidden:
            return Status::PermissionDenied(message.empty() ? "Forbidden" : message);
        case TokenErrorCode::kNotFound:
            return Status::NotFound(message.empty() ? "Session not found" : message);
        case TokenErrorCode::kUnavailable:
            return Status::Unavailable(message.empty() ? "Token store unavailable" : message);
        case TokenErrorCode::kCancelled:
            return Status::Cancelled(message.empty() ? "Cancelled" : message);
        case TokenErrorCode::kInvalidArgument:
            return Status::InvalidArgument(message);
        case TokenErrorCode::kConflict:
        case TokenErrorCode::kInternal:
            return Status::Internal(message.empty() ? "Internal error" : message);
    }
    return Status::Internal("Unknown token error");
}

// 将存储层返回的 Status 转换为令牌错误
inline TokenStatus FromStoreStatus(const common::Status& status) {
    using common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return TokenStatus::OK();
        case StatusCode::kCancelled:
            return TokenStatus(TokenErrorCode::kCancelled, status.Message());
        case StatusCode::kNotFound:
            return TokenStatus(TokenErrorCode::kNotFound, status.Message());
        case StatusCode::kAlreadyExists:
            return TokenStatus(TokenErrorCode::kConflict, status.Message());
        case StatusCode::kInvalidArgument:
            return TokenStatus(TokenErrorCode::kInvalidArgument, status.Message());
        // 存储超时一律视为服务不可用, 绝不当作盗用
        case StatusCode::kDeadlineExceeded:
        case StatusCode::kUnavailable:
            return TokenStatus(TokenErrorCode::kUnavailable, status.Message());
        default:
            return TokenStatus(TokenErrorCode::kInternal, status.Message());
    }
}

}
}
