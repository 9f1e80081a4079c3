#pragma once

#include <cstddef>
#include <string>

namespace sessionguard {
namespace core {

// 令牌值生成器接口
class TokenGenerator {
public:
    virtual ~TokenGenerator() = default;

    // 生成不透明的令牌值
    virtual std::string Generate() = 0;
    // 生成记录ID与令牌族ID
    virtual std::string GenerateId() = 0;
};

// 基于 OpenSSL 加密安全随机数的实现
// 随机源失败时抛出 std::runtime_error
class SecureTokenGenerator : public TokenGenerator {
public:
    static constexpr std::size_t kTokenBytes = 64; // 512 位熵
    static constexpr std::size_t kIdBytes = 16;

    std::string Generate() override;
    std::string GenerateId() override;
};

// base64url 编码, 不带填充
std::string Base64UrlEncode(const unsigned char* data, std::size_t length);

}
}
