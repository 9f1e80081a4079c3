#pragma once

#include "common/status_or.hpp"

#include <string>

namespace sessionguard {
namespace core {

// 短期访问令牌签发方, 由外部协作者实现
class AccessTokenSigner {
public:
    virtual ~AccessTokenSigner() = default;

    virtual common::StatusOr<std::string> Sign(const std::string& user_id,
                                               const std::string& tenant_id) = 0;
};

}
}
