#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace sessionguard {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define SESSIONGUARD_LOG_DEBUG(...) ::sessionguard::common::GetLogger()->debug(__VA_ARGS__)
#define SESSIONGUARD_LOG_INFO(...)  ::sessionguard::common::GetLogger()->info(__VA_ARGS__)
#define SESSIONGUARD_LOG_WARN(...)  ::sessionguard::common::GetLogger()->warn(__VA_ARGS__)
#define SESSIONGUARD_LOG_ERROR(...) ::sessionguard::common::GetLogger()->error(__VA_ARGS__)

}
}
