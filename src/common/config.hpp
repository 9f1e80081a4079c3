#pragma once

#include <string>

namespace sessionguard {
namespace common {

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
};

// Mysql配置结构体
struct MysqlConfig {
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "dev";
    std::string password = "";
    std::string database = "sessionguard";
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
    bool enabled = false;
};

// 存储配置结构体
struct StorageConfig {
    MysqlConfig mysql;
};

// 刷新令牌配置结构体
struct TokenConfig {
    int lifetime_days = 7;               // 新令牌族的默认有效期(天)
    int max_concurrent_sessions = 0;     // 每个用户的最大会话数, 0 表示不限制
    bool enforce_device_binding = false; // 是否强制校验设备指纹
    int max_generate_attempts = 3;       // 令牌值冲突时的最大重试次数
};

// 安全事件配置结构体
struct EventsConfig {
    bool log_expired = true; // 是否上报过期令牌的使用
};

// 应用配置结构体
struct AppConfig {
    LoggingConfig logging;
    StorageConfig storage;
    TokenConfig token;
    EventsConfig events;
};

}
}
