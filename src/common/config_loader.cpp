#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace sessionguard {
namespace common {

namespace {
// 检测配置文件路径
std::string DetectConfigPath() {
    if (const char* env = std::getenv("SESSIONGUARD_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

AppConfig ConfigLoader::Parse(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + ex.what());
    }
    return FromJson(json);
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    try {
        return nlohmann::json::parse(ifs, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Invalid config file " + path + ": " + ex.what());
    }
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
    }
    // Storage配置
    if (j.contains("storage")) {
        const auto& storage = j["storage"];
        if (storage.contains("mysql")) {
            const auto& mysql = storage["mysql"];
            cfg.storage.mysql.host = mysql.value("host", cfg.storage.mysql.host);
            cfg.storage.mysql.port = mysql.value("port", cfg.storage.mysql.port);
            cfg.storage.mysql.user = mysql.value("user", cfg.storage.mysql.user);
            cfg.storage.mysql.password = mysql.value("password", cfg.storage.mysql.password);
            cfg.storage.mysql.database = mysql.value("database", cfg.storage.mysql.database);
            cfg.storage.mysql.pool_size = mysql.value("pool_size", cfg.storage.mysql.pool_size);
            cfg.storage.mysql.connection_timeout_ms = mysql.value("connection_timeout_ms", cfg.storage.mysql.connection_timeout_ms);
            cfg.storage.mysql.read_timeout_ms = mysql.value("read_timeout_ms", cfg.storage.mysql.read_timeout_ms);
            cfg.storage.mysql.write_timeout_ms = mysql.value("write_timeout_ms", cfg.storage.mysql.write_timeout_ms);
            cfg.storage.mysql.enabled = mysql.value("enabled", cfg.storage.mysql.enabled);
        }
    }
    // Token配置
    if (j.contains("token")) {
        const auto& token = j["token"];
        cfg.token.lifetime_days = token.value("lifetime_days", cfg.token.lifetime_days);
        cfg.token.max_concurrent_sessions = token.value("max_concurrent_sessions", cfg.token.max_concurrent_sessions);
        cfg.token.enforce_device_binding = token.value("enforce_device_binding", cfg.token.enforce_device_binding);
        cfg.token.max_generate_attempts = token.value("max_generate_attempts", cfg.token.max_generate_attempts);
    }
    // Events配置
    if (j.contains("events")) {
        cfg.events.log_expired = j["events"].value("log_expired", cfg.events.log_expired);
    }

    if (cfg.token.lifetime_days <= 0) {
        throw std::runtime_error("token.lifetime_days must be positive");
    }
    if (cfg.token.max_concurrent_sessions < 0) {
        throw std::runtime_error("token.max_concurrent_sessions must not be negative");
    }
    if (cfg.token.max_generate_attempts <= 0) {
        throw std::runtime_error("token.max_generate_attempts must be positive");
    }
    return cfg;
}

}
}
