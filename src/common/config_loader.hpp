#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace sessionguard {
namespace common {

class ConfigLoader {
public:
    // 读取并校验配置文件, 文件缺失或取值非法时抛出 std::runtime_error
    static AppConfig Load(const std::string& path);
    // SESSIONGUARD_CONFIG 指定的文件, 未设置时使用源码树中的示例配置
    static AppConfig LoadFromEnvOrDefault();
    // 直接解析 JSON 文本, 允许注释
    static AppConfig Parse(const std::string& text);
private:
    static AppConfig FromJson(const nlohmann::json& j);
    static nlohmann::json ReadFile(const std::string& path);
};

}
}
