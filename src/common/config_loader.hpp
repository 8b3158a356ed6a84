#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace relay {
namespace common {

class ConfigLoader {
public:
    static AppConfig Load(const std::string& path);
    static AppConfig LoadFromEnvOrDefault();
    // 用环境变量覆盖敏感配置 (密钥, 回调地址)
    static void ApplyEnvOverrides(AppConfig& config);
private:
    static AppConfig FromJson(const nlohmann::json& j);
    static nlohmann::json ReadFile(const std::string& path);
};

// 获取全局配置单例
const AppConfig& GlobalConfig();

}
}
