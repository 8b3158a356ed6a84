#pragma once
#include "thread_pool/fwd.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace thread_pool {

class ThreadPoolConfigLoader {
public:
    static std::optional<ThreadPoolConfigLoader> FromFile(const std::string& filepath);
    static std::optional<ThreadPoolConfigLoader> FromString(const std::string& json);
    static std::optional<ThreadPoolConfigLoader> FromJson(const nlohmann::json& jcfg);

    const ThreadPoolConfig& GetConfig() const noexcept {
        return config_;
    }
    std::string Dump() const;
private:
    ThreadPoolConfigLoader() = default;

    // Parsing layer
    static QueueFullPolicy ParsePolicy(const std::string& policy);
    // Validation/Normalization layer; throws std::invalid_argument
    static ThreadPoolConfig Normalize(const nlohmann::json& jcfg);

    bool LoadJson(const nlohmann::json& jcfg, const std::string& source_desc);
private:
    ThreadPoolConfig config_;
};
}
