#include "thread_pool/config.hpp"
#include "thread_pool/logger.hpp"

#include <fstream>
#include <stdexcept>

namespace thread_pool {
    std::optional<ThreadPoolConfigLoader> ThreadPoolConfigLoader::FromFile(const std::string& filepath) {
        std::ifstream ifs(filepath);
        if (!ifs.is_open()) {
            TP_LOG_ERROR("ThreadPoolConfigLoader: cannot open config file {}", filepath);
            return std::nullopt;
        }
        ThreadPoolConfigLoader loader;
        try {
            nlohmann::json jcfg;
            ifs >> jcfg;
            if (!loader.LoadJson(jcfg, filepath)) {
                return std::nullopt;
            }
        } catch (const nlohmann::json::exception& e) {
            TP_LOG_ERROR("ThreadPoolConfigLoader: failed to parse {}: {}", filepath, e.what());
            return std::nullopt;
        }
        return loader;
    }

    std::optional<ThreadPoolConfigLoader> ThreadPoolConfigLoader::FromString(const std::string& json) {
        ThreadPoolConfigLoader loader;
        try {
            if (!loader.LoadJson(nlohmann::json::parse(json), "<string>")) {
                return std::nullopt;
            }
        } catch (const nlohmann::json::exception& e) {
            TP_LOG_ERROR("ThreadPoolConfigLoader: failed to parse string config: {}", e.what());
            return std::nullopt;
        }
        return loader;
    }

    std::optional<ThreadPoolConfigLoader> ThreadPoolConfigLoader::FromJson(const nlohmann::json& jcfg) {
        ThreadPoolConfigLoader loader;
        if (!loader.LoadJson(jcfg, "<json>")) {
            return std::nullopt;
        }
        return loader;
    }

    bool ThreadPoolConfigLoader::LoadJson(const nlohmann::json& jcfg, const std::string& source_desc) {
        try {
            config_ = Normalize(jcfg);
        } catch (const std::exception& e) {
            TP_LOG_ERROR("ThreadPoolConfigLoader: failed to normalize config from {}: {}", source_desc, e.what());
            return false;
        }
        TP_LOG_INFO("ThreadPool config loaded from {} (queue_cap={} threads={} policy={})",
                    source_desc, config_.queue_cap, config_.threads, config_.queue_policy);
        return true;
    }

    QueueFullPolicy ThreadPoolConfigLoader::ParsePolicy(const std::string& policy) {
        if (policy == "Block") {
            return QueueFullPolicy::Block;
        } else if (policy == "Discard") {
            return QueueFullPolicy::Discard;
        }
        throw std::invalid_argument("Invalid queue_policy: " + policy);
    }

    ThreadPoolConfig ThreadPoolConfigLoader::Normalize(const nlohmann::json& jcfg) {
        if (!jcfg.is_object()) {
            throw std::invalid_argument("thread pool config must be a JSON object");
        }
        ThreadPoolConfig cfg;
        cfg.queue_cap = jcfg.value("queue_cap", cfg.queue_cap);
        // "core_threads" is accepted as an alias for older config files
        cfg.threads = jcfg.value("threads", jcfg.value("core_threads", cfg.threads));
        if (jcfg.contains("queue_policy")) {
            cfg.queue_policy = ParsePolicy(jcfg.at("queue_policy").get<std::string>());
        }
        if (cfg.queue_cap == 0) {
            throw std::invalid_argument("queue_cap must be positive");
        }
        if (cfg.threads == 0) {
            throw std::invalid_argument("threads must be positive");
        }
        return cfg;
    }

    std::string ThreadPoolConfigLoader::Dump() const {
        nlohmann::json j{
            {"queue_cap", config_.queue_cap},
            {"threads", config_.threads},
            {"queue_policy", fmt::format("{}", config_.queue_policy)}};
        return j.dump(2);
    }
}
