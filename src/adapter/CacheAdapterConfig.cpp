#include "memocache/adapter/CacheAdapterConfig.hpp"
#include <fstream>
#include <stdexcept>

namespace memocache {
namespace adapter {

bool CacheAdapterConfig::validate() const {
    return validationError().empty();
}

std::string CacheAdapterConfig::validationError() const {
    if (servers.empty()) {
        return "servers must not be empty";
    }
    for (const auto& server : servers) {
        if (server.empty()) {
            return "server address must not be empty";
        }
    }
    if (generation < 0) {
        return "generation must be a non-negative integer";
    }
    if (readTimeout.count() <= 0) {
        return "readTimeout must be positive";
    }
    if (defaultKeyTTL.count() < 0) {
        return "defaultKeyTTL must not be negative";
    }
    if (!transportOptions.is_object()) {
        return "transportOptions must be a JSON object";
    }
    return {};
}

nlohmann::json CacheAdapterConfig::toJson() const {
    return {
        {"servers", servers},
        {"defaultKeyTTL", defaultKeyTTL.count()},
        {"generation", generation},
        {"readTimeout", readTimeout.count()},
        {"transportOptions", transportOptions}
    };
}

std::string CacheAdapterConfig::fingerprint() const {
    // nlohmann::json objects are std::map backed, so dump() is key-sorted
    return toJson().dump();
}

CacheAdapterConfig CacheAdapterConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Cache configuration must be a JSON object");
    }

    CacheAdapterConfig config;
    try {
        if (j.contains("servers")) {
            const auto& servers = j.at("servers");
            if (servers.is_string()) {
                config.servers.push_back(servers.get<std::string>());
            } else {
                config.servers = servers.get<std::vector<std::string>>();
            }
        }
        if (j.contains("defaultKeyTTL")) {
            config.defaultKeyTTL = std::chrono::seconds(j.at("defaultKeyTTL").get<std::int64_t>());
        }
        if (j.contains("generation")) {
            config.generation = j.at("generation").get<std::int64_t>();
        }
        if (j.contains("readTimeout")) {
            config.readTimeout = std::chrono::milliseconds(j.at("readTimeout").get<std::int64_t>());
        }
        if (j.contains("transportOptions")) {
            config.transportOptions = j.at("transportOptions");
        } else if (j.contains("memcachedOptions")) {
            config.transportOptions = j.at("memcachedOptions");
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid cache configuration: ") + e.what());
    }
    if (config.transportOptions.is_null()) {
        config.transportOptions = nlohmann::json::object();
    }
    return config;
}

CacheAdapterConfig CacheAdapterConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open cache configuration file: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Cannot parse cache configuration file " + path + ": " + e.what());
    }
    try {
        return fromJson(j);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

} // namespace adapter
} // namespace memocache
