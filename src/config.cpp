#include "config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace switchyard {

namespace {

using json = nlohmann::json;

std::chrono::milliseconds MillisecondsOr(const json& j, const char* key, std::chrono::milliseconds fallback) {
    auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    return std::chrono::milliseconds(it->get<int64_t>());
}

} // namespace

void from_json(const json& j, SessionConfig& config) {
    config.iceServers = j.value("iceServers", config.iceServers);
    if (auto it = j.find("bindAddress"); it != j.end() && it->is_string()) {
        config.bindAddress = it->get<std::string>();
    }
    config.portRangeBegin = j.value("portRangeBegin", config.portRangeBegin);
    config.portRangeEnd = j.value("portRangeEnd", config.portRangeEnd);
    config.enableIceTcp = j.value("enableIceTcp", config.enableIceTcp);
    if (auto it = j.find("maxMessageSize"); it != j.end() && it->is_number_unsigned()) {
        config.maxMessageSize = it->get<size_t>();
    }

    if (config.portRangeBegin > config.portRangeEnd) {
        throw std::invalid_argument("portRangeBegin is greater than portRangeEnd");
    }
}

void from_json(const json& j, RouterConfig& config) {
    config.findPublisherAttempts = j.value("findPublisherAttempts", config.findPublisherAttempts);
    config.findPublisherInterval = MillisecondsOr(j, "findPublisherIntervalMs", config.findPublisherInterval);
    config.trackWaitTimeout = MillisecondsOr(j, "trackWaitTimeoutMs", config.trackWaitTimeout);

    if (config.findPublisherAttempts < 1) {
        throw std::invalid_argument("findPublisherAttempts must be at least 1");
    }
}

void from_json(const json& j, ServerConfig& config) {
    config.port = j.value("port", config.port);
    config.logLevel = j.value("logLevel", config.logLevel);
    if (auto it = j.find("router"); it != j.end()) {
        it->get_to(config.router);
    }
    if (auto it = j.find("session"); it != j.end()) {
        it->get_to(config.session);
    }
}

ServerConfig LoadServerConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file " + path);
    }

    ServerConfig config;
    json::parse(in).get_to(config);
    return config;
}

} // namespace switchyard
