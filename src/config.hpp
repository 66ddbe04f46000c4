#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace switchyard {

// Per-session engine settings
struct SessionConfig {
    std::vector<std::string> iceServers{"stun:stun.l.google.com:19302"};
    std::optional<std::string> bindAddress;
    uint16_t portRangeBegin = 1024;
    uint16_t portRangeEnd = 65535;
    bool enableIceTcp = false;
    std::optional<size_t> maxMessageSize;
};

struct RouterConfig {
    // Bounded lookup used by Subscribe while the publish side may still be negotiating
    int findPublisherAttempts = 10;
    std::chrono::milliseconds findPublisherInterval{500};

    // How long Publish waits for a track to arrive on the negotiated session
    std::chrono::milliseconds trackWaitTimeout{3000};
};

struct ServerConfig {
    uint16_t port = 8000;
    std::string logLevel = "info";
    RouterConfig router;
    SessionConfig session;
};

void from_json(const nlohmann::json& j, SessionConfig& config);
void from_json(const nlohmann::json& j, RouterConfig& config);
void from_json(const nlohmann::json& j, ServerConfig& config);

// Throws when the file cannot be read or holds invalid values
ServerConfig LoadServerConfig(const std::string& path);

} // namespace switchyard
