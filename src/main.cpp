#include "config.hpp"
#include "rtc_peer_connection.hpp"
#include "signaling_server.hpp"

#include <exception>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    switchyard::ServerConfig config;
    try {
        if (argc > 1) {
            config = switchyard::LoadServerConfig(argv[1]);
        }
        switchyard::InitEngineLogger(config.logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    switchyard::SignalingServer server(config, std::make_shared<switchyard::RtcPeerConnectionFactory>());
    server.Run();

    return 0;
}
