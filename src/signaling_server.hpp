#pragma once

#include "fwd.hpp"
#include "config.hpp"
#include "participant.hpp"

#include <rtc/rtc.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>

namespace switchyard {

class Room;

// WebSocket signaling front end. Every socket event is handled on one loop
// thread; a client first sends {"type": "join", "roomId": ...} and everything
// after that goes to its Participant.
class SignalingServer {
public:
    SignalingServer(ServerConfig config, std::shared_ptr<PeerConnectionFactory> factory);
    ~SignalingServer();

    // Blocks until Stop()
    void Run();
    void Stop();

private:
    struct Client {
        std::shared_ptr<rtc::WebSocket> ws;
        std::string roomId;
        std::shared_ptr<Participant> participant;
    };

    void WsOpenCallback(std::shared_ptr<rtc::WebSocket> ws);
    void WsClosedCallback(std::shared_ptr<rtc::WebSocket> ws);
    void WsOnMessageCallback(std::shared_ptr<rtc::WebSocket> ws, rtc::message_variant message);

    void HandleJoin(ClientId clientId, Client& client, const nlohmann::json& message);
    void LeaveRoom(ClientId clientId, Client& client);

    std::pair<ClientId, std::shared_ptr<Client>> FindClient(const std::shared_ptr<rtc::WebSocket>& ws);

    const ServerConfig Config_;
    const std::shared_ptr<PeerConnectionFactory> Factory_;

    std::atomic_uint64_t IdGenerator_{1};
    std::unordered_map<ClientId, std::shared_ptr<Client>> Clients_;
    std::unordered_map<std::string, std::shared_ptr<Room>> Rooms_;

    std::shared_ptr<Loop> Loop_;
    std::shared_ptr<rtc::WebSocketServer> WsServer_;
};

} // namespace switchyard
