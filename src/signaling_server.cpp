#include "signaling_server.hpp"

#include "loop.hpp"
#include "room.hpp"

#include <exception>
#include <iostream>

namespace switchyard {

namespace {

using json = nlohmann::json;

void SendJson(const std::shared_ptr<rtc::WebSocket>& ws, const json& message) {
    if (ws->isOpen()) {
        ws->send(message.dump());
    }
}

} // namespace

SignalingServer::SignalingServer(ServerConfig config, std::shared_ptr<PeerConnectionFactory> factory)
    : Config_(std::move(config))
    , Factory_(std::move(factory))
    , Loop_(std::make_shared<Loop>())
{ }

SignalingServer::~SignalingServer() {
    Stop();
}

void SignalingServer::WsOpenCallback(std::shared_ptr<rtc::WebSocket> ws) {
    Loop_->EnqueueTask([this, ws = std::move(ws)]
    {
        auto id = IdGenerator_++;
        auto client = std::make_shared<Client>();
        client->ws = ws;
        Clients_.emplace(id, client);

        std::cout << "[Client " << id << "] WebSocket connected" << std::endl;
    });
}

void SignalingServer::WsClosedCallback(std::shared_ptr<rtc::WebSocket> ws) {
    Loop_->EnqueueTask([this, ws = std::move(ws)]
    {
        auto [id, client] = FindClient(ws);
        if (!client) {
            return;
        }

        std::cout << "[Client " << id << "] WebSocket disconnected" << std::endl;
        LeaveRoom(id, *client);
        Clients_.erase(id);

        // The callbacks hold the socket
        ws->resetCallbacks();
    });
}

void SignalingServer::WsOnMessageCallback(std::shared_ptr<rtc::WebSocket> ws, rtc::message_variant message) {
    Loop_->EnqueueTask([this, ws = std::move(ws), message = std::move(message)]
    {
        auto pstr = std::get_if<std::string>(&message);
        if (!pstr) {
            return;
        }

        auto [clientId, client] = FindClient(ws);
        if (!client) {
            std::cerr << "Client not found for signaling message" << std::endl;
            return;
        }

        json j;
        try {
            j = json::parse(*pstr);
        } catch (const json::parse_error& e) {
            std::cerr << "[Client " << clientId << "] Invalid JSON signaling message: " << e.what() << std::endl;
            SendJson(ws, json{{"type", "error"}, {"code", "BadRequest"}, {"message", e.what()}});
            return;
        }

        if (!j.is_object()) {
            SendJson(ws, json{{"type", "error"}, {"code", "BadRequest"}, {"message", "Expected a JSON object"}});
            return;
        }

        if (j.value("type", "") == "join") {
            HandleJoin(clientId, *client, j);
            return;
        }

        if (!client->participant) {
            std::cerr << "[Client " << clientId << "] Message before join" << std::endl;
            SendJson(ws, json{{"type", "error"}, {"code", "InvalidState"}, {"message", "Join a room first"}});
            return;
        }

        client->participant->HandleMessage(j);
    });
}

void SignalingServer::HandleJoin(ClientId clientId, Client& client, const json& message) {
    auto roomIdIt = message.find("roomId");
    if (roomIdIt == message.end() || !roomIdIt->is_string()) {
        std::cerr << "[Client " << clientId << "] Join missing room id" << std::endl;
        SendJson(client.ws, json{{"type", "error"}, {"code", "BadRequest"}, {"message", "Join missing roomId"}});
        return;
    }

    // Switching rooms leaves the previous one
    LeaveRoom(clientId, client);

    const std::string roomId = *roomIdIt;
    auto& room = Rooms_[roomId];
    if (!room) {
        room = std::make_shared<Room>(roomId, Factory_, Config_.router);
    }

    try {
        auto ws = client.ws;
        client.participant = Participant::Create(clientId, room, Config_.session, [ws](const json& out) {
            SendJson(ws, out);
        });
    } catch (const std::exception& e) {
        std::cerr << "[Client " << clientId << "] Failed to join room " << roomId << ": " << e.what() << std::endl;
        SendJson(client.ws, json{{"type", "error"}, {"code", "EngineFailure"}, {"message", e.what()}});
        if (room->ParticipantCount() == 0) {
            Rooms_.erase(roomId);
        }
        return;
    }

    client.roomId = roomId;
    room->AddParticipant(client.participant);
    SendJson(client.ws, json{{"type", "joined"}, {"roomId", roomId}, {"clientId", clientId}});
}

void SignalingServer::LeaveRoom(ClientId clientId, Client& client) {
    if (!client.participant) {
        return;
    }

    client.participant.reset();
    auto it = Rooms_.find(client.roomId);
    client.roomId.clear();
    if (it == Rooms_.end()) {
        return;
    }

    it->second->RemoveParticipant(clientId);
    if (it->second->ParticipantCount() == 0) {
        std::cout << "[Room " << it->first << "] Last participant left, closing" << std::endl;
        it->second->Close();
        Rooms_.erase(it);
    }
}

std::pair<ClientId, std::shared_ptr<SignalingServer::Client>> SignalingServer::FindClient(
    const std::shared_ptr<rtc::WebSocket>& ws)
{
    for (auto& [id, client] : Clients_) {
        if (client->ws == ws) {
            return {id, client};
        }
    }
    return {0, nullptr};
}

void SignalingServer::Run() {
    rtc::WebSocketServer::Configuration wsCfg;
    wsCfg.port = Config_.port;
    wsCfg.enableTls = false;
    if (Config_.session.bindAddress) {
        wsCfg.bindAddress = Config_.session.bindAddress;
    }

    WsServer_ = std::make_shared<rtc::WebSocketServer>(wsCfg);
    WsServer_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
        ws->onOpen([this, ws]() mutable {
            WsOpenCallback(ws);
        });

        ws->onClosed([this, ws]() mutable {
            WsClosedCallback(ws);
        });

        ws->onMessage([this, ws](rtc::message_variant message) mutable {
            WsOnMessageCallback(ws, std::move(message));
        });
    });

    std::cout << "Signaling server listening on port " << WsServer_->port() << std::endl;
    Loop_->Run();
}

void SignalingServer::Stop() {
    if (WsServer_) {
        WsServer_->stop();
    }

    Loop_->EnqueueTask([this] {
        for (auto& [id, room] : Rooms_) {
            room->Close();
        }
        Rooms_.clear();
        Clients_.clear();
        Loop_->Stop();
    });
}

} // namespace switchyard
