#pragma once

#include "fwd.hpp"
#include "config.hpp"
#include "participant.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace switchyard {

// A named group of participants sharing one Router
class Room {
public:
    Room(std::string id, std::shared_ptr<PeerConnectionFactory> factory, RouterConfig config);
    ~Room();

    const std::string& Id() const {
        return Id_;
    }

    const std::shared_ptr<Router>& GetRouter() const {
        return Router_;
    }

    void AddParticipant(const std::shared_ptr<Participant>& participant);

    // Closes the participant. Returns false if it was not in the room.
    bool RemoveParticipant(ClientId clientId);

    bool HasParticipant(ClientId clientId);
    size_t ParticipantCount();

    // Sends `message` to every participant except `from`
    void Broadcast(ClientId from, const nlohmann::json& message);

    void Close();

private:
    const std::string Id_;
    const std::shared_ptr<Router> Router_;

    std::mutex Mutex_;
    std::unordered_map<ClientId, std::shared_ptr<Participant>> Participants_;
};

} // namespace switchyard
