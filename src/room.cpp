#include "room.hpp"

#include "router.hpp"

#include <iostream>
#include <vector>

namespace switchyard {

Room::Room(std::string id, std::shared_ptr<PeerConnectionFactory> factory, RouterConfig config)
    : Id_(std::move(id))
    , Router_(Router::Create(std::move(factory), std::move(config)))
{
    std::cout << "[Room " << Id_ << "] Created with router " << Router_->Id() << std::endl;
}

Room::~Room() {
    Close();
}

void Room::AddParticipant(const std::shared_ptr<Participant>& participant) {
    std::lock_guard<std::mutex> guard(Mutex_);
    Participants_[participant->Id()] = participant;
}

bool Room::RemoveParticipant(ClientId clientId) {
    std::shared_ptr<Participant> participant;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        auto it = Participants_.find(clientId);
        if (it == Participants_.end()) {
            return false;
        }
        participant = std::move(it->second);
        Participants_.erase(it);
    }

    std::cout << "Removing participant " << clientId << " from room " << Id_ << std::endl;
    participant->Close();
    return true;
}

bool Room::HasParticipant(ClientId clientId) {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Participants_.count(clientId) > 0;
}

size_t Room::ParticipantCount() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Participants_.size();
}

void Room::Broadcast(ClientId from, const nlohmann::json& message) {
    std::vector<std::shared_ptr<Participant>> targets;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        for (auto& [id, participant] : Participants_) {
            if (id != from) {
                targets.push_back(participant);
            }
        }
    }

    for (auto& participant : targets) {
        participant->Send(message);
    }
}

void Room::Close() {
    std::unordered_map<ClientId, std::shared_ptr<Participant>> participants;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        participants.swap(Participants_);
    }

    for (auto& [id, participant] : participants) {
        participant->Close();
    }
    Router_->Close();
}

} // namespace switchyard
