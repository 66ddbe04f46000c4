#pragma once

#include "fwd.hpp"
#include "config.hpp"
#include "loop.hpp"
#include "session.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace switchyard {

class Room;

using ClientId = uint64_t;

// Candidates travel as {"candidate", "sdpMid", "sdpMLineIndex"}
void to_json(nlohmann::json& j, const IceCandidate& candidate);
void from_json(const nlohmann::json& j, IceCandidate& candidate);

// One signaling client in a room. Owns a PublishSession and a SubscribeSession
// on the room's Router and translates JSON signaling messages into session
// operations. Replies and session events go out through the sender.
class Participant : public SessionObserver, public std::enable_shared_from_this<Participant> {
public:
    using Sender = std::function<void(const nlohmann::json&)>;

    static std::shared_ptr<Participant> Create(ClientId id,
                                               const std::shared_ptr<Room>& room,
                                               const SessionConfig& config,
                                               Sender sender);
    ~Participant() override;

    ClientId Id() const {
        return Id_;
    }

    // Called on the signaling thread. Operations that may wait (offer, publish,
    // subscribe) are handed to this participant's worker; the rest run inline.
    void HandleMessage(const nlohmann::json& message);

    void Send(const nlohmann::json& message);

    // Closes both sessions, which unregisters everything this client published
    void Close();

    // SessionObserver
    void OnIceCandidate(const std::string& sessionId, const IceCandidate& candidate) override;
    void OnNegotiationNeeded(const std::string& sessionId, const SessionDescription& offer) override;
    void OnPublisherRemoved(const std::string& sessionId,
                            const std::string& subscriberId,
                            const std::string& publisherId) override;

private:
    Participant(ClientId id, const std::shared_ptr<Room>& room, Sender sender);

    void Start(const SessionConfig& config);

    void Dispatch(const std::string& type, const nlohmann::json& message);

    void HandlePublisherInit();
    void HandleSubscriberInit();
    void HandleOffer(const nlohmann::json& message);
    void HandleAnswer(const nlohmann::json& message);
    void HandlePublish(const nlohmann::json& message);
    void HandleSubscribe(const nlohmann::json& message);
    void HandleStopPublish(const nlohmann::json& message);
    void HandleStopSubscribe(const nlohmann::json& message);

    // Runs `handler` and turns its failure into an error reply
    void Guarded(const std::string& type, const std::function<void()>& handler);
    void SendError(const std::string& requestType, const std::string& code, const std::string& message);

    std::shared_ptr<PublishSession> GetPublishSession();
    std::shared_ptr<SubscribeSession> GetSubscribeSession();

    const ClientId Id_;
    const std::string Label_;
    const std::weak_ptr<Room> Room_;
    const Sender Sender_;

    std::mutex Mutex_;
    std::shared_ptr<PublishSession> PublishSession_;
    std::shared_ptr<SubscribeSession> SubscribeSession_;
    bool PublisherObserved_ = false;
    bool SubscriberObserved_ = false;
    bool Closed_ = false;

    std::shared_ptr<Loop> Worker_;
    std::thread WorkerThread_;
};

} // namespace switchyard
