#include "participant.hpp"

#include "error.hpp"
#include "publish_session.hpp"
#include "publisher.hpp"
#include "room.hpp"
#include "router.hpp"
#include "subscribe_session.hpp"
#include "subscriber.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>

namespace switchyard {

namespace {

using json = nlohmann::json;

SessionDescription DescriptionFrom(const json& message, SdpType type) {
    return SessionDescription{type, message.at("sdp").get<std::string>()};
}

} // namespace

void to_json(json& j, const IceCandidate& candidate) {
    j = json{
        {"candidate", candidate.candidate},
        {"sdpMid", candidate.sdpMid},
    };
    if (candidate.sdpMLineIndex) {
        j["sdpMLineIndex"] = *candidate.sdpMLineIndex;
    }
}

void from_json(const json& j, IceCandidate& candidate) {
    candidate.candidate = j.at("candidate").get<std::string>();
    candidate.sdpMid = j.value("sdpMid", "");
    if (auto it = j.find("sdpMLineIndex"); it != j.end() && it->is_number_integer()) {
        candidate.sdpMLineIndex = it->get<int>();
    }
}

std::shared_ptr<Participant> Participant::Create(ClientId id,
                                                 const std::shared_ptr<Room>& room,
                                                 const SessionConfig& config,
                                                 Sender sender) {
    auto participant = std::shared_ptr<Participant>(new Participant(id, room, std::move(sender)));
    participant->Start(config);
    return participant;
}

Participant::Participant(ClientId id, const std::shared_ptr<Room>& room, Sender sender)
    : Id_(id)
    , Label_("Client " + std::to_string(id))
    , Room_(room)
    , Sender_(std::move(sender))
    , Worker_(std::make_shared<Loop>())
{ }

Participant::~Participant() {
    Close();
}

void Participant::Start(const SessionConfig& config) {
    auto room = Room_.lock();
    if (!room) {
        throw Error(ErrorCode::SessionClosed, "Room of " + Label_ + " is gone");
    }

    auto router = room->GetRouter();
    auto publishSession = router->CreatePublishSession(config);
    auto subscribeSession = router->CreateSubscribeSession(config);
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        PublishSession_ = std::move(publishSession);
        SubscribeSession_ = std::move(subscribeSession);
    }

    WorkerThread_ = std::thread{std::bind(&Loop::Run, Worker_)};
    std::cout << "[" << Label_ << "] Joined room " << room->Id() << std::endl;
}

void Participant::HandleMessage(const json& message) {
    auto typeIt = message.find("type");
    if (typeIt == message.end() || !typeIt->is_string()) {
        std::cerr << "[" << Label_ << "] Signaling message missing type" << std::endl;
        SendError("", "BadRequest", "Signaling message missing type");
        return;
    }

    const std::string type = *typeIt;
    std::cout << "[" << Label_ << "] Received signaling: " << type << std::endl;

    if (type == "offer" || type == "publish" || type == "subscribe") {
        Worker_->EnqueueTask([weak = weak_from_this(), type, message] {
            if (auto self = weak.lock()) {
                self->Dispatch(type, message);
            }
        });
        return;
    }

    Dispatch(type, message);
}

void Participant::Dispatch(const std::string& type, const json& message) {
    Guarded(type, [&] {
        if (type == "ping") {
            Send(json{{"type", "pong"}});
        } else if (type == "publisherInit") {
            HandlePublisherInit();
        } else if (type == "subscriberInit") {
            HandleSubscriberInit();
        } else if (type == "offer") {
            HandleOffer(message);
        } else if (type == "answer") {
            HandleAnswer(message);
        } else if (type == "publisherIce") {
            GetPublishSession()->AddIceCandidate(message.at("candidate").get<IceCandidate>());
        } else if (type == "subscriberIce") {
            GetSubscribeSession()->AddIceCandidate(message.at("candidate").get<IceCandidate>());
        } else if (type == "publish") {
            HandlePublish(message);
        } else if (type == "subscribe") {
            HandleSubscribe(message);
        } else if (type == "stopPublish") {
            HandleStopPublish(message);
        } else if (type == "stopSubscribe") {
            HandleStopSubscribe(message);
        } else {
            std::cout << "[" << Label_ << "] Unknown message type: " << type << std::endl;
            throw std::invalid_argument("Unknown message type " + type);
        }
    });
}

void Participant::HandlePublisherInit() {
    auto session = GetPublishSession();
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        if (PublisherObserved_) {
            return;
        }
        PublisherObserved_ = true;
    }
    session->AddObserver(weak_from_this());
}

void Participant::HandleSubscriberInit() {
    auto session = GetSubscribeSession();
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        if (SubscriberObserved_) {
            return;
        }
        SubscriberObserved_ = true;
    }
    session->AddObserver(weak_from_this());

    auto room = Room_.lock();
    if (!room) {
        return;
    }

    // Announce what the others already publish
    std::vector<std::string> own;
    for (const auto& publisher : GetPublishSession()->GetPublishers()) {
        own.push_back(publisher->Id());
    }

    std::vector<std::string> ids;
    for (auto& id : room->GetRouter()->PublisherIds()) {
        if (std::find(own.begin(), own.end(), id) == own.end()) {
            ids.push_back(std::move(id));
        }
    }

    if (!ids.empty()) {
        Send(json{{"type", "published"}, {"publisherIds", ids}});
    }
}

void Participant::HandleOffer(const json& message) {
    auto session = GetPublishSession();
    auto offer = DescriptionFrom(message, SdpType::Offer);

    std::cout << "[" << Label_ << "] Processing offer..." << std::endl;
    auto answer = session->IsNegotiated() ? session->Renegotiate(offer) : session->GetAnswer(offer);

    std::cout << "[" << Label_ << "] Sending answer" << std::endl;
    Send(json{{"type", "answer"}, {"sdp", answer.sdp}});
}

void Participant::HandleAnswer(const json& message) {
    auto answer = DescriptionFrom(message, SdpType::Answer);
    if (message.value("target", "subscriber") == "publisher") {
        GetPublishSession()->SetAnswer(answer);
    } else {
        GetSubscribeSession()->SetAnswer(answer);
    }
}

void Participant::HandlePublish(const json& message) {
    auto trackId = message.at("trackId").get<std::string>();
    auto publisher = GetPublishSession()->Publish(trackId);

    std::cout << "[" << Label_ << "] Published a track: " << publisher->Id() << std::endl;
    if (auto room = Room_.lock()) {
        room->Broadcast(Id_, json{{"type", "published"}, {"publisherIds", json::array({publisher->Id()})}});
    }
}

void Participant::HandleSubscribe(const json& message) {
    auto publisherIds = message.at("publisherIds").get<std::vector<std::string>>();
    auto session = GetSubscribeSession();

    // One offer per publisher. Each Subscribe waits until the previous offer is answered.
    for (const auto& publisherId : publisherIds) {
        Guarded("subscribe", [&] {
            auto result = session->Subscribe(publisherId);
            Send(json{{"type", "offer"}, {"target", "subscriber"}, {"sdp", result.second.sdp}});
            Send(json{
                {"type", "subscribed"},
                {"subscriberIds", json::array({result.first->Id()})},
                {"publisherId", publisherId},
            });
        });
        if (session->IsClosed()) {
            break;
        }
    }
}

void Participant::HandleStopPublish(const json& message) {
    auto publisherId = message.at("publisherId").get<std::string>();
    if (!GetPublishSession()->Unpublish(publisherId)) {
        throw Error(ErrorCode::PublisherNotFound, "Not publishing " + publisherId);
    }
}

void Participant::HandleStopSubscribe(const json& message) {
    auto subscriberId = message.at("subscriberId").get<std::string>();
    if (!GetSubscribeSession()->Unsubscribe(subscriberId)) {
        throw Error(ErrorCode::InvalidState, "No subscriber " + subscriberId);
    }
}

void Participant::Guarded(const std::string& type, const std::function<void()>& handler) {
    try {
        handler();
    } catch (const Error& e) {
        std::cerr << "[" << Label_ << "] " << type << " failed: " << e.what() << std::endl;
        SendError(type, ErrorCodeToString(e.Code()), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[" << Label_ << "] Invalid " << type << " message: " << e.what() << std::endl;
        SendError(type, "BadRequest", e.what());
    }
}

void Participant::SendError(const std::string& requestType, const std::string& code, const std::string& message) {
    Send(json{
        {"type", "error"},
        {"request", requestType},
        {"code", code},
        {"message", message},
    });
}

void Participant::Send(const json& message) {
    if (!Sender_) {
        return;
    }

    try {
        Sender_(message);
    } catch (const std::exception& e) {
        std::cerr << "[" << Label_ << "] Failed to send " << message.value("type", "") << ": " << e.what() << std::endl;
    }
}

std::shared_ptr<PublishSession> Participant::GetPublishSession() {
    std::lock_guard<std::mutex> guard(Mutex_);
    if (!PublishSession_) {
        throw Error(ErrorCode::SessionClosed, Label_ + " has left");
    }
    return PublishSession_;
}

std::shared_ptr<SubscribeSession> Participant::GetSubscribeSession() {
    std::lock_guard<std::mutex> guard(Mutex_);
    if (!SubscribeSession_) {
        throw Error(ErrorCode::SessionClosed, Label_ + " has left");
    }
    return SubscribeSession_;
}

void Participant::Close() {
    std::shared_ptr<PublishSession> publishSession;
    std::shared_ptr<SubscribeSession> subscribeSession;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        if (Closed_) {
            return;
        }
        Closed_ = true;
        publishSession = std::move(PublishSession_);
        subscribeSession = std::move(SubscribeSession_);
    }

    std::cout << "[" << Label_ << "] Leaving" << std::endl;

    // Wakes the worker if it waits inside a session
    if (subscribeSession) {
        subscribeSession->Close();
    }
    if (publishSession) {
        publishSession->Close();
    }

    Worker_->Stop();
    if (WorkerThread_.joinable()) {
        if (WorkerThread_.get_id() == std::this_thread::get_id()) {
            WorkerThread_.detach();
        } else {
            WorkerThread_.join();
        }
    }
}

void Participant::OnIceCandidate(const std::string& sessionId, const IceCandidate& candidate) {
    bool fromPublisher = false;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        fromPublisher = PublishSession_ && PublishSession_->Id() == sessionId;
    }

    Send(json{{"type", fromPublisher ? "publisherIce" : "subscriberIce"}, {"candidate", candidate}});
}

void Participant::OnNegotiationNeeded(const std::string& sessionId, const SessionDescription& offer) {
    bool fromPublisher = false;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        fromPublisher = PublishSession_ && PublishSession_->Id() == sessionId;
    }

    Send(json{{"type", "offer"}, {"target", fromPublisher ? "publisher" : "subscriber"}, {"sdp", offer.sdp}});
}

void Participant::OnPublisherRemoved(const std::string& sessionId,
                                     const std::string& subscriberId,
                                     const std::string& publisherId) {
    Send(json{
        {"type", "publisherRemoved"},
        {"subscriberId", subscriberId},
        {"publisherId", publisherId},
    });
}

} // namespace switchyard
