#include "subscribe_session.hpp"

#include "error.hpp"
#include "publisher.hpp"
#include "router.hpp"
#include "subscriber.hpp"

#include <exception>
#include <iostream>

namespace switchyard {

SubscribeSession::SubscribeSession(std::weak_ptr<Router> router,
                                   std::shared_ptr<PeerConnection> peerConnection,
                                   RouterConfig routerConfig)
    : Session(Type::Subscribe, std::move(router), std::move(peerConnection), std::move(routerConfig))
{ }

SubscribeSession::~SubscribeSession() {
    Close();
}

std::pair<std::shared_ptr<Subscriber>, SessionDescription> SubscribeSession::Subscribe(const std::string& publisherId) {
    ThrowIfClosed("Subscribe");

    auto router = GetRouter();
    if (!router) {
        throw Error(ErrorCode::SessionClosed, "Router of session " + Id_ + " is gone");
    }

    auto publisher = router->FindPublisher(publisherId,
                                           RouterConfig_.findPublisherAttempts,
                                           RouterConfig_.findPublisherInterval,
                                           Id_);

    ScopedNegotiation negotiation(NegotiationLock_);

    std::string mid;
    try {
        mid = PeerConnection_->AddTrack(publisher->Source());
    } catch (const std::exception& e) {
        throw Error(ErrorCode::EngineFailure, "Failed to add track " + publisherId + ": " + e.what());
    }

    // Stored before registration so a removal racing with it always finds the subscriber here
    auto subscriber = std::make_shared<Subscriber>(publisherId, Id_, publisher->Kind(), mid);
    {
        std::lock_guard<std::mutex> guard(SubscribersMutex_);
        Subscribers_.emplace(subscriber->Id(), subscriber);
    }

    try {
        // Fails if the publisher went away since the lookup
        router->RegisterSubscriber(*subscriber);
    } catch (const Error&) {
        TakeSubscriber(subscriber->Id());
        subscriber->Close();
        DetachTrack(mid);
        throw;
    }

    SessionDescription offer;
    try {
        offer = CreateLocalOffer();
    } catch (const Error&) {
        TakeSubscriber(subscriber->Id());
        subscriber->Close();
        router->UnregisterSubscriber(subscriber->Id());
        DetachTrack(mid);
        throw;
    }

    // The cycle stays open until SetAnswer
    negotiation.Detach();

    std::cout << "[" << Label_ << "] Subscribed to " << publisher->Kind() << " publisher " << publisherId
              << " as " << subscriber->Id() << std::endl;
    return {subscriber, offer};
}

void SubscribeSession::SetAnswer(const SessionDescription& answer) {
    ThrowIfClosed("SetAnswer");

    if (NegotiationLock_.GetState() == NegotiationLock::State::Idle
        || GetNegotiationState() != NegotiationState::HaveLocalOffer)
    {
        throw Error(ErrorCode::InvalidState, "Session " + Id_ + " has no outstanding offer");
    }

    ApplyRemoteAnswer(answer);
    NegotiationLock_.Release();
}

bool SubscribeSession::Unsubscribe(const std::string& subscriberId) {
    ThrowIfClosed("Unsubscribe");

    auto subscriber = TakeSubscriber(subscriberId);
    if (!subscriber) {
        return false;
    }

    subscriber->Close();
    if (auto router = GetRouter()) {
        router->UnregisterSubscriber(subscriberId);
    }
    DetachTrack(subscriber->Mid());
    return true;
}

std::vector<std::shared_ptr<Subscriber>> SubscribeSession::GetSubscribers() {
    std::lock_guard<std::mutex> guard(SubscribersMutex_);
    std::vector<std::shared_ptr<Subscriber>> subscribers;
    subscribers.reserve(Subscribers_.size());
    for (auto& [id, subscriber] : Subscribers_) {
        subscribers.push_back(subscriber);
    }
    return subscribers;
}

void SubscribeSession::HandlePublisherRemoved(const std::string& publisherId,
                                              const std::vector<std::string>& subscriberIds) {
    if (IsClosed()) {
        return;
    }

    for (const auto& subscriberId : subscriberIds) {
        auto subscriber = TakeSubscriber(subscriberId);
        if (!subscriber) {
            continue;
        }

        std::cout << "[" << Label_ << "] Publisher " << publisherId << " removed, closing subscriber "
                  << subscriberId << std::endl;
        subscriber->Close();
        DetachTrack(subscriber->Mid());

        NotifyObservers([this, &subscriberId, &publisherId](SessionObserver& observer) {
            observer.OnPublisherRemoved(Id_, subscriberId, publisherId);
        });
    }
}

void SubscribeSession::OnClose() {
    std::unordered_map<std::string, std::shared_ptr<Subscriber>> subscribers;
    {
        std::lock_guard<std::mutex> guard(SubscribersMutex_);
        subscribers.swap(Subscribers_);
    }

    auto router = GetRouter();
    for (auto& [id, subscriber] : subscribers) {
        subscriber->Close();
        if (router) {
            router->UnregisterSubscriber(id);
        }
    }
}

void SubscribeSession::OnTrack(const std::shared_ptr<RemoteTrack>& track) {
    std::cout << "[" << Label_ << "] Ignoring inbound track " << track->Id() << std::endl;
}

void SubscribeSession::OnTrackClosed(const std::string& trackId) {
    std::cout << "[" << Label_ << "] Track closed: " << trackId << std::endl;
}

std::shared_ptr<Subscriber> SubscribeSession::TakeSubscriber(const std::string& subscriberId) {
    std::lock_guard<std::mutex> guard(SubscribersMutex_);
    auto it = Subscribers_.find(subscriberId);
    if (it == Subscribers_.end()) {
        return nullptr;
    }
    auto subscriber = std::move(it->second);
    Subscribers_.erase(it);
    return subscriber;
}

// Removing a track makes the engine ask for a renegotiation, which this session then offers itself
void SubscribeSession::DetachTrack(const std::string& mid) {
    try {
        PeerConnection_->RemoveTrack(mid);
    } catch (const std::exception& e) {
        std::cerr << "[" << Label_ << "] Failed to remove track " << mid << ": " << e.what() << std::endl;
    }
}

} // namespace switchyard
