#include "publish_session.hpp"

#include "error.hpp"
#include "publisher.hpp"
#include "router.hpp"

#include <iostream>

namespace switchyard {

PublishSession::PublishSession(std::weak_ptr<Router> router,
                               std::shared_ptr<PeerConnection> peerConnection,
                               RouterConfig routerConfig)
    : Session(Type::Publish, std::move(router), std::move(peerConnection), std::move(routerConfig))
{ }

PublishSession::~PublishSession() {
    Close();
}

SessionDescription PublishSession::GetAnswer(const SessionDescription& offer) {
    ThrowIfClosed("GetAnswer");

    // Fails fast instead of queueing behind an outstanding server offer
    if (FirstNegotiationDone_) {
        throw Error(ErrorCode::InvalidState, "Session " + Id_ + " is already negotiated");
    }

    ScopedNegotiation negotiation(NegotiationLock_);
    // A concurrent GetAnswer may have won the lock first
    if (FirstNegotiationDone_) {
        throw Error(ErrorCode::InvalidState, "Session " + Id_ + " is already negotiated");
    }

    auto answer = AnswerRemoteOffer(offer);
    FirstNegotiationDone_ = true;
    return answer;
}

SessionDescription PublishSession::Renegotiate(const SessionDescription& offer) {
    ThrowIfClosed("Renegotiate");

    if (!FirstNegotiationDone_) {
        throw Error(ErrorCode::InvalidState, "Session " + Id_ + " has not been negotiated yet");
    }

    ScopedNegotiation negotiation(NegotiationLock_);
    return AnswerRemoteOffer(offer);
}

void PublishSession::SetAnswer(const SessionDescription& answer) {
    ThrowIfClosed("SetAnswer");

    if (NegotiationLock_.GetState() == NegotiationLock::State::Idle
        || GetNegotiationState() != NegotiationState::HaveLocalOffer)
    {
        throw Error(ErrorCode::InvalidState, "Session " + Id_ + " has no outstanding offer");
    }

    ApplyRemoteAnswer(answer);
    NegotiationLock_.Release();
}

std::shared_ptr<Publisher> PublishSession::Publish(const std::string& trackId) {
    return Publish(trackId, RouterConfig_.trackWaitTimeout);
}

std::shared_ptr<Publisher> PublishSession::Publish(const std::string& trackId, std::chrono::milliseconds timeout) {
    ThrowIfClosed("Publish");

    auto router = GetRouter();
    if (!router) {
        throw Error(ErrorCode::SessionClosed, "Router of session " + Id_ + " is gone");
    }

    std::unique_lock<std::mutex> lock(TracksMutex_);
    if (auto it = Publishers_.find(trackId); it != Publishers_.end()) {
        return it->second;
    }

    bool arrived = TracksCv_.wait_for(lock, timeout, [this, &trackId] {
        return IsClosed() || ArrivedTracks_.count(trackId) > 0;
    });
    if (IsClosed()) {
        throw Error(ErrorCode::SessionClosed, "Session " + Id_ + " closed while waiting for track " + trackId);
    }
    if (!arrived) {
        throw Error(ErrorCode::TrackNotFound, "Track " + trackId + " did not arrive on session " + Id_);
    }

    // Another Publish may have bound the track while we were waiting
    if (auto it = Publishers_.find(trackId); it != Publishers_.end()) {
        return it->second;
    }

    auto publisher = std::make_shared<Publisher>(Id_, ArrivedTracks_.at(trackId));
    router->RegisterPublisher(publisher);
    Publishers_.emplace(trackId, publisher);

    std::cout << "[" << Label_ << "] Published " << publisher->Kind() << " track " << trackId << std::endl;
    return publisher;
}

bool PublishSession::Unpublish(const std::string& publisherId) {
    std::shared_ptr<Publisher> publisher;
    {
        std::lock_guard<std::mutex> guard(TracksMutex_);
        auto it = Publishers_.find(publisherId);
        if (it == Publishers_.end()) {
            return false;
        }
        publisher = std::move(it->second);
        Publishers_.erase(it);
    }

    UnregisterFromRouter(publisher);
    return true;
}

std::vector<std::shared_ptr<Publisher>> PublishSession::GetPublishers() {
    std::lock_guard<std::mutex> guard(TracksMutex_);
    std::vector<std::shared_ptr<Publisher>> publishers;
    publishers.reserve(Publishers_.size());
    for (auto& [id, publisher] : Publishers_) {
        publishers.push_back(publisher);
    }
    return publishers;
}

std::vector<std::string> PublishSession::GetArrivedTrackIds() {
    std::lock_guard<std::mutex> guard(TracksMutex_);
    std::vector<std::string> ids;
    ids.reserve(ArrivedTracks_.size());
    for (auto& [id, track] : ArrivedTracks_) {
        ids.push_back(id);
    }
    return ids;
}

void PublishSession::OnClose() {
    std::unordered_map<std::string, std::shared_ptr<Publisher>> publishers;
    {
        std::lock_guard<std::mutex> guard(TracksMutex_);
        publishers.swap(Publishers_);
        ArrivedTracks_.clear();
    }
    TracksCv_.notify_all();

    for (auto& [id, publisher] : publishers) {
        UnregisterFromRouter(publisher);
    }
}

bool PublishSession::CanRenegotiate() {
    return FirstNegotiationDone_;
}

void PublishSession::OnTrack(const std::shared_ptr<RemoteTrack>& track) {
    if (IsClosed()) {
        return;
    }

    std::cout << "[" << Label_ << "] Track arrived: id=" << track->Id()
              << ", kind=" << track->Kind() << ", mid=" << track->Mid() << std::endl;
    {
        std::lock_guard<std::mutex> guard(TracksMutex_);
        ArrivedTracks_[track->Id()] = track;
    }
    TracksCv_.notify_all();
}

void PublishSession::OnTrackClosed(const std::string& trackId) {
    std::shared_ptr<Publisher> publisher;
    {
        std::lock_guard<std::mutex> guard(TracksMutex_);
        ArrivedTracks_.erase(trackId);
        if (auto it = Publishers_.find(trackId); it != Publishers_.end()) {
            publisher = std::move(it->second);
            Publishers_.erase(it);
        }
    }

    std::cout << "[" << Label_ << "] Track ended: " << trackId << std::endl;
    if (publisher) {
        UnregisterFromRouter(publisher);
    }
}

void PublishSession::UnregisterFromRouter(const std::shared_ptr<Publisher>& publisher) {
    publisher->Close();
    if (auto router = GetRouter()) {
        router->UnregisterPublisher(publisher->Id());
    }
}

} // namespace switchyard
