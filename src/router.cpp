#include "router.hpp"

#include "error.hpp"
#include "peer_connection.hpp"
#include "publish_session.hpp"
#include "publisher.hpp"
#include "subscribe_session.hpp"
#include "subscriber.hpp"
#include "types.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace switchyard {

std::shared_ptr<Router> Router::Create(std::shared_ptr<PeerConnectionFactory> factory, RouterConfig config) {
    return std::shared_ptr<Router>(new Router(std::move(factory), std::move(config)));
}

Router::Router(std::shared_ptr<PeerConnectionFactory> factory, RouterConfig config)
    : Id_(GenerateId())
    , Config_(std::move(config))
    , Factory_(std::move(factory))
{
    std::cout << "[Router " << Id_ << "] Created" << std::endl;
}

Router::~Router() {
    std::cout << "[Router " << Id_ << "] Destroyed" << std::endl;
}

template <typename T>
std::shared_ptr<T> Router::CreateSession(const SessionConfig& config) {
    std::shared_ptr<PeerConnection> peerConnection;
    try {
        peerConnection = Factory_->Create(config);
    } catch (const std::exception& e) {
        throw Error(ErrorCode::EngineFailure, "Failed to create peer connection: " + std::string(e.what()));
    }

    auto session = std::make_shared<T>(weak_from_this(), std::move(peerConnection), Config_);
    static_cast<Session&>(*session).Start();

    {
        std::lock_guard<std::mutex> guard(Mutex_);
        if (!Closed_) {
            Sessions_.emplace(session->Id(), session);
            return session;
        }
    }

    session->Close();
    throw Error(ErrorCode::SessionClosed, "Router " + Id_ + " is closed");
}

std::shared_ptr<PublishSession> Router::CreatePublishSession(const SessionConfig& config) {
    return CreateSession<PublishSession>(config);
}

std::shared_ptr<SubscribeSession> Router::CreateSubscribeSession(const SessionConfig& config) {
    return CreateSession<SubscribeSession>(config);
}

std::shared_ptr<Session> Router::FindSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> guard(Mutex_);
    auto it = Sessions_.find(sessionId);
    return it == Sessions_.end() ? nullptr : it->second;
}

size_t Router::SessionCount() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Sessions_.size();
}

void Router::RemoveSession(const std::string& sessionId) {
    std::shared_ptr<Session> removed;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        auto it = Sessions_.find(sessionId);
        if (it == Sessions_.end()) {
            return;
        }
        removed = std::move(it->second);
        Sessions_.erase(it);
    }

    // Lookups made on behalf of the session give up
    PublishersCv_.notify_all();
    std::cout << "[Router " << Id_ << "] Session " << sessionId << " removed" << std::endl;
}

void Router::RegisterPublisher(const std::shared_ptr<Publisher>& publisher) {
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        auto it = Publishers_.find(publisher->Id());
        if (it != Publishers_.end() && !it->second.expired()) {
            throw Error(ErrorCode::InvalidState, "Publisher " + publisher->Id() + " is already registered");
        }
        Publishers_[publisher->Id()] = publisher;
    }

    PublishersCv_.notify_all();
    std::cout << "[Router " << Id_ << "] Publisher " << publisher->Id() << " registered" << std::endl;
}

bool Router::UnregisterPublisher(const std::string& publisherId) {
    std::vector<std::pair<std::shared_ptr<Session>, std::vector<std::string>>> affected;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        if (Publishers_.erase(publisherId) == 0) {
            return false;
        }

        std::unordered_map<std::string, std::vector<std::string>> bySession;
        for (auto it = Subscribers_.begin(); it != Subscribers_.end();) {
            if (it->second.publisherId == publisherId) {
                bySession[it->second.sessionId].push_back(it->first);
                it = Subscribers_.erase(it);
            } else {
                ++it;
            }
        }

        for (auto& [sessionId, subscriberIds] : bySession) {
            if (auto session = Sessions_.find(sessionId); session != Sessions_.end()) {
                affected.emplace_back(session->second, std::move(subscriberIds));
            }
        }
    }

    std::cout << "[Router " << Id_ << "] Publisher " << publisherId << " unregistered, notifying "
              << affected.size() << " sessions" << std::endl;

    for (auto& [session, subscriberIds] : affected) {
        session->HandlePublisherRemoved(publisherId, subscriberIds);
    }
    return true;
}

std::shared_ptr<Publisher> Router::GetPublisher(const std::string& publisherId) {
    std::lock_guard<std::mutex> guard(Mutex_);
    auto it = Publishers_.find(publisherId);
    return it == Publishers_.end() ? nullptr : it->second.lock();
}

std::shared_ptr<Publisher> Router::FindPublisher(const std::string& publisherId,
                                                 int maxAttempts,
                                                 std::chrono::milliseconds interval,
                                                 const std::string& requestingSessionId) {
    maxAttempts = std::max(maxAttempts, 1);

    std::shared_ptr<Publisher> publisher;
    bool cancelled = false;
    auto ready = [&] {
        cancelled = Closed_ || (!requestingSessionId.empty() && Sessions_.count(requestingSessionId) == 0);
        if (auto it = Publishers_.find(publisherId); it != Publishers_.end()) {
            publisher = it->second.lock();
        }
        return cancelled || publisher != nullptr;
    };

    const auto start = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(Mutex_);
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        PublishersCv_.wait_until(lock, start + interval * attempt, ready);
        if (publisher) {
            if (attempt > 1) {
                std::cout << "[Router " << Id_ << "] Publisher " << publisherId << " found on attempt "
                          << attempt << std::endl;
            }
            return publisher;
        }
        if (cancelled) {
            throw Error(ErrorCode::Cancelled, "Lookup of publisher " + publisherId + " cancelled");
        }
    }

    throw Error(ErrorCode::PublisherNotFound,
                "Publisher " + publisherId + " not found after " + std::to_string(maxAttempts) + " attempts");
}

std::vector<std::string> Router::PublisherIds() {
    std::lock_guard<std::mutex> guard(Mutex_);
    std::vector<std::string> ids;
    for (auto& [id, publisher] : Publishers_) {
        if (!publisher.expired()) {
            ids.push_back(id);
        }
    }
    return ids;
}

void Router::RegisterSubscriber(const Subscriber& subscriber) {
    std::lock_guard<std::mutex> guard(Mutex_);
    auto it = Publishers_.find(subscriber.PublisherId());
    if (it == Publishers_.end() || it->second.expired()) {
        throw Error(ErrorCode::PublisherNotFound, "Publisher " + subscriber.PublisherId() + " is gone");
    }
    Subscribers_[subscriber.Id()] = SubscriberEntry{subscriber.PublisherId(), subscriber.SessionId()};
}

bool Router::UnregisterSubscriber(const std::string& subscriberId) {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Subscribers_.erase(subscriberId) > 0;
}

size_t Router::SubscriberCount(const std::string& publisherId) {
    std::lock_guard<std::mutex> guard(Mutex_);
    return std::count_if(Subscribers_.begin(), Subscribers_.end(), [&publisherId](const auto& entry) {
        return entry.second.publisherId == publisherId;
    });
}

void Router::Close() {
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        if (Closed_) {
            return;
        }
        Closed_ = true;
        sessions = Sessions_;
    }
    PublishersCv_.notify_all();

    std::cout << "[Router " << Id_ << "] Closing " << sessions.size() << " sessions" << std::endl;
    for (auto& [id, session] : sessions) {
        session->Close();
    }
}

bool Router::IsClosed() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Closed_;
}

} // namespace switchyard
