#pragma once

#include "fwd.hpp"
#include "config.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace switchyard {

// Shared state of one room: its sessions, the live Publishers and the
// Subscribers forwarding them. Every registry operation runs under one mutex.
class Router : public std::enable_shared_from_this<Router> {
public:
    static std::shared_ptr<Router> Create(std::shared_ptr<PeerConnectionFactory> factory,
                                          RouterConfig config = {});
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    const std::string& Id() const {
        return Id_;
    }

    const RouterConfig& Config() const {
        return Config_;
    }

    std::shared_ptr<PublishSession> CreatePublishSession(const SessionConfig& config);
    std::shared_ptr<SubscribeSession> CreateSubscribeSession(const SessionConfig& config);

    std::shared_ptr<Session> FindSession(const std::string& sessionId);
    size_t SessionCount();

    // Called by a session when it closes
    void RemoveSession(const std::string& sessionId);

    // Throws InvalidState if a Publisher with the same id is already registered
    void RegisterPublisher(const std::shared_ptr<Publisher>& publisher);

    // Returns false if the id is not registered. Sessions holding Subscribers
    // of the Publisher are notified once each, after the registry is updated.
    bool UnregisterPublisher(const std::string& publisherId);

    // Single non-blocking lookup
    std::shared_ptr<Publisher> GetPublisher(const std::string& publisherId);

    // Looks the Publisher up for at most `maxAttempts` windows of `interval`
    // each; a registration during a window ends the wait immediately. Throws
    // PublisherNotFound when every window passed, and Cancelled if the router
    // or the requesting session closes meanwhile.
    std::shared_ptr<Publisher> FindPublisher(const std::string& publisherId,
                                             int maxAttempts,
                                             std::chrono::milliseconds interval,
                                             const std::string& requestingSessionId = {});

    std::vector<std::string> PublisherIds();

    // Throws PublisherNotFound if the Subscriber's Publisher is not registered
    void RegisterSubscriber(const Subscriber& subscriber);
    bool UnregisterSubscriber(const std::string& subscriberId);
    size_t SubscriberCount(const std::string& publisherId);

    // Closes every session
    void Close();
    bool IsClosed();

private:
    Router(std::shared_ptr<PeerConnectionFactory> factory, RouterConfig config);

    template <typename T>
    std::shared_ptr<T> CreateSession(const SessionConfig& config);

    struct SubscriberEntry {
        std::string publisherId;
        std::string sessionId;
    };

    const std::string Id_;
    const RouterConfig Config_;
    const std::shared_ptr<PeerConnectionFactory> Factory_;

    std::mutex Mutex_;
    std::condition_variable PublishersCv_;
    bool Closed_ = false;
    std::unordered_map<std::string, std::shared_ptr<Session>> Sessions_;
    // Lookup handles only, Publishers are owned by their PublishSession
    std::unordered_map<std::string, std::weak_ptr<Publisher>> Publishers_;
    std::unordered_map<std::string, SubscriberEntry> Subscribers_;
};

} // namespace switchyard
