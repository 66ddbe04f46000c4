#pragma once

#include "fwd.hpp"
#include "session.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace switchyard {

// Owns one outbound peer session. Each Subscribe adds a forwarded track and
// starts an offer/answer cycle that SetAnswer completes.
class SubscribeSession : public Session {
public:
    SubscribeSession(std::weak_ptr<Router> router,
                     std::shared_ptr<PeerConnection> peerConnection,
                     RouterConfig routerConfig);
    ~SubscribeSession() override;

    // Resolves the Publisher through the Router (retrying while its publish
    // negotiation may still be running), adds its track and returns the new
    // Subscriber with the offer to forward to the client.
    std::pair<std::shared_ptr<Subscriber>, SessionDescription> Subscribe(const std::string& publisherId);

    // Throws InvalidState when no offer is outstanding
    void SetAnswer(const SessionDescription& answer);

    bool Unsubscribe(const std::string& subscriberId);

    std::vector<std::shared_ptr<Subscriber>> GetSubscribers();

    void HandlePublisherRemoved(const std::string& publisherId,
                                const std::vector<std::string>& subscriberIds) override;

protected:
    void OnClose() override;

    void OnTrack(const std::shared_ptr<RemoteTrack>& track) override;
    void OnTrackClosed(const std::string& trackId) override;

private:
    std::shared_ptr<Subscriber> TakeSubscriber(const std::string& subscriberId);
    void DetachTrack(const std::string& mid);

    std::mutex SubscribersMutex_;
    std::unordered_map<std::string, std::shared_ptr<Subscriber>> Subscribers_;
};

} // namespace switchyard
