#pragma once

#include "fwd.hpp"
#include "session.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace switchyard {

// Owns one inbound peer session and turns its tracks into Publishers
class PublishSession : public Session {
public:
    PublishSession(std::weak_ptr<Router> router,
                   std::shared_ptr<PeerConnection> peerConnection,
                   RouterConfig routerConfig);
    ~PublishSession() override;

    // First negotiation of the session. Throws InvalidDescription if the offer
    // cannot be applied and InvalidState if the session was already negotiated.
    SessionDescription GetAnswer(const SessionDescription& offer);

    // Answers a later offer from the client, e.g. after it added a track
    SessionDescription Renegotiate(const SessionDescription& offer);

    // Answer to an offer this session emitted through OnNegotiationNeeded
    void SetAnswer(const SessionDescription& answer);

    // Waits up to the router's track timeout for the track to arrive, then
    // registers it with the Router. Publishing the same track twice returns the same Publisher.
    std::shared_ptr<Publisher> Publish(const std::string& trackId);
    std::shared_ptr<Publisher> Publish(const std::string& trackId, std::chrono::milliseconds timeout);

    bool Unpublish(const std::string& publisherId);

    bool IsNegotiated() const {
        return FirstNegotiationDone_;
    }

    std::vector<std::shared_ptr<Publisher>> GetPublishers();
    std::vector<std::string> GetArrivedTrackIds();

protected:
    void OnClose() override;
    bool CanRenegotiate() override;

    void OnTrack(const std::shared_ptr<RemoteTrack>& track) override;
    void OnTrackClosed(const std::string& trackId) override;

private:
    void UnregisterFromRouter(const std::shared_ptr<Publisher>& publisher);

    std::atomic_bool FirstNegotiationDone_{false};

    std::mutex TracksMutex_;
    std::condition_variable TracksCv_;
    std::unordered_map<std::string, std::shared_ptr<RemoteTrack>> ArrivedTracks_;
    std::unordered_map<std::string, std::shared_ptr<Publisher>> Publishers_;
};

} // namespace switchyard
