#pragma once

#include "config.hpp"
#include "peer_connection.hpp"
#include "types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace switchyard {
namespace test {

class FakeRemoteTrack : public RemoteTrack {
public:
    FakeRemoteTrack(std::string id, MediaKind kind, std::string mid = "0");

    std::string Id() const override;
    MediaKind Kind() const override;
    std::string Mid() const override;
    std::string MediaDescription() const override;

private:
    const std::string Id_;
    const MediaKind Kind_;
    const std::string Mid_;
};

// Scripted engine. Every call is recorded; offers carry one media section per
// added track with extension ids that differ from the canonical ones.
class FakePeerConnection : public PeerConnection {
public:
    FakePeerConnection() = default;

    void SetObserver(std::weak_ptr<PeerConnectionObserver> observer) override;

    void SetRemoteDescription(const SessionDescription& description) override;
    bool HasRemoteDescription() const override;

    SessionDescription CreateOffer() override;
    SessionDescription CreateAnswer() override;

    void AddRemoteCandidate(const IceCandidate& candidate) override;

    std::string AddTrack(const std::shared_ptr<RemoteTrack>& source) override;
    void RemoveTrack(const std::string& mid) override;

    void Close() override;

    // Engine side events
    void FireTrack(const std::shared_ptr<RemoteTrack>& track);
    void FireTrackClosed(const std::string& trackId);
    void FireLocalCandidate(const IceCandidate& candidate);
    void FireNegotiationNeeded();

    // Failure injection
    std::atomic_bool failSetRemoteDescription{false};
    std::atomic_bool failCreateOffer{false};
    std::atomic_bool failCreateAnswer{false};
    std::atomic_bool failAddTrack{false};
    std::atomic_bool failCandidates{false};
    // Whether AddTrack/RemoveTrack raise OnNegotiationNeeded like a real engine
    std::atomic_bool signalNegotiationNeeded{true};
    // Runs inside AddTrack before the track is added. Set it before the session is used.
    std::function<void()> onAddTrack;

    std::vector<SessionDescription> RemoteDescriptions();
    // Descriptions as the engine generated and applied them
    std::vector<SessionDescription> LocalDescriptions();
    std::vector<IceCandidate> AppliedCandidates();
    std::vector<std::string> OutgoingMids();
    size_t OfferCount();
    bool IsClosed();

private:
    std::shared_ptr<PeerConnectionObserver> GetObserver();

    mutable std::mutex Mutex_;
    std::weak_ptr<PeerConnectionObserver> Observer_;
    std::vector<SessionDescription> RemoteDescriptions_;
    std::vector<SessionDescription> LocalDescriptions_;
    std::vector<IceCandidate> Candidates_;
    std::unordered_map<std::string, std::shared_ptr<RemoteTrack>> Outgoing_;
    std::vector<std::string> MidOrder_;
    uint64_t NextMid_ = 0;
    size_t OfferCount_ = 0;
    bool Closed_ = false;
};

// Hands out FakePeerConnections and keeps them for inspection
class FakePeerConnectionFactory : public PeerConnectionFactory {
public:
    std::shared_ptr<PeerConnection> Create(const SessionConfig& config) override;

    std::shared_ptr<FakePeerConnection> Last();
    std::vector<std::shared_ptr<FakePeerConnection>> Created();

    std::atomic_bool failCreate{false};

private:
    std::mutex Mutex_;
    std::vector<std::shared_ptr<FakePeerConnection>> Created_;
};

// A remote offer as a browser would send it, with non-canonical extension ids
std::string MakeRemoteOffer(const std::vector<std::string>& trackIds);

} // namespace test
} // namespace switchyard
