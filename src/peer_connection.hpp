#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <memory>
#include <string>

namespace switchyard {

// An inbound track or data channel as delivered by the engine
class RemoteTrack {
public:
    virtual ~RemoteTrack() = default;

    // Stable identity of the track (msid track id, or the label of a data channel)
    virtual std::string Id() const = 0;
    virtual MediaKind Kind() const = 0;
    virtual std::string Mid() const = 0;
    // The media section describing the track, used to forward it on another session
    virtual std::string MediaDescription() const = 0;
};

enum class ConnectionState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed,
};

const char* ConnectionStateToString(ConnectionState state);

// Notifications from the engine, delivered on engine threads. Implementations
// must not block for long.
class PeerConnectionObserver {
public:
    virtual ~PeerConnectionObserver() = default;

    virtual void OnLocalCandidate(const IceCandidate& candidate) = 0;
    virtual void OnTrack(const std::shared_ptr<RemoteTrack>& track) = 0;
    virtual void OnTrackClosed(const std::string& trackId) = 0;
    virtual void OnNegotiationNeeded() = 0;
    virtual void OnStateChange(ConnectionState state) = 0;
};

// The connectivity engine behind one session: ICE, DTLS, SRTP and SCTP live
// behind this interface. Failures are reported by throwing std::exception.
class PeerConnection {
public:
    virtual ~PeerConnection() = default;

    virtual void SetObserver(std::weak_ptr<PeerConnectionObserver> observer) = 0;

    virtual void SetRemoteDescription(const SessionDescription& description) = 0;
    virtual bool HasRemoteDescription() const = 0;

    // Generates a local description of the given kind and applies it.
    // Callers may only rewrite the returned copy, so the applied description keeps
    // the engine's extension ids. Engines that forward media have to normalize
    // forwarded sections before they are added (see PrepareForwardedMedia).
    virtual SessionDescription CreateOffer() = 0;
    virtual SessionDescription CreateAnswer() = 0;

    virtual void AddRemoteCandidate(const IceCandidate& candidate) = 0;

    // Starts forwarding `source` on this session and returns the local mid
    virtual std::string AddTrack(const std::shared_ptr<RemoteTrack>& source) = 0;
    virtual void RemoveTrack(const std::string& mid) = 0;

    // After Close() returns no observer callback is delivered
    virtual void Close() = 0;
};

class PeerConnectionFactory {
public:
    virtual ~PeerConnectionFactory() = default;

    virtual std::shared_ptr<PeerConnection> Create(const SessionConfig& config) = 0;
};

} // namespace switchyard
