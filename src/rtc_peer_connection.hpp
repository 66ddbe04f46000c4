#pragma once

#include "fwd.hpp"
#include "config.hpp"
#include "peer_connection.hpp"

#include <rtc/rtc.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

namespace switchyard {

// Inbound media track. Every RTP/RTCP message received is copied to the
// outbound tracks of the sessions subscribed to it.
class RtcRemoteMediaTrack : public RemoteTrack, public std::enable_shared_from_this<RtcRemoteMediaTrack> {
public:
    static std::shared_ptr<RtcRemoteMediaTrack> Create(std::shared_ptr<rtc::Track> track);

    std::string Id() const override;
    MediaKind Kind() const override;
    std::string Mid() const override;
    std::string MediaDescription() const override;

    void AddSink(const std::string& key, const std::shared_ptr<rtc::Track>& sink);
    void RemoveSink(const std::string& key);

private:
    explicit RtcRemoteMediaTrack(std::shared_ptr<rtc::Track> track);

    const std::shared_ptr<rtc::Track> Track_;
    const std::string Id_;

    std::mutex SinksMutex_;
    std::unordered_map<std::string, std::weak_ptr<rtc::Track>> Sinks_;
};

// Inbound data channel, published under its label
class RtcRemoteDataChannel : public RemoteTrack, public std::enable_shared_from_this<RtcRemoteDataChannel> {
public:
    static std::shared_ptr<RtcRemoteDataChannel> Create(std::shared_ptr<rtc::DataChannel> channel);

    std::string Id() const override;
    MediaKind Kind() const override;
    std::string Mid() const override;
    std::string MediaDescription() const override;

    void AddSink(const std::string& key, const std::shared_ptr<rtc::DataChannel>& sink);
    void RemoveSink(const std::string& key);

    // Drops the forwarding callbacks registered on the inbound channel
    void ResetCallbacks();

private:
    explicit RtcRemoteDataChannel(std::shared_ptr<rtc::DataChannel> channel);

    const std::shared_ptr<rtc::DataChannel> Channel_;

    std::mutex SinksMutex_;
    std::unordered_map<std::string, std::weak_ptr<rtc::DataChannel>> Sinks_;
};

// PeerConnection backed by libdatachannel. Automatic negotiation is disabled:
// offers and answers are only produced when the session asks for them.
class RtcPeerConnection : public PeerConnection {
public:
    explicit RtcPeerConnection(const SessionConfig& config);
    ~RtcPeerConnection() override;

    void SetObserver(std::weak_ptr<PeerConnectionObserver> observer) override;

    void SetRemoteDescription(const SessionDescription& description) override;
    bool HasRemoteDescription() const override;

    SessionDescription CreateOffer() override;
    SessionDescription CreateAnswer() override;

    void AddRemoteCandidate(const IceCandidate& candidate) override;

    std::string AddTrack(const std::shared_ptr<RemoteTrack>& source) override;
    void RemoveTrack(const std::string& mid) override;

    void Close() override;

    // Called by the engine for each data channel the remote peer opens. The
    // channel is published once open and kept until it or this session closes.
    void AcceptDataChannel(std::shared_ptr<rtc::DataChannel> dc);
    size_t InboundDataChannelCount();

private:
    using Outgoing = std::variant<std::shared_ptr<rtc::Track>, std::shared_ptr<rtc::DataChannel>>;

    struct OutgoingEntry {
        Outgoing local;
        std::weak_ptr<RemoteTrack> source;
    };

    SessionDescription CreateLocalDescription(rtc::Description::Type type);
    void NotifyNegotiationNeeded();

    const std::shared_ptr<rtc::PeerConnection> PeerConnection_;

    std::mutex Mutex_;
    std::weak_ptr<PeerConnectionObserver> Observer_;
    std::unordered_map<std::string, OutgoingEntry> Outgoing_;
    // Inbound data channels by label, owned here until they close
    std::unordered_map<std::string, std::shared_ptr<RtcRemoteDataChannel>> Inbound_;
    uint64_t NextMid_ = 0;
};

class RtcPeerConnectionFactory : public PeerConnectionFactory {
public:
    std::shared_ptr<PeerConnection> Create(const SessionConfig& config) override;
};

rtc::Configuration ToRtcConfiguration(const SessionConfig& config);

// Rewrites an inbound media section so it can be offered on another session
// under `mid`, send-only and with canonical extension ids
std::string PrepareForwardedMedia(const std::string& section, const std::string& mid);

// Accepts none, fatal, error, warning, info, debug and verbose
rtc::LogLevel ParseLogLevel(const std::string& level);
void InitEngineLogger(const std::string& level);

} // namespace switchyard
