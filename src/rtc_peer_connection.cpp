#include "rtc_peer_connection.hpp"

#include "extension_normalizer.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace switchyard {

namespace {

std::string TrackIdFromDescription(const rtc::Description::Media& description) {
    // "msid:<stream id> <track id>"
    for (const auto& attribute : description.attributes()) {
        if (attribute.rfind("msid:", 0) != 0) {
            continue;
        }
        auto space = attribute.find(' ');
        if (space != std::string::npos && space + 1 < attribute.size()) {
            return attribute.substr(space + 1);
        }
    }
    return description.mid();
}

ConnectionState ToConnectionState(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return ConnectionState::New;
        case rtc::PeerConnection::State::Connecting: return ConnectionState::Connecting;
        case rtc::PeerConnection::State::Connected: return ConnectionState::Connected;
        case rtc::PeerConnection::State::Disconnected: return ConnectionState::Disconnected;
        case rtc::PeerConnection::State::Failed: return ConnectionState::Failed;
        case rtc::PeerConnection::State::Closed: return ConnectionState::Closed;
    }
    return ConnectionState::Failed;
}

bool IsDirectionLine(const std::string& line) {
    return line == "a=sendrecv" || line == "a=recvonly" || line == "a=sendonly" || line == "a=inactive";
}

} // namespace

std::shared_ptr<RtcRemoteMediaTrack> RtcRemoteMediaTrack::Create(std::shared_ptr<rtc::Track> track) {
    auto remote = std::shared_ptr<RtcRemoteMediaTrack>(new RtcRemoteMediaTrack(std::move(track)));

    remote->Track_->onMessage([weak = std::weak_ptr<RtcRemoteMediaTrack>(remote)](rtc::binary message) {
        auto self = weak.lock();
        if (!self) {
            return;
        }

        std::lock_guard<std::mutex> lock(self->SinksMutex_);
        for (auto& [key, sink] : self->Sinks_) {
            auto target = sink.lock();
            if (target && target->isOpen()) {
                target->send(message);
            }
        }
    }, nullptr);

    return remote;
}

RtcRemoteMediaTrack::RtcRemoteMediaTrack(std::shared_ptr<rtc::Track> track)
    : Track_(std::move(track))
    , Id_(TrackIdFromDescription(Track_->description()))
{ }

std::string RtcRemoteMediaTrack::Id() const {
    return Id_;
}

MediaKind RtcRemoteMediaTrack::Kind() const {
    return MediaKindFromString(Track_->description().type()).value_or(MediaKind::Video);
}

std::string RtcRemoteMediaTrack::Mid() const {
    return Track_->mid();
}

std::string RtcRemoteMediaTrack::MediaDescription() const {
    return Track_->description().generateSdp("\r\n");
}

void RtcRemoteMediaTrack::AddSink(const std::string& key, const std::shared_ptr<rtc::Track>& sink) {
    std::lock_guard<std::mutex> guard(SinksMutex_);
    Sinks_[key] = sink;
}

void RtcRemoteMediaTrack::RemoveSink(const std::string& key) {
    std::lock_guard<std::mutex> guard(SinksMutex_);
    Sinks_.erase(key);
}

std::shared_ptr<RtcRemoteDataChannel> RtcRemoteDataChannel::Create(std::shared_ptr<rtc::DataChannel> channel) {
    auto remote = std::shared_ptr<RtcRemoteDataChannel>(new RtcRemoteDataChannel(std::move(channel)));

    remote->Channel_->onMessage([weak = std::weak_ptr<RtcRemoteDataChannel>(remote)](rtc::message_variant data) {
        auto self = weak.lock();
        if (!self) {
            return;
        }

        std::lock_guard<std::mutex> lock(self->SinksMutex_);
        for (auto& [key, sink] : self->Sinks_) {
            auto target = sink.lock();
            if (target && target->isOpen()) {
                target->send(data);
            }
        }
    });

    return remote;
}

RtcRemoteDataChannel::RtcRemoteDataChannel(std::shared_ptr<rtc::DataChannel> channel)
    : Channel_(std::move(channel))
{ }

void RtcRemoteDataChannel::ResetCallbacks() {
    Channel_->resetCallbacks();
}

std::string RtcRemoteDataChannel::Id() const {
    return Channel_->label();
}

MediaKind RtcRemoteDataChannel::Kind() const {
    return MediaKind::Data;
}

std::string RtcRemoteDataChannel::Mid() const {
    if (auto stream = Channel_->stream()) {
        return std::to_string(*stream);
    }
    return {};
}

std::string RtcRemoteDataChannel::MediaDescription() const {
    return {};
}

void RtcRemoteDataChannel::AddSink(const std::string& key, const std::shared_ptr<rtc::DataChannel>& sink) {
    std::lock_guard<std::mutex> guard(SinksMutex_);
    Sinks_[key] = sink;
}

void RtcRemoteDataChannel::RemoveSink(const std::string& key) {
    std::lock_guard<std::mutex> guard(SinksMutex_);
    Sinks_.erase(key);
}

RtcPeerConnection::RtcPeerConnection(const SessionConfig& config)
    : PeerConnection_(std::make_shared<rtc::PeerConnection>(ToRtcConfiguration(config)))
{ }

RtcPeerConnection::~RtcPeerConnection() {
    Close();
}

void RtcPeerConnection::SetObserver(std::weak_ptr<PeerConnectionObserver> observer) {
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        Observer_ = observer;
    }

    PeerConnection_->onLocalCandidate([observer](rtc::Candidate cand) {
        if (auto o = observer.lock()) {
            o->OnLocalCandidate(IceCandidate{cand.candidate(), cand.mid(), std::nullopt});
        }
    });

    PeerConnection_->onTrack([observer](std::shared_ptr<rtc::Track> track) {
        auto remote = RtcRemoteMediaTrack::Create(track);
        track->onClosed([observer, id = remote->Id()] {
            if (auto o = observer.lock()) {
                o->OnTrackClosed(id);
            }
        });

        if (auto o = observer.lock()) {
            o->OnTrack(remote);
        }
    });

    PeerConnection_->onDataChannel([this](std::shared_ptr<rtc::DataChannel> dc) {
        AcceptDataChannel(std::move(dc));
    });

    PeerConnection_->onStateChange([observer](rtc::PeerConnection::State state) {
        if (auto o = observer.lock()) {
            o->OnStateChange(ToConnectionState(state));
        }
    });
}

void RtcPeerConnection::AcceptDataChannel(std::shared_ptr<rtc::DataChannel> dc) {
    auto remote = RtcRemoteDataChannel::Create(dc);
    std::weak_ptr<PeerConnectionObserver> observer;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        observer = Observer_;
        Inbound_[dc->label()] = remote;
    }

    // The channel owns these callbacks, so they only hold the wrapper weakly
    dc->onOpen([observer, weak = std::weak_ptr<RtcRemoteDataChannel>(remote)] {
        auto self = weak.lock();
        auto o = observer.lock();
        if (self && o) {
            o->OnTrack(self);
        }
    });
    dc->onClosed([this, observer, label = dc->label()] {
        {
            std::lock_guard<std::mutex> guard(Mutex_);
            Inbound_.erase(label);
        }
        if (auto o = observer.lock()) {
            o->OnTrackClosed(label);
        }
    });
}

size_t RtcPeerConnection::InboundDataChannelCount() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Inbound_.size();
}

void RtcPeerConnection::SetRemoteDescription(const SessionDescription& description) {
    PeerConnection_->setRemoteDescription(rtc::Description(description.sdp, SdpTypeToString(description.type)));
}

bool RtcPeerConnection::HasRemoteDescription() const {
    return PeerConnection_->remoteDescription().has_value();
}

SessionDescription RtcPeerConnection::CreateOffer() {
    return CreateLocalDescription(rtc::Description::Type::Offer);
}

SessionDescription RtcPeerConnection::CreateAnswer() {
    return CreateLocalDescription(rtc::Description::Type::Answer);
}

SessionDescription RtcPeerConnection::CreateLocalDescription(rtc::Description::Type type) {
    PeerConnection_->setLocalDescription(type);

    auto local = PeerConnection_->localDescription();
    if (!local) {
        throw std::runtime_error("Local description was not generated");
    }

    auto sdpType = SdpTypeFromString(local->typeString());
    if (!sdpType) {
        throw std::runtime_error("Unexpected local description type " + local->typeString());
    }
    return SessionDescription{*sdpType, std::string(*local)};
}

void RtcPeerConnection::AddRemoteCandidate(const IceCandidate& candidate) {
    PeerConnection_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdpMid));
}

std::string RtcPeerConnection::AddTrack(const std::shared_ptr<RemoteTrack>& source) {
    std::string mid;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        mid = std::to_string(NextMid_++);
    }

    if (auto channel = std::dynamic_pointer_cast<RtcRemoteDataChannel>(source)) {
        auto local = PeerConnection_->createDataChannel(channel->Id());
        channel->AddSink(mid, local);

        std::lock_guard<std::mutex> guard(Mutex_);
        Outgoing_.emplace(mid, OutgoingEntry{local, source});
    } else if (auto track = std::dynamic_pointer_cast<RtcRemoteMediaTrack>(source)) {
        rtc::Description::Media media(PrepareForwardedMedia(track->MediaDescription(), mid));
        auto local = PeerConnection_->addTrack(std::move(media));
        track->AddSink(mid, local);

        std::lock_guard<std::mutex> guard(Mutex_);
        Outgoing_.emplace(mid, OutgoingEntry{local, source});
    } else {
        throw std::invalid_argument("Track " + source->Id() + " does not belong to this engine");
    }

    NotifyNegotiationNeeded();
    return mid;
}

void RtcPeerConnection::RemoveTrack(const std::string& mid) {
    OutgoingEntry entry;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        auto it = Outgoing_.find(mid);
        if (it == Outgoing_.end()) {
            return;
        }
        entry = std::move(it->second);
        Outgoing_.erase(it);
    }

    if (auto source = entry.source.lock()) {
        if (auto channel = std::dynamic_pointer_cast<RtcRemoteDataChannel>(source)) {
            channel->RemoveSink(mid);
        } else if (auto track = std::dynamic_pointer_cast<RtcRemoteMediaTrack>(source)) {
            track->RemoveSink(mid);
        }
    }

    std::visit([](auto& local) {
        local->close();
    }, entry.local);

    NotifyNegotiationNeeded();
}

void RtcPeerConnection::Close() {
    std::unordered_map<std::string, OutgoingEntry> outgoing;
    std::unordered_map<std::string, std::shared_ptr<RtcRemoteDataChannel>> inbound;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        Observer_.reset();
        outgoing.swap(Outgoing_);
        inbound.swap(Inbound_);
    }

    PeerConnection_->resetCallbacks();
    for (auto& [label, channel] : inbound) {
        channel->ResetCallbacks();
    }
    for (auto& [mid, entry] : outgoing) {
        std::visit([](auto& local) {
            local->resetCallbacks();
        }, entry.local);
    }
    PeerConnection_->close();
}

void RtcPeerConnection::NotifyNegotiationNeeded() {
    std::shared_ptr<PeerConnectionObserver> observer;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        observer = Observer_.lock();
    }

    if (observer && PeerConnection_->negotiationNeeded()) {
        observer->OnNegotiationNeeded();
    }
}

std::shared_ptr<PeerConnection> RtcPeerConnectionFactory::Create(const SessionConfig& config) {
    return std::make_shared<RtcPeerConnection>(config);
}

rtc::Configuration ToRtcConfiguration(const SessionConfig& config) {
    rtc::Configuration rtcConfig;
    for (const auto& url : config.iceServers) {
        rtcConfig.iceServers.emplace_back(url);
    }
    rtcConfig.bindAddress = config.bindAddress;
    rtcConfig.portRangeBegin = config.portRangeBegin;
    rtcConfig.portRangeEnd = config.portRangeEnd;
    rtcConfig.enableIceTcp = config.enableIceTcp;
    rtcConfig.maxMessageSize = config.maxMessageSize;
    rtcConfig.disableAutoNegotiation = true;
    return rtcConfig;
}

std::string PrepareForwardedMedia(const std::string& section, const std::string& mid) {
    std::istringstream in(NormalizeExtensions(section));
    std::string result;
    std::string line;
    bool directionWritten = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        if (line.rfind("a=mid:", 0) == 0) {
            line = "a=mid:" + mid;
        } else if (IsDirectionLine(line)) {
            if (directionWritten) {
                continue;
            }
            line = "a=sendonly";
            directionWritten = true;
        }
        result += line;
        result += "\r\n";
    }

    if (!directionWritten) {
        result += "a=sendonly\r\n";
    }
    return result;
}

rtc::LogLevel ParseLogLevel(const std::string& level) {
    if (level == "none") return rtc::LogLevel::None;
    if (level == "fatal") return rtc::LogLevel::Fatal;
    if (level == "error") return rtc::LogLevel::Error;
    if (level == "warning") return rtc::LogLevel::Warning;
    if (level == "info") return rtc::LogLevel::Info;
    if (level == "debug") return rtc::LogLevel::Debug;
    if (level == "verbose") return rtc::LogLevel::Verbose;
    throw std::invalid_argument("Unknown log level " + level);
}

void InitEngineLogger(const std::string& level) {
    rtc::InitLogger(ParseLogLevel(level));
}

} // namespace switchyard
