#include "testing/fake_peer_connection.hpp"

#include <algorithm>
#include <stdexcept>

namespace switchyard {
namespace test {

namespace {

std::string MediaSection(MediaKind kind, const std::string& mid, const std::string& trackId) {
    std::string media = kind == MediaKind::Data
        ? "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n"
        : std::string("m=") + MediaKindToString(kind) + " 9 UDP/TLS/RTP/SAVPF 111\r\n";

    media += "a=mid:" + mid + "\r\n";
    if (kind != MediaKind::Data) {
        media += "a=extmap:5 urn:ietf:params:rtp-hdrext:ssrc-audio-level\r\n";
        media += "a=extmap:7/sendonly urn:ietf:params:rtp-hdrext:sdes:mid\r\n";
        media += "a=extmap:9 http://www.ietf.org/id/draft-holmer-rmcat-transport-wide-cc-extensions-01\r\n";
        media += "a=msid:stream " + trackId + "\r\n";
        media += "a=sendonly\r\n";
    }
    return media;
}

} // namespace

FakeRemoteTrack::FakeRemoteTrack(std::string id, MediaKind kind, std::string mid)
    : Id_(std::move(id))
    , Kind_(kind)
    , Mid_(std::move(mid))
{ }

std::string FakeRemoteTrack::Id() const {
    return Id_;
}

MediaKind FakeRemoteTrack::Kind() const {
    return Kind_;
}

std::string FakeRemoteTrack::Mid() const {
    return Mid_;
}

std::string FakeRemoteTrack::MediaDescription() const {
    return MediaSection(Kind_, Mid_, Id_);
}

void FakePeerConnection::SetObserver(std::weak_ptr<PeerConnectionObserver> observer) {
    std::lock_guard<std::mutex> guard(Mutex_);
    Observer_ = std::move(observer);
}

void FakePeerConnection::SetRemoteDescription(const SessionDescription& description) {
    if (failSetRemoteDescription) {
        throw std::invalid_argument("Malformed description");
    }

    std::lock_guard<std::mutex> guard(Mutex_);
    RemoteDescriptions_.push_back(description);
}

bool FakePeerConnection::HasRemoteDescription() const {
    std::lock_guard<std::mutex> guard(Mutex_);
    return !RemoteDescriptions_.empty();
}

SessionDescription FakePeerConnection::CreateOffer() {
    if (failCreateOffer) {
        throw std::runtime_error("Offer generation failed");
    }

    std::lock_guard<std::mutex> guard(Mutex_);
    ++OfferCount_;

    std::string sdp = "v=0\r\no=- 1 " + std::to_string(OfferCount_) + " IN IP4 0.0.0.0\r\ns=-\r\nt=0 0\r\n";
    for (const auto& mid : MidOrder_) {
        const auto& source = Outgoing_.at(mid);
        sdp += MediaSection(source->Kind(), mid, source->Id());
    }
    LocalDescriptions_.push_back(SessionDescription{SdpType::Offer, sdp});
    return LocalDescriptions_.back();
}

SessionDescription FakePeerConnection::CreateAnswer() {
    if (failCreateAnswer) {
        throw std::runtime_error("Answer generation failed");
    }

    std::lock_guard<std::mutex> guard(Mutex_);
    LocalDescriptions_.push_back(
        SessionDescription{SdpType::Answer, "v=0\r\no=- 1 1 IN IP4 0.0.0.0\r\ns=-\r\nt=0 0\r\n"});
    return LocalDescriptions_.back();
}

void FakePeerConnection::AddRemoteCandidate(const IceCandidate& candidate) {
    if (failCandidates) {
        throw std::invalid_argument("Unparsable candidate");
    }

    std::lock_guard<std::mutex> guard(Mutex_);
    Candidates_.push_back(candidate);
}

std::string FakePeerConnection::AddTrack(const std::shared_ptr<RemoteTrack>& source) {
    if (onAddTrack) {
        onAddTrack();
    }
    if (failAddTrack) {
        throw std::runtime_error("Track rejected");
    }

    std::string mid;
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        mid = std::to_string(NextMid_++);
        Outgoing_.emplace(mid, source);
        MidOrder_.push_back(mid);
    }

    if (signalNegotiationNeeded) {
        FireNegotiationNeeded();
    }
    return mid;
}

void FakePeerConnection::RemoveTrack(const std::string& mid) {
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        if (Outgoing_.erase(mid) == 0) {
            return;
        }
        MidOrder_.erase(std::remove(MidOrder_.begin(), MidOrder_.end(), mid), MidOrder_.end());
    }

    if (signalNegotiationNeeded) {
        FireNegotiationNeeded();
    }
}

void FakePeerConnection::Close() {
    std::lock_guard<std::mutex> guard(Mutex_);
    Observer_.reset();
    Closed_ = true;
}

void FakePeerConnection::FireTrack(const std::shared_ptr<RemoteTrack>& track) {
    if (auto observer = GetObserver()) {
        observer->OnTrack(track);
    }
}

void FakePeerConnection::FireTrackClosed(const std::string& trackId) {
    if (auto observer = GetObserver()) {
        observer->OnTrackClosed(trackId);
    }
}

void FakePeerConnection::FireLocalCandidate(const IceCandidate& candidate) {
    if (auto observer = GetObserver()) {
        observer->OnLocalCandidate(candidate);
    }
}

void FakePeerConnection::FireNegotiationNeeded() {
    if (auto observer = GetObserver()) {
        observer->OnNegotiationNeeded();
    }
}

std::vector<SessionDescription> FakePeerConnection::RemoteDescriptions() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return RemoteDescriptions_;
}

std::vector<SessionDescription> FakePeerConnection::LocalDescriptions() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return LocalDescriptions_;
}

std::vector<IceCandidate> FakePeerConnection::AppliedCandidates() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Candidates_;
}

std::vector<std::string> FakePeerConnection::OutgoingMids() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return MidOrder_;
}

size_t FakePeerConnection::OfferCount() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return OfferCount_;
}

bool FakePeerConnection::IsClosed() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Closed_;
}

std::shared_ptr<PeerConnectionObserver> FakePeerConnection::GetObserver() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Observer_.lock();
}

std::shared_ptr<PeerConnection> FakePeerConnectionFactory::Create(const SessionConfig& config) {
    if (failCreate) {
        throw std::runtime_error("Engine unavailable");
    }

    auto peerConnection = std::make_shared<FakePeerConnection>();
    std::lock_guard<std::mutex> guard(Mutex_);
    Created_.push_back(peerConnection);
    return peerConnection;
}

std::shared_ptr<FakePeerConnection> FakePeerConnectionFactory::Last() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Created_.empty() ? nullptr : Created_.back();
}

std::vector<std::shared_ptr<FakePeerConnection>> FakePeerConnectionFactory::Created() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Created_;
}

std::string MakeRemoteOffer(const std::vector<std::string>& trackIds) {
    std::string sdp = "v=0\r\no=- 42 2 IN IP4 127.0.0.1\r\ns=-\r\nt=0 0\r\n";
    for (size_t i = 0; i < trackIds.size(); ++i) {
        sdp += MediaSection(MediaKind::Audio, std::to_string(i), trackIds[i]);
    }
    return sdp;
}

} // namespace test
} // namespace switchyard
