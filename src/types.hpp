#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace switchyard {

enum class SdpType {
    Offer,
    Answer,
};

enum class MediaKind {
    Audio,
    Video,
    Data,
};

// Negotiation state of one session, as seen by the control plane.
enum class NegotiationState {
    Stable,
    HaveLocalOffer,
    HaveRemoteOffer,
};

struct SessionDescription {
    SdpType type = SdpType::Offer;
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string sdpMid;
    std::optional<int> sdpMLineIndex;
};

const char* SdpTypeToString(SdpType type);
std::optional<SdpType> SdpTypeFromString(const std::string& type);

const char* MediaKindToString(MediaKind kind);
std::optional<MediaKind> MediaKindFromString(const std::string& kind);

const char* NegotiationStateToString(NegotiationState state);

std::ostream& operator<<(std::ostream& out, SdpType type);
std::ostream& operator<<(std::ostream& out, MediaKind kind);
std::ostream& operator<<(std::ostream& out, NegotiationState state);

std::string GenerateId();

} // namespace switchyard
