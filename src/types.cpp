#include "types.hpp"

#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace switchyard {

const char* SdpTypeToString(SdpType type) {
    switch (type) {
        case SdpType::Offer: return "offer";
        case SdpType::Answer: return "answer";
    }
    return "unknown";
}

std::optional<SdpType> SdpTypeFromString(const std::string& type) {
    if (type == "offer") {
        return SdpType::Offer;
    }
    if (type == "answer") {
        return SdpType::Answer;
    }
    return std::nullopt;
}

const char* MediaKindToString(MediaKind kind) {
    switch (kind) {
        case MediaKind::Audio: return "audio";
        case MediaKind::Video: return "video";
        case MediaKind::Data: return "data";
    }
    return "unknown";
}

std::optional<MediaKind> MediaKindFromString(const std::string& kind) {
    if (kind == "audio") {
        return MediaKind::Audio;
    }
    if (kind == "video") {
        return MediaKind::Video;
    }
    // "application" is what an m= line says for SCTP data channels
    if (kind == "data" || kind == "application") {
        return MediaKind::Data;
    }
    return std::nullopt;
}

const char* NegotiationStateToString(NegotiationState state) {
    switch (state) {
        case NegotiationState::Stable: return "Stable";
        case NegotiationState::HaveLocalOffer: return "HaveLocalOffer";
        case NegotiationState::HaveRemoteOffer: return "HaveRemoteOffer";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, SdpType type) {
    return out << SdpTypeToString(type);
}

std::ostream& operator<<(std::ostream& out, MediaKind kind) {
    return out << MediaKindToString(kind);
}

std::ostream& operator<<(std::ostream& out, NegotiationState state) {
    return out << NegotiationStateToString(state);
}

// Random version 4 UUID
std::string GenerateId() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    uint64_t hi;
    uint64_t lo;
    {
        std::lock_guard<std::mutex> guard(mutex);
        hi = engine();
        lo = engine();
    }
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream out;
    out << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return out.str();
}

} // namespace switchyard
