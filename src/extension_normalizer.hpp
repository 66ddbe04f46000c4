#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace switchyard {

// Well-known RTP header extension URIs and the id every session in a router uses for them.
inline constexpr std::string_view kAudioLevelUri = "urn:ietf:params:rtp-hdrext:ssrc-audio-level";
inline constexpr std::string_view kAbsSendTimeUri = "http://www.webrtc.org/experiments/rtp-hdrext/abs-send-time";
inline constexpr std::string_view kTransportCcUri = "http://www.ietf.org/id/draft-holmer-rmcat-transport-wide-cc-extensions-01";
inline constexpr std::string_view kSdesMidUri = "urn:ietf:params:rtp-hdrext:sdes:mid";
inline constexpr std::string_view kSdesRtpStreamIdUri = "urn:ietf:params:rtp-hdrext:sdes:rtp-stream-id";
inline constexpr std::string_view kSdesRepairedRtpStreamIdUri = "urn:ietf:params:rtp-hdrext:sdes:repaired-rtp-stream-id";
inline constexpr std::string_view kVideoOrientationUri = "urn:3gpp:video-orientation";
inline constexpr std::string_view kTimeOffsetUri = "urn:ietf:params:rtp-hdrext:toffset";

std::optional<int> CanonicalExtensionId(std::string_view uri);

// Rewrites every "a=extmap:" line whose URI is in the canonical table to the
// canonical id. Lines with other URIs and all other lines are left untouched,
// line endings included. Never throws on malformed input.
std::string NormalizeExtensions(const std::string& sdp);

} // namespace switchyard
