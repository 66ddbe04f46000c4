#include "extension_normalizer.hpp"

#include <gtest/gtest.h>

#include <string>

namespace switchyard {
namespace test {

TEST(ExtensionNormalizerTest, CanonicalIds) {
    EXPECT_EQ(CanonicalExtensionId(kAudioLevelUri), 1);
    EXPECT_EQ(CanonicalExtensionId(kAbsSendTimeUri), 2);
    EXPECT_EQ(CanonicalExtensionId(kTransportCcUri), 3);
    EXPECT_EQ(CanonicalExtensionId(kSdesMidUri), 4);
    EXPECT_EQ(CanonicalExtensionId(kSdesRtpStreamIdUri), 10);
    EXPECT_EQ(CanonicalExtensionId(kSdesRepairedRtpStreamIdUri), 11);
    EXPECT_EQ(CanonicalExtensionId(kVideoOrientationUri), 13);
    EXPECT_EQ(CanonicalExtensionId(kTimeOffsetUri), 14);
    EXPECT_FALSE(CanonicalExtensionId("urn:example:unknown").has_value());
}

TEST(ExtensionNormalizerTest, RewritesKnownUris) {
    const std::string sdp =
        "m=audio 9 UDP/TLS/RTP/SAVPF 111\r\n"
        "a=extmap:5 urn:ietf:params:rtp-hdrext:sdes:mid\r\n"
        "a=extmap:9 urn:ietf:params:rtp-hdrext:ssrc-audio-level\r\n";

    EXPECT_EQ(NormalizeExtensions(sdp),
        "m=audio 9 UDP/TLS/RTP/SAVPF 111\r\n"
        "a=extmap:4 urn:ietf:params:rtp-hdrext:sdes:mid\r\n"
        "a=extmap:1 urn:ietf:params:rtp-hdrext:ssrc-audio-level\r\n");
}

TEST(ExtensionNormalizerTest, KeepsDirectionAndAttributes) {
    const std::string sdp = "a=extmap:7/sendonly urn:3gpp:video-orientation extra\r\n";

    EXPECT_EQ(NormalizeExtensions(sdp), "a=extmap:13/sendonly urn:3gpp:video-orientation extra\r\n");
}

TEST(ExtensionNormalizerTest, UnknownUriKeepsItsId) {
    const std::string sdp =
        "a=extmap:12 http://example.com/custom-extension\r\n"
        "a=extmap:6 urn:ietf:params:rtp-hdrext:toffset\r\n";

    EXPECT_EQ(NormalizeExtensions(sdp),
        "a=extmap:12 http://example.com/custom-extension\r\n"
        "a=extmap:14 urn:ietf:params:rtp-hdrext:toffset\r\n");
}

TEST(ExtensionNormalizerTest, NoExtmapIsIdentity) {
    const std::string sdp = "v=0\r\no=- 1 1 IN IP4 0.0.0.0\r\ns=-\r\nt=0 0\r\na=group:BUNDLE 0\r\n";

    EXPECT_EQ(NormalizeExtensions(sdp), sdp);
    EXPECT_EQ(NormalizeExtensions(""), "");
}

TEST(ExtensionNormalizerTest, PreservesBareNewlines) {
    const std::string sdp = "a=mid:0\na=extmap:3 urn:ietf:params:rtp-hdrext:sdes:mid\na=sendonly";

    EXPECT_EQ(NormalizeExtensions(sdp), "a=mid:0\na=extmap:4 urn:ietf:params:rtp-hdrext:sdes:mid\na=sendonly");
}

TEST(ExtensionNormalizerTest, Idempotent) {
    const std::string sdp =
        "a=extmap:8 http://www.webrtc.org/experiments/rtp-hdrext/abs-send-time\r\n"
        "a=extmap:2 http://www.ietf.org/id/draft-holmer-rmcat-transport-wide-cc-extensions-01\r\n"
        "a=extmap:20 urn:example:other\r\n";

    const auto once = NormalizeExtensions(sdp);
    EXPECT_EQ(NormalizeExtensions(once), once);
}

TEST(ExtensionNormalizerTest, MalformedLinesAreLeftAlone) {
    const std::string sdp =
        "a=extmap:\r\n"
        "a=extmap:abc urn:ietf:params:rtp-hdrext:sdes:mid\r\n"
        "a=extmap:5\r\n";

    EXPECT_EQ(NormalizeExtensions(sdp), sdp);
}

} // namespace test
} // namespace switchyard
