#include "rtc_peer_connection.hpp"

#include <rtc/rtc.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace switchyard {
namespace test {

namespace {

class NullPeerConnectionObserver : public PeerConnectionObserver {
public:
    void OnLocalCandidate(const IceCandidate& candidate) override {}
    void OnTrack(const std::shared_ptr<RemoteTrack>& track) override {}
    void OnTrackClosed(const std::string& trackId) override {}
    void OnNegotiationNeeded() override {}
    void OnStateChange(ConnectionState state) override {}
};

constexpr char kInboundAudio[] =
    "m=audio 9 UDP/TLS/RTP/SAVPF 111\r\n"
    "a=mid:3\r\n"
    "a=extmap:5 urn:ietf:params:rtp-hdrext:ssrc-audio-level\r\n"
    "a=msid:stream mic\r\n"
    "a=sendrecv\r\n"
    "a=recvonly\r\n";

} // namespace

TEST(RtcPeerConnectionTest, ForwardedMediaIsSendOnlyUnderNewMid) {
    auto media = PrepareForwardedMedia(kInboundAudio, "7");

    EXPECT_NE(media.find("a=mid:7\r\n"), std::string::npos);
    EXPECT_EQ(media.find("a=mid:3"), std::string::npos);
    EXPECT_NE(media.find("a=extmap:1 urn:ietf:params:rtp-hdrext:ssrc-audio-level"), std::string::npos);
    EXPECT_NE(media.find("a=sendonly\r\n"), std::string::npos);
    EXPECT_EQ(media.find("a=sendrecv"), std::string::npos);
    EXPECT_EQ(media.find("a=recvonly"), std::string::npos);
    EXPECT_EQ(media.find("a=sendonly"), media.rfind("a=sendonly"));
}

TEST(RtcPeerConnectionTest, ForwardedMediaGetsDirectionWhenMissing) {
    auto media = PrepareForwardedMedia("m=video 9 UDP/TLS/RTP/SAVPF 96\na=mid:0\n", "1");
    EXPECT_EQ(media, "m=video 9 UDP/TLS/RTP/SAVPF 96\r\na=mid:1\r\na=sendonly\r\n");
}

TEST(RtcPeerConnectionTest, LogLevels) {
    EXPECT_EQ(ParseLogLevel("none"), rtc::LogLevel::None);
    EXPECT_EQ(ParseLogLevel("warning"), rtc::LogLevel::Warning);
    EXPECT_EQ(ParseLogLevel("verbose"), rtc::LogLevel::Verbose);
    EXPECT_THROW(ParseLogLevel("loud"), std::invalid_argument);
}

TEST(RtcPeerConnectionTest, InboundDataChannelIsReleasedOnClose) {
    RtcPeerConnection connection(SessionConfig{});
    auto observer = std::make_shared<NullPeerConnectionObserver>();
    connection.SetObserver(observer);

    rtc::PeerConnection peer;
    auto channel = peer.createDataChannel("chat");
    connection.AcceptDataChannel(channel);

    EXPECT_EQ(connection.InboundDataChannelCount(), 1u);
    EXPECT_EQ(channel.use_count(), 2);

    // Nothing the channel holds may keep its wrapper alive
    connection.Close();
    EXPECT_EQ(connection.InboundDataChannelCount(), 0u);
    EXPECT_EQ(channel.use_count(), 1);

    peer.close();
}

} // namespace test
} // namespace switchyard
