#include "participant.hpp"

#include "publish_session.hpp"
#include "room.hpp"
#include "router.hpp"
#include "testing/fake_peer_connection.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace switchyard {
namespace test {

using json = nlohmann::json;
using namespace std::chrono_literals;

constexpr char kAnswerSdp[] = "v=0\r\no=- 7 1 IN IP4 127.0.0.1\r\ns=-\r\nt=0 0\r\n";

namespace {

// Everything a participant sent to its client
class MessageLog {
public:
    Participant::Sender Sender() {
        return [this](const json& message) {
            std::lock_guard<std::mutex> guard(Mutex_);
            Messages_.push_back(message);
            Cv_.notify_all();
        };
    }

    bool WaitFor(const std::string& type, size_t count = 1, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock<std::mutex> lock(Mutex_);
        return Cv_.wait_for(lock, timeout, [&] { return CountLocked(type) >= count; });
    }

    std::vector<json> OfType(const std::string& type) {
        std::lock_guard<std::mutex> guard(Mutex_);
        std::vector<json> result;
        for (const auto& message : Messages_) {
            if (message.at("type") == type) {
                result.push_back(message);
            }
        }
        return result;
    }

private:
    size_t CountLocked(const std::string& type) {
        size_t count = 0;
        for (const auto& message : Messages_) {
            count += message.at("type") == type ? 1 : 0;
        }
        return count;
    }

    std::mutex Mutex_;
    std::condition_variable Cv_;
    std::vector<json> Messages_;
};

} // namespace

class ParticipantTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<FakePeerConnectionFactory>();

        RouterConfig config;
        config.findPublisherAttempts = 4;
        config.findPublisherInterval = 50ms;
        config.trackWaitTimeout = 500ms;
        room_ = std::make_shared<Room>("lobby", factory_, config);

        alice_ = Participant::Create(1, room_, {}, aliceLog_.Sender());
        room_->AddParticipant(alice_);
        bob_ = Participant::Create(2, room_, {}, bobLog_.Sender());
        room_->AddParticipant(bob_);

        auto engines = factory_->Created();
        alicePublishEngine_ = engines.at(0);
        aliceSubscribeEngine_ = engines.at(1);
        bobPublishEngine_ = engines.at(2);
        bobSubscribeEngine_ = engines.at(3);
    }

    void TearDown() override {
        room_->Close();
    }

    // Negotiates alice's publish session and publishes `trackId` from it
    void AlicePublishes(const std::string& trackId) {
        alice_->HandleMessage(json{{"type", "offer"}, {"sdp", MakeRemoteOffer({trackId})}});
        ASSERT_TRUE(aliceLog_.WaitFor("answer"));

        alicePublishEngine_->FireTrack(std::make_shared<FakeRemoteTrack>(trackId, MediaKind::Audio));
        alice_->HandleMessage(json{{"type", "publish"}, {"trackId", trackId}});
        ASSERT_TRUE(bobLog_.WaitFor("published"));
    }

    std::shared_ptr<FakePeerConnectionFactory> factory_;
    std::shared_ptr<Room> room_;
    MessageLog aliceLog_;
    MessageLog bobLog_;
    std::shared_ptr<Participant> alice_;
    std::shared_ptr<Participant> bob_;
    std::shared_ptr<FakePeerConnection> alicePublishEngine_;
    std::shared_ptr<FakePeerConnection> aliceSubscribeEngine_;
    std::shared_ptr<FakePeerConnection> bobPublishEngine_;
    std::shared_ptr<FakePeerConnection> bobSubscribeEngine_;
};

TEST_F(ParticipantTest, CreatesBothSessions) {
    EXPECT_EQ(factory_->Created().size(), 4u);
    EXPECT_EQ(room_->GetRouter()->SessionCount(), 4u);
    EXPECT_EQ(room_->ParticipantCount(), 2u);
}

TEST_F(ParticipantTest, PingPong) {
    alice_->HandleMessage(json{{"type", "ping"}});
    EXPECT_EQ(aliceLog_.OfType("pong").size(), 1u);
}

TEST_F(ParticipantTest, MalformedMessages) {
    alice_->HandleMessage(json{{"sdp", "v=0"}});
    alice_->HandleMessage(json{{"type", "dance"}});
    alice_->HandleMessage(json{{"type", "stopPublish"}});

    auto errors = aliceLog_.OfType("error");
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0]["code"], "BadRequest");
    EXPECT_EQ(errors[1]["request"], "dance");
    EXPECT_EQ(errors[2]["request"], "stopPublish");
    EXPECT_EQ(errors[2]["code"], "BadRequest");
}

TEST_F(ParticipantTest, OfferIsAnswered) {
    alice_->HandleMessage(json{{"type", "offer"}, {"sdp", MakeRemoteOffer({"mic"})}});
    ASSERT_TRUE(aliceLog_.WaitFor("answer"));

    auto answer = aliceLog_.OfType("answer")[0];
    EXPECT_FALSE(answer["sdp"].get<std::string>().empty());
    EXPECT_EQ(alicePublishEngine_->RemoteDescriptions().size(), 1u);

    // A second offer renegotiates the same session
    alice_->HandleMessage(json{{"type", "offer"}, {"sdp", MakeRemoteOffer({"mic", "cam"})}});
    ASSERT_TRUE(aliceLog_.WaitFor("answer", 2));
    EXPECT_EQ(alicePublishEngine_->RemoteDescriptions().size(), 2u);
}

TEST_F(ParticipantTest, CandidatesReachTheRightSession) {
    alice_->HandleMessage(json{
        {"type", "publisherIce"},
        {"candidate", {{"candidate", "candidate:1 1 udp 1 10.0.0.1 5000 typ host"}, {"sdpMid", "0"}, {"sdpMLineIndex", 0}}},
    });
    alice_->HandleMessage(json{{"type", "offer"}, {"sdp", MakeRemoteOffer({"mic"})}});
    ASSERT_TRUE(aliceLog_.WaitFor("answer"));

    auto applied = alicePublishEngine_->AppliedCandidates();
    ASSERT_EQ(applied.size(), 1u);
    EXPECT_EQ(applied[0].sdpMid, "0");
    EXPECT_EQ(applied[0].sdpMLineIndex, 0);
    EXPECT_TRUE(aliceSubscribeEngine_->AppliedCandidates().empty());
}

TEST_F(ParticipantTest, LocalCandidatesAreForwardedAfterInit) {
    alicePublishEngine_->FireLocalCandidate(IceCandidate{"candidate:early", "0", 0});
    EXPECT_TRUE(aliceLog_.OfType("publisherIce").empty());

    alice_->HandleMessage(json{{"type", "publisherInit"}});
    alice_->HandleMessage(json{{"type", "subscriberInit"}});
    alicePublishEngine_->FireLocalCandidate(IceCandidate{"candidate:pub", "0", 0});
    aliceSubscribeEngine_->FireLocalCandidate(IceCandidate{"candidate:sub", "0", std::nullopt});

    auto publisherIce = aliceLog_.OfType("publisherIce");
    ASSERT_EQ(publisherIce.size(), 1u);
    EXPECT_EQ(publisherIce[0]["candidate"]["candidate"], "candidate:pub");
    EXPECT_EQ(publisherIce[0]["candidate"]["sdpMLineIndex"], 0);

    auto subscriberIce = aliceLog_.OfType("subscriberIce");
    ASSERT_EQ(subscriberIce.size(), 1u);
    EXPECT_FALSE(subscriberIce[0]["candidate"].contains("sdpMLineIndex"));
}

TEST_F(ParticipantTest, PublishIsAnnouncedToOthers) {
    AlicePublishes("mic");

    auto published = bobLog_.OfType("published");
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0]["publisherIds"], json::array({"mic"}));
    EXPECT_TRUE(aliceLog_.OfType("published").empty());
    EXPECT_NE(room_->GetRouter()->GetPublisher("mic"), nullptr);
}

TEST_F(ParticipantTest, SubscriberInitAnnouncesExistingPublishers) {
    AlicePublishes("mic");

    bob_->HandleMessage(json{{"type", "subscriberInit"}});
    EXPECT_EQ(bobLog_.OfType("published").size(), 2u);

    // Nobody else publishes, so alice hears nothing
    alice_->HandleMessage(json{{"type", "subscriberInit"}});
    EXPECT_TRUE(aliceLog_.OfType("published").empty());
}

TEST_F(ParticipantTest, SubscribeAndAnswer) {
    AlicePublishes("mic");
    bob_->HandleMessage(json{{"type", "subscriberInit"}});

    bob_->HandleMessage(json{{"type", "subscribe"}, {"publisherIds", {"mic"}}});
    ASSERT_TRUE(bobLog_.WaitFor("subscribed"));

    auto offers = bobLog_.OfType("offer");
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0]["target"], "subscriber");
    EXPECT_NE(offers[0]["sdp"].get<std::string>().find("a=extmap:1 urn:ietf:params:rtp-hdrext:ssrc-audio-level"),
              std::string::npos);

    auto subscribed = bobLog_.OfType("subscribed")[0];
    EXPECT_EQ(subscribed["publisherId"], "mic");
    ASSERT_EQ(subscribed["subscriberIds"].size(), 1u);
    EXPECT_EQ(room_->GetRouter()->SubscriberCount("mic"), 1u);

    bob_->HandleMessage(json{{"type", "answer"}, {"sdp", kAnswerSdp}});
    EXPECT_TRUE(bobLog_.OfType("error").empty());
    EXPECT_EQ(bobSubscribeEngine_->RemoteDescriptions().size(), 1u);
}

TEST_F(ParticipantTest, SubscribeToUnknownPublisherReportsError) {
    bob_->HandleMessage(json{{"type", "subscribe"}, {"publisherIds", {"ghost"}}});
    ASSERT_TRUE(bobLog_.WaitFor("error"));

    auto error = bobLog_.OfType("error")[0];
    EXPECT_EQ(error["request"], "subscribe");
    EXPECT_EQ(error["code"], "PublisherNotFound");
}

TEST_F(ParticipantTest, StopPublishNotifiesSubscribers) {
    AlicePublishes("mic");
    bob_->HandleMessage(json{{"type", "subscriberInit"}});
    bob_->HandleMessage(json{{"type", "subscribe"}, {"publisherIds", {"mic"}}});
    ASSERT_TRUE(bobLog_.WaitFor("subscribed"));
    bob_->HandleMessage(json{{"type", "answer"}, {"sdp", kAnswerSdp}});

    alice_->HandleMessage(json{{"type", "stopPublish"}, {"publisherId", "mic"}});

    ASSERT_TRUE(bobLog_.WaitFor("publisherRemoved"));
    auto removed = bobLog_.OfType("publisherRemoved")[0];
    EXPECT_EQ(removed["publisherId"], "mic");
    EXPECT_EQ(removed["subscriberId"], bobLog_.OfType("subscribed")[0]["subscriberIds"][0]);

    // The emptied session is renegotiated from the server side
    ASSERT_TRUE(bobLog_.WaitFor("offer", 2));
    EXPECT_EQ(room_->GetRouter()->GetPublisher("mic"), nullptr);
}

TEST_F(ParticipantTest, StopUnknownSubscriber) {
    bob_->HandleMessage(json{{"type", "stopSubscribe"}, {"subscriberId", "nope"}});

    auto errors = bobLog_.OfType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["code"], "InvalidState");
}

TEST_F(ParticipantTest, LeavingUnpublishes) {
    AlicePublishes("mic");

    EXPECT_TRUE(room_->RemoveParticipant(alice_->Id()));
    EXPECT_FALSE(room_->HasParticipant(alice_->Id()));
    EXPECT_EQ(room_->GetRouter()->GetPublisher("mic"), nullptr);
    EXPECT_EQ(room_->GetRouter()->SessionCount(), 2u);
    EXPECT_TRUE(alicePublishEngine_->IsClosed());

    alice_->HandleMessage(json{{"type", "publisherIce"}, {"candidate", {{"candidate", "candidate:late"}}}});
    auto errors = aliceLog_.OfType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["code"], "SessionClosed");
}

TEST_F(ParticipantTest, BroadcastSkipsSender) {
    room_->Broadcast(alice_->Id(), json{{"type", "published"}, {"publisherIds", json::array()}});

    EXPECT_TRUE(aliceLog_.OfType("published").empty());
    EXPECT_EQ(bobLog_.OfType("published").size(), 1u);
}

TEST_F(ParticipantTest, RoomCloseClosesEverything) {
    room_->Close();

    EXPECT_EQ(room_->ParticipantCount(), 0u);
    EXPECT_TRUE(room_->GetRouter()->IsClosed());
    for (const auto& engine : factory_->Created()) {
        EXPECT_TRUE(engine->IsClosed());
    }
}

} // namespace test
} // namespace switchyard
