#include "channels/channel_base.hpp"

#include <chrono>

#include <gtest/gtest.h>

namespace kivybot::channels {
namespace {

using namespace std::chrono_literals;

class RecordingChannel : public ChannelBase {
public:
    RecordingChannel(bus::MessageBus& bus, std::vector<std::string> allow_from)
        : ChannelBase("test", bus, std::move(allow_from)) {}

    void Start() override { running_ = true; }
    void Stop() override { running_ = false; }
    void Send(const bus::OutboundMessage&) override {}

    void LoggedInAs(const std::string& id) { SetSelfId(id); }
};

TEST(SenderIdentityTest, SplitsIdAndUsername) {
    const auto full = SenderIdentity::Parse("7|alice");
    EXPECT_EQ(full.id, "7");
    EXPECT_EQ(full.username, "alice");

    const auto bare = SenderIdentity::Parse("12345");
    EXPECT_EQ(bare.id, "12345");
    EXPECT_TRUE(bare.username.empty());
}

TEST(ChannelBaseTest, EmptyAllowListAdmitsEveryone) {
    bus::MessageBus bus;
    RecordingChannel channel(bus, {});
    EXPECT_TRUE(channel.IsAllowed("7|alice"));
    EXPECT_TRUE(channel.IsAllowed("99"));
}

TEST(ChannelBaseTest, AllowListMatchesIdOrUsername) {
    bus::MessageBus bus;
    RecordingChannel channel(bus, {"7", "@Bob"});
    EXPECT_TRUE(channel.IsAllowed("7|alice"));
    EXPECT_TRUE(channel.IsAllowed("8|bob"));
    EXPECT_FALSE(channel.IsAllowed("9|carol"));
    EXPECT_FALSE(channel.IsAllowed("70"));
}

TEST(ChannelBaseTest, PublishesTrimmedMessage) {
    bus::MessageBus bus;
    RecordingChannel channel(bus, {});
    EXPECT_EQ(channel.HandleMessage("7|alice", "100", "  /ping \n", {{"message_id", "5"}}),
              InboundVerdict::kPublished);

    bus::InboundMessage msg;
    ASSERT_TRUE(bus.TryConsumeInbound(msg, 10ms));
    EXPECT_EQ(msg.channel, "test");
    EXPECT_EQ(msg.chat_id, "100");
    EXPECT_EQ(msg.content, "/ping");
    EXPECT_EQ(msg.MetadataOr("message_id", ""), "5");
    EXPECT_EQ(msg.MetadataOr("username", ""), "alice");
}

TEST(ChannelBaseTest, DropsBlankBlockedAndOwnMessages) {
    bus::MessageBus bus;
    RecordingChannel channel(bus, {"7", "42"});
    channel.LoggedInAs("42");

    EXPECT_EQ(channel.HandleMessage("7|alice", "100", " \n\t", {}), InboundVerdict::kEmpty);
    EXPECT_EQ(channel.HandleMessage("9|carol", "100", "/stats", {}), InboundVerdict::kNotAllowed);
    EXPECT_EQ(channel.HandleMessage("42|kivy_bot", "100", "Screenshot rendered.", {}),
              InboundVerdict::kOwnMessage);
    EXPECT_EQ(bus.InboundSize(), 0u);
}

}  // namespace
}  // namespace kivybot::channels
