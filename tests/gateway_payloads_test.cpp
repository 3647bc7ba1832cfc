#include <gtest/gtest.h>
#include <harmonia/exceptions.hpp>
#include <harmonia/gateway_payloads.hpp>

using namespace Harmonia;

TEST(GatewayPayloadsTest, IdentifyUnsharded) {
    nlohmann::json payload = GatewayPayloads::identify("token", GuildsIntent | GuildMessagesIntent);

    EXPECT_EQ(payload["token"], "token");
    EXPECT_EQ(payload["intents"], (1u << 0) | (1u << 9));
    EXPECT_EQ(payload["properties"]["browser"], "harmonia");
    EXPECT_EQ(payload["large_threshold"], 250);
    EXPECT_EQ(payload["compress"], false);
    EXPECT_EQ(payload["presence"]["status"], "online");
    EXPECT_EQ(payload.count("shard"), 0u);
}

TEST(GatewayPayloadsTest, IdentifySharded) {
    nlohmann::json payload = GatewayPayloads::identify("token", Intents(NonPrivilegedIntents), 1, 4);

    EXPECT_EQ(payload["shard"], nlohmann::json({ 1, 4 }));
}

TEST(GatewayPayloadsTest, IdentifyValidation) {
    EXPECT_THROW(GatewayPayloads::identify("t", GuildsIntent, 4, 4), InvalidParameter);
    EXPECT_THROW(GatewayPayloads::identify("t", GuildsIntent, -2, 4), InvalidParameter);
    EXPECT_THROW(GatewayPayloads::identify("t", GuildsIntent, 0, 0), InvalidParameter);
    EXPECT_THROW(GatewayPayloads::identify("t", GuildsIntent, GatewayPayloads::NoSharding,
                                           GatewayPayloads::NoSharding, Presence(), 49), InvalidParameter);
    EXPECT_THROW(GatewayPayloads::identify("t", GuildsIntent, GatewayPayloads::NoSharding,
                                           GatewayPayloads::NoSharding, Presence(), 251), InvalidParameter);
}

TEST(GatewayPayloadsTest, Resume) {
    EXPECT_EQ(GatewayPayloads::resume("token", "abc", 42),
              nlohmann::json({{ "token", "token" }, { "session_id", "abc" }, { "seq", 42 }}));
    EXPECT_THROW(GatewayPayloads::resume("token", "", 42), InvalidParameter);
}

TEST(GatewayPayloadsTest, Presence) {
    Presence presence;
    presence.status = PresenceStatus::DoNotDisturb;
    presence.activities.push_back(Activity("chess", ActivityType::Competing));
    presence.since = uint64_t(1000);

    nlohmann::json json = GatewayPayloads::updatePresence(presence);

    EXPECT_EQ(json["status"], "dnd");
    EXPECT_EQ(json["since"], 1000);
    EXPECT_EQ(json["activities"][0], nlohmann::json({{ "name", "chess" }, { "type", 5 }}));
}

TEST(GatewayPayloadsTest, PresenceValidation) {
    Presence unknownStatus;
    unknownStatus.status = "busy";
    EXPECT_THROW(GatewayPayloads::updatePresence(unknownStatus), InvalidParameter);

    Presence stream;
    stream.activities.push_back(Activity("live", ActivityType::Streaming));
    EXPECT_THROW(stream.validate(), InvalidParameter);

    stream.activities[0].url = std::string("https://twitch.tv/example");
    EXPECT_NO_THROW(stream.validate());
}

TEST(GatewayPayloadsTest, VoiceState) {
    EXPECT_EQ(GatewayPayloads::updateVoiceState(1, Snowflake(2), true),
              nlohmann::json({{ "guild_id", "1" }, { "channel_id", "2" }, { "self_mute", true }, { "self_deaf", false }}));

    EXPECT_TRUE(GatewayPayloads::updateVoiceState(1, boost::none)["channel_id"].is_null());
}

TEST(GatewayPayloadsTest, RequestGuildMembersByQuery) {
    nlohmann::json payload = GatewayPayloads::requestGuildMembers(7, std::string("ha"), {}, 10, false, "n1");

    EXPECT_EQ(payload, nlohmann::json({
        { "guild_id", "7" }, { "limit", 10 }, { "presences", false }, { "query", "ha" }, { "nonce", "n1" }
    }));
}

TEST(GatewayPayloadsTest, RequestGuildMembersByIds) {
    nlohmann::json payload = GatewayPayloads::requestGuildMembers(7, boost::none, { 1, 2 });

    EXPECT_EQ(payload["user_ids"], nlohmann::json({ "1", "2" }));
    EXPECT_EQ(payload.count("query"), 0u);
}

TEST(GatewayPayloadsTest, RequestGuildMembersValidation) {
    EXPECT_THROW(GatewayPayloads::requestGuildMembers(7, std::string(""), { 1 }), InvalidParameter);
    EXPECT_THROW(GatewayPayloads::requestGuildMembers(7, boost::none), InvalidParameter);
    EXPECT_THROW(GatewayPayloads::requestGuildMembers(7, boost::none, std::vector<Snowflake>(101, 1)),
                 InvalidParameter);
    EXPECT_THROW(GatewayPayloads::requestGuildMembers(7, std::string(""), {}, -1), InvalidParameter);
    EXPECT_THROW(GatewayPayloads::requestGuildMembers(7, std::string(""), {}, 0, false, std::string(33, 'n')),
                 InvalidParameter);
}
