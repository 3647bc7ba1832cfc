#include <gtest/gtest.h>
#include <harmonia/exceptions.hpp>
#include <harmonia/types/interaction.hpp>
#include <harmonia/rest_client.hpp>
#include "fake_connection.hpp"

using namespace Harmonia;
using namespace Harmonia::Testing;

namespace {
    Image tinyPng() {
        std::vector<uint8_t> bytes = { 0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n', 0, 0, 0, 0x0D };
        return Image(File("tiny.png", bytes));
    }

    std::string repeat(const std::string& piece, unsigned times) {
        std::string result;
        for (unsigned i = 0; i < times; ++i) result += piece;
        return result;
    }

    const std::string cyrillic = "\xD0\xB6";   // 2 bytes, 1 character
}

TEST_F(RestClientTest, ModifyChannelSendsOnlyPassedFields) {
    client.modifyChannel(1, std::string("general"), boost::none, std::string("About things"));

    const REST::HTTPRequest& request = server->last();
    EXPECT_EQ(request.method, "PATCH");
    EXPECT_EQ(request.path, api("/channels/1"));
    EXPECT_EQ(jsonOf(request), nlohmann::json({{ "name", "general" }, { "topic", "About things" }}));
}

TEST_F(RestClientTest, ModifyChannelRemovesParent) {
    client.modifyChannel(1, boost::none, boost::none, boost::none, 64000u, boost::none, Snowflake(0));

    nlohmann::json body = jsonOf(server->last());
    EXPECT_EQ(body["bitrate"], 64000);
    EXPECT_TRUE(body["parent_id"].is_null());
}

TEST_F(RestClientTest, ModifyChannelValidation) {
    EXPECT_THROW(client.modifyChannel(1), InvalidParameter);
    EXPECT_THROW(client.setChannelName(1, ""), InvalidParameter);
    EXPECT_THROW(client.setChannelTopic(1, std::string(1025, 'x')), InvalidParameter);
    EXPECT_THROW(client.modifyChannel(1, boost::none, boost::none, std::string("topic"), 64000u), InvalidParameter);
    EXPECT_THROW(client.modifyChannel(1, boost::none, boost::none, boost::none, 7999u), InvalidParameter);
    EXPECT_THROW(client.modifyChannel(1, boost::none, boost::none, boost::none, boost::none,
                                      static_cast<unsigned short>(100)), InvalidParameter);
    EXPECT_THROW(client.modifyChannel(1, nlohmann::json::object()), InvalidParameter);

    EXPECT_TRUE(server->requests.empty());
}

TEST_F(RestClientTest, ChannelPositionAndRawModify) {
    client.setChannelPosition(4, 2);
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "position", 2 }}));

    client.modifyChannel(4, nlohmann::json{{ "nsfw", true }}, std::string("adults only"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "nsfw", true }}));
    EXPECT_EQ(header(server->last(), "X-Audit-Log-Reason"), "adults%20only");
}

TEST_F(RestClientTest, EditChannelPermissionsSendsBitsAsStrings) {
    client.editChannelPermissions(1, 2, Permissions{ SendMessages, ViewChannel },
                                  Permissions(ManageMessages), OverwriteType::Member);

    const REST::HTTPRequest& request = server->last();
    EXPECT_EQ(request.method, "PUT");
    EXPECT_EQ(request.path, api("/channels/1/permissions/2"));

    nlohmann::json body = jsonOf(request);
    EXPECT_EQ(body["allow"], std::to_string(uint64_t(SendMessages) | uint64_t(ViewChannel)));
    EXPECT_EQ(body["deny"], std::to_string(uint64_t(ManageMessages)));
    EXPECT_EQ(body["type"], 1);
}

TEST_F(RestClientTest, ChannelInvites) {
    client.createChannelInvite(3, 3600, 5, true);

    EXPECT_EQ(server->last().path, api("/channels/3/invites"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({
        { "max_age", 3600 }, { "max_uses", 5 }, { "temporary", true }, { "unique", false }
    }));

    EXPECT_THROW(client.createChannelInvite(3, 604801), InvalidParameter);
    EXPECT_THROW(client.createChannelInvite(3, 0, 101), InvalidParameter);
    EXPECT_EQ(server->requests.size(), 1u);
}

TEST_F(RestClientTest, PinsAndTyping) {
    client.pinMessage(1, 2);
    EXPECT_EQ(server->last().method, "PUT");
    EXPECT_EQ(server->last().path, api("/channels/1/pins/2"));

    client.unpinMessage(1, 2);
    EXPECT_EQ(server->last().method, "DELETE");

    client.triggerTypingIndicator(1);
    EXPECT_EQ(server->last().method, "POST");
    EXPECT_EQ(server->last().path, api("/channels/1/typing"));
}

TEST_F(RestClientTest, FollowAnnouncementChannel) {
    client.followAnnouncementChannel(10, 20);

    EXPECT_EQ(server->last().path, api("/channels/10/followers"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "webhook_channel_id", "20" }}));
}

TEST_F(RestClientTest, GetMessagesPagination) {
    client.getMessages(1);
    EXPECT_EQ(server->last().path, api("/channels/1/messages?limit=50"));

    client.getMessages(1, RestClient::Before(99), 10);
    EXPECT_EQ(server->last().path, api("/channels/1/messages?before=99&limit=10"));

    client.getMessages(1, RestClient::After(5), 100);
    EXPECT_EQ(server->last().path, api("/channels/1/messages?after=5&limit=100"));

    client.getMessages(1, RestClient::Around(7));
    EXPECT_EQ(server->last().path, api("/channels/1/messages?around=7&limit=50"));

    EXPECT_THROW(client.getMessages(1, 0), InvalidParameter);
    EXPECT_THROW(client.getMessages(1, 101), InvalidParameter);
    EXPECT_EQ(server->requests.size(), 4u);
}

TEST_F(RestClientTest, CreateMessageRequiresContent) {
    EXPECT_THROW(client.createMessage(1, OutgoingMessage()), InvalidParameter);
    EXPECT_THROW(client.sendTextMessage(1, ""), InvalidParameter);
    EXPECT_THROW(client.sendTextMessage(1, std::string(2001, 'a')), InvalidParameter);
    EXPECT_TRUE(server->requests.empty());
}

TEST_F(RestClientTest, ReplyMessage) {
    OutgoingMessage message("pong");
    message.replyTo = Snowflake(55);
    message.allowedMentions = AllowedMentions();
    client.createMessage(1, message);

    nlohmann::json body = jsonOf(server->last());
    EXPECT_EQ(body["message_reference"]["message_id"], "55");
    EXPECT_EQ(body["message_reference"]["fail_if_not_exists"], true);
    EXPECT_EQ(body["allowed_mentions"]["parse"], nlohmann::json::array());
}

TEST_F(RestClientTest, EditMessageAllowsPartialUpdate) {
    OutgoingMessage message;
    message.embeds.push_back({{ "title", "Edited" }});
    client.editMessage(1, 2, message);

    const REST::HTTPRequest& request = server->last();
    EXPECT_EQ(request.method, "PATCH");
    EXPECT_EQ(request.path, api("/channels/1/messages/2"));
    EXPECT_EQ(jsonOf(request).count("content"), 0u);
}

TEST_F(RestClientTest, BulkDelete) {
    client.bulkDeleteMessages(1, { 10, 11, 12 }, std::string("cleanup"));

    EXPECT_EQ(server->last().path, api("/channels/1/messages/bulk-delete"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "messages", { "10", "11", "12" } }}));

    EXPECT_THROW(client.bulkDeleteMessages(1, { 10 }), InvalidParameter);
    EXPECT_THROW(client.bulkDeleteMessages(1, std::vector<Snowflake>(101, Snowflake(1))), InvalidParameter);
    EXPECT_EQ(server->requests.size(), 1u);
}

TEST_F(RestClientTest, ReactionEmojiIsEncoded) {
    client.createReaction(1, 2, "\xF0\x9F\x91\x8D");
    EXPECT_EQ(server->last().method, "PUT");
    EXPECT_EQ(server->last().path, api("/channels/1/messages/2/reactions/%F0%9F%91%8D/@me"));

    client.deleteUserReaction(1, 2, "blob:123", 77);
    EXPECT_EQ(server->last().method, "DELETE");
    EXPECT_EQ(server->last().path, api("/channels/1/messages/2/reactions/blob%3A123/77"));

    client.getReactions(1, 2, "blob:123", 10, 5);
    EXPECT_EQ(server->last().path, api("/channels/1/messages/2/reactions/blob%3A123?limit=10&after=5"));

    client.deleteAllReactions(1, 2);
    EXPECT_EQ(server->last().path, api("/channels/1/messages/2/reactions"));

    EXPECT_THROW(client.createReaction(1, 2, ""), InvalidParameter);
}

TEST_F(RestClientTest, Threads) {
    client.startThreadFromMessage(1, 2, "discussion", AutoArchiveDuration::Day);
    EXPECT_EQ(server->last().path, api("/channels/1/messages/2/threads"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "name", "discussion" }, { "auto_archive_duration", 1440 }}));

    client.startThreadWithoutMessage(1, "secret");
    EXPECT_EQ(server->last().path, api("/channels/1/threads"));
    EXPECT_EQ(jsonOf(server->last())["type"], 12);

    EXPECT_THROW(client.startThreadWithoutMessage(1, "text", ChannelType::GuildText), InvalidParameter);
    EXPECT_THROW(client.startThreadFromMessage(1, 2, ""), InvalidParameter);
    EXPECT_THROW(client.startThreadFromMessage(1, 2, "x", boost::none, 21601u), InvalidParameter);

    client.joinThread(5);
    EXPECT_EQ(server->last().path, api("/channels/5/thread-members/@me"));

    client.getThreadMember(5, 6, true);
    EXPECT_EQ(server->last().path, api("/channels/5/thread-members/6?with_member=true"));

    client.listThreadMembers(5, false, 9, 20);
    EXPECT_EQ(server->last().path, api("/channels/5/thread-members?with_member=false&limit=20&after=9"));

    client.listPublicArchivedThreads(5, std::string("2021-01-01T00:00:00"), 10u);
    EXPECT_EQ(server->last().path, api("/channels/5/threads/archived/public?before=2021-01-01T00%3A00%3A00&limit=10"));

    client.listJoinedPrivateArchivedThreads(5);
    EXPECT_EQ(server->last().path, api("/channels/5/users/@me/threads/archived/private"));

    client.listActiveGuildThreads(8);
    EXPECT_EQ(server->last().path, api("/guilds/8/threads/active"));
}

TEST_F(RestClientTest, ForumThreadWithFile) {
    OutgoingMessage message("first post");
    message.files.push_back(File("notes.txt", std::vector<uint8_t>{ 'h', 'i' }));

    client.startForumThread(1, "post", message, boost::none, boost::none, { 3, 4 });

    std::string body = bodyOf(server->last());
    EXPECT_NE(body.find("\"applied_tags\":[\"3\",\"4\"]"), std::string::npos);
    EXPECT_NE(body.find("name=\"files[0]\"; filename=\"notes.txt\""), std::string::npos);
    EXPECT_NE(body.find("Content-Type: text/plain"), std::string::npos);

    EXPECT_THROW(client.startForumThread(1, "post", message, boost::none, boost::none, { 1, 2, 3, 4, 5, 6 }),
                 InvalidParameter);
}

TEST_F(RestClientTest, GuildBasics) {
    client.getGuild(1, true);
    EXPECT_EQ(server->last().path, api("/guilds/1?with_counts=true"));

    client.createGuild("My guild", {{ "verification_level", 1 }});
    EXPECT_EQ(server->last().path, api("/guilds"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "name", "My guild" }, { "verification_level", 1 }}));

    client.createGuildChannel(1, "voice", ChannelType::GuildVoice);
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "name", "voice" }, { "type", 2 }}));

    EXPECT_THROW(client.createGuild("x"), InvalidParameter);
    EXPECT_THROW(client.modifyGuild(1, nlohmann::json::object()), InvalidParameter);
    EXPECT_THROW(client.modifyGuild(1, {{ "name", "y" }}), InvalidParameter);
    EXPECT_THROW(client.modifyGuildChannelPositions(1, nlohmann::json::array()), InvalidParameter);
}

TEST_F(RestClientTest, Members) {
    client.listGuildMembers(1, 1000, 42);
    EXPECT_EQ(server->last().path, api("/guilds/1/members?limit=1000&after=42"));

    client.searchGuildMembers(1, "ann e", 5);
    EXPECT_EQ(server->last().path, api("/guilds/1/members/search?query=ann%20e&limit=5"));

    client.modifyCurrentMember(1, boost::none);
    EXPECT_EQ(server->last().path, api("/guilds/1/members/@me"));
    EXPECT_TRUE(jsonOf(server->last())["nick"].is_null());

    client.addGuildMemberRole(1, 2, 3, std::string("promotion"));
    EXPECT_EQ(server->last().method, "PUT");
    EXPECT_EQ(server->last().path, api("/guilds/1/members/2/roles/3"));

    EXPECT_THROW(client.listGuildMembers(1, 0), InvalidParameter);
    EXPECT_THROW(client.listGuildMembers(1, 1001), InvalidParameter);
    EXPECT_THROW(client.searchGuildMembers(1, ""), InvalidParameter);
    EXPECT_THROW(client.modifyGuildMember(1, 2, {{ "nick", std::string(33, 'n') }}), InvalidParameter);
    EXPECT_THROW(client.addGuildMember(1, 2, ""), InvalidParameter);
}

TEST_F(RestClientTest, Bans) {
    client.banMember(1, 2, 7, std::string("raid"));

    const REST::HTTPRequest& request = server->last();
    EXPECT_EQ(request.method, "PUT");
    EXPECT_EQ(request.path, api("/guilds/1/bans/2?delete_message_days=7"));
    EXPECT_TRUE(request.body.empty());
    EXPECT_EQ(header(request, "X-Audit-Log-Reason"), "raid");

    client.getGuildBans(1, 10, 0, 500);
    EXPECT_EQ(server->last().path, api("/guilds/1/bans?limit=10&after=500"));

    EXPECT_THROW(client.banMember(1, 2, 8), InvalidParameter);
    EXPECT_EQ(server->requests.size(), 2u);
}

TEST_F(RestClientTest, Prune) {
    client.getGuildPruneCount(1, 14, { 5, 6 });
    EXPECT_EQ(server->last().path, api("/guilds/1/prune?days=14&include_roles=5&include_roles=6"));

    client.beginGuildPrune(1, 30, false);
    EXPECT_EQ(server->last().method, "POST");
    EXPECT_EQ(server->last().path, api("/guilds/1/prune?days=30&compute_prune_count=false"));

    EXPECT_THROW(client.getGuildPruneCount(1, 31), InvalidParameter);
}

TEST_F(RestClientTest, WidgetAndTemplates) {
    client.modifyGuildWidget(1, true, Snowflake(0));
    EXPECT_EQ(server->last().path, api("/guilds/1/widget"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "enabled", true }, { "channel_id", nullptr }}));

    client.getGuildWidget(1);
    EXPECT_EQ(server->last().path, api("/guilds/1/widget.json"));

    client.getGuildTemplate("abc");
    EXPECT_EQ(server->last().path, api("/guilds/templates/abc"));

    client.syncGuildTemplate(1, "abc");
    EXPECT_EQ(server->last().method, "PUT");
    EXPECT_EQ(server->last().path, api("/guilds/1/templates/abc"));

    EXPECT_THROW(client.createGuildTemplate(1, "t", std::string(121, 'd')), InvalidParameter);
    EXPECT_THROW(client.modifyGuildTemplate(1, "abc", boost::none, boost::none), InvalidParameter);
    EXPECT_THROW(client.syncGuildTemplate(1, ""), InvalidParameter);
}

TEST_F(RestClientTest, VoiceStates) {
    client.modifyCurrentUserVoiceState(1, 2, false, std::string());
    EXPECT_EQ(server->last().path, api("/guilds/1/voice-states/@me"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({
        { "channel_id", "2" }, { "suppress", false }, { "request_to_speak_timestamp", nullptr }
    }));

    client.modifyUserVoiceState(1, 3, 2, true);
    EXPECT_EQ(server->last().path, api("/guilds/1/voice-states/3"));
}

TEST_F(RestClientTest, Emojis) {
    client.createGuildEmoji(1, "blob", tinyPng(), { 9 });

    nlohmann::json body = jsonOf(server->last());
    EXPECT_EQ(server->last().path, api("/guilds/1/emojis"));
    EXPECT_EQ(body["name"], "blob");
    EXPECT_EQ(body["image"].get<std::string>().find("data:image/png;base64,"), 0u);
    EXPECT_EQ(body["roles"], nlohmann::json({ "9" }));

    EXPECT_THROW(client.createGuildEmoji(1, "b", tinyPng()), InvalidParameter);
    EXPECT_THROW(client.modifyGuildEmoji(1, 2, boost::none, boost::none), InvalidParameter);
}

TEST_F(RestClientTest, StickerUploadIsPlainForm) {
    client.createGuildSticker(1, "wave", "", "wave", File("wave.png", std::vector<uint8_t>{ 1 }));

    std::string body = bodyOf(server->last());
    EXPECT_EQ(server->last().path, api("/guilds/1/stickers"));
    EXPECT_EQ(body.find("payload_json"), std::string::npos);
    EXPECT_NE(body.find("name=\"tags\""), std::string::npos);
    EXPECT_NE(body.find("name=\"file\"; filename=\"wave.png\""), std::string::npos);

    EXPECT_THROW(client.createGuildSticker(1, "wave", "d", "wave", File("a.png", std::vector<uint8_t>{ 1 })),
                 InvalidParameter);
    EXPECT_THROW(client.createGuildSticker(1, "wave", "", "", File("a.png", std::vector<uint8_t>{ 1 })),
                 InvalidParameter);
}

TEST_F(RestClientTest, ScheduledEvents) {
    client.listScheduledEvents(1, true);
    EXPECT_EQ(server->last().path, api("/guilds/1/scheduled-events?with_user_count=true"));

    client.getScheduledEventUsers(1, 2, 50, true, 0, 10);
    EXPECT_EQ(server->last().path, api("/guilds/1/scheduled-events/2/users?limit=50&with_member=true&after=10"));

    EXPECT_THROW(client.createScheduledEvent(1, {{ "name", "party" }}), InvalidParameter);
    EXPECT_THROW(client.getScheduledEventUsers(1, 2, 101), InvalidParameter);
}

TEST_F(RestClientTest, StageInstances) {
    client.createStageInstance(5, "Town hall");

    EXPECT_EQ(server->last().path, api("/stage-instances"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({
        { "channel_id", "5" }, { "topic", "Town hall" }, { "privacy_level", 2 }, { "send_start_notification", false }
    }));

    EXPECT_THROW(client.createStageInstance(5, ""), InvalidParameter);
    EXPECT_THROW(client.modifyStageInstance(5, boost::none, boost::none), InvalidParameter);
}

TEST_F(RestClientTest, Invites) {
    client.getInvite("abc", true, false, Snowflake(3));
    EXPECT_EQ(server->last().path,
              api("/invites/abc?with_counts=true&with_expiration=false&guild_scheduled_event_id=3"));

    client.deleteInvite("abc");
    EXPECT_EQ(server->last().method, "DELETE");

    EXPECT_THROW(client.getInvite(""), InvalidParameter);
}

TEST_F(RestClientTest, Users) {
    client.setUsername("new name");
    EXPECT_EQ(server->last().method, "PATCH");
    EXPECT_EQ(server->last().path, api("/users/@me"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "username", "new name" }}));

    EXPECT_THROW(client.setUsername("a"), InvalidParameter);
    EXPECT_THROW(client.setUsername("user#1"), InvalidParameter);
    EXPECT_THROW(client.setUsername("everyone"), InvalidParameter);
    EXPECT_THROW(client.modifyCurrentUser(boost::none), InvalidParameter);

    client.getCurrentUserGuilds(100, 0, 0, true);
    EXPECT_EQ(server->last().path, api("/users/@me/guilds?limit=100&with_counts=true"));
    EXPECT_THROW(client.getCurrentUserGuilds(201), InvalidParameter);

    client.createDm(7);
    EXPECT_EQ(server->last().path, api("/users/@me/channels"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "recipient_id", "7" }}));

    client.createGroupDm({ "t1" }, {{ Snowflake(8), "pal" }});
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({
        { "access_tokens", { "t1" } }, { "nicks", {{ "8", "pal" }} }
    }));

    client.leaveGuild(3);
    EXPECT_EQ(server->last().method, "DELETE");
    EXPECT_EQ(server->last().path, api("/users/@me/guilds/3"));
}

TEST_F(RestClientTest, WebhookNames) {
    client.createWebhook(1, "Notifier");
    EXPECT_EQ(server->last().path, api("/channels/1/webhooks"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "name", "Notifier" }}));

    EXPECT_THROW(client.createWebhook(1, ""), InvalidParameter);
    EXPECT_THROW(client.createWebhook(1, "Not Clyde"), InvalidParameter);
    EXPECT_THROW(client.modifyWebhook(1, boost::none, boost::none), InvalidParameter);
    EXPECT_EQ(server->requests.size(), 1u);
}

TEST_F(RestClientTest, ExecuteWebhook) {
    client.executeWebhook(1, "tok/en", OutgoingMessage("hello"), std::string("Announcer"),
                          boost::none, Snowflake(9), true);

    const REST::HTTPRequest& request = server->last();
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.path, api("/webhooks/1/tok%2Fen?wait=true&thread_id=9"));
    EXPECT_EQ(jsonOf(request), nlohmann::json({{ "content", "hello" }, { "username", "Announcer" }}));

    client.executeSlackWebhook(1, "tok", {{ "text", "hi" }});
    EXPECT_EQ(server->last().path, api("/webhooks/1/tok/slack?wait=true"));

    client.executeGitHubWebhook(1, "tok", nlohmann::json::object(), boost::none, false);
    EXPECT_EQ(server->last().path, api("/webhooks/1/tok/github?wait=false"));

    EXPECT_THROW(client.executeWebhook(1, "", OutgoingMessage("x")), InvalidParameter);
    EXPECT_THROW(client.executeWebhook(1, "tok", OutgoingMessage("x"), std::string()), InvalidParameter);
}

TEST_F(RestClientTest, WebhookMessages) {
    client.editWebhookMessage(1, "tok", 2, OutgoingMessage("fixed"), Snowflake(3));
    EXPECT_EQ(server->last().method, "PATCH");
    EXPECT_EQ(server->last().path, api("/webhooks/1/tok/messages/2?thread_id=3"));

    client.deleteWebhookMessage(1, "tok", 2);
    EXPECT_EQ(server->last().method, "DELETE");
    EXPECT_EQ(server->last().path, api("/webhooks/1/tok/messages/2"));
}

TEST_F(RestClientTest, InteractionResponses) {
    client.createInteractionResponse(10, "itoken", InteractionResponseType::DeferredChannelMessageWithSource);
    EXPECT_EQ(server->last().path, api("/interactions/10/itoken/callback"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "type", 5 }}));

    OutgoingMessage reply("done");
    reply.flags = MessageFlags(Ephemeral);
    client.createInteractionResponse(10, "itoken", InteractionResponseType::ChannelMessageWithSource, reply);
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({
        { "type", 4 }, { "data", {{ "content", "done" }, { "flags", 64 }} }
    }));

    client.createInteractionResponse(10, "itoken", autocompleteResponse({{ {"name", "a"}, {"value", "a"} }}));
    EXPECT_EQ(jsonOf(server->last())["type"], 8);

    EXPECT_THROW(client.createInteractionResponse(10, "", InteractionResponseType::Pong), InvalidParameter);
    EXPECT_THROW(client.createInteractionResponse(10, "itoken", nlohmann::json{{ "data", 1 }}), InvalidParameter);
}

TEST_F(RestClientTest, FollowupsAndOriginalResponse) {
    client.editOriginalInteractionResponse(20, "itoken", OutgoingMessage("edited"));
    EXPECT_EQ(server->last().method, "PATCH");
    EXPECT_EQ(server->last().path, api("/webhooks/20/itoken/messages/@original"));

    client.createFollowupMessage(20, "itoken", OutgoingMessage("more"));
    EXPECT_EQ(server->last().method, "POST");
    EXPECT_EQ(server->last().path, api("/webhooks/20/itoken"));

    client.deleteFollowupMessage(20, "itoken", 30);
    EXPECT_EQ(server->last().path, api("/webhooks/20/itoken/messages/30"));
}

TEST_F(RestClientTest, ApplicationCommands) {
    nlohmann::json command = {{ "name", "ping" }, { "description", "Replies with pong" }};

    client.createGlobalApplicationCommand(100, command);
    EXPECT_EQ(server->last().path, api("/applications/100/commands"));
    EXPECT_EQ(jsonOf(server->last()), command);

    client.getGuildApplicationCommands(100, 5, true);
    EXPECT_EQ(server->last().path, api("/applications/100/guilds/5/commands?with_localizations=true"));

    client.bulkOverwriteGuildApplicationCommands(100, 5, nlohmann::json::array({ command }));
    EXPECT_EQ(server->last().method, "PUT");

    client.editApplicationCommandPermissions(100, 5, 7, nlohmann::json::array());
    EXPECT_EQ(server->last().path, api("/applications/100/guilds/5/commands/7/permissions"));
    EXPECT_EQ(jsonOf(server->last()), nlohmann::json({{ "permissions", nlohmann::json::array() }}));

    EXPECT_THROW(client.createGlobalApplicationCommand(100, {{ "description", "no name" }}), InvalidParameter);
    EXPECT_THROW(client.createGlobalApplicationCommand(100, {{ "name", std::string(33, 'c') }}), InvalidParameter);
    EXPECT_THROW(client.bulkOverwriteGlobalApplicationCommands(100, command), InvalidParameter);
}

TEST_F(RestClientTest, Applications) {
    client.getCurrentApplication();
    EXPECT_EQ(server->last().path, api("/oauth2/applications/@me"));

    client.getApplicationAssets(100);
    EXPECT_EQ(server->last().path, api("/oauth2/applications/100/assets"));
}

TEST_F(RestClientTest, AutoModerationAndAuditLog) {
    EXPECT_THROW(client.createAutoModerationRule(1, {{ "name", "no links" }}), InvalidParameter);

    client.createAutoModerationRule(1, {
        { "name", "no links" }, { "event_type", 1 }, { "trigger_type", 1 }, { "actions", nlohmann::json::array() }
    });
    EXPECT_EQ(server->last().path, api("/guilds/1/auto-moderation/rules"));

    client.deleteAutoModerationRule(1, 2);
    EXPECT_EQ(server->last().path, api("/guilds/1/auto-moderation/rules/2"));

    client.getAuditLog(1, 5, 22, 0, 0, 10);
    EXPECT_EQ(server->last().path, api("/guilds/1/audit-logs?user_id=5&action_type=22&limit=10"));

    EXPECT_THROW(client.getAuditLog(1, 0, boost::none, 0, 0, 101), InvalidParameter);
}

TEST_F(RestClientTest, NameLimitsCountCharacters) {
    client.setChannelName(1, repeat(cyrillic, 100));
    client.setUsername(repeat(cyrillic, 32));
    client.createWebhook(1, repeat(cyrillic, 80));
    client.modifyCurrentMember(1, repeat(cyrillic, 32));
    EXPECT_EQ(server->requests.size(), 4u);

    EXPECT_THROW(client.setChannelName(1, repeat(cyrillic, 101)), InvalidParameter);
    EXPECT_THROW(client.setUsername(repeat(cyrillic, 33)), InvalidParameter);
    EXPECT_THROW(client.createWebhook(1, repeat(cyrillic, 81)), InvalidParameter);
    EXPECT_THROW(client.modifyCurrentMember(1, repeat(cyrillic, 33)), InvalidParameter);
    EXPECT_THROW(client.modifyGuildMember(1, 2, {{ "nick", repeat(cyrillic, 33) }}), InvalidParameter);
    EXPECT_EQ(server->requests.size(), 4u);
}
