// Harmonia - Discord API library for C++11 using boost libraries.
// Copyright © 2017 Maks Mazurov (fox.cpp) <foxcpp@yandex.ru>
// 
// Permission is hereby granted, free of charge, to any person obtaining
// a copy of this software and associated documentation files (the "Software"),
// to deal in the Software without restriction, including without limitation
// the rights to use, copy, modify, merge, publish, distribute, sublicense,
// and/or sell copies of the Software, and to permit persons to whom the
// Software is furnished to do so, subject to the following conditions:
// 
// The above copyright notice and this permission notice shall be included
// in all copies or substantial portions of the Software.
// 
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
// EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
// OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
// IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
// DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
// TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
// OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#ifndef HARMONIA_REST_CLIENT_HPP
#define HARMONIA_REST_CLIENT_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>
#include <harmonia/config.hpp>
#include <harmonia/permission.hpp>
#include <harmonia/ratelimit_lock.hpp>
#include <harmonia/route.hpp>
#include <harmonia/internal/rest.hpp>
#include <harmonia/types/enums.hpp>
#include <harmonia/types/file.hpp>
#include <harmonia/types/image.hpp>
#include <harmonia/types/outgoing_message.hpp>
#include <harmonia/types/snowflake.hpp>

/**
 * \file rest_client.hpp
 *
 *  Defines \ref Harmonia::RestClient class and some helper data types.
 */

namespace Harmonia {
    enum class TokenType {
        Bot,    ///< "Authorization: Bot <token>"
        Bearer, ///< "Authorization: Bearer <token>", OAuth2 access token.
    };

    using Reason = boost::optional<std::string>;

    class RestClient {
    public:
        using ConnectionFactory = std::function<std::unique_ptr<REST::HTTPConnection>()>;

        /**
         * Construct RestClient, does nothing network-related to make RestClient's cheap
         * to construct.
         *
         * \param ioContext ASIO I/O context. Should not be destroyed while
         *                  RestClient exists.
         * \param token     token string, don't add "Bearer " or "Bot " prefix,
         *                  it's added according to tokenType.
         */
        RestClient(boost::asio::io_context& ioContext, const std::string& token,
                   TokenType tokenType = TokenType::Bot);

        /**
         * Construct RestClient that uses connections created by factory.
         * Factory is called once by constructor and again every time connection
         * is dropped by server. Returned connection is expected to open itself
         * lazily, on first request.
         *
         * now and sleep are passed to \ref ratelimitLock, real clock is used if null.
         */
        RestClient(ConnectionFactory connectionFactory, const std::string& token,
                   TokenType tokenType = TokenType::Bot,
                   RatelimitLock::NowFunction now = nullptr,
                   RatelimitLock::SleepFunction sleep = nullptr);

        RestClient(const RestClient&) = delete;
        RestClient& operator=(const RestClient&) = delete;

        /**
         * Send REST-request and return result json.
         *
         * \note Newly constructed RestClient object don't have open REST
         *       connection. It will be openned when sendRestRequest called
         *       first time.
         *
         * \param route     Endpoint, its bucket key is used for rate limiting.
         * \param payload   JSON payload, pass null (default) if none.
         * \param query     GET request query.
         * \param multipart Pass one or more MultipartEntity to perform multipart request.
         *                  If payload is also present, it will be first entity (payload_json).
         * \param reason    Audit log entry reason, sent as X-Audit-Log-Reason header
         *                  if not blank.
         *
         * \returns Response JSON, null if response have no body.
         *
         * \throws RESTError or derived exception on API error.
         * \throws RatelimitHit if HARMONIA_MAX_RETRIES requests were rate limited.
         * \throws boost::system::system_error on connection problem.
         *
         * \ingroup REST
         */
        nlohmann::json sendRestRequest(const Route& route,
                                       const nlohmann::json& payload = nullptr,
                                       const REST::QueryParams& query = {},
                                       const std::vector<REST::MultipartEntity>& multipart = {},
                                       const Reason& reason = boost::none);

        /**
         * Same as above, but endpoint is taken as is. Colon followed by lowercase
         * letters is treated as route placeholder, so don't use it.
         */
        nlohmann::json sendRestRequest(const std::string& method, const std::string& endpoint,
                                       const nlohmann::json& payload = nullptr,
                                       const REST::QueryParams& query = {},
                                       const std::vector<REST::MultipartEntity>& multipart = {});

        /**
         * Scheduler used for all requests made by this client.
         */
        RatelimitLock ratelimitLock;

        inline const std::string& token() const {
            return token_;
        }

        inline TokenType tokenType() const {
            return tokenType_;
        }

        /// "/api/vN", prepended to every route.
        static std::string restBasePath();

        /** \defgroup REST REST methods
         *
         * Functions for performing requests to REST endpoints.
         *
         * All methods in this group are thread-safe and stateless if not stated otherwise.
         * Every method validates arguments before doing any I/O and throws
         * \ref InvalidParameter if something is out of range.
         *
         * @{
         */

        /**
         * \defgroup REST_gateway Gateway
         * @{
         */

        nlohmann::json getGateway();

        /**
         * Gateway URL with recommended shards count and session start limits.
         * Requires bot token.
         */
        nlohmann::json getGatewayBot();

        /**
         * Returns gateway URL to be used with \ref GatewayClient::connect.
         *
         * \sa \ref getGatewayUrlBot
         */
        std::string getGatewayUrl();

        /**
         * Return gateway URL to be used with \ref GatewayClient::connect.
         * if client is a bot. Also returns recommended shards count.
         *
         * \returns std::pair with gateway URL (first) and recommended
         *          shards count (second).
         */
        std::pair<std::string, int> getGatewayUrlBot();

        /// @}

        /**
         * \defgroup REST_channels Channel operations
         *
         * Methods related to channels.
         *
         * Most require MANAGE_CHANNELS permission if operating on guild channel.
         *
         * @{
         */

        /**
         * Get a channel by ID. Returns a guild channel or dm channel object.
         *
         * \throws UnknownEntity if channel doesn't exist.
         */
        nlohmann::json getChannel(Snowflake channelId);

        /**
         * Update a channels settings.
         *
         * Requires the MANAGE_CHANNELS permission for the guild.
         * Fires ChannelUpdate event.
         *
         * \param channelId  Snowflake ID of target channel.
         * \param name       1-100 character channel name.
         * \param position   The position of the channel in the left-hand listing.
         * \param topic      0-1024 character channel topic (Text channel only).
         * \param bitrate    The bitrate (in bits) for voice channel; 8000 to 384000.
         * \param usersLimit The user limit for voice channels; 0-99, 0 means no limit.
         * \param parentId   New category, 0 to remove from category.
         *
         * \throws InvalidParameter if no arguments other than channelId passed,
         *         also thrown when both voice and text channel arguments passed.
         * \throws InvalidParameter if arguments out of range.
         *
         * \returns Guild channel object after modification.
         */
        nlohmann::json modifyChannel(Snowflake channelId,
                                     boost::optional<std::string> name = boost::none,
                                     boost::optional<int> position = boost::none,
                                     boost::optional<std::string> topic = boost::none,
                                     boost::optional<unsigned> bitrate = boost::none,
                                     boost::optional<unsigned short> usersLimit = boost::none,
                                     boost::optional<Snowflake> parentId = boost::none,
                                     const Reason& reason = boost::none);

        /**
         * Send arbitrary channel modification (for fields not covered by overload above,
         * like forum tags or thread settings).
         */
        nlohmann::json modifyChannel(Snowflake channelId, const nlohmann::json& changedFields,
                                     const Reason& reason = boost::none);

        /// Same as \ref modifyChannel, but changes only name.
        inline nlohmann::json setChannelName(Snowflake channelId, const std::string& newName) {
            return modifyChannel(channelId, boost::optional<std::string>(newName));
        }
        /// Same as \ref modifyChannel, but changes only position.
        inline nlohmann::json setChannelPosition(Snowflake channelId, int newPosition) {
            return modifyChannel(channelId, boost::none, newPosition);
        }
        /// Same as \ref modifyChannel, but changes only topic.
        inline nlohmann::json setChannelTopic(Snowflake textChannelId, const std::string& newTopic) {
            return modifyChannel(textChannelId, boost::none, boost::none, newTopic);
        }

        /**
         * Delete a guild channel or close DM.
         *
         * \returns Channel object.
         */
        nlohmann::json deleteChannel(Snowflake channelId, const Reason& reason = boost::none);

        /**
         * Edit permission overwrite for role or member. Bits not defined
         * in \ref Permission are dropped.
         */
        void editChannelPermissions(Snowflake channelId, Snowflake overwriteId,
                                    Permissions allow, Permissions deny,
                                    OverwriteType type, const Reason& reason = boost::none);

        void deleteChannelPermission(Snowflake channelId, Snowflake overwriteId,
                                     const Reason& reason = boost::none);

        nlohmann::json getChannelInvites(Snowflake channelId);

        /**
         * Create invite for channel.
         *
         * \param maxAgeSecs Lifetime in seconds, 0-604800, 0 means never expire.
         * \param maxUses    0-100, 0 means unlimited.
         * \param temporaryMembership Kick members after they disconnect
         *                            unless role assigned.
         * \param unique     Don't reuse similar invite.
         */
        nlohmann::json createChannelInvite(Snowflake channelId, unsigned maxAgeSecs = 86400,
                                           unsigned maxUses = 0,
                                           bool temporaryMembership = false,
                                           bool unique = false,
                                           const Reason& reason = boost::none);

        /**
         * Follow announcement channel, messages are crossposted to targetChannelId.
         * Requires MANAGE_WEBHOOKS in target channel.
         */
        nlohmann::json followAnnouncementChannel(Snowflake channelId, Snowflake targetChannelId);

        /**
         * Post a typing indicator for the specified channel.
         * Generally bots should not use this, but if a bot is responding to a command and
         * expects the computation to take a few seconds, this may be used.
         */
        void triggerTypingIndicator(Snowflake channelId);

        nlohmann::json getPinnedMessages(Snowflake channelId);
        void pinMessage(Snowflake channelId, Snowflake messageId, const Reason& reason = boost::none);
        void unpinMessage(Snowflake channelId, Snowflake messageId, const Reason& reason = boost::none);

        /**
         * Add recipient to group DM, requires OAuth2 access token of user
         * with gdm.join scope.
         */
        void groupDmAddRecipient(Snowflake groupDmId, Snowflake userId,
                                 const std::string& accessToken, const std::string& nick = "");
        void groupDmRemoveRecipient(Snowflake groupDmId, Snowflake userId);

        /// @}

        /**
         * \defgroup REST_messages Messages
         *
         * Reading history requires READ_MESSAGE_HISTORY, sending requires SEND_MESSAGES.
         *
         * @{
         */

        /// Tag for \ref getMessages, messages after id.
        struct After {
            explicit After(Snowflake id) : id(id) {}
            Snowflake id;
        };

        /// Tag for \ref getMessages, messages before id.
        struct Before {
            explicit Before(Snowflake id) : id(id) {}
            Snowflake id;
        };

        /// Tag for \ref getMessages, messages around id.
        struct Around {
            explicit Around(Snowflake id) : id(id) {}
            Snowflake id;
        };

        nlohmann::json getMessage(Snowflake channelId, Snowflake messageId);

        /**
         * Get latest messages in channel.
         *
         * \param limit 1-100.
         */
        nlohmann::json getMessages(Snowflake channelId, unsigned limit = 50);
        nlohmann::json getMessages(Snowflake channelId, After afterId, unsigned limit = 50);
        nlohmann::json getMessages(Snowflake channelId, Before beforeId, unsigned limit = 50);
        nlohmann::json getMessages(Snowflake channelId, Around aroundId, unsigned limit = 50);

        /**
         * Post a message to a guild text or DM channel.
         *
         * If message have files, request is sent as multipart/form-data.
         * Fires a Message Create gateway event.
         *
         * \throws InvalidParameter if message is empty or exceeds limits,
         *         see \ref OutgoingMessage::validate.
         *
         * \returns Message object.
         */
        nlohmann::json createMessage(Snowflake channelId, const OutgoingMessage& message);

        /**
         * Shortcut for \ref createMessage with only content.
         */
        nlohmann::json sendTextMessage(Snowflake channelId, const std::string& text, bool tts = false);

        /**
         * Edit a previously sent message.
         * Only fields set in message are changed.
         */
        nlohmann::json editMessage(Snowflake channelId, Snowflake messageId, const OutgoingMessage& message);

        void deleteMessage(Snowflake channelId, Snowflake messageId, const Reason& reason = boost::none);

        /**
         * Publish message in announcement channel to following channels.
         */
        nlohmann::json crosspostMessage(Snowflake channelId, Snowflake messageId);

        /**
         * Delete multiple messages in a single request. Messages older than
         * 2 weeks can't be deleted this way.
         *
         * \throws InvalidParameter if there are less than 2 or more than 100 messages.
         */
        void bulkDeleteMessages(Snowflake channelId, const std::vector<Snowflake>& messageIds,
                                const Reason& reason = boost::none);

        /// @}

        /**
         * \defgroup REST_reactions Reactions
         *
         * Emoji is either unicode emoji or "name:id" for custom emoji.
         *
         * @{
         */

        void createReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji);
        void deleteOwnReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji);
        void deleteUserReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji,
                                Snowflake userId);

        /**
         * Users reacted with emoji.
         *
         * \param limit 1-100.
         * \param after Return users after this id, 0 to start from beginning.
         */
        nlohmann::json getReactions(Snowflake channelId, Snowflake messageId, const std::string& emoji,
                                    unsigned limit = 25, Snowflake after = 0);

        void deleteAllReactions(Snowflake channelId, Snowflake messageId);
        void deleteAllReactionsForEmoji(Snowflake channelId, Snowflake messageId, const std::string& emoji);

        /// @}

        /**
         * \defgroup REST_threads Threads
         * @{
         */

        nlohmann::json startThreadFromMessage(Snowflake channelId, Snowflake messageId,
                                              const std::string& name,
                                              boost::optional<AutoArchiveDuration> autoArchiveDuration = boost::none,
                                              boost::optional<unsigned> rateLimitPerUser = boost::none,
                                              const Reason& reason = boost::none);

        /**
         * \param type PublicThread, PrivateThread or AnnouncementThread.
         * \param invitable Whether non-moderators can add members to private thread.
         */
        nlohmann::json startThreadWithoutMessage(Snowflake channelId, const std::string& name,
                                                 ChannelType type = ChannelType::PrivateThread,
                                                 boost::optional<AutoArchiveDuration> autoArchiveDuration = boost::none,
                                                 boost::optional<bool> invitable = boost::none,
                                                 boost::optional<unsigned> rateLimitPerUser = boost::none,
                                                 const Reason& reason = boost::none);

        /**
         * Create post in forum channel. Multipart request is used if message have files.
         *
         * \param appliedTags Forum tag ids, max 5.
         */
        nlohmann::json startForumThread(Snowflake channelId, const std::string& name,
                                        const OutgoingMessage& message,
                                        boost::optional<AutoArchiveDuration> autoArchiveDuration = boost::none,
                                        boost::optional<unsigned> rateLimitPerUser = boost::none,
                                        const std::vector<Snowflake>& appliedTags = {},
                                        const Reason& reason = boost::none);

        void joinThread(Snowflake threadId);
        void leaveThread(Snowflake threadId);
        void addThreadMember(Snowflake threadId, Snowflake userId);
        void removeThreadMember(Snowflake threadId, Snowflake userId);
        nlohmann::json getThreadMember(Snowflake threadId, Snowflake userId, bool withMember = false);

        /**
         * \param limit 1-100.
         */
        nlohmann::json listThreadMembers(Snowflake threadId, bool withMember = false,
                                         Snowflake after = 0, unsigned limit = 100);

        /// All active threads in guild visible for current user.
        nlohmann::json listActiveGuildThreads(Snowflake guildId);

        /**
         * \param before ISO8601 timestamp, threads archived before it.
         * \param limit  Max threads to return, 1-100.
         */
        nlohmann::json listPublicArchivedThreads(Snowflake channelId,
                                                 const boost::optional<std::string>& before = boost::none,
                                                 boost::optional<unsigned> limit = boost::none);
        nlohmann::json listPrivateArchivedThreads(Snowflake channelId,
                                                  const boost::optional<std::string>& before = boost::none,
                                                  boost::optional<unsigned> limit = boost::none);

        /**
         * Private archived threads current user joined.
         *
         * \param before Thread id.
         */
        nlohmann::json listJoinedPrivateArchivedThreads(Snowflake channelId, Snowflake before = 0,
                                                        boost::optional<unsigned> limit = boost::none);

        /// @}

        /**
         * \defgroup REST_guilds Guilds
         *
         * Methods related to guilds.
         *
         * @{
         */

        /**
         * Create a new guild. Only for bots in less than 10 guilds.
         *
         * \param name 2-100 characters.
         * \param fields Other guild fields (icon, channels, roles, ...).
         */
        nlohmann::json createGuild(const std::string& name, const nlohmann::json& fields = nlohmann::json::object());

        nlohmann::json createGuildFromTemplate(const std::string& templateCode, const std::string& name,
                                               const boost::optional<Image>& icon = boost::none);

        /**
         * \param withCounts Fill approximate_member_count and approximate_presence_count.
         */
        nlohmann::json getGuild(Snowflake guildId, bool withCounts = false);

        /// Guild preview, works only for discoverable guilds if bot is not member.
        nlohmann::json getGuildPreview(Snowflake guildId);

        nlohmann::json modifyGuild(Snowflake guildId, const nlohmann::json& changedFields,
                                   const Reason& reason = boost::none);

        /// Delete a guild permanently. User must be owner.
        void deleteGuild(Snowflake guildId);

        nlohmann::json getGuildChannels(Snowflake guildId);

        /**
         * \param name 1-100 characters.
         * \param fields Other channel fields (topic, bitrate, permission_overwrites, parent_id, ...).
         */
        nlohmann::json createGuildChannel(Snowflake guildId, const std::string& name,
                                          ChannelType type = ChannelType::GuildText,
                                          const nlohmann::json& fields = nlohmann::json::object(),
                                          const Reason& reason = boost::none);

        /**
         * \param positions Array of objects with "id" and "position"
         *                  (and optionally "lock_permissions", "parent_id").
         */
        void modifyGuildChannelPositions(Snowflake guildId, const nlohmann::json& positions);

        nlohmann::json getGuildMember(Snowflake guildId, Snowflake userId);

        /**
         * Requires GUILD_MEMBERS privileged intent.
         *
         * \param limit 1-1000.
         * \param after Highest user id in previous page, 0 to start from beginning.
         */
        nlohmann::json listGuildMembers(Snowflake guildId, unsigned limit = 1, Snowflake after = 0);

        /**
         * Members whose username or nickname starts with query.
         *
         * \param limit 1-1000.
         */
        nlohmann::json searchGuildMembers(Snowflake guildId, const std::string& query, unsigned limit = 1);

        /**
         * Add user to guild using OAuth2 access token with guilds.join scope.
         *
         * \returns Member object, or null if user is already member.
         */
        nlohmann::json addGuildMember(Snowflake guildId, Snowflake userId, const std::string& accessToken,
                                      const nlohmann::json& fields = nlohmann::json::object());

        /**
         * Change nick, roles, mute, deaf, channel_id or communication_disabled_until.
         */
        nlohmann::json modifyGuildMember(Snowflake guildId, Snowflake userId, const nlohmann::json& changedFields,
                                         const Reason& reason = boost::none);

        /// Change nickname of current user, boost::none to reset.
        nlohmann::json modifyCurrentMember(Snowflake guildId, const boost::optional<std::string>& nick,
                                           const Reason& reason = boost::none);

        void addGuildMemberRole(Snowflake guildId, Snowflake userId, Snowflake roleId,
                                const Reason& reason = boost::none);
        void removeGuildMemberRole(Snowflake guildId, Snowflake userId, Snowflake roleId,
                                   const Reason& reason = boost::none);

        /**
         * Remove member from guild. Requires KICK_MEMBERS permission.
         */
        void kickMember(Snowflake guildId, Snowflake userId, const Reason& reason = boost::none);

        /**
         * \param limit 1-1000.
         * \param before, after User ids, 0 if not used.
         */
        nlohmann::json getGuildBans(Snowflake guildId, unsigned limit = 1000,
                                    Snowflake before = 0, Snowflake after = 0);

        nlohmann::json getGuildBan(Snowflake guildId, Snowflake userId);

        /**
         * Ban user. Requires BAN_MEMBERS permission.
         *
         * \param deleteMessageDays Delete messages sent by user in last N days, 0-7.
         */
        void banMember(Snowflake guildId, Snowflake userId, unsigned deleteMessageDays = 0,
                       const Reason& reason = boost::none);

        void unbanMember(Snowflake guildId, Snowflake userId, const Reason& reason = boost::none);

        nlohmann::json getGuildRoles(Snowflake guildId);

        /**
         * \param fields name, permissions, color, hoist, icon, unicode_emoji, mentionable.
         *               Empty object creates role with defaults.
         */
        nlohmann::json createGuildRole(Snowflake guildId, const nlohmann::json& fields = nlohmann::json::object(),
                                       const Reason& reason = boost::none);

        /**
         * \param positions Array of objects with "id" and "position".
         */
        nlohmann::json modifyGuildRolePositions(Snowflake guildId, const nlohmann::json& positions,
                                                const Reason& reason = boost::none);

        nlohmann::json modifyGuildRole(Snowflake guildId, Snowflake roleId, const nlohmann::json& changedFields,
                                       const Reason& reason = boost::none);

        void deleteGuildRole(Snowflake guildId, Snowflake roleId, const Reason& reason = boost::none);

        /**
         * Number of members that would be removed by prune.
         *
         * \param days 0-30. Discord rejects 0, but it's passed through as is.
         * \param includeRoles By default members with roles are not pruned,
         *                     members with these roles are included.
         */
        nlohmann::json getGuildPruneCount(Snowflake guildId, unsigned days = 7,
                                          const std::vector<Snowflake>& includeRoles = {});

        /**
         * Kick inactive members.
         *
         * \param computePruneCount Return number of pruned members, discouraged for large guilds.
         */
        nlohmann::json beginGuildPrune(Snowflake guildId, unsigned days = 7, bool computePruneCount = true,
                                       const std::vector<Snowflake>& includeRoles = {},
                                       const Reason& reason = boost::none);

        nlohmann::json getGuildVoiceRegions(Snowflake guildId);
        nlohmann::json getGuildInvites(Snowflake guildId);
        nlohmann::json getGuildIntegrations(Snowflake guildId);
        void deleteGuildIntegration(Snowflake guildId, Snowflake integrationId, const Reason& reason = boost::none);

        nlohmann::json getGuildWidgetSettings(Snowflake guildId);
        nlohmann::json modifyGuildWidget(Snowflake guildId, boost::optional<bool> enabled,
                                         boost::optional<Snowflake> channelId = boost::none,
                                         const Reason& reason = boost::none);
        nlohmann::json getGuildWidget(Snowflake guildId);
        nlohmann::json getGuildVanityUrl(Snowflake guildId);

        nlohmann::json getGuildWelcomeScreen(Snowflake guildId);
        nlohmann::json modifyGuildWelcomeScreen(Snowflake guildId, const nlohmann::json& changedFields,
                                                const Reason& reason = boost::none);

        nlohmann::json getGuildMembershipScreening(Snowflake guildId);
        nlohmann::json modifyGuildMembershipScreening(Snowflake guildId, const nlohmann::json& changedFields);

        nlohmann::json getGuildTemplate(const std::string& templateCode);
        nlohmann::json getGuildTemplates(Snowflake guildId);

        /**
         * \param name 1-100 characters.
         * \param description 0-120 characters.
         */
        nlohmann::json createGuildTemplate(Snowflake guildId, const std::string& name,
                                           const boost::optional<std::string>& description = boost::none);
        nlohmann::json syncGuildTemplate(Snowflake guildId, const std::string& templateCode);
        nlohmann::json modifyGuildTemplate(Snowflake guildId, const std::string& templateCode,
                                           const boost::optional<std::string>& name = boost::none,
                                           const boost::optional<std::string>& description = boost::none);
        nlohmann::json deleteGuildTemplate(Snowflake guildId, const std::string& templateCode);

        /**
         * Change voice state of current user in stage channel.
         *
         * \param suppress Toggle suppressed state.
         * \param requestToSpeakTimestamp ISO8601 timestamp, empty string to remove request.
         */
        void modifyCurrentUserVoiceState(Snowflake guildId, Snowflake channelId,
                                         boost::optional<bool> suppress = boost::none,
                                         const boost::optional<std::string>& requestToSpeakTimestamp = boost::none);
        void modifyUserVoiceState(Snowflake guildId, Snowflake userId, Snowflake channelId,
                                  boost::optional<bool> suppress = boost::none);

        /// @}

        /**
         * \defgroup REST_emojis Emojis
         * @{
         */

        nlohmann::json listGuildEmojis(Snowflake guildId);
        nlohmann::json getGuildEmoji(Snowflake guildId, Snowflake emojiId);

        /**
         * \param image Emoji image, max 256 KiB.
         * \param roles Roles allowed to use emoji, empty = everyone.
         */
        nlohmann::json createGuildEmoji(Snowflake guildId, const std::string& name, const Image& image,
                                        const std::vector<Snowflake>& roles = {},
                                        const Reason& reason = boost::none);
        nlohmann::json modifyGuildEmoji(Snowflake guildId, Snowflake emojiId,
                                        const boost::optional<std::string>& name = boost::none,
                                        const boost::optional<std::vector<Snowflake> >& roles = boost::none,
                                        const Reason& reason = boost::none);
        void deleteGuildEmoji(Snowflake guildId, Snowflake emojiId, const Reason& reason = boost::none);

        /// @}

        /**
         * \defgroup REST_stickers Stickers
         * @{
         */

        nlohmann::json getSticker(Snowflake stickerId);
        nlohmann::json listStickerPacks();
        nlohmann::json listGuildStickers(Snowflake guildId);
        nlohmann::json getGuildSticker(Snowflake guildId, Snowflake stickerId);

        /**
         * Upload sticker (PNG, APNG, GIF or Lottie JSON, max 512 KiB).
         *
         * \param name 2-30 characters.
         * \param description Empty or 2-100 characters.
         * \param tags Autocomplete keywords, max 200 characters.
         */
        nlohmann::json createGuildSticker(Snowflake guildId, const std::string& name,
                                          const std::string& description, const std::string& tags,
                                          const File& file, const Reason& reason = boost::none);
        nlohmann::json modifyGuildSticker(Snowflake guildId, Snowflake stickerId,
                                          const boost::optional<std::string>& name = boost::none,
                                          const boost::optional<std::string>& description = boost::none,
                                          const boost::optional<std::string>& tags = boost::none,
                                          const Reason& reason = boost::none);
        void deleteGuildSticker(Snowflake guildId, Snowflake stickerId, const Reason& reason = boost::none);

        /// @}

        /**
         * \defgroup REST_events Scheduled events
         * @{
         */

        nlohmann::json listScheduledEvents(Snowflake guildId, bool withUserCounts = false);

        /**
         * \param event Object with name, privacy_level, scheduled_start_time,
         *              entity_type and fields required by entity type.
         */
        nlohmann::json createScheduledEvent(Snowflake guildId, const nlohmann::json& event,
                                            const Reason& reason = boost::none);
        nlohmann::json getScheduledEvent(Snowflake guildId, Snowflake eventId, bool withUserCounts = false);
        nlohmann::json modifyScheduledEvent(Snowflake guildId, Snowflake eventId, const nlohmann::json& changedFields,
                                            const Reason& reason = boost::none);
        void deleteScheduledEvent(Snowflake guildId, Snowflake eventId);

        /**
         * \param limit 1-100.
         */
        nlohmann::json getScheduledEventUsers(Snowflake guildId, Snowflake eventId, unsigned limit = 100,
                                              bool withMember = false, Snowflake before = 0, Snowflake after = 0);

        /// @}

        /**
         * \defgroup REST_stage Stage instances
         * @{
         */

        /**
         * \param topic 1-120 characters.
         * \param sendStartNotification Notify @everyone, requires MENTION_EVERYONE.
         */
        nlohmann::json createStageInstance(Snowflake channelId, const std::string& topic,
                                           StagePrivacyLevel privacyLevel = StagePrivacyLevel::GuildOnly,
                                           bool sendStartNotification = false,
                                           const Reason& reason = boost::none);
        nlohmann::json getStageInstance(Snowflake channelId);
        nlohmann::json modifyStageInstance(Snowflake channelId,
                                           const boost::optional<std::string>& topic = boost::none,
                                           boost::optional<StagePrivacyLevel> privacyLevel = boost::none,
                                           const Reason& reason = boost::none);
        void deleteStageInstance(Snowflake channelId, const Reason& reason = boost::none);

        /// @}

        /**
         * \defgroup REST_invites Invites
         * @{
         */

        /**
         * \param withCounts Fill approximate member counts.
         * \param withExpiration Fill expires_at.
         */
        nlohmann::json getInvite(const std::string& inviteCode, bool withCounts = false,
                                 bool withExpiration = false,
                                 boost::optional<Snowflake> scheduledEventId = boost::none);
        nlohmann::json deleteInvite(const std::string& inviteCode, const Reason& reason = boost::none);

        /// @}

        /**
         * \defgroup REST_users Users
         *
         * Methods related to current user and other users.
         *
         * @{
         */

        /**
         * Get user object of requester's account.
         *
         * For OAuth2 requires identify scope, which will return the object without an email,
         * and optionally the email scope, which returns the object with an email.
         */
        nlohmann::json getCurrentUser();

        nlohmann::json getUser(Snowflake userId);

        /**
         * Change username and/or avatar. Pass empty optional to keep current value.
         *
         * \throws InvalidParameter if username is invalid, see \ref setUsername.
         */
        nlohmann::json modifyCurrentUser(const boost::optional<std::string>& username,
                                         const boost::optional<Image>& avatar = boost::none);

        /**
         * Change username of current user.
         *
         * \throws InvalidParameter if username is invalid:
         * * Length is not in range 2-32.
         * * Contains '@', '#', ':' or '```'.
         * * Is 'discordtag', 'everyone' or 'here'.
         */
        inline nlohmann::json setUsername(const std::string& newUsername) {
            return modifyCurrentUser(newUsername);
        }

        /**
         * Change avatar of current user.
         */
        inline nlohmann::json setAvatar(const Image& avatar) {
            return modifyCurrentUser(boost::none, avatar);
        }

        /**
         * Get guilds current user is member of.
         *
         * \param limit 1-200.
         * \param before, after Guild ids for pagination, 0 if not used.
         */
        nlohmann::json getCurrentUserGuilds(unsigned limit = 200, Snowflake before = 0, Snowflake after = 0,
                                            bool withCounts = false);

        /// Member object of current user in guild, requires guilds.members.read OAuth2 scope.
        nlohmann::json getCurrentUserGuildMember(Snowflake guildId);

        void leaveGuild(Snowflake guildId);

        /// Get list of DM channels. Returns empty array for bots.
        nlohmann::json getUserDms();

        /// Create a new DM channel with a user. Returns a DM channel object.
        nlohmann::json createDm(Snowflake recipientId);

        /**
         * Create a new group DM channel with multiple users.
         *
         * \param accessTokens OAuth2 access tokens of users that have granted gdm.join scope.
         * \param nicks user id => nickname map.
         */
        nlohmann::json createGroupDm(const std::vector<std::string>& accessTokens,
                                     const std::map<Snowflake, std::string>& nicks = {});

        /// Requires connections OAuth2 scope.
        nlohmann::json getUserConnections();

        /// Voice regions that can be used when setting channel rtc_region.
        nlohmann::json listVoiceRegions();

        /// @}

        /**
         * \defgroup REST_webhooks Webhooks
         *
         * Methods with "WithToken" suffix don't require authorization,
         * webhook token is used instead.
         *
         * @{
         */

        /**
         * \param name 1-80 characters, can't contain "clyde".
         */
        nlohmann::json createWebhook(Snowflake channelId, const std::string& name,
                                     const boost::optional<Image>& avatar = boost::none,
                                     const Reason& reason = boost::none);
        nlohmann::json getChannelWebhooks(Snowflake channelId);
        nlohmann::json getGuildWebhooks(Snowflake guildId);
        nlohmann::json getWebhook(Snowflake webhookId);
        nlohmann::json getWebhookWithToken(Snowflake webhookId, const std::string& webhookToken);

        /**
         * \param channelId Move webhook to this channel.
         */
        nlohmann::json modifyWebhook(Snowflake webhookId,
                                     const boost::optional<std::string>& name = boost::none,
                                     const boost::optional<Image>& avatar = boost::none,
                                     boost::optional<Snowflake> channelId = boost::none,
                                     const Reason& reason = boost::none);
        nlohmann::json modifyWebhookWithToken(Snowflake webhookId, const std::string& webhookToken,
                                              const boost::optional<std::string>& name = boost::none,
                                              const boost::optional<Image>& avatar = boost::none);
        void deleteWebhook(Snowflake webhookId, const Reason& reason = boost::none);
        void deleteWebhookWithToken(Snowflake webhookId, const std::string& webhookToken);

        /**
         * Send message using webhook.
         *
         * \param username  Override default username of webhook.
         * \param avatarUrl Override default avatar of webhook.
         * \param threadId  Send to thread in webhook's channel.
         * \param wait      Wait for server confirmation and return message object,
         *                  if false - null is returned.
         */
        nlohmann::json executeWebhook(Snowflake webhookId, const std::string& webhookToken,
                                      const OutgoingMessage& message,
                                      const boost::optional<std::string>& username = boost::none,
                                      const boost::optional<std::string>& avatarUrl = boost::none,
                                      boost::optional<Snowflake> threadId = boost::none,
                                      bool wait = false);

        /// Execute webhook with Slack-formatted payload.
        nlohmann::json executeSlackWebhook(Snowflake webhookId, const std::string& webhookToken,
                                           const nlohmann::json& payload,
                                           boost::optional<Snowflake> threadId = boost::none,
                                           bool wait = true);

        /// Execute webhook with GitHub event payload.
        nlohmann::json executeGitHubWebhook(Snowflake webhookId, const std::string& webhookToken,
                                            const nlohmann::json& payload,
                                            boost::optional<Snowflake> threadId = boost::none,
                                            bool wait = true);

        nlohmann::json getWebhookMessage(Snowflake webhookId, const std::string& webhookToken, Snowflake messageId,
                                         boost::optional<Snowflake> threadId = boost::none);
        nlohmann::json editWebhookMessage(Snowflake webhookId, const std::string& webhookToken, Snowflake messageId,
                                          const OutgoingMessage& message,
                                          boost::optional<Snowflake> threadId = boost::none);
        void deleteWebhookMessage(Snowflake webhookId, const std::string& webhookToken, Snowflake messageId,
                                  boost::optional<Snowflake> threadId = boost::none);

        /// @}

        /**
         * \defgroup REST_interactions Interactions
         *
         * Interaction token is valid for 15 minutes, initial response
         * must be sent in 3 seconds.
         *
         * @{
         */

        /**
         * Respond to interaction.
         *
         * \param message Used as response data for message response types,
         *                multipart request is used if it have files.
         */
        void createInteractionResponse(Snowflake interactionId, const std::string& interactionToken,
                                       InteractionResponseType type,
                                       const boost::optional<OutgoingMessage>& message = boost::none);

        /**
         * Respond to interaction with raw response object ({type, data}),
         * for example made by \ref autocompleteResponse.
         */
        void createInteractionResponse(Snowflake interactionId, const std::string& interactionToken,
                                       const nlohmann::json& response);

        nlohmann::json getOriginalInteractionResponse(Snowflake applicationId, const std::string& interactionToken);
        nlohmann::json editOriginalInteractionResponse(Snowflake applicationId, const std::string& interactionToken,
                                                       const OutgoingMessage& message);
        void deleteOriginalInteractionResponse(Snowflake applicationId, const std::string& interactionToken);

        nlohmann::json createFollowupMessage(Snowflake applicationId, const std::string& interactionToken,
                                             const OutgoingMessage& message);
        nlohmann::json getFollowupMessage(Snowflake applicationId, const std::string& interactionToken,
                                          Snowflake messageId);
        nlohmann::json editFollowupMessage(Snowflake applicationId, const std::string& interactionToken,
                                           Snowflake messageId, const OutgoingMessage& message);
        void deleteFollowupMessage(Snowflake applicationId, const std::string& interactionToken,
                                   Snowflake messageId);

        /// @}

        /**
         * \defgroup REST_commands Application commands
         *
         * Command object format is described in Discord documentation,
         * name (1-32 characters) is checked before sending.
         *
         * @{
         */

        nlohmann::json getGlobalApplicationCommands(Snowflake applicationId, bool withLocalizations = false);
        nlohmann::json createGlobalApplicationCommand(Snowflake applicationId, const nlohmann::json& command);
        nlohmann::json getGlobalApplicationCommand(Snowflake applicationId, Snowflake commandId);
        nlohmann::json editGlobalApplicationCommand(Snowflake applicationId, Snowflake commandId,
                                                    const nlohmann::json& changedFields);
        void deleteGlobalApplicationCommand(Snowflake applicationId, Snowflake commandId);

        /// Replace all global commands, commands not listed are deleted.
        nlohmann::json bulkOverwriteGlobalApplicationCommands(Snowflake applicationId,
                                                              const nlohmann::json& commands);

        nlohmann::json getGuildApplicationCommands(Snowflake applicationId, Snowflake guildId,
                                                   bool withLocalizations = false);
        nlohmann::json createGuildApplicationCommand(Snowflake applicationId, Snowflake guildId,
                                                     const nlohmann::json& command);
        nlohmann::json getGuildApplicationCommand(Snowflake applicationId, Snowflake guildId, Snowflake commandId);
        nlohmann::json editGuildApplicationCommand(Snowflake applicationId, Snowflake guildId, Snowflake commandId,
                                                   const nlohmann::json& changedFields);
        void deleteGuildApplicationCommand(Snowflake applicationId, Snowflake guildId, Snowflake commandId);
        nlohmann::json bulkOverwriteGuildApplicationCommands(Snowflake applicationId, Snowflake guildId,
                                                             const nlohmann::json& commands);

        nlohmann::json getGuildApplicationCommandPermissions(Snowflake applicationId, Snowflake guildId);
        nlohmann::json getApplicationCommandPermissions(Snowflake applicationId, Snowflake guildId,
                                                        Snowflake commandId);

        /**
         * Requires Bearer token with applications.commands.permissions.update scope.
         *
         * \param permissions Array of {id, type, permission} objects, max 100.
         */
        nlohmann::json editApplicationCommandPermissions(Snowflake applicationId, Snowflake guildId,
                                                         Snowflake commandId, const nlohmann::json& permissions);

        /**
         * \param permissions Array of {id, permissions} objects, one per command.
         */
        nlohmann::json batchEditApplicationCommandPermissions(Snowflake applicationId, Snowflake guildId,
                                                              const nlohmann::json& permissions);

        /// @}

        /**
         * \defgroup REST_applications Applications
         * @{
         */

        /// Application of current bot.
        nlohmann::json getCurrentApplication();

        /// Public information about application (RPC endpoint).
        nlohmann::json getApplication(Snowflake applicationId);

        /// Rich presence assets of application.
        nlohmann::json getApplicationAssets(Snowflake applicationId);

        /// @}

        /**
         * \defgroup REST_moderation Auto moderation and audit log
         * @{
         */

        nlohmann::json listAutoModerationRules(Snowflake guildId);
        nlohmann::json getAutoModerationRule(Snowflake guildId, Snowflake ruleId);

        /**
         * \param rule Object with name, event_type, trigger_type, trigger_metadata,
         *             actions, enabled, exempt_roles, exempt_channels.
         */
        nlohmann::json createAutoModerationRule(Snowflake guildId, const nlohmann::json& rule,
                                                const Reason& reason = boost::none);
        nlohmann::json modifyAutoModerationRule(Snowflake guildId, Snowflake ruleId,
                                                const nlohmann::json& changedFields,
                                                const Reason& reason = boost::none);
        void deleteAutoModerationRule(Snowflake guildId, Snowflake ruleId, const Reason& reason = boost::none);

        /**
         * Get guild audit log. Requires VIEW_AUDIT_LOG permission.
         *
         * \param userId     Only entries made by this user, 0 if not used.
         * \param actionType Only entries of this type.
         * \param before, after Entry ids, 0 if not used.
         * \param limit      1-100.
         */
        nlohmann::json getAuditLog(Snowflake guildId, Snowflake userId = 0,
                                   boost::optional<int> actionType = boost::none,
                                   Snowflake before = 0, Snowflake after = 0,
                                   unsigned limit = 50);

        /// @}

        /// @}
    private:
        // Send request, reopen connection once if it was closed by server.
        REST::HTTPResponse performRequest(const REST::HTTPRequest& request);

        void prepareRequestBody(REST::HTTPRequest& request,
                                const nlohmann::json& payload,
                                const std::vector<REST::MultipartEntity>& elements);

        // Send message with files as multipart (payload_json + files[i]) or as JSON.
        nlohmann::json sendMessageRequest(const Route& route, const OutgoingMessage& message,
                                          const REST::QueryParams& query = {},
                                          const nlohmann::json& extraFields = nlohmann::json::object());

        [[noreturn]] static void throwRestError(const REST::HTTPResponse& response,
                                                const nlohmann::json& payload);

        static REST::MultipartEntity fileToMultipartEntity(const File& file, const std::string& name);

        ConnectionFactory connectionFactory;
        std::unique_ptr<REST::HTTPConnection> restConnection;
        std::mutex connectionMutex;

        std::string token_;
        TokenType tokenType_;
    };
} // namespace Harmonia

#endif // HARMONIA_REST_CLIENT_HPP
