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

#include <harmonia/rest_client.hpp>
#include <harmonia/exceptions.hpp>
#include <harmonia/internal/utils.hpp>

namespace Harmonia {
    namespace {
        void checkMessagesLimit(unsigned limit) {
            if (limit > 100 || limit == 0) {
                throw InvalidParameter("limit", "limit out of range (should be 1-100).");
            }
        }

        void checkThreadName(const std::string& name) {
            if (name.empty() || Utils::utf8Length(name) > 100) {
                throw InvalidParameter("name", "name size out of range (should be 1-100).");
            }
        }

        void checkRateLimitPerUser(const boost::optional<unsigned>& rateLimitPerUser) {
            if (rateLimitPerUser && *rateLimitPerUser > 21600) {
                throw InvalidParameter("rateLimitPerUser", "rateLimitPerUser out of range (should be 0-21600).");
            }
        }

        Route channelRoute(const std::string& method, const std::string& suffix, Snowflake channelId) {
            return Route(method, "/channels/:channel_id" + suffix, {{ "channel_id", channelId.toString() }});
        }

        Route messageRoute(const std::string& method, const std::string& suffix,
                           Snowflake channelId, Snowflake messageId) {
            return Route(method, "/channels/:channel_id/messages/:message_id" + suffix, {
                { "channel_id", channelId.toString() },
                { "message_id", messageId.toString() }
            });
        }

        Route reactionRoute(const std::string& method, const std::string& suffix,
                            Snowflake channelId, Snowflake messageId, const std::string& emoji) {
            if (emoji.empty()) {
                throw InvalidParameter("emoji", "emoji must not be empty.");
            }
            return Route(method, "/channels/:channel_id/messages/:message_id/reactions/:emoji" + suffix, {
                { "channel_id", channelId.toString() },
                { "message_id", messageId.toString() },
                { "emoji",      emoji                }
            });
        }
    } // namespace

    nlohmann::json RestClient::getChannel(Snowflake channelId) {
        return sendRestRequest(channelRoute("GET", "", channelId));
    }

    nlohmann::json RestClient::modifyChannel(Snowflake channelId,
                                             boost::optional<std::string> name,
                                             boost::optional<int> position,
                                             boost::optional<std::string> topic,
                                             boost::optional<unsigned> bitrate,
                                             boost::optional<unsigned short> usersLimit,
                                             boost::optional<Snowflake> parentId,
                                             const Reason& reason) {
        nlohmann::json payload = nlohmann::json::object();
        if (name) {
            if (Utils::utf8Length(*name) > 100 || name->empty()) {
                throw InvalidParameter("name", "name size out of range (should be 1-100).");
            }
            payload.emplace("name", *name);
        }
        if (position) {
            payload.emplace("position", *position);
        }
        if (topic && (bitrate || usersLimit)) {
            throw InvalidParameter("bitrate", "Passing both voice-only and text-only channel arguments.");
        }
        if (topic) {
            if (Utils::utf8Length(*topic) > 1024) {
                throw InvalidParameter("topic", "topic size out of range (should be 0-1024).");
            }
            payload.emplace("topic", *topic);
        }
        if (bitrate) {
            if (*bitrate < 8000 || *bitrate > 384000) {
                throw InvalidParameter("bitrate", "bitrate out of range (should be 8000-384000).");
            }
            payload.emplace("bitrate", *bitrate);
        }
        if (usersLimit) {
            if (*usersLimit > 99) {
                throw InvalidParameter("usersLimit", "usersLimit out of range (should be 0-99).");
            }
            payload.emplace("user_limit", *usersLimit);
        }
        if (parentId) {
            if (*parentId == 0) {
                payload.emplace("parent_id", nullptr);
            } else {
                payload.emplace("parent_id", *parentId);
            }
        }
        if (payload.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyChannel.");
        }

        return sendRestRequest(channelRoute("PATCH", "", channelId), payload, {}, {}, reason);
    }

    nlohmann::json RestClient::modifyChannel(Snowflake channelId, const nlohmann::json& changedFields,
                                             const Reason& reason) {
        if (!changedFields.is_object() || changedFields.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyChannel.");
        }
        return sendRestRequest(channelRoute("PATCH", "", channelId), changedFields, {}, {}, reason);
    }

    nlohmann::json RestClient::deleteChannel(Snowflake channelId, const Reason& reason) {
        return sendRestRequest(channelRoute("DELETE", "", channelId), nullptr, {}, {}, reason);
    }

    void RestClient::editChannelPermissions(Snowflake channelId, Snowflake overwriteId,
                                            Permissions allow, Permissions deny,
                                            OverwriteType type, const Reason& reason) {
        // Unknown bits are rejected by API.
        const uint64_t allowBits = static_cast<uint64_t>(allow) & AllPermissions;
        const uint64_t denyBits  = static_cast<uint64_t>(deny)  & AllPermissions;

        sendRestRequest(Route("PUT", "/channels/:channel_id/permissions/:overwrite_id", {
                            { "channel_id",   channelId.toString()   },
                            { "overwrite_id", overwriteId.toString() }
                        }), {
                            { "allow", std::to_string(allowBits)      },
                            { "deny",  std::to_string(denyBits)       },
                            { "type",  static_cast<int>(type)         }
                        }, {}, {}, reason);
    }

    void RestClient::deleteChannelPermission(Snowflake channelId, Snowflake overwriteId, const Reason& reason) {
        sendRestRequest(Route("DELETE", "/channels/:channel_id/permissions/:overwrite_id", {
                            { "channel_id",   channelId.toString()   },
                            { "overwrite_id", overwriteId.toString() }
                        }), nullptr, {}, {}, reason);
    }

    nlohmann::json RestClient::getChannelInvites(Snowflake channelId) {
        return sendRestRequest(channelRoute("GET", "/invites", channelId));
    }

    nlohmann::json RestClient::createChannelInvite(Snowflake channelId, unsigned maxAgeSecs, unsigned maxUses,
                                                   bool temporaryMembership, bool unique,
                                                   const Reason& reason) {
        if (maxAgeSecs > 604800) {
            throw InvalidParameter("maxAgeSecs", "maxAgeSecs out of range (should be 0-604800).");
        }
        if (maxUses > 100) {
            throw InvalidParameter("maxUses", "maxUses out of range (should be 0-100).");
        }

        return sendRestRequest(channelRoute("POST", "/invites", channelId), {
                                   { "max_age",   maxAgeSecs          },
                                   { "max_uses",  maxUses             },
                                   { "temporary", temporaryMembership },
                                   { "unique",    unique              }
                               }, {}, {}, reason);
    }

    nlohmann::json RestClient::followAnnouncementChannel(Snowflake channelId, Snowflake targetChannelId) {
        return sendRestRequest(channelRoute("POST", "/followers", channelId),
                               {{ "webhook_channel_id", targetChannelId }});
    }

    void RestClient::triggerTypingIndicator(Snowflake channelId) {
        sendRestRequest(channelRoute("POST", "/typing", channelId));
    }

    nlohmann::json RestClient::getPinnedMessages(Snowflake channelId) {
        return sendRestRequest(channelRoute("GET", "/pins", channelId));
    }

    void RestClient::pinMessage(Snowflake channelId, Snowflake messageId, const Reason& reason) {
        sendRestRequest(Route("PUT", "/channels/:channel_id/pins/:message_id", {
                            { "channel_id", channelId.toString() },
                            { "message_id", messageId.toString() }
                        }), nullptr, {}, {}, reason);
    }

    void RestClient::unpinMessage(Snowflake channelId, Snowflake messageId, const Reason& reason) {
        sendRestRequest(Route("DELETE", "/channels/:channel_id/pins/:message_id", {
                            { "channel_id", channelId.toString() },
                            { "message_id", messageId.toString() }
                        }), nullptr, {}, {}, reason);
    }

    void RestClient::groupDmAddRecipient(Snowflake groupDmId, Snowflake userId,
                                         const std::string& accessToken, const std::string& nick) {
        nlohmann::json payload = {{ "access_token", accessToken }};
        if (!nick.empty()) payload["nick"] = nick;

        sendRestRequest(Route("PUT", "/channels/:channel_id/recipients/:user_id", {
                            { "channel_id", groupDmId.toString() },
                            { "user_id",    userId.toString()    }
                        }), payload);
    }

    void RestClient::groupDmRemoveRecipient(Snowflake groupDmId, Snowflake userId) {
        sendRestRequest(Route("DELETE", "/channels/:channel_id/recipients/:user_id", {
                            { "channel_id", groupDmId.toString() },
                            { "user_id",    userId.toString()    }
                        }));
    }

    nlohmann::json RestClient::getMessage(Snowflake channelId, Snowflake messageId) {
        return sendRestRequest(messageRoute("GET", "", channelId, messageId));
    }

    nlohmann::json RestClient::getMessages(Snowflake channelId, unsigned limit) {
        checkMessagesLimit(limit);

        return sendRestRequest(channelRoute("GET", "/messages", channelId), nullptr,
                               {{ "limit", std::to_string(limit) }});
    }

    nlohmann::json RestClient::getMessages(Snowflake channelId, RestClient::After afterId, unsigned limit) {
        checkMessagesLimit(limit);

        return sendRestRequest(channelRoute("GET", "/messages", channelId), nullptr,
                               {{ "after", afterId.id.toString() },
                                { "limit", std::to_string(limit) }});
    }

    nlohmann::json RestClient::getMessages(Snowflake channelId, RestClient::Before beforeId, unsigned limit) {
        checkMessagesLimit(limit);

        return sendRestRequest(channelRoute("GET", "/messages", channelId), nullptr,
                               {{ "before", beforeId.id.toString() },
                                { "limit",  std::to_string(limit)  }});
    }

    nlohmann::json RestClient::getMessages(Snowflake channelId, RestClient::Around aroundId, unsigned limit) {
        checkMessagesLimit(limit);

        return sendRestRequest(channelRoute("GET", "/messages", channelId), nullptr,
                               {{ "around", aroundId.id.toString() },
                                { "limit",  std::to_string(limit)  }});
    }

    nlohmann::json RestClient::createMessage(Snowflake channelId, const OutgoingMessage& message) {
        message.validate();
        return sendMessageRequest(channelRoute("POST", "/messages", channelId), message);
    }

    nlohmann::json RestClient::sendTextMessage(Snowflake channelId, const std::string& text, bool tts) {
        OutgoingMessage message(text);
        message.tts = tts;
        return createMessage(channelId, message);
    }

    nlohmann::json RestClient::editMessage(Snowflake channelId, Snowflake messageId,
                                           const OutgoingMessage& message) {
        message.validate(true);
        return sendMessageRequest(messageRoute("PATCH", "", channelId, messageId), message);
    }

    void RestClient::deleteMessage(Snowflake channelId, Snowflake messageId, const Reason& reason) {
        sendRestRequest(messageRoute("DELETE", "", channelId, messageId), nullptr, {}, {}, reason);
    }

    nlohmann::json RestClient::crosspostMessage(Snowflake channelId, Snowflake messageId) {
        return sendRestRequest(messageRoute("POST", "/crosspost", channelId, messageId));
    }

    void RestClient::bulkDeleteMessages(Snowflake channelId, const std::vector<Snowflake>& messageIds,
                                        const Reason& reason) {
        if (messageIds.size() < 2 || messageIds.size() > 100) {
            throw InvalidParameter("messageIds", "messages count out of range (should be 2-100).");
        }

        sendRestRequest(channelRoute("POST", "/messages/bulk-delete", channelId),
                        {{ "messages", messageIds }}, {}, {}, reason);
    }

    void RestClient::createReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji) {
        sendRestRequest(reactionRoute("PUT", "/@me", channelId, messageId, emoji));
    }

    void RestClient::deleteOwnReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji) {
        sendRestRequest(reactionRoute("DELETE", "/@me", channelId, messageId, emoji));
    }

    void RestClient::deleteUserReaction(Snowflake channelId, Snowflake messageId, const std::string& emoji,
                                        Snowflake userId) {
        if (emoji.empty()) {
            throw InvalidParameter("emoji", "emoji must not be empty.");
        }
        sendRestRequest(Route("DELETE", "/channels/:channel_id/messages/:message_id/reactions/:emoji/:user_id", {
                            { "channel_id", channelId.toString() },
                            { "message_id", messageId.toString() },
                            { "emoji",      emoji                },
                            { "user_id",    userId.toString()    }
                        }));
    }

    nlohmann::json RestClient::getReactions(Snowflake channelId, Snowflake messageId, const std::string& emoji,
                                            unsigned limit, Snowflake after) {
        checkMessagesLimit(limit);

        REST::QueryParams query = {{ "limit", std::to_string(limit) }};
        if (after != 0) query.push_back({ "after", after.toString() });

        return sendRestRequest(reactionRoute("GET", "", channelId, messageId, emoji), nullptr, query);
    }

    void RestClient::deleteAllReactions(Snowflake channelId, Snowflake messageId) {
        sendRestRequest(messageRoute("DELETE", "/reactions", channelId, messageId));
    }

    void RestClient::deleteAllReactionsForEmoji(Snowflake channelId, Snowflake messageId, const std::string& emoji) {
        sendRestRequest(reactionRoute("DELETE", "", channelId, messageId, emoji));
    }

    nlohmann::json RestClient::startThreadFromMessage(Snowflake channelId, Snowflake messageId,
                                                      const std::string& name,
                                                      boost::optional<AutoArchiveDuration> autoArchiveDuration,
                                                      boost::optional<unsigned> rateLimitPerUser,
                                                      const Reason& reason) {
        checkThreadName(name);
        checkRateLimitPerUser(rateLimitPerUser);

        nlohmann::json payload = {{ "name", name }};
        if (autoArchiveDuration) payload["auto_archive_duration"] = static_cast<int>(*autoArchiveDuration);
        if (rateLimitPerUser)    payload["rate_limit_per_user"]   = *rateLimitPerUser;

        return sendRestRequest(messageRoute("POST", "/threads", channelId, messageId), payload, {}, {}, reason);
    }

    nlohmann::json RestClient::startThreadWithoutMessage(Snowflake channelId, const std::string& name,
                                                         ChannelType type,
                                                         boost::optional<AutoArchiveDuration> autoArchiveDuration,
                                                         boost::optional<bool> invitable,
                                                         boost::optional<unsigned> rateLimitPerUser,
                                                         const Reason& reason) {
        checkThreadName(name);
        checkRateLimitPerUser(rateLimitPerUser);
        if (type != ChannelType::PublicThread && type != ChannelType::PrivateThread &&
            type != ChannelType::AnnouncementThread) {
            throw InvalidParameter("type", "type should be one of thread types.");
        }

        nlohmann::json payload = {
            { "name", name                    },
            { "type", static_cast<int>(type)  }
        };
        if (autoArchiveDuration) payload["auto_archive_duration"] = static_cast<int>(*autoArchiveDuration);
        if (invitable)           payload["invitable"]             = *invitable;
        if (rateLimitPerUser)    payload["rate_limit_per_user"]   = *rateLimitPerUser;

        return sendRestRequest(channelRoute("POST", "/threads", channelId), payload, {}, {}, reason);
    }

    nlohmann::json RestClient::startForumThread(Snowflake channelId, const std::string& name,
                                                const OutgoingMessage& message,
                                                boost::optional<AutoArchiveDuration> autoArchiveDuration,
                                                boost::optional<unsigned> rateLimitPerUser,
                                                const std::vector<Snowflake>& appliedTags,
                                                const Reason& reason) {
        checkThreadName(name);
        checkRateLimitPerUser(rateLimitPerUser);
        if (appliedTags.size() > 5) {
            throw InvalidParameter("appliedTags", "too many tags (should be 0-5).");
        }
        message.validate();

        nlohmann::json payload = {
            { "name",    name              },
            { "message", message.toJson()  }
        };
        if (autoArchiveDuration) payload["auto_archive_duration"] = static_cast<int>(*autoArchiveDuration);
        if (rateLimitPerUser)    payload["rate_limit_per_user"]   = *rateLimitPerUser;
        if (!appliedTags.empty()) payload["applied_tags"]         = appliedTags;

        std::vector<REST::MultipartEntity> multipart;
        for (size_t i = 0; i < message.files.size(); ++i) {
            multipart.push_back(fileToMultipartEntity(message.files[i], "files[" + std::to_string(i) + "]"));
        }

        return sendRestRequest(channelRoute("POST", "/threads", channelId), payload, {}, multipart, reason);
    }

    void RestClient::joinThread(Snowflake threadId) {
        sendRestRequest(channelRoute("PUT", "/thread-members/@me", threadId));
    }

    void RestClient::leaveThread(Snowflake threadId) {
        sendRestRequest(channelRoute("DELETE", "/thread-members/@me", threadId));
    }

    void RestClient::addThreadMember(Snowflake threadId, Snowflake userId) {
        sendRestRequest(Route("PUT", "/channels/:channel_id/thread-members/:user_id", {
                            { "channel_id", threadId.toString() },
                            { "user_id",    userId.toString()   }
                        }));
    }

    void RestClient::removeThreadMember(Snowflake threadId, Snowflake userId) {
        sendRestRequest(Route("DELETE", "/channels/:channel_id/thread-members/:user_id", {
                            { "channel_id", threadId.toString() },
                            { "user_id",    userId.toString()   }
                        }));
    }

    nlohmann::json RestClient::getThreadMember(Snowflake threadId, Snowflake userId, bool withMember) {
        return sendRestRequest(Route("GET", "/channels/:channel_id/thread-members/:user_id", {
                                   { "channel_id", threadId.toString() },
                                   { "user_id",    userId.toString()   }
                               }), nullptr,
                               {{ "with_member", withMember ? "true" : "false" }});
    }

    nlohmann::json RestClient::listThreadMembers(Snowflake threadId, bool withMember, Snowflake after,
                                                 unsigned limit) {
        checkMessagesLimit(limit);

        REST::QueryParams query = {
            { "with_member", withMember ? "true" : "false" },
            { "limit",       std::to_string(limit)         }
        };
        if (after != 0) query.push_back({ "after", after.toString() });

        return sendRestRequest(channelRoute("GET", "/thread-members", threadId), nullptr, query);
    }

    nlohmann::json RestClient::listActiveGuildThreads(Snowflake guildId) {
        return sendRestRequest(Route("GET", "/guilds/:guild_id/threads/active",
                                     {{ "guild_id", guildId.toString() }}));
    }

    nlohmann::json RestClient::listPublicArchivedThreads(Snowflake channelId,
                                                         const boost::optional<std::string>& before,
                                                         boost::optional<unsigned> limit) {
        REST::QueryParams query;
        if (before) query.push_back({ "before", *before });
        if (limit) {
            checkMessagesLimit(*limit);
            query.push_back({ "limit", std::to_string(*limit) });
        }

        return sendRestRequest(channelRoute("GET", "/threads/archived/public", channelId), nullptr, query);
    }

    nlohmann::json RestClient::listPrivateArchivedThreads(Snowflake channelId,
                                                          const boost::optional<std::string>& before,
                                                          boost::optional<unsigned> limit) {
        REST::QueryParams query;
        if (before) query.push_back({ "before", *before });
        if (limit) {
            checkMessagesLimit(*limit);
            query.push_back({ "limit", std::to_string(*limit) });
        }

        return sendRestRequest(channelRoute("GET", "/threads/archived/private", channelId), nullptr, query);
    }

    nlohmann::json RestClient::listJoinedPrivateArchivedThreads(Snowflake channelId, Snowflake before,
                                                                boost::optional<unsigned> limit) {
        REST::QueryParams query;
        if (before != 0) query.push_back({ "before", before.toString() });
        if (limit) {
            checkMessagesLimit(*limit);
            query.push_back({ "limit", std::to_string(*limit) });
        }

        return sendRestRequest(channelRoute("GET", "/users/@me/threads/archived/private", channelId),
                               nullptr, query);
    }
} // namespace Harmonia
