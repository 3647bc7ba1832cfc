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
        Route guildRoute(const std::string& method, const std::string& suffix, Snowflake guildId) {
            return Route(method, "/guilds/:guild_id" + suffix, {{ "guild_id", guildId.toString() }});
        }

        Route memberRoute(const std::string& method, const std::string& suffix,
                          Snowflake guildId, Snowflake userId) {
            return Route(method, "/guilds/:guild_id/members/:user_id" + suffix, {
                { "guild_id", guildId.toString() },
                { "user_id",  userId.toString()  }
            });
        }

        Route templateRoute(const std::string& method, Snowflake guildId, const std::string& templateCode) {
            if (templateCode.empty()) {
                throw InvalidParameter("templateCode", "templateCode must not be empty.");
            }
            return Route(method, "/guilds/:guild_id/templates/:template_code", {
                { "guild_id",      guildId.toString() },
                { "template_code", templateCode       }
            });
        }

        void checkMembersLimit(unsigned limit) {
            if (limit == 0 || limit > 1000) {
                throw InvalidParameter("limit", "limit out of range (should be 1-1000).");
            }
        }

        void checkPruneDays(unsigned days) {
            if (days > 30) {
                throw InvalidParameter("days", "days out of range (should be 0-30).");
            }
        }

        void addIncludeRoles(REST::QueryParams& query, const std::vector<Snowflake>& includeRoles) {
            for (Snowflake roleId : includeRoles) {
                query.push_back({ "include_roles", roleId.toString() });
            }
        }

        nlohmann::json rolesToJson(const std::vector<Snowflake>& roles) {
            nlohmann::json result = nlohmann::json::array();
            for (Snowflake role : roles) result.push_back(role);
            return result;
        }

        const char* boolString(bool value) {
            return value ? "true" : "false";
        }
    } // namespace

    nlohmann::json RestClient::createGuild(const std::string& name, const nlohmann::json& fields) {
        if (Utils::utf8Length(name) < 2 || Utils::utf8Length(name) > 100) {
            throw InvalidParameter("name", "name size out of range (should be 2-100).");
        }

        nlohmann::json payload = fields.is_object() ? fields : nlohmann::json::object();
        payload["name"] = name;

        return sendRestRequest(Route("POST", "/guilds"), payload);
    }

    nlohmann::json RestClient::createGuildFromTemplate(const std::string& templateCode, const std::string& name,
                                                       const boost::optional<Image>& icon) {
        if (Utils::utf8Length(name) < 2 || Utils::utf8Length(name) > 100) {
            throw InvalidParameter("name", "name size out of range (should be 2-100).");
        }
        if (templateCode.empty()) {
            throw InvalidParameter("templateCode", "templateCode must not be empty.");
        }

        nlohmann::json payload = {{ "name", name }};
        if (icon) payload["icon"] = icon->toDataUri();

        return sendRestRequest(Route("POST", "/guilds/templates/:template_code",
                                     {{ "template_code", templateCode }}), payload);
    }

    nlohmann::json RestClient::getGuild(Snowflake guildId, bool withCounts) {
        return sendRestRequest(guildRoute("GET", "", guildId), nullptr,
                               {{ "with_counts", boolString(withCounts) }});
    }

    nlohmann::json RestClient::getGuildPreview(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/preview", guildId));
    }

    nlohmann::json RestClient::modifyGuild(Snowflake guildId, const nlohmann::json& changedFields,
                                           const Reason& reason) {
        if (!changedFields.is_object() || changedFields.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyGuild.");
        }
        auto nameIt = changedFields.find("name");
        if (nameIt != changedFields.end() && nameIt->is_string()) {
            const std::string name = nameIt->get<std::string>();
            if (Utils::utf8Length(name) < 2 || Utils::utf8Length(name) > 100) {
                throw InvalidParameter("name", "name size out of range (should be 2-100).");
            }
        }

        return sendRestRequest(guildRoute("PATCH", "", guildId), changedFields, {}, {}, reason);
    }

    void RestClient::deleteGuild(Snowflake guildId) {
        sendRestRequest(guildRoute("DELETE", "", guildId));
    }

    nlohmann::json RestClient::getGuildChannels(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/channels", guildId));
    }

    nlohmann::json RestClient::createGuildChannel(Snowflake guildId, const std::string& name, ChannelType type,
                                                  const nlohmann::json& fields, const Reason& reason) {
        if (name.empty() || Utils::utf8Length(name) > 100) {
            throw InvalidParameter("name", "name size out of range (should be 1-100).");
        }

        nlohmann::json payload = fields.is_object() ? fields : nlohmann::json::object();
        payload["name"] = name;
        payload["type"] = static_cast<int>(type);

        return sendRestRequest(guildRoute("POST", "/channels", guildId), payload, {}, {}, reason);
    }

    void RestClient::modifyGuildChannelPositions(Snowflake guildId, const nlohmann::json& positions) {
        if (!positions.is_array() || positions.empty()) {
            throw InvalidParameter("positions", "positions should be non-empty array.");
        }
        sendRestRequest(guildRoute("PATCH", "/channels", guildId), positions);
    }

    nlohmann::json RestClient::getGuildMember(Snowflake guildId, Snowflake userId) {
        return sendRestRequest(memberRoute("GET", "", guildId, userId));
    }

    nlohmann::json RestClient::listGuildMembers(Snowflake guildId, unsigned limit, Snowflake after) {
        checkMembersLimit(limit);

        REST::QueryParams query = {{ "limit", std::to_string(limit) }};
        if (after != 0) query.push_back({ "after", after.toString() });

        return sendRestRequest(guildRoute("GET", "/members", guildId), nullptr, query);
    }

    nlohmann::json RestClient::searchGuildMembers(Snowflake guildId, const std::string& query, unsigned limit) {
        checkMembersLimit(limit);
        if (query.empty()) {
            throw InvalidParameter("query", "query must not be empty.");
        }

        return sendRestRequest(guildRoute("GET", "/members/search", guildId), nullptr, {
                                   { "query", query                 },
                                   { "limit", std::to_string(limit) }
                               });
    }

    nlohmann::json RestClient::addGuildMember(Snowflake guildId, Snowflake userId, const std::string& accessToken,
                                              const nlohmann::json& fields) {
        if (accessToken.empty()) {
            throw InvalidParameter("accessToken", "accessToken must not be empty.");
        }

        nlohmann::json payload = fields.is_object() ? fields : nlohmann::json::object();
        payload["access_token"] = accessToken;

        return sendRestRequest(memberRoute("PUT", "", guildId, userId), payload);
    }

    nlohmann::json RestClient::modifyGuildMember(Snowflake guildId, Snowflake userId,
                                                 const nlohmann::json& changedFields, const Reason& reason) {
        if (!changedFields.is_object() || changedFields.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyGuildMember.");
        }
        auto nickIt = changedFields.find("nick");
        if (nickIt != changedFields.end() && nickIt->is_string() &&
            Utils::utf8Length(nickIt->get<std::string>()) > 32) {
            throw InvalidParameter("nick", "nick size out of range (should be 0-32).");
        }

        return sendRestRequest(memberRoute("PATCH", "", guildId, userId), changedFields, {}, {}, reason);
    }

    nlohmann::json RestClient::modifyCurrentMember(Snowflake guildId, const boost::optional<std::string>& nick,
                                                   const Reason& reason) {
        nlohmann::json payload = nlohmann::json::object();
        if (nick) {
            if (Utils::utf8Length(*nick) > 32) {
                throw InvalidParameter("nick", "nick size out of range (should be 0-32).");
            }
            payload["nick"] = *nick;
        } else {
            payload["nick"] = nullptr;
        }

        return sendRestRequest(guildRoute("PATCH", "/members/@me", guildId), payload, {}, {}, reason);
    }

    void RestClient::addGuildMemberRole(Snowflake guildId, Snowflake userId, Snowflake roleId,
                                        const Reason& reason) {
        sendRestRequest(Route("PUT", "/guilds/:guild_id/members/:user_id/roles/:role_id", {
                            { "guild_id", guildId.toString() },
                            { "user_id",  userId.toString()  },
                            { "role_id",  roleId.toString()  }
                        }), nullptr, {}, {}, reason);
    }

    void RestClient::removeGuildMemberRole(Snowflake guildId, Snowflake userId, Snowflake roleId,
                                           const Reason& reason) {
        sendRestRequest(Route("DELETE", "/guilds/:guild_id/members/:user_id/roles/:role_id", {
                            { "guild_id", guildId.toString() },
                            { "user_id",  userId.toString()  },
                            { "role_id",  roleId.toString()  }
                        }), nullptr, {}, {}, reason);
    }

    void RestClient::kickMember(Snowflake guildId, Snowflake userId, const Reason& reason) {
        sendRestRequest(memberRoute("DELETE", "", guildId, userId), nullptr, {}, {}, reason);
    }

    nlohmann::json RestClient::getGuildBans(Snowflake guildId, unsigned limit, Snowflake before, Snowflake after) {
        checkMembersLimit(limit);

        REST::QueryParams query = {{ "limit", std::to_string(limit) }};
        if (before != 0) query.push_back({ "before", before.toString() });
        if (after  != 0) query.push_back({ "after",  after.toString()  });

        return sendRestRequest(guildRoute("GET", "/bans", guildId), nullptr, query);
    }

    nlohmann::json RestClient::getGuildBan(Snowflake guildId, Snowflake userId) {
        return sendRestRequest(Route("GET", "/guilds/:guild_id/bans/:user_id", {
                                   { "guild_id", guildId.toString() },
                                   { "user_id",  userId.toString()  }
                               }));
    }

    void RestClient::banMember(Snowflake guildId, Snowflake userId, unsigned deleteMessageDays,
                               const Reason& reason) {
        if (deleteMessageDays > 7) {
            throw InvalidParameter("deleteMessageDays", "deleteMessageDays out of range (should be 0-7).");
        }

        sendRestRequest(Route("PUT", "/guilds/:guild_id/bans/:user_id", {
                            { "guild_id", guildId.toString() },
                            { "user_id",  userId.toString()  }
                        }), nullptr,
                        {{ "delete_message_days", std::to_string(deleteMessageDays) }}, {}, reason);
    }

    void RestClient::unbanMember(Snowflake guildId, Snowflake userId, const Reason& reason) {
        sendRestRequest(Route("DELETE", "/guilds/:guild_id/bans/:user_id", {
                            { "guild_id", guildId.toString() },
                            { "user_id",  userId.toString()  }
                        }), nullptr, {}, {}, reason);
    }

    nlohmann::json RestClient::getGuildRoles(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/roles", guildId));
    }

    nlohmann::json RestClient::createGuildRole(Snowflake guildId, const nlohmann::json& fields,
                                               const Reason& reason) {
        nlohmann::json payload = fields.is_object() ? fields : nlohmann::json::object();
        return sendRestRequest(guildRoute("POST", "/roles", guildId), payload, {}, {}, reason);
    }

    nlohmann::json RestClient::modifyGuildRolePositions(Snowflake guildId, const nlohmann::json& positions,
                                                        const Reason& reason) {
        if (!positions.is_array() || positions.empty()) {
            throw InvalidParameter("positions", "positions should be non-empty array.");
        }
        return sendRestRequest(guildRoute("PATCH", "/roles", guildId), positions, {}, {}, reason);
    }

    nlohmann::json RestClient::modifyGuildRole(Snowflake guildId, Snowflake roleId,
                                               const nlohmann::json& changedFields, const Reason& reason) {
        if (!changedFields.is_object() || changedFields.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyGuildRole.");
        }
        return sendRestRequest(Route("PATCH", "/guilds/:guild_id/roles/:role_id", {
                                   { "guild_id", guildId.toString() },
                                   { "role_id",  roleId.toString()  }
                               }), changedFields, {}, {}, reason);
    }

    void RestClient::deleteGuildRole(Snowflake guildId, Snowflake roleId, const Reason& reason) {
        sendRestRequest(Route("DELETE", "/guilds/:guild_id/roles/:role_id", {
                            { "guild_id", guildId.toString() },
                            { "role_id",  roleId.toString()  }
                        }), nullptr, {}, {}, reason);
    }

    nlohmann::json RestClient::getGuildPruneCount(Snowflake guildId, unsigned days,
                                                  const std::vector<Snowflake>& includeRoles) {
        checkPruneDays(days);

        REST::QueryParams query = {{ "days", std::to_string(days) }};
        addIncludeRoles(query, includeRoles);

        return sendRestRequest(guildRoute("GET", "/prune", guildId), nullptr, query);
    }

    nlohmann::json RestClient::beginGuildPrune(Snowflake guildId, unsigned days, bool computePruneCount,
                                               const std::vector<Snowflake>& includeRoles,
                                               const Reason& reason) {
        checkPruneDays(days);

        REST::QueryParams query = {
            { "days",                std::to_string(days)          },
            { "compute_prune_count", boolString(computePruneCount) }
        };
        addIncludeRoles(query, includeRoles);

        return sendRestRequest(guildRoute("POST", "/prune", guildId), nullptr, query, {}, reason);
    }

    nlohmann::json RestClient::getGuildVoiceRegions(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/regions", guildId));
    }

    nlohmann::json RestClient::getGuildInvites(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/invites", guildId));
    }

    nlohmann::json RestClient::getGuildIntegrations(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/integrations", guildId));
    }

    void RestClient::deleteGuildIntegration(Snowflake guildId, Snowflake integrationId, const Reason& reason) {
        sendRestRequest(Route("DELETE", "/guilds/:guild_id/integrations/:integration_id", {
                            { "guild_id",       guildId.toString()       },
                            { "integration_id", integrationId.toString() }
                        }), nullptr, {}, {}, reason);
    }

    nlohmann::json RestClient::getGuildWidgetSettings(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/widget", guildId));
    }

    nlohmann::json RestClient::modifyGuildWidget(Snowflake guildId, boost::optional<bool> enabled,
                                                 boost::optional<Snowflake> channelId, const Reason& reason) {
        nlohmann::json payload = nlohmann::json::object();
        if (enabled) payload["enabled"] = *enabled;
        if (channelId) {
            if (*channelId == 0) payload["channel_id"] = nullptr;
            else                 payload["channel_id"] = *channelId;
        }
        if (payload.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyGuildWidget.");
        }

        return sendRestRequest(guildRoute("PATCH", "/widget", guildId), payload, {}, {}, reason);
    }

    nlohmann::json RestClient::getGuildWidget(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/widget.json", guildId));
    }

    nlohmann::json RestClient::getGuildVanityUrl(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/vanity-url", guildId));
    }

    nlohmann::json RestClient::getGuildWelcomeScreen(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/welcome-screen", guildId));
    }

    nlohmann::json RestClient::modifyGuildWelcomeScreen(Snowflake guildId, const nlohmann::json& changedFields,
                                                        const Reason& reason) {
        if (!changedFields.is_object() || changedFields.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyGuildWelcomeScreen.");
        }
        auto channelsIt = changedFields.find("welcome_channels");
        if (channelsIt != changedFields.end() && channelsIt->is_array() && channelsIt->size() > 5) {
            throw InvalidParameter("welcome_channels", "too many welcome channels (should be 0-5).");
        }

        return sendRestRequest(guildRoute("PATCH", "/welcome-screen", guildId), changedFields, {}, {}, reason);
    }

    nlohmann::json RestClient::getGuildMembershipScreening(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/member-verification", guildId));
    }

    nlohmann::json RestClient::modifyGuildMembershipScreening(Snowflake guildId,
                                                              const nlohmann::json& changedFields) {
        if (!changedFields.is_object() || changedFields.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyGuildMembershipScreening.");
        }
        return sendRestRequest(guildRoute("PATCH", "/member-verification", guildId), changedFields);
    }

    nlohmann::json RestClient::getGuildTemplate(const std::string& templateCode) {
        if (templateCode.empty()) {
            throw InvalidParameter("templateCode", "templateCode must not be empty.");
        }
        return sendRestRequest(Route("GET", "/guilds/templates/:template_code",
                                     {{ "template_code", templateCode }}));
    }

    nlohmann::json RestClient::getGuildTemplates(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/templates", guildId));
    }

    nlohmann::json RestClient::createGuildTemplate(Snowflake guildId, const std::string& name,
                                                   const boost::optional<std::string>& description) {
        if (name.empty() || Utils::utf8Length(name) > 100) {
            throw InvalidParameter("name", "name size out of range (should be 1-100).");
        }
        if (description && Utils::utf8Length(*description) > 120) {
            throw InvalidParameter("description", "description size out of range (should be 0-120).");
        }

        nlohmann::json payload = {{ "name", name }};
        if (description) payload["description"] = *description;

        return sendRestRequest(guildRoute("POST", "/templates", guildId), payload);
    }

    nlohmann::json RestClient::syncGuildTemplate(Snowflake guildId, const std::string& templateCode) {
        return sendRestRequest(templateRoute("PUT", guildId, templateCode));
    }

    nlohmann::json RestClient::modifyGuildTemplate(Snowflake guildId, const std::string& templateCode,
                                                   const boost::optional<std::string>& name,
                                                   const boost::optional<std::string>& description) {
        nlohmann::json payload = nlohmann::json::object();
        if (name) {
            if (name->empty() || Utils::utf8Length(*name) > 100) {
                throw InvalidParameter("name", "name size out of range (should be 1-100).");
            }
            payload["name"] = *name;
        }
        if (description) {
            if (Utils::utf8Length(*description) > 120) {
                throw InvalidParameter("description", "description size out of range (should be 0-120).");
            }
            payload["description"] = *description;
        }
        if (payload.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyGuildTemplate.");
        }

        return sendRestRequest(templateRoute("PATCH", guildId, templateCode), payload);
    }

    nlohmann::json RestClient::deleteGuildTemplate(Snowflake guildId, const std::string& templateCode) {
        return sendRestRequest(templateRoute("DELETE", guildId, templateCode));
    }

    void RestClient::modifyCurrentUserVoiceState(Snowflake guildId, Snowflake channelId,
                                                 boost::optional<bool> suppress,
                                                 const boost::optional<std::string>& requestToSpeakTimestamp) {
        nlohmann::json payload = {{ "channel_id", channelId }};
        if (suppress) payload["suppress"] = *suppress;
        if (requestToSpeakTimestamp) {
            if (requestToSpeakTimestamp->empty()) payload["request_to_speak_timestamp"] = nullptr;
            else                                  payload["request_to_speak_timestamp"] = *requestToSpeakTimestamp;
        }

        sendRestRequest(guildRoute("PATCH", "/voice-states/@me", guildId), payload);
    }

    void RestClient::modifyUserVoiceState(Snowflake guildId, Snowflake userId, Snowflake channelId,
                                          boost::optional<bool> suppress) {
        nlohmann::json payload = {{ "channel_id", channelId }};
        if (suppress) payload["suppress"] = *suppress;

        sendRestRequest(Route("PATCH", "/guilds/:guild_id/voice-states/:user_id", {
                            { "guild_id", guildId.toString() },
                            { "user_id",  userId.toString()  }
                        }), payload);
    }

    nlohmann::json RestClient::listGuildEmojis(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/emojis", guildId));
    }

    nlohmann::json RestClient::getGuildEmoji(Snowflake guildId, Snowflake emojiId) {
        return sendRestRequest(Route("GET", "/guilds/:guild_id/emojis/:emoji_id", {
                                   { "guild_id", guildId.toString() },
                                   { "emoji_id", emojiId.toString() }
                               }));
    }

    nlohmann::json RestClient::createGuildEmoji(Snowflake guildId, const std::string& name, const Image& image,
                                                const std::vector<Snowflake>& roles, const Reason& reason) {
        if (Utils::utf8Length(name) < 2 || Utils::utf8Length(name) > 32) {
            throw InvalidParameter("name", "name size out of range (should be 2-32).");
        }
        if (image.file.bytes.size() > 256 * 1024) {
            throw InvalidParameter("image", "emoji image is larger than 256 KiB.");
        }

        return sendRestRequest(guildRoute("POST", "/emojis", guildId), {
                                   { "name",  name                },
                                   { "image", image.toDataUri()   },
                                   { "roles", rolesToJson(roles)  }
                               }, {}, {}, reason);
    }

    nlohmann::json RestClient::modifyGuildEmoji(Snowflake guildId, Snowflake emojiId,
                                                const boost::optional<std::string>& name,
                                                const boost::optional<std::vector<Snowflake> >& roles,
                                                const Reason& reason) {
        nlohmann::json payload = nlohmann::json::object();
        if (name) {
            if (Utils::utf8Length(*name) < 2 || Utils::utf8Length(*name) > 32) {
                throw InvalidParameter("name", "name size out of range (should be 2-32).");
            }
            payload["name"] = *name;
        }
        if (roles) payload["roles"] = rolesToJson(*roles);
        if (payload.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyGuildEmoji.");
        }

        return sendRestRequest(Route("PATCH", "/guilds/:guild_id/emojis/:emoji_id", {
                                   { "guild_id", guildId.toString() },
                                   { "emoji_id", emojiId.toString() }
                               }), payload, {}, {}, reason);
    }

    void RestClient::deleteGuildEmoji(Snowflake guildId, Snowflake emojiId, const Reason& reason) {
        sendRestRequest(Route("DELETE", "/guilds/:guild_id/emojis/:emoji_id", {
                            { "guild_id", guildId.toString() },
                            { "emoji_id", emojiId.toString() }
                        }), nullptr, {}, {}, reason);
    }

    nlohmann::json RestClient::getSticker(Snowflake stickerId) {
        return sendRestRequest(Route("GET", "/stickers/:sticker_id", {{ "sticker_id", stickerId.toString() }}));
    }

    nlohmann::json RestClient::listStickerPacks() {
        return sendRestRequest(Route("GET", "/sticker-packs"));
    }

    nlohmann::json RestClient::listGuildStickers(Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/stickers", guildId));
    }

    nlohmann::json RestClient::getGuildSticker(Snowflake guildId, Snowflake stickerId) {
        return sendRestRequest(Route("GET", "/guilds/:guild_id/stickers/:sticker_id", {
                                   { "guild_id",   guildId.toString()   },
                                   { "sticker_id", stickerId.toString() }
                               }));
    }

    nlohmann::json RestClient::createGuildSticker(Snowflake guildId, const std::string& name,
                                                  const std::string& description, const std::string& tags,
                                                  const File& file, const Reason& reason) {
        if (Utils::utf8Length(name) < 2 || Utils::utf8Length(name) > 30) {
            throw InvalidParameter("name", "name size out of range (should be 2-30).");
        }
        if (!description.empty() && (Utils::utf8Length(description) < 2 || Utils::utf8Length(description) > 100)) {
            throw InvalidParameter("description", "description size out of range (should be empty or 2-100).");
        }
        if (tags.empty() || Utils::utf8Length(tags) > 200) {
            throw InvalidParameter("tags", "tags size out of range (should be 1-200).");
        }
        if (file.bytes.size() > 512 * 1024) {
            throw InvalidParameter("file", "sticker file is larger than 512 KiB.");
        }

        auto textEntity = [](const std::string& field, const std::string& value) {
            return REST::MultipartEntity{ field, "", {}, std::vector<uint8_t>(value.begin(), value.end()) };
        };

        // Sticker upload is plain form, not payload_json.
        return sendRestRequest(guildRoute("POST", "/stickers", guildId), nullptr, {}, {
                                   textEntity("name", name),
                                   textEntity("description", description),
                                   textEntity("tags", tags),
                                   fileToMultipartEntity(file, "file")
                               }, reason);
    }

    nlohmann::json RestClient::modifyGuildSticker(Snowflake guildId, Snowflake stickerId,
                                                  const boost::optional<std::string>& name,
                                                  const boost::optional<std::string>& description,
                                                  const boost::optional<std::string>& tags,
                                                  const Reason& reason) {
        nlohmann::json payload = nlohmann::json::object();
        if (name) {
            if (Utils::utf8Length(*name) < 2 || Utils::utf8Length(*name) > 30) {
                throw InvalidParameter("name", "name size out of range (should be 2-30).");
            }
            payload["name"] = *name;
        }
        if (description) {
            if (!description->empty() && (Utils::utf8Length(*description) < 2 || Utils::utf8Length(*description) > 100)) {
                throw InvalidParameter("description", "description size out of range (should be empty or 2-100).");
            }
            payload["description"] = *description;
        }
        if (tags) {
            if (Utils::utf8Length(*tags) > 200) {
                throw InvalidParameter("tags", "tags size out of range (should be 0-200).");
            }
            payload["tags"] = *tags;
        }
        if (payload.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyGuildSticker.");
        }

        return sendRestRequest(Route("PATCH", "/guilds/:guild_id/stickers/:sticker_id", {
                                   { "guild_id",   guildId.toString()   },
                                   { "sticker_id", stickerId.toString() }
                               }), payload, {}, {}, reason);
    }

    void RestClient::deleteGuildSticker(Snowflake guildId, Snowflake stickerId, const Reason& reason) {
        sendRestRequest(Route("DELETE", "/guilds/:guild_id/stickers/:sticker_id", {
                            { "guild_id",   guildId.toString()   },
                            { "sticker_id", stickerId.toString() }
                        }), nullptr, {}, {}, reason);
    }

    nlohmann::json RestClient::listScheduledEvents(Snowflake guildId, bool withUserCounts) {
        return sendRestRequest(guildRoute("GET", "/scheduled-events", guildId), nullptr,
                               {{ "with_user_count", boolString(withUserCounts) }});
    }

    nlohmann::json RestClient::createScheduledEvent(Snowflake guildId, const nlohmann::json& event,
                                                    const Reason& reason) {
        if (!event.is_object()) {
            throw InvalidParameter("event", "event should be object.");
        }
        for (const char* required : { "name", "privacy_level", "scheduled_start_time", "entity_type" }) {
            if (event.find(required) == event.end()) {
                throw InvalidParameter(required, "required field is missing.");
            }
        }
        auto nameIt = event.find("name");
        if (nameIt->is_string() && (nameIt->get<std::string>().empty() ||
                                    Utils::utf8Length(nameIt->get<std::string>()) > 100)) {
            throw InvalidParameter("name", "name size out of range (should be 1-100).");
        }

        return sendRestRequest(guildRoute("POST", "/scheduled-events", guildId), event, {}, {}, reason);
    }

    nlohmann::json RestClient::getScheduledEvent(Snowflake guildId, Snowflake eventId, bool withUserCounts) {
        return sendRestRequest(Route("GET", "/guilds/:guild_id/scheduled-events/:event_id", {
                                   { "guild_id", guildId.toString() },
                                   { "event_id", eventId.toString() }
                               }), nullptr,
                               {{ "with_user_count", boolString(withUserCounts) }});
    }

    nlohmann::json RestClient::modifyScheduledEvent(Snowflake guildId, Snowflake eventId,
                                                    const nlohmann::json& changedFields, const Reason& reason) {
        if (!changedFields.is_object() || changedFields.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyScheduledEvent.");
        }
        return sendRestRequest(Route("PATCH", "/guilds/:guild_id/scheduled-events/:event_id", {
                                   { "guild_id", guildId.toString() },
                                   { "event_id", eventId.toString() }
                               }), changedFields, {}, {}, reason);
    }

    void RestClient::deleteScheduledEvent(Snowflake guildId, Snowflake eventId) {
        sendRestRequest(Route("DELETE", "/guilds/:guild_id/scheduled-events/:event_id", {
                            { "guild_id", guildId.toString() },
                            { "event_id", eventId.toString() }
                        }));
    }

    nlohmann::json RestClient::getScheduledEventUsers(Snowflake guildId, Snowflake eventId, unsigned limit,
                                                      bool withMember, Snowflake before, Snowflake after) {
        if (limit == 0 || limit > 100) {
            throw InvalidParameter("limit", "limit out of range (should be 1-100).");
        }

        REST::QueryParams query = {
            { "limit",       std::to_string(limit)  },
            { "with_member", boolString(withMember) }
        };
        if (before != 0) query.push_back({ "before", before.toString() });
        if (after  != 0) query.push_back({ "after",  after.toString()  });

        return sendRestRequest(Route("GET", "/guilds/:guild_id/scheduled-events/:event_id/users", {
                                   { "guild_id", guildId.toString() },
                                   { "event_id", eventId.toString() }
                               }), nullptr, query);
    }

    nlohmann::json RestClient::createStageInstance(Snowflake channelId, const std::string& topic,
                                                   StagePrivacyLevel privacyLevel, bool sendStartNotification,
                                                   const Reason& reason) {
        if (topic.empty() || Utils::utf8Length(topic) > 120) {
            throw InvalidParameter("topic", "topic size out of range (should be 1-120).");
        }

        return sendRestRequest(Route("POST", "/stage-instances"), {
                                   { "channel_id",              channelId                        },
                                   { "topic",                   topic                            },
                                   { "privacy_level",           static_cast<int>(privacyLevel)   },
                                   { "send_start_notification", sendStartNotification            }
                               }, {}, {}, reason);
    }

    nlohmann::json RestClient::getStageInstance(Snowflake channelId) {
        return sendRestRequest(Route("GET", "/stage-instances/:channel_id", {{ "channel_id", channelId.toString() }}));
    }

    nlohmann::json RestClient::modifyStageInstance(Snowflake channelId, const boost::optional<std::string>& topic,
                                                   boost::optional<StagePrivacyLevel> privacyLevel,
                                                   const Reason& reason) {
        nlohmann::json payload = nlohmann::json::object();
        if (topic) {
            if (topic->empty() || Utils::utf8Length(*topic) > 120) {
                throw InvalidParameter("topic", "topic size out of range (should be 1-120).");
            }
            payload["topic"] = *topic;
        }
        if (privacyLevel) payload["privacy_level"] = static_cast<int>(*privacyLevel);
        if (payload.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyStageInstance.");
        }

        return sendRestRequest(Route("PATCH", "/stage-instances/:channel_id", {{ "channel_id", channelId.toString() }}),
                               payload, {}, {}, reason);
    }

    void RestClient::deleteStageInstance(Snowflake channelId, const Reason& reason) {
        sendRestRequest(Route("DELETE", "/stage-instances/:channel_id", {{ "channel_id", channelId.toString() }}),
                        nullptr, {}, {}, reason);
    }
} // namespace Harmonia
