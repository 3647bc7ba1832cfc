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
        void checkUsername(const std::string& username) {
            if (Utils::utf8Length(username) < 2 || Utils::utf8Length(username) > 32) {
                throw InvalidParameter("username", "username size out of range (should be 2-32).");
            }
            if (username.find_first_of("@#:") != std::string::npos || username.find("```") != std::string::npos) {
                throw InvalidParameter("username", "username contains forbidden substring: '@', '#', ':' or '```'.");
            }
            if (username == "discordtag" || username == "everyone" || username == "here") {
                throw InvalidParameter("username", "username is forbidden: 'discordtag', 'everyone' or 'here'.");
            }
        }
    } // namespace

    nlohmann::json RestClient::getCurrentUser() {
        return sendRestRequest(Route("GET", "/users/@me"));
    }

    nlohmann::json RestClient::getUser(Snowflake userId) {
        return sendRestRequest(Route("GET", "/users/:user_id", {{ "user_id", userId.toString() }}));
    }

    nlohmann::json RestClient::modifyCurrentUser(const boost::optional<std::string>& username,
                                                 const boost::optional<Image>& avatar) {
        nlohmann::json payload = nlohmann::json::object();
        if (username) {
            checkUsername(*username);
            payload["username"] = *username;
        }
        if (avatar) {
            payload["avatar"] = avatar->toDataUri();
        }
        if (payload.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyCurrentUser.");
        }

        return sendRestRequest(Route("PATCH", "/users/@me"), payload);
    }

    nlohmann::json RestClient::getCurrentUserGuilds(unsigned limit, Snowflake before, Snowflake after,
                                                    bool withCounts) {
        if (limit == 0 || limit > 200) {
            throw InvalidParameter("limit", "limit out of range (should be 1-200).");
        }

        REST::QueryParams query = {{ "limit", std::to_string(limit) }};
        if (before != 0) query.push_back({ "before", before.toString() });
        if (after  != 0) query.push_back({ "after",  after.toString()  });
        if (withCounts)  query.push_back({ "with_counts", "true" });

        return sendRestRequest(Route("GET", "/users/@me/guilds"), nullptr, query);
    }

    nlohmann::json RestClient::getCurrentUserGuildMember(Snowflake guildId) {
        return sendRestRequest(Route("GET", "/users/@me/guilds/:guild_id/member",
                                     {{ "guild_id", guildId.toString() }}));
    }

    void RestClient::leaveGuild(Snowflake guildId) {
        sendRestRequest(Route("DELETE", "/users/@me/guilds/:guild_id", {{ "guild_id", guildId.toString() }}));
    }

    nlohmann::json RestClient::getUserDms() {
        return sendRestRequest(Route("GET", "/users/@me/channels"));
    }

    nlohmann::json RestClient::createDm(Snowflake recipientId) {
        return sendRestRequest(Route("POST", "/users/@me/channels"), {{ "recipient_id", recipientId }});
    }

    nlohmann::json RestClient::createGroupDm(const std::vector<std::string>& accessTokens,
                                             const std::map<Snowflake, std::string>& nicks) {
        if (accessTokens.empty()) {
            throw InvalidParameter("accessTokens", "at least one access token required.");
        }

        nlohmann::json nicksJson = nlohmann::json::object();
        for (const auto& nick : nicks) {
            nicksJson[nick.first.toString()] = nick.second;
        }

        return sendRestRequest(Route("POST", "/users/@me/channels"), {
                                   { "access_tokens", accessTokens },
                                   { "nicks",         nicksJson    }
                               });
    }

    nlohmann::json RestClient::getUserConnections() {
        return sendRestRequest(Route("GET", "/users/@me/connections"));
    }

    nlohmann::json RestClient::listVoiceRegions() {
        return sendRestRequest(Route("GET", "/voice/regions"));
    }

    nlohmann::json RestClient::getInvite(const std::string& inviteCode, bool withCounts, bool withExpiration,
                                         boost::optional<Snowflake> scheduledEventId) {
        if (inviteCode.empty()) {
            throw InvalidParameter("inviteCode", "inviteCode must not be empty.");
        }

        REST::QueryParams query = {
            { "with_counts",     withCounts     ? "true" : "false" },
            { "with_expiration", withExpiration ? "true" : "false" }
        };
        if (scheduledEventId) query.push_back({ "guild_scheduled_event_id", scheduledEventId->toString() });

        return sendRestRequest(Route("GET", "/invites/:invite_code", {{ "invite_code", inviteCode }}),
                               nullptr, query);
    }

    nlohmann::json RestClient::deleteInvite(const std::string& inviteCode, const Reason& reason) {
        if (inviteCode.empty()) {
            throw InvalidParameter("inviteCode", "inviteCode must not be empty.");
        }

        return sendRestRequest(Route("DELETE", "/invites/:invite_code", {{ "invite_code", inviteCode }}),
                               nullptr, {}, {}, reason);
    }
} // namespace Harmonia
