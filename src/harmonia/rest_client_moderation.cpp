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
        Route ruleRoute(const std::string& method, Snowflake guildId, Snowflake ruleId) {
            return Route(method, "/guilds/:guild_id/auto-moderation/rules/:rule_id", {
                { "guild_id", guildId.toString() },
                { "rule_id",  ruleId.toString()  }
            });
        }

        void checkRuleName(const nlohmann::json& rule) {
            auto nameIt = rule.find("name");
            if (nameIt != rule.end() && (!nameIt->is_string() || nameIt->get<std::string>().empty() ||
                                         Utils::utf8Length(nameIt->get<std::string>()) > 100)) {
                throw InvalidParameter("name", "name size out of range (should be 1-100).");
            }
        }
    } // namespace

    nlohmann::json RestClient::listAutoModerationRules(Snowflake guildId) {
        return sendRestRequest(Route("GET", "/guilds/:guild_id/auto-moderation/rules",
                                     {{ "guild_id", guildId.toString() }}));
    }

    nlohmann::json RestClient::getAutoModerationRule(Snowflake guildId, Snowflake ruleId) {
        return sendRestRequest(ruleRoute("GET", guildId, ruleId));
    }

    nlohmann::json RestClient::createAutoModerationRule(Snowflake guildId, const nlohmann::json& rule,
                                                        const Reason& reason) {
        if (!rule.is_object()) {
            throw InvalidParameter("rule", "rule should be object.");
        }
        for (const char* required : { "name", "event_type", "trigger_type", "actions" }) {
            if (rule.find(required) == rule.end()) {
                throw InvalidParameter(required, "required field is missing.");
            }
        }
        checkRuleName(rule);

        return sendRestRequest(Route("POST", "/guilds/:guild_id/auto-moderation/rules",
                                     {{ "guild_id", guildId.toString() }}),
                               rule, {}, {}, reason);
    }

    nlohmann::json RestClient::modifyAutoModerationRule(Snowflake guildId, Snowflake ruleId,
                                                        const nlohmann::json& changedFields,
                                                        const Reason& reason) {
        if (!changedFields.is_object() || changedFields.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyAutoModerationRule.");
        }
        checkRuleName(changedFields);

        return sendRestRequest(ruleRoute("PATCH", guildId, ruleId), changedFields, {}, {}, reason);
    }

    void RestClient::deleteAutoModerationRule(Snowflake guildId, Snowflake ruleId, const Reason& reason) {
        sendRestRequest(ruleRoute("DELETE", guildId, ruleId), nullptr, {}, {}, reason);
    }

    nlohmann::json RestClient::getAuditLog(Snowflake guildId, Snowflake userId, boost::optional<int> actionType,
                                           Snowflake before, Snowflake after, unsigned limit) {
        if (limit == 0 || limit > 100) {
            throw InvalidParameter("limit", "limit out of range (should be 1-100).");
        }

        REST::QueryParams query;
        if (userId != 0)  query.push_back({ "user_id",     userId.toString()             });
        if (actionType)   query.push_back({ "action_type", std::to_string(*actionType)   });
        if (before != 0)  query.push_back({ "before",      before.toString()             });
        if (after  != 0)  query.push_back({ "after",       after.toString()              });
        query.push_back({ "limit", std::to_string(limit) });

        return sendRestRequest(Route("GET", "/guilds/:guild_id/audit-logs", {{ "guild_id", guildId.toString() }}),
                               nullptr, query);
    }
} // namespace Harmonia
