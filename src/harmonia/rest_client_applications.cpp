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
        void checkCommand(const nlohmann::json& command, bool creating) {
            if (!command.is_object()) {
                throw InvalidParameter("command", "command should be object.");
            }

            auto nameIt = command.find("name");
            if (nameIt == command.end()) {
                if (creating) throw InvalidParameter("name", "command name is required.");
            } else if (!nameIt->is_string() || nameIt->get<std::string>().empty() ||
                       Utils::utf8Length(nameIt->get<std::string>()) > 32) {
                throw InvalidParameter("name", "name size out of range (should be 1-32).");
            }

            auto descriptionIt = command.find("description");
            if (descriptionIt != command.end() && descriptionIt->is_string() &&
                Utils::utf8Length(descriptionIt->get<std::string>()) > 100) {
                throw InvalidParameter("description", "description size out of range (should be 0-100).");
            }

            auto optionsIt = command.find("options");
            if (optionsIt != command.end() && optionsIt->is_array() && optionsIt->size() > 25) {
                throw InvalidParameter("options", "too many options (should be 0-25).");
            }
        }

        void checkCommandList(const nlohmann::json& commands) {
            if (!commands.is_array()) {
                throw InvalidParameter("commands", "commands should be array.");
            }
            for (const auto& command : commands) checkCommand(command, true);
        }

        REST::QueryParams localizationsQuery(bool withLocalizations) {
            return {{ "with_localizations", withLocalizations ? "true" : "false" }};
        }

        Route globalRoute(const std::string& method, Snowflake applicationId) {
            return Route(method, "/applications/:application_id/commands",
                         {{ "application_id", applicationId.toString() }});
        }

        Route globalCommandRoute(const std::string& method, Snowflake applicationId, Snowflake commandId) {
            return Route(method, "/applications/:application_id/commands/:command_id", {
                { "application_id", applicationId.toString() },
                { "command_id",     commandId.toString()     }
            });
        }

        Route guildRoute(const std::string& method, const std::string& suffix,
                         Snowflake applicationId, Snowflake guildId) {
            return Route(method, "/applications/:application_id/guilds/:guild_id/commands" + suffix, {
                { "application_id", applicationId.toString() },
                { "guild_id",       guildId.toString()       }
            });
        }

        Route guildCommandRoute(const std::string& method, const std::string& suffix,
                                Snowflake applicationId, Snowflake guildId, Snowflake commandId) {
            return Route(method, "/applications/:application_id/guilds/:guild_id/commands/:command_id" + suffix, {
                { "application_id", applicationId.toString() },
                { "guild_id",       guildId.toString()       },
                { "command_id",     commandId.toString()     }
            });
        }
    } // namespace

    nlohmann::json RestClient::getGlobalApplicationCommands(Snowflake applicationId, bool withLocalizations) {
        return sendRestRequest(globalRoute("GET", applicationId), nullptr, localizationsQuery(withLocalizations));
    }

    nlohmann::json RestClient::createGlobalApplicationCommand(Snowflake applicationId, const nlohmann::json& command) {
        checkCommand(command, true);
        return sendRestRequest(globalRoute("POST", applicationId), command);
    }

    nlohmann::json RestClient::getGlobalApplicationCommand(Snowflake applicationId, Snowflake commandId) {
        return sendRestRequest(globalCommandRoute("GET", applicationId, commandId));
    }

    nlohmann::json RestClient::editGlobalApplicationCommand(Snowflake applicationId, Snowflake commandId,
                                                            const nlohmann::json& changedFields) {
        checkCommand(changedFields, false);
        return sendRestRequest(globalCommandRoute("PATCH", applicationId, commandId), changedFields);
    }

    void RestClient::deleteGlobalApplicationCommand(Snowflake applicationId, Snowflake commandId) {
        sendRestRequest(globalCommandRoute("DELETE", applicationId, commandId));
    }

    nlohmann::json RestClient::bulkOverwriteGlobalApplicationCommands(Snowflake applicationId,
                                                                      const nlohmann::json& commands) {
        checkCommandList(commands);
        return sendRestRequest(globalRoute("PUT", applicationId), commands);
    }

    nlohmann::json RestClient::getGuildApplicationCommands(Snowflake applicationId, Snowflake guildId,
                                                           bool withLocalizations) {
        return sendRestRequest(guildRoute("GET", "", applicationId, guildId), nullptr,
                               localizationsQuery(withLocalizations));
    }

    nlohmann::json RestClient::createGuildApplicationCommand(Snowflake applicationId, Snowflake guildId,
                                                             const nlohmann::json& command) {
        checkCommand(command, true);
        return sendRestRequest(guildRoute("POST", "", applicationId, guildId), command);
    }

    nlohmann::json RestClient::getGuildApplicationCommand(Snowflake applicationId, Snowflake guildId,
                                                          Snowflake commandId) {
        return sendRestRequest(guildCommandRoute("GET", "", applicationId, guildId, commandId));
    }

    nlohmann::json RestClient::editGuildApplicationCommand(Snowflake applicationId, Snowflake guildId,
                                                           Snowflake commandId, const nlohmann::json& changedFields) {
        checkCommand(changedFields, false);
        return sendRestRequest(guildCommandRoute("PATCH", "", applicationId, guildId, commandId), changedFields);
    }

    void RestClient::deleteGuildApplicationCommand(Snowflake applicationId, Snowflake guildId, Snowflake commandId) {
        sendRestRequest(guildCommandRoute("DELETE", "", applicationId, guildId, commandId));
    }

    nlohmann::json RestClient::bulkOverwriteGuildApplicationCommands(Snowflake applicationId, Snowflake guildId,
                                                                     const nlohmann::json& commands) {
        checkCommandList(commands);
        return sendRestRequest(guildRoute("PUT", "", applicationId, guildId), commands);
    }

    nlohmann::json RestClient::getGuildApplicationCommandPermissions(Snowflake applicationId, Snowflake guildId) {
        return sendRestRequest(guildRoute("GET", "/permissions", applicationId, guildId));
    }

    nlohmann::json RestClient::getApplicationCommandPermissions(Snowflake applicationId, Snowflake guildId,
                                                                Snowflake commandId) {
        return sendRestRequest(guildCommandRoute("GET", "/permissions", applicationId, guildId, commandId));
    }

    nlohmann::json RestClient::editApplicationCommandPermissions(Snowflake applicationId, Snowflake guildId,
                                                                 Snowflake commandId,
                                                                 const nlohmann::json& permissions) {
        if (!permissions.is_array() || permissions.size() > 100) {
            throw InvalidParameter("permissions", "permissions should be array of 0-100 elements.");
        }

        return sendRestRequest(guildCommandRoute("PUT", "/permissions", applicationId, guildId, commandId),
                               {{ "permissions", permissions }});
    }

    nlohmann::json RestClient::batchEditApplicationCommandPermissions(Snowflake applicationId, Snowflake guildId,
                                                                      const nlohmann::json& permissions) {
        if (!permissions.is_array()) {
            throw InvalidParameter("permissions", "permissions should be array.");
        }
        return sendRestRequest(guildRoute("PUT", "/permissions", applicationId, guildId), permissions);
    }

    nlohmann::json RestClient::getCurrentApplication() {
        return sendRestRequest(Route("GET", "/oauth2/applications/@me"));
    }

    nlohmann::json RestClient::getApplication(Snowflake applicationId) {
        return sendRestRequest(Route("GET", "/applications/:application_id/rpc",
                                     {{ "application_id", applicationId.toString() }}));
    }

    nlohmann::json RestClient::getApplicationAssets(Snowflake applicationId) {
        return sendRestRequest(Route("GET", "/oauth2/applications/:application_id/assets",
                                     {{ "application_id", applicationId.toString() }}));
    }
} // namespace Harmonia
