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
#include <algorithm>
#include <cctype>
#include <harmonia/exceptions.hpp>
#include <harmonia/internal/utils.hpp>

namespace Harmonia {
    namespace {
        void checkWebhookName(const std::string& name) {
            if (name.empty() || Utils::utf8Length(name) > 80) {
                throw InvalidParameter("name", "name size out of range (should be 1-80).");
            }

            std::string lowered(name);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](char ch) {
                return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            });
            if (lowered.find("clyde") != std::string::npos) {
                throw InvalidParameter("name", "name must not contain 'clyde'.");
            }
        }

        Route webhookRoute(const std::string& method, Snowflake webhookId) {
            return Route(method, "/webhooks/:webhook_id", {{ "webhook_id", webhookId.toString() }});
        }

        Route tokenRoute(const std::string& method, const std::string& suffix,
                         Snowflake webhookId, const std::string& webhookToken) {
            if (webhookToken.empty()) {
                throw InvalidParameter("webhookToken", "webhookToken must not be empty.");
            }
            return Route(method, "/webhooks/:webhook_id/:webhook_token" + suffix, {
                { "webhook_id",    webhookId.toString() },
                { "webhook_token", webhookToken         }
            });
        }

        Route webhookMessageRoute(const std::string& method, Snowflake webhookId,
                                  const std::string& webhookToken, Snowflake messageId) {
            if (webhookToken.empty()) {
                throw InvalidParameter("webhookToken", "webhookToken must not be empty.");
            }
            return Route(method, "/webhooks/:webhook_id/:webhook_token/messages/:message_id", {
                { "webhook_id",    webhookId.toString() },
                { "webhook_token", webhookToken         },
                { "message_id",    messageId.toString() }
            });
        }

        REST::QueryParams threadQuery(const boost::optional<Snowflake>& threadId) {
            REST::QueryParams query;
            if (threadId) query.push_back({ "thread_id", threadId->toString() });
            return query;
        }

        REST::QueryParams executeQuery(const boost::optional<Snowflake>& threadId, bool wait) {
            REST::QueryParams query = {{ "wait", wait ? "true" : "false" }};
            if (threadId) query.push_back({ "thread_id", threadId->toString() });
            return query;
        }
    } // namespace

    nlohmann::json RestClient::createWebhook(Snowflake channelId, const std::string& name,
                                             const boost::optional<Image>& avatar, const Reason& reason) {
        checkWebhookName(name);

        nlohmann::json payload = {{ "name", name }};
        if (avatar) payload["avatar"] = avatar->toDataUri();

        return sendRestRequest(Route("POST", "/channels/:channel_id/webhooks", {{ "channel_id", channelId.toString() }}),
                               payload, {}, {}, reason);
    }

    nlohmann::json RestClient::getChannelWebhooks(Snowflake channelId) {
        return sendRestRequest(Route("GET", "/channels/:channel_id/webhooks", {{ "channel_id", channelId.toString() }}));
    }

    nlohmann::json RestClient::getGuildWebhooks(Snowflake guildId) {
        return sendRestRequest(Route("GET", "/guilds/:guild_id/webhooks", {{ "guild_id", guildId.toString() }}));
    }

    nlohmann::json RestClient::getWebhook(Snowflake webhookId) {
        return sendRestRequest(webhookRoute("GET", webhookId));
    }

    nlohmann::json RestClient::getWebhookWithToken(Snowflake webhookId, const std::string& webhookToken) {
        return sendRestRequest(tokenRoute("GET", "", webhookId, webhookToken));
    }

    nlohmann::json RestClient::modifyWebhook(Snowflake webhookId, const boost::optional<std::string>& name,
                                             const boost::optional<Image>& avatar,
                                             boost::optional<Snowflake> channelId, const Reason& reason) {
        nlohmann::json payload = nlohmann::json::object();
        if (name) {
            checkWebhookName(*name);
            payload["name"] = *name;
        }
        if (avatar)    payload["avatar"]     = avatar->toDataUri();
        if (channelId) payload["channel_id"] = *channelId;
        if (payload.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyWebhook.");
        }

        return sendRestRequest(webhookRoute("PATCH", webhookId), payload, {}, {}, reason);
    }

    nlohmann::json RestClient::modifyWebhookWithToken(Snowflake webhookId, const std::string& webhookToken,
                                                      const boost::optional<std::string>& name,
                                                      const boost::optional<Image>& avatar) {
        nlohmann::json payload = nlohmann::json::object();
        if (name) {
            checkWebhookName(*name);
            payload["name"] = *name;
        }
        if (avatar) payload["avatar"] = avatar->toDataUri();
        if (payload.empty()) {
            throw InvalidParameter("", "No arguments passed to modifyWebhookWithToken.");
        }

        return sendRestRequest(tokenRoute("PATCH", "", webhookId, webhookToken), payload);
    }

    void RestClient::deleteWebhook(Snowflake webhookId, const Reason& reason) {
        sendRestRequest(webhookRoute("DELETE", webhookId), nullptr, {}, {}, reason);
    }

    void RestClient::deleteWebhookWithToken(Snowflake webhookId, const std::string& webhookToken) {
        sendRestRequest(tokenRoute("DELETE", "", webhookId, webhookToken));
    }

    nlohmann::json RestClient::executeWebhook(Snowflake webhookId, const std::string& webhookToken,
                                              const OutgoingMessage& message,
                                              const boost::optional<std::string>& username,
                                              const boost::optional<std::string>& avatarUrl,
                                              boost::optional<Snowflake> threadId, bool wait) {
        message.validate();
        if (username && (username->empty() || Utils::utf8Length(*username) > 80)) {
            throw InvalidParameter("username", "username size out of range (should be 1-80).");
        }

        nlohmann::json extraFields = nlohmann::json::object();
        if (username)  extraFields["username"]   = *username;
        if (avatarUrl) extraFields["avatar_url"] = *avatarUrl;

        return sendMessageRequest(tokenRoute("POST", "", webhookId, webhookToken), message,
                                  executeQuery(threadId, wait), extraFields);
    }

    nlohmann::json RestClient::executeSlackWebhook(Snowflake webhookId, const std::string& webhookToken,
                                                   const nlohmann::json& payload,
                                                   boost::optional<Snowflake> threadId, bool wait) {
        return sendRestRequest(tokenRoute("POST", "/slack", webhookId, webhookToken), payload,
                               executeQuery(threadId, wait));
    }

    nlohmann::json RestClient::executeGitHubWebhook(Snowflake webhookId, const std::string& webhookToken,
                                                    const nlohmann::json& payload,
                                                    boost::optional<Snowflake> threadId, bool wait) {
        return sendRestRequest(tokenRoute("POST", "/github", webhookId, webhookToken), payload,
                               executeQuery(threadId, wait));
    }

    nlohmann::json RestClient::getWebhookMessage(Snowflake webhookId, const std::string& webhookToken,
                                                 Snowflake messageId, boost::optional<Snowflake> threadId) {
        return sendRestRequest(webhookMessageRoute("GET", webhookId, webhookToken, messageId),
                               nullptr, threadQuery(threadId));
    }

    nlohmann::json RestClient::editWebhookMessage(Snowflake webhookId, const std::string& webhookToken,
                                                  Snowflake messageId, const OutgoingMessage& message,
                                                  boost::optional<Snowflake> threadId) {
        message.validate(true);
        return sendMessageRequest(webhookMessageRoute("PATCH", webhookId, webhookToken, messageId),
                                  message, threadQuery(threadId));
    }

    void RestClient::deleteWebhookMessage(Snowflake webhookId, const std::string& webhookToken,
                                          Snowflake messageId, boost::optional<Snowflake> threadId) {
        sendRestRequest(webhookMessageRoute("DELETE", webhookId, webhookToken, messageId),
                        nullptr, threadQuery(threadId));
    }

    void RestClient::createInteractionResponse(Snowflake interactionId, const std::string& interactionToken,
                                               InteractionResponseType type,
                                               const boost::optional<OutgoingMessage>& message) {
        if (interactionToken.empty()) {
            throw InvalidParameter("interactionToken", "interactionToken must not be empty.");
        }

        Route route("POST", "/interactions/:interaction_id/:interaction_token/callback", {
            { "interaction_id",    interactionId.toString() },
            { "interaction_token", interactionToken         }
        });

        if (!message) {
            sendRestRequest(route, {{ "type", static_cast<int>(type) }});
            return;
        }

        // Update responses change only fields that are set.
        message->validate(type == InteractionResponseType::UpdateMessage);

        std::vector<REST::MultipartEntity> multipart;
        for (size_t i = 0; i < message->files.size(); ++i) {
            multipart.push_back(fileToMultipartEntity(message->files[i], "files[" + std::to_string(i) + "]"));
        }

        sendRestRequest(route, {
                            { "type", static_cast<int>(type) },
                            { "data", message->toJson()      }
                        }, {}, multipart);
    }

    void RestClient::createInteractionResponse(Snowflake interactionId, const std::string& interactionToken,
                                               const nlohmann::json& response) {
        if (interactionToken.empty()) {
            throw InvalidParameter("interactionToken", "interactionToken must not be empty.");
        }
        if (!response.is_object() || response.find("type") == response.end()) {
            throw InvalidParameter("response", "response should be object with type.");
        }

        sendRestRequest(Route("POST", "/interactions/:interaction_id/:interaction_token/callback", {
                            { "interaction_id",    interactionId.toString() },
                            { "interaction_token", interactionToken         }
                        }), response);
    }

    nlohmann::json RestClient::getOriginalInteractionResponse(Snowflake applicationId,
                                                              const std::string& interactionToken) {
        return sendRestRequest(tokenRoute("GET", "/messages/@original", applicationId, interactionToken));
    }

    nlohmann::json RestClient::editOriginalInteractionResponse(Snowflake applicationId,
                                                               const std::string& interactionToken,
                                                               const OutgoingMessage& message) {
        message.validate(true);
        return sendMessageRequest(tokenRoute("PATCH", "/messages/@original", applicationId, interactionToken),
                                  message);
    }

    void RestClient::deleteOriginalInteractionResponse(Snowflake applicationId, const std::string& interactionToken) {
        sendRestRequest(tokenRoute("DELETE", "/messages/@original", applicationId, interactionToken));
    }

    nlohmann::json RestClient::createFollowupMessage(Snowflake applicationId, const std::string& interactionToken,
                                                     const OutgoingMessage& message) {
        message.validate();
        return sendMessageRequest(tokenRoute("POST", "", applicationId, interactionToken), message);
    }

    nlohmann::json RestClient::getFollowupMessage(Snowflake applicationId, const std::string& interactionToken,
                                                  Snowflake messageId) {
        return sendRestRequest(webhookMessageRoute("GET", applicationId, interactionToken, messageId));
    }

    nlohmann::json RestClient::editFollowupMessage(Snowflake applicationId, const std::string& interactionToken,
                                                   Snowflake messageId, const OutgoingMessage& message) {
        message.validate(true);
        return sendMessageRequest(webhookMessageRoute("PATCH", applicationId, interactionToken, messageId),
                                  message);
    }

    void RestClient::deleteFollowupMessage(Snowflake applicationId, const std::string& interactionToken,
                                           Snowflake messageId) {
        sendRestRequest(webhookMessageRoute("DELETE", applicationId, interactionToken, messageId));
    }
} // namespace Harmonia
