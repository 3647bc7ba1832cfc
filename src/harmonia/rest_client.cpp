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
#include <stdexcept>                                  // std::logic_error
#include <thread>                                     // std::this_thread::sleep_for
#include <boost/beast/http/error.hpp>                 // boost::beast::http::error::end_of_stream
#include <boost/asio/error.hpp>
#include <harmonia/exceptions.hpp>
#include <harmonia/internal/utils.hpp>                // Utils::makeQueryString, Utils::urlEncode

#if defined(HARMONIA_DEBUG_LOG)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr <<  "rest_client.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Harmonia {
    namespace {
        RatelimitLock::TimePoint realNow() {
            return RatelimitLock::Clock::now();
        }

        void realSleep(RatelimitLock::Clock::duration duration) {
            std::this_thread::sleep_for(duration);
        }

        bool isConnectionDrop(const boost::system::error_code& ec) {
            return ec == boost::beast::http::error::end_of_stream ||
                   ec == boost::asio::error::eof ||
                   ec == boost::asio::error::broken_pipe ||
                   ec == boost::asio::error::connection_reset;
        }

        // Walk nested "errors" object and find first {"_errors": [{"message": ...}]}.
        // Path is built from keys joined with dots, like "embeds.0.title".
        bool findFieldError(const nlohmann::json& node, const std::string& path,
                            std::string& outPath, std::string& outMessage) {
            if (!node.is_object()) return false;

            auto errorsIt = node.find("_errors");
            if (errorsIt != node.end() && errorsIt->is_array() && !errorsIt->empty()) {
                const nlohmann::json& first = (*errorsIt)[0];
                outPath = path;
                outMessage = first.is_object() ? first.value("message", std::string())
                                               : first.dump();
                return true;
            }

            for (auto it = node.begin(); it != node.end(); ++it) {
                if (it.key() == "_errors") continue;

                std::string childPath = path.empty() ? it.key() : path + "." + it.key();
                if (findFieldError(it.value(), childPath, outPath, outMessage)) return true;
            }
            return false;
        }
    } // namespace

    RestClient::RestClient(boost::asio::io_context& ioContext, const std::string& token, TokenType tokenType)
        : RestClient([&ioContext]() {
                         return std::unique_ptr<REST::HTTPConnection>(
                             new REST::HTTPSConnection(ioContext, "discord.com"));
                     }, token, tokenType) {}

    RestClient::RestClient(ConnectionFactory connectionFactory, const std::string& token, TokenType tokenType,
                           RatelimitLock::NowFunction now, RatelimitLock::SleepFunction sleep)
        : ratelimitLock(now ? now : RatelimitLock::NowFunction(realNow),
                        sleep ? sleep : RatelimitLock::SleepFunction(realSleep))
        , connectionFactory(std::move(connectionFactory))
        , restConnection(this->connectionFactory())
        , token_(token)
        , tokenType_(tokenType) {

        restConnection->connectionHeaders.insert({ "Authorization",
            std::string(tokenType == TokenType::Bot ? "Bot " : "Bearer ") + token });

        // Discord API requires "DiscordBot" user-agent for any connections
        // including non-bots.
        restConnection->connectionHeaders.insert({ "User-Agent", "DiscordBot (" HARMONIA_URL ", " HARMONIA_VERSION ")" });
    }

    std::string RestClient::restBasePath() {
        return std::string("/api/v") + std::to_string(HARMONIA_API_VERSION);
    }

    nlohmann::json RestClient::getGateway() {
        return sendRestRequest(Route("GET", "/gateway"));
    }

    nlohmann::json RestClient::getGatewayBot() {
        return sendRestRequest(Route("GET", "/gateway/bot"));
    }

    std::string RestClient::getGatewayUrl() {
        nlohmann::json response = getGateway();
        return response.at("url").get<std::string>();
    }

    std::pair<std::string, int> RestClient::getGatewayUrlBot() {
        nlohmann::json response = getGatewayBot();
        return { response.at("url").get<std::string>(), response.at("shards").get<int>() };
    }

    nlohmann::json RestClient::sendRestRequest(const std::string& method, const std::string& endpoint,
                                               const nlohmann::json& payload,
                                               const REST::QueryParams& query,
                                               const std::vector<REST::MultipartEntity>& multipart) {
        return sendRestRequest(Route(method, endpoint), payload, query, multipart);
    }

    nlohmann::json RestClient::sendRestRequest(const Route& route,
                                               const nlohmann::json& payload,
                                               const REST::QueryParams& query,
                                               const std::vector<REST::MultipartEntity>& multipart,
                                               const Reason& reason) {
        REST::HTTPRequest request;

        request.method  = route.method();
        request.path    = restBasePath() + route.path() + Utils::makeQueryString(query);
        request.version = 11;

        prepareRequestBody(request, payload, multipart);

        request.headers.insert({ "Accept", "application/json" });
        if (reason && !Utils::isBlank(*reason)) {
            request.headers.insert({ "X-Audit-Log-Reason", Utils::urlEncode(*reason) });
        }

        for (unsigned attempt = 0; ; ++attempt) {
            // Make sure we can do request without getting ratelimited.
            ratelimitLock.down(route);

            DEBUG_MSG(std::string("Sending REST request: ") + route.templateKey() + " " + payload.dump());
            REST::HTTPResponse response = performRequest(request);

            ratelimitLock.refreshInfo(route, response.headers);

            if (response.statusCode == 429) {
                nlohmann::json jsonResp = nlohmann::json::parse(response.body.begin(), response.body.end(),
                                                                 nullptr, false);
                double retryAfter = 0.0;
                bool global = false, retryAfterKnown = false;
                if (jsonResp.is_object()) {
                    auto retryIt = jsonResp.find("retry_after");
                    if (retryIt != jsonResp.end() && retryIt->is_number()) {
                        retryAfter = retryIt->get<double>();
                        retryAfterKnown = true;
                    }
                    auto globalIt = jsonResp.find("global");
                    if (globalIt != jsonResp.end() && globalIt->is_boolean()) global = globalIt->get<bool>();
                }
                auto retryHeaderIt = response.headers.find("Retry-After");
                if (!retryAfterKnown && retryHeaderIt != response.headers.end()) {
                    try {
                        retryAfter = std::stod(retryHeaderIt->second);
                    } catch (const std::logic_error& excp) {
                        DEBUG_MSG(std::string("Malformed Retry-After header: ") + excp.what());
                    }
                }
                auto scopeIt = response.headers.find("X-RateLimit-Scope");
                if (scopeIt != response.headers.end() && scopeIt->second == "global") global = true;
                auto globalHeaderIt = response.headers.find("X-RateLimit-Global");
                if (globalHeaderIt != response.headers.end() && globalHeaderIt->second == "true") global = true;

                DEBUG_MSG(std::string("Ratelimit hit for ") + route.templateKey() + ", retry after " +
                          std::to_string(retryAfter) + (global ? " (global)" : ""));
                ratelimitLock.hit(route, retryAfter, global);

#ifdef HARMONIA_RATELIMIT_HIT_AS_ERROR
                throw RatelimitHit(route.templateKey(), retryAfter, global);
#else
                if (attempt >= HARMONIA_MAX_RETRIES) {
                    throw RatelimitHit(route.templateKey(), retryAfter, global);
                }
                continue;
#endif
            }

            bool success = response.statusCode / 100 == 2;

            if (response.body.empty()) {
                if (success) return nullptr;
                throwRestError(response, nullptr);
            }

            if (!success) {
                // Error bodies are not always JSON (proxy error pages, for example).
                nlohmann::json jsonResp = nlohmann::json::parse(response.body.begin(), response.body.end(),
                                                                 nullptr, false);
                DEBUG_MSG("Got non-2xx HTTP status code.");
                DEBUG_MSG(std::string(response.body.begin(), response.body.end()));
                throwRestError(response, jsonResp.is_discarded() ? nlohmann::json(nullptr) : jsonResp);
            }

            return nlohmann::json::parse(response.body.begin(), response.body.end());
        }
    }

    REST::HTTPResponse RestClient::performRequest(const REST::HTTPRequest& request) {
        std::lock_guard<std::mutex> lock(connectionMutex);

        if (!restConnection->isOpen()) restConnection->open();

        try {
            return restConnection->request(request);
        } catch (boost::system::system_error& excp) {
            if (!isConnectionDrop(excp.code())) throw;

            DEBUG_MSG("HTTP Connection closed by remote. Reopenning and retrying.");
            {
                REST::HeadersMap prevHeaders = std::move(restConnection->connectionHeaders);
                restConnection = connectionFactory();
                restConnection->connectionHeaders = std::move(prevHeaders);
                restConnection->open();
            }

            return restConnection->request(request);
        }
    }

    void RestClient::prepareRequestBody(REST::HTTPRequest& request,
                                        const nlohmann::json& payload,
                                        const std::vector<REST::MultipartEntity>& elements) {
        if (elements.empty()) {
            if (!payload.is_null()) {
                std::string bodyStr = payload.dump();
                request.body = std::vector<uint8_t>(bodyStr.begin(), bodyStr.end());
                request.headers.insert({ "Content-Type", "application/json" });
            }
            return;
        }

        std::vector<REST::MultipartEntity> actualMultipartElements;
        actualMultipartElements.reserve(elements.size() + 1);

        if (!payload.is_null()) {
            std::string bodyStr = payload.dump();
            actualMultipartElements.push_back({
                /* name              */ "payload_json",
                /* filename          */ "",
                /* additionalHeaders */ {{ "Content-Type", "application/json" }},
                /* body              */ std::vector<uint8_t>(bodyStr.begin(), bodyStr.end())
            });
        }

        for (const auto& element : elements) actualMultipartElements.push_back(element);

        REST::HTTPRequest tempRequest = REST::buildMultipartRequest(actualMultipartElements);
        request.headers["Content-Type"] = tempRequest.headers["Content-Type"];
        request.body                    = std::move(tempRequest.body);
    }

    nlohmann::json RestClient::sendMessageRequest(const Route& route, const OutgoingMessage& message,
                                                  const REST::QueryParams& query,
                                                  const nlohmann::json& extraFields) {
        nlohmann::json payload = message.toJson();
        for (auto it = extraFields.begin(); it != extraFields.end(); ++it) {
            payload[it.key()] = it.value();
        }

        std::vector<REST::MultipartEntity> multipart;
        multipart.reserve(message.files.size());
        for (size_t i = 0; i < message.files.size(); ++i) {
            multipart.push_back(fileToMultipartEntity(message.files[i], "files[" + std::to_string(i) + "]"));
        }

        return sendRestRequest(route, payload, query, multipart);
    }

    void RestClient::throwRestError(const REST::HTTPResponse& response,
                                    const nlohmann::json& payload) {
        int code = -1;
        std::string message = "Unknown REST API error";
        nlohmann::json errors = nullptr;

        if (payload.is_object()) {
            auto codeIt = payload.find("code");
            if (codeIt != payload.end() && codeIt->is_number_integer()) code = codeIt->get<int>();

            auto messageIt = payload.find("message");
            if (messageIt != payload.end() && messageIt->is_string()) message = messageIt->get<std::string>();

            auto errorsIt = payload.find("errors");
            if (errorsIt != payload.end()) errors = *errorsIt;
        }

        const int status = static_cast<int>(response.statusCode);

        if (code >= 10001 && code <= 10099) {
            throw UnknownEntity(message, code, status);
        }
        if (code >= 30000 && code <= 30099) {
            throw LimitReached(message, code, status);
        }

        if (status == 400 && payload.is_object()) {
            std::string fieldPath, fieldMessage;
            if (findFieldError(errors, "", fieldPath, fieldMessage)) {
                throw InvalidParameter(fieldPath, fieldMessage, code, errors);
            }

            /* REST API sometimes return errors about invalid paramters in
             * old format, like this:
             * ```json
             * {
             *  "parameter_name": [ "whats_wrong" ]
             * }
             * ```
             */
            if (payload.find("message") == payload.end()) {
                for (auto it = payload.begin(); it != payload.end(); ++it) {
                    const nlohmann::json& param = it.value();
                    if (param.is_array() && param.size() == 1 && param[0].is_string()) {
                        throw InvalidParameter(it.key(), param[0].get<std::string>(), code, payload);
                    }
                }
            }
        }

        switch (status) {
        case 401: throw Unauthorized(message, code);
        case 403: throw Forbidden(message, code);
        case 404: throw NotFound(message, code);
        case 413: throw RequestTooLarge(message, code);
        default: break;
        }

        if (status / 100 == 5) {
            throw ServerError(message, status, code);
        }

        throw RESTError(message, code, status, errors);
    }

    REST::MultipartEntity RestClient::fileToMultipartEntity(const File& file, const std::string& name) {
        return {
                /* name:              */ name,
                /* filename:          */ file.filename,
                /* additionalHeaders: */ {{ "Content-Type", Utils::mimeTypeFromFilename(file.filename) }},
                /* body:              */ file.bytes
               };
    }
} // namespace Harmonia
