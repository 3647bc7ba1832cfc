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

#include <harmonia/gateway_client.hpp>
#include <chrono>
#include <random>
#include <thread>
#include <utility>
#include <harmonia/exceptions.hpp>
#include <harmonia/internal/utils.hpp>

#if defined(HARMONIA_DEBUG_LOG)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr <<  "gateway_client.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Harmonia {

namespace {
    // Field of gateway message, null if absent.
    const nlohmann::json& messageField(const nlohmann::json& message, const char* name) {
        static const nlohmann::json null;

        auto it = message.find(name);
        return it != message.end() ? *it : null;
    }
}

constexpr int GatewayClient::NoSharding;
constexpr int GatewayClient::NoCloseEvent;

GatewayClient::GatewayClient(boost::asio::io_context& ioContext, const std::string& token)
    : GatewayClient(ioContext, [&ioContext]() -> std::shared_ptr<WebSocketConnection> {
                                   return std::make_shared<TLSWebSocket>(ioContext);
                               }, token) {}

GatewayClient::GatewayClient(boost::asio::io_context& ioContext, ConnectionFactory connectionFactory,
                             const std::string& token, SleepFunction sleep)
    : heartbeatTimer(ioContext), token_(token), ioContext(ioContext)
    , connectionFactory(std::move(connectionFactory))
    , sleep(sleep ? std::move(sleep) : SleepFunction([](std::chrono::milliseconds delay) {
                                            std::this_thread::sleep_for(delay);
                                        })) {}

GatewayClient::~GatewayClient() {
    if (gatewayConnection && gatewayConnection->isSocketOpen()) disconnect();
}

bool GatewayClient::isFatalCloseCode(int code) {
    return code == 4004 || (code >= 4010 && code <= 4014);
}

std::string GatewayClient::gatewayPath() {
    std::string path = std::string("/?v=") + std::to_string(HARMONIA_API_VERSION) + "&encoding=json";
#ifdef HARMONIA_ZLIB
    path += "&compress=zlib-stream";
#endif
    return path;
}

void GatewayClient::openConnection(const std::string& gatewayUrl) {
    DEBUG_MSG("Opening gateway connection...");
    gatewayConnection = connectionFactory();
#ifdef HARMONIA_ZLIB
    inflater.reset();
#endif

    REST::HeadersMap headers;
    headers["User-Agent"] = std::string("DiscordBot (") + HARMONIA_URL + ", " + HARMONIA_VERSION + ")";
    gatewayConnection->handshake(Utils::domainFromUrl(gatewayUrl), gatewayPath(), 443, headers);

    DEBUG_MSG("Reading Hello message...");
    nlohmann::json gatewayHello = readMessage();
    if (gatewayHello.value("op", -1) != OpCode::Hello) {
        throw GatewayError(std::string("Expected Hello message, got: ") + gatewayHello.dump());
    }

    heartbeatIntervalMs  = gatewayHello["d"]["heartbeat_interval"].get<unsigned>();
    unansweredHeartbeats = 0;
    DEBUG_MSG(std::string("Gateway heartbeat interval: ") + std::to_string(heartbeatIntervalMs) + " ms.");
}

void GatewayClient::connect(const std::string& gatewayUrl, int shardId, int shardCount,
                            const Presence& initialPresence, Intents intents) {

    // Validate everything before doing any I/O.
    nlohmann::json identifyPayload = GatewayPayloads::identify(token_, intents, shardId, shardCount,
                                                               initialPresence, largeThreshold);

    if (gatewayConnection) disconnect(NoCloseEvent);
    openConnection(gatewayUrl);

    DEBUG_MSG("Sending Identify message...");
    sendMessage(OpCode::Identify, identifyPayload);

    DEBUG_MSG("Waiting for Ready event...");
    lastSequenceNumber_ = 0;
    handshaking = true;
    nlohmann::json readyPayload = waitForEvent(Event::Ready);
    handshaking = false;

    DEBUG_MSG("Got Ready event. Starting heartbeat and polling...");

    sessionId_        = readyPayload["session_id"].get<std::string>();
    resumeGatewayUrl_ = readyPayload.value("resume_gateway_url", "");
    lastGatewayUrl_   = gatewayUrl;
    shardId_          = shardId;
    shardCount_       = shardCount;
    presence_         = initialPresence;
    intents_          = intents;

    heartbeat = true;
    asyncHeartbeat();
    poll = true;
    asyncPoll();

    // We must dispatch this event too, because it contain
    // information probably useful for users.
    eventDispatcher.dispatchEvent(Event::Ready, readyPayload);
}

void GatewayClient::resume(const std::string& gatewayUrl,
                           const std::string& sessionId, int lastSequenceNumber,
                           int shardId, int shardCount) {

    DEBUG_MSG(std::string("Resuming interrupted gateway session. sessionId=") + sessionId +
              " lastSeq=" + std::to_string(lastSequenceNumber));

    nlohmann::json resumePayload = GatewayPayloads::resume(token_, sessionId, lastSequenceNumber);

    if (gatewayConnection) disconnect(NoCloseEvent);
    openConnection(gatewayUrl);

    DEBUG_MSG("Sending Resume message...");
    sendMessage(OpCode::Resume, resumePayload);

    DEBUG_MSG("Waiting for Resumed event...");

    sessionId_          = sessionId;
    lastSequenceNumber_ = lastSequenceNumber;
    shardId_            = shardId;
    shardCount_         = shardCount;
    if (lastGatewayUrl_.empty()) lastGatewayUrl_ = gatewayUrl;

    // GatewayError can be thrown here, why?
    //  waitForEvent calls processMessage for other messages (including OP Invalid Session),
    //  processMessage throws GatewayError if receives Invalid Session while handshaking.
    handshaking = true;
    nlohmann::json resumedPayload = waitForEvent(Event::Resumed);
    handshaking = false;
    DEBUG_MSG("Got Resumed event, starting heartbeat and polling...");

    heartbeat = true;
    asyncHeartbeat();
    poll = true;
    asyncPoll();

    eventDispatcher.dispatchEvent(Event::Resumed, resumedPayload);
}

void GatewayClient::disconnect(int code) noexcept {
    DEBUG_MSG(std::string("Disconnecting from gateway... code=") + std::to_string(code));

    heartbeat = false;
    boost::system::error_code ec;
    heartbeatTimer.cancel(ec);

    poll = false;
    handshaking = false;

    if (!gatewayConnection) return;

    if (code != NoCloseEvent && gatewayConnection->isSocketOpen()) {
        try {
            gatewayConnection->shutdown(websocket::close_reason(static_cast<uint16_t>(code)));
        } catch (const std::exception& excp) {
            // Connection is dropped anyway.
            DEBUG_MSG(std::string("Failed to send Close frame: ") + excp.what());
        }
    }

    gatewayConnection.reset();
}

nlohmann::json GatewayClient::waitForEvent(Event type) {
    DEBUG_MSG(std::string("Waiting for event, type=") + EventDispatcher::eventToString(type));
    skipMessages = true;

    while (true) {
        lastMessage = nullptr;

        if (poll) {
            DEBUG_MSG("Running ASIO event loop iteration...");
            ioContext.run_one();
        } else {
            DEBUG_MSG("Reading using blocking I/O...");
            lastMessage = readMessage();
        }

        if (lastMessage.is_null() || lastMessage.empty()) continue;

        if (lastMessage.value("op", -1) == OpCode::EventDispatch &&
            lastMessage["t"].is_string() &&
            EventDispatcher::eventFromString(lastMessage["t"].get<std::string>()) == type) {

            if (lastMessage["s"].is_number()) lastSequenceNumber_ = lastMessage["s"].get<int>();
            break;
        } else {
            // processMessage may reconnect and overwrite lastMessage.
            nlohmann::json message = lastMessage;
            processMessage(message);
        }
    }

    skipMessages = false;

    return lastMessage["d"];
}

boost::optional<nlohmann::json> GatewayClient::decodeMessage(const std::vector<uint8_t>& bytes) {
#ifdef HARMONIA_ZLIB
    boost::optional<std::vector<uint8_t> > inflated = inflater.feed(bytes);
    if (!inflated) return boost::none;
    return nlohmann::json::parse(*inflated);
#else
    return nlohmann::json::parse(bytes);
#endif
}

nlohmann::json GatewayClient::readMessage() {
    while (true) {
        std::vector<uint8_t> bytes;
        try {
            bytes = gatewayConnection->readMessage();
        } catch (boost::system::system_error& excp) {
            int closeCode = gatewayConnection->closeCode();
            if (closeCode == -1) throw;

            DEBUG_MSG(std::string("Gateway closed connection, code=") + std::to_string(closeCode));
            throw GatewayError(std::string("Gateway closed connection: ") + excp.what(), closeCode);
        }

        boost::optional<nlohmann::json> message = decodeMessage(bytes);
        if (message) return *message;
    }
}

void GatewayClient::recoverConnection() {
    DEBUG_MSG("Lost gateway connection, recovering...");
    disconnect(NoCloseEvent);

    if (sessionId_.empty()) {
        startNewSession();
        return;
    }

    try {
        resume(resumeGatewayUrl_.empty() ? lastGatewayUrl_ : resumeGatewayUrl_,
               sessionId_, lastSequenceNumber_, shardId_, shardCount_);
    } catch (GatewayError& excp) {
        if (isFatalCloseCode(excp.disconnectCode)) throw;

        DEBUG_MSG("Resume failed, starting new session...");
        startNewSession();
    }
}

void GatewayClient::startNewSession() {
    disconnect(NoCloseEvent);
    sessionId_.clear();
    resumeGatewayUrl_.clear();

    // Gateway wants random 1-5 seconds delay before new Identify.
    std::random_device randomDevice;
    std::uniform_int_distribution<int> delayMs(1000, 5000);
    sleep(std::chrono::milliseconds(delayMs(randomDevice)));

    connect(lastGatewayUrl_, shardId_, shardCount_, presence_, intents_);
}

void GatewayClient::asyncPoll() {
    DEBUG_MSG("Polling gateway messages...");
    gatewayConnection->asyncReadMessage([this](WebSocketConnection& connection, const std::vector<uint8_t>& body,
                                               boost::system::error_code ec) {
        // Result of read on connection we already dropped.
        if (!poll || &connection != gatewayConnection.get()) return;

        if (ec) {
            int closeCode = connection.closeCode();
            DEBUG_MSG(std::string("Gateway read failed: ") + ec.message() + ", close code: " + std::to_string(closeCode));
            if (isFatalCloseCode(closeCode)) {
                disconnect(NoCloseEvent);
                throw GatewayError("Gateway closed connection with fatal code.", closeCode);
            }

            recoverConnection();
            return;
        }

        try {
            boost::optional<nlohmann::json> message = decodeMessage(body);
            if (message) {
                lastMessage = *message;
                if (!skipMessages) processMessage(*message);
            }
        } catch (nlohmann::json::parse_error& excp) {
            // we may fail here because of partially readen message (what
            // means gateway dropped our connection).
            DEBUG_MSG(excp.what());
            recoverConnection();
            return;
        }

        // processMessage may have replaced connection and started polling on it.
        if (poll && &connection == gatewayConnection.get()) asyncPoll();
    });
}

void GatewayClient::processMessage(const nlohmann::json& message) {
    switch (message.value("op", -1)) {
    case OpCode::EventDispatch: {
        const nlohmann::json& data     = messageField(message, "d");
        const nlohmann::json& sequence = messageField(message, "s");
        std::string type = messageField(message, "t").get<std::string>();
        DEBUG_MSG(std::string("Gateway Event: t=") + type + " s=" + sequence.dump());

        if (sequence.is_number()) lastSequenceNumber_ = sequence.get<int>();
        if (type == "READY") {
            sessionId_        = data["session_id"].get<std::string>();
            resumeGatewayUrl_ = data.value("resume_gateway_url", "");
        }
        eventDispatcher.dispatchEvent(type, data);
        break;
    }
    case OpCode::HeartbeatAck:
        DEBUG_MSG("Gateway heartbeat answered.");
        unansweredHeartbeats = 0;
        break;
    case OpCode::Heartbeat:
        DEBUG_MSG("Received heartbeat request.");
        sendMessage(OpCode::Heartbeat, lastSequenceNumber_ ? nlohmann::json(lastSequenceNumber_) : nullptr);
        break;
    case OpCode::Reconnect:
        DEBUG_MSG("Gateway asked us to reconnect...");
        recoverConnection();
        break;
    case OpCode::InvalidSession: {
        const nlohmann::json& data = messageField(message, "d");
        bool resumable = data.is_boolean() && data.get<bool>();
        DEBUG_MSG(std::string("Invalid session error, resumable=") + (resumable ? "true" : "false"));

        if (handshaking) throw GatewayError("Invalid session.");

        if (resumable) {
            recoverConnection();
        } else {
            startNewSession();
        }
        break;
    }
    default:
        DEBUG_MSG("Unexpected gateway message.");
        DEBUG_MSG(message.dump());
    }
}

void GatewayClient::sendMessage(GatewayClient::OpCode opCode, const nlohmann::json& payload) {
    nlohmann::json message = {
        { "op", opCode  },
        { "d",  payload },
    };

    std::string messageString = message.dump();
    gatewayConnection->sendMessage(std::vector<uint8_t>(messageString.begin(), messageString.end()));
}

void GatewayClient::updatePresence(const Presence& presence) {
    sendMessage(OpCode::PresenceUpdate, GatewayPayloads::updatePresence(presence));
    presence_ = presence;
}

void GatewayClient::updateVoiceState(Snowflake guildId, boost::optional<Snowflake> channelId,
                                     bool selfMute, bool selfDeaf) {
    sendMessage(OpCode::VoiceStateUpdate,
                GatewayPayloads::updateVoiceState(guildId, channelId, selfMute, selfDeaf));
}

void GatewayClient::requestGuildMembers(Snowflake guildId,
                                        const boost::optional<std::string>& query,
                                        const std::vector<Snowflake>& userIds,
                                        int limit, bool presences,
                                        const std::string& nonce) {
    sendMessage(OpCode::RequestGuildMembers,
                GatewayPayloads::requestGuildMembers(guildId, query, userIds, limit, presences, nonce));
}

void GatewayClient::asyncHeartbeat() {
    boost::system::error_code ec;
    heartbeatTimer.cancel(ec);
    heartbeatTimer.expires_from_now(boost::posix_time::milliseconds(heartbeatIntervalMs));
    heartbeatTimer.async_wait([this](const boost::system::error_code& ec){
        if (ec == boost::asio::error::operation_aborted) return;
        if (!heartbeat) return;

        sendHeartbeat();

        if (heartbeat) asyncHeartbeat();
    });
}

void GatewayClient::sendHeartbeat() {
    if (unansweredHeartbeats >= 2) {
        DEBUG_MSG("Missing gateway heartbeat answer. Reconnecting...");
        recoverConnection();
        return;
    }

    DEBUG_MSG("Gateway heartbeat sent.");
    sendMessage(OpCode::Heartbeat, lastSequenceNumber_ ? nlohmann::json(lastSequenceNumber_) : nullptr);
    ++unansweredHeartbeats;
}

} // namespace Harmonia
