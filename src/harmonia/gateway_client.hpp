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

#ifndef HARMONIA_GATEWAY_CLIENT_HPP
#define HARMONIA_GATEWAY_CLIENT_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/deadline_timer.hpp>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>
#include <harmonia/config.hpp>
#include <harmonia/event_dispatcher.hpp>
#include <harmonia/gateway_payloads.hpp>
#include <harmonia/intents.hpp>
#include <harmonia/types/presence.hpp>
#include <harmonia/types/snowflake.hpp>
#include <harmonia/internal/wss.hpp>
#include <harmonia/internal/zlib.hpp>

namespace Harmonia {
    class GatewayClient {
    public:
        static constexpr int NoSharding = GatewayPayloads::NoSharding;
        static constexpr int NoCloseEvent = -1;

        using ConnectionFactory = std::function<std::shared_ptr<WebSocketConnection>()>;
        using SleepFunction     = std::function<void(std::chrono::milliseconds)>;

        /**
         * Construct GatewayClient, connection is opened by \ref connect or \ref resume.
         *
         * \param ioContext ASIO I/O context. Should not be destroyed while
         *                  GatewayClient exists.
         */
        GatewayClient(boost::asio::io_context& ioContext, const std::string& token);

        /**
         * Construct GatewayClient that uses connections created by factory.
         * Factory is called for every new connection: connect, resume and
         * each reconnect.
         *
         * sleep is used for delay before new Identify, std::this_thread::sleep_for if null.
         */
        GatewayClient(boost::asio::io_context& ioContext, ConnectionFactory connectionFactory,
                      const std::string& token, SleepFunction sleep = nullptr);
        ~GatewayClient();

        GatewayClient(const GatewayClient&) = delete;
        GatewayClient& operator=(const GatewayClient&) = delete;

        /**
         * Connect and identify to gateway.
         *
         * Either this method or \ref resume should be called and succeed
         * in order to start event receiving. You should pass gateway URL
         * received by calling to \ref RestClient::getGatewayUrl or
         * \ref RestClient::getGatewayUrlBot.
         *
         * Also if your client is a bot and you're using sharding, then you
         * need to pass shardId and shardCount, otherwise you should leave both
         * parameters to NoSharding.
         *
         * Events are received while io_context passed to constructor is running.
         *
         * \throws InvalidParameter if presence, intents or shard info is invalid.
         * \throws GatewayError if gateway closed connection (for example, because of
         *         invalid token (4004) or disallowed intents (4014)).
         * \throws ConnectionError if failed to open connection.
         *
         * \sa \ref GatewayClient::resume
         */
        void connect(const std::string& gatewayUrl,
                     /* sharding info: */ int shardId = NoSharding, int shardCount = NoSharding,
                     const Presence& initialPresence = Presence(),
                     Intents intents = Intents(NonPrivilegedIntents));

        /**
         * Resume interrupted gateway session.
         *
         * Can be invoked instead of \ref connect if you're recovering from
         * bot crash and want to receive lost events.
         *
         * \throws GatewayError if session can't be resumed, in this case
         *         you have to use \ref connect.
         */
        void resume(const std::string& gatewayUrl,
                    const std::string& sessionId, int lastSequenceNumber,
                    int shardId = NoSharding, int shardCount = NoSharding);

        /**
         * Disconnect from gateway with sending Close frame
         * with specified code.
         *
         * Codes 1000 and 1001 invalidate session. Pass 4000 or any other
         * code if you want to resume it later. NoCloseEvent drops connection
         * without Close frame.
         */
        void disconnect(int code = 1000) noexcept;

        /**
         * Block until event of specified type received. Other messages
         * are processed as usual.
         */
        nlohmann::json waitForEvent(Event type);

        /**
         * Update bot's presence (op 3).
         */
        void updatePresence(const Presence& presence);

        /**
         * Join, move or leave (channelId = boost::none) voice channel (op 4).
         * Answered by VOICE_STATE_UPDATE and VOICE_SERVER_UPDATE events.
         */
        void updateVoiceState(Snowflake guildId, boost::optional<Snowflake> channelId,
                              bool selfMute = false, bool selfDeaf = false);

        /**
         * Request members of guild (op 8). Received in GUILD_MEMBERS_CHUNK events.
         *
         * \sa \ref GatewayPayloads::requestGuildMembers
         */
        void requestGuildMembers(Snowflake guildId,
                                 const boost::optional<std::string>& query,
                                 const std::vector<Snowflake>& userIds = {},
                                 int limit = 0, bool presences = false,
                                 const std::string& nonce = "");

        /**
         * Event dispatcher instance used for gateway
         * event dispatching.
         */
        EventDispatcher eventDispatcher;

        /// large_threshold sent in Identify, 50-250.
        unsigned largeThreshold = 250;

        inline const std::string& token() const {
            return token_;
        }

        inline const std::string& sessionId() const {
            return sessionId_;
        }

        inline int lastSequenceNumber() const {
            return lastSequenceNumber_;
        }

        inline const std::string& lastGatewayUrl() const {
            return lastGatewayUrl_;
        }

        /// URL received in READY, used to resume session.
        inline const std::string& resumeGatewayUrl() const {
            return resumeGatewayUrl_;
        }

        inline bool isConnected() const {
            return gatewayConnection && gatewayConnection->isSocketOpen();
        }

        /**
         * Close codes after which reconnection makes no sense: 4004 (authentication
         * failed) and 4010-4014 (invalid shard, sharding required, invalid API version,
         * invalid or disallowed intents).
         */
        static bool isFatalCloseCode(int code);

        /// "/?v=N&encoding=json", with "&compress=zlib-stream" if zlib is enabled.
        static std::string gatewayPath();
    private:
        enum OpCode {
            EventDispatch        = 0,
            Heartbeat            = 1,
            Identify             = 2,
            PresenceUpdate       = 3,
            VoiceStateUpdate     = 4,
            Resume               = 6,
            Reconnect            = 7,
            RequestGuildMembers  = 8,
            InvalidSession       = 9,
            Hello                = 10,
            HeartbeatAck         = 11,
        };

        // Handshake and read Hello.
        void openConnection(const std::string& gatewayUrl);

        // Disconnect without Close event, try to resume session, if failed - start new session.
        void recoverConnection();

        // Identify again after delay, used on op 9 with d = false.
        void startNewSession();

        // Poll gateway connection using async read while poll = true, calls
        // processMessage for each message if skipMessages is not set.
        // Saves last received message in lastMessage.
        void asyncPoll();
        bool poll = false, skipMessages = false;
        nlohmann::json lastMessage;

        // Set while waiting for READY or RESUMED, Invalid Session is reported as GatewayError.
        bool handshaking = false;

        // Returns boost::none if message is split and more frames are needed.
        boost::optional<nlohmann::json> decodeMessage(const std::vector<uint8_t>& bytes);
        nlohmann::json readMessage();

        void processMessage(const nlohmann::json& message);
        void sendMessage(OpCode code, const nlohmann::json& payload = nullptr);

        // Calls sendHeartbeat every heartbeatIntervalMs milliseconds using
        // heartbeatTimer while heartbeat = true.
        void asyncHeartbeat();

        // Heartbeat information, used by asyncHeartbeat and sendHeartbeat.
        bool heartbeat = false;
        unsigned heartbeatIntervalMs = 41250;
        unsigned unansweredHeartbeats = 0;
        boost::asio::deadline_timer heartbeatTimer;

        // Send heartbeat, if we don't have answer for two heartbeats - reconnect and return.
        void sendHeartbeat();

        // Session information.
        std::string sessionId_, lastGatewayUrl_, resumeGatewayUrl_, token_;
        int shardId_ = NoSharding, shardCount_ = NoSharding;
        int lastSequenceNumber_ = 0;
        Presence presence_;
        Intents intents_;

        boost::asio::io_context& ioContext; // non-owning reference to I/O context.
        ConnectionFactory connectionFactory;
        SleepFunction sleep;
        std::shared_ptr<WebSocketConnection> gatewayConnection;
#ifdef HARMONIA_ZLIB
        Zlib::Inflater inflater;
#endif
    };
} // namespace Harmonia

#endif // HARMONIA_GATEWAY_CLIENT_HPP
