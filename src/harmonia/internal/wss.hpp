#ifndef HARMONIA_WSS_HPP
#define HARMONIA_WSS_HPP

#include <cstdint>                              // uint8_t
#include <functional>                           // std::function
#include <string>                               // std::string
#include <vector>                               // std::vector
#include <memory>                               // std::enable_shared_from_this
#include <mutex>                                // std::mutex, std::lock_guard
#include <boost/asio/ip/tcp.hpp>                // tcp::socket
#include <boost/asio/io_context.hpp>            // asio::io_context
#include <boost/asio/ssl/context.hpp>           // ssl::context
#include <boost/asio/ssl/stream.hpp>            // ssl::stream
#include <boost/beast/websocket/stream.hpp>     // websocket::stream
#include <boost/beast/websocket/ssl.hpp>        // teardown for ssl::stream
#include <harmonia/internal/rest.hpp>           // REST::HeadersMap

/**
 *  \file wss.hpp
 *  \internal
 *
 *  Better interface for WebSockets on top of low-level boost.beast.
 */

namespace Harmonia {
    namespace ssl       = boost::asio::ssl;
    namespace websocket = boost::beast::websocket;

    /**
     *  \internal
     *
     *  Message-oriented WebSocket connection used by GatewayClient.
     *
     *  \ref TLSWebSocket is the only implementation used in production,
     *  other implementations can be injected into GatewayClient through
     *  connection factory.
     */
    class WebSocketConnection {
    public:
        using AsyncReadCallback = std::function<void(WebSocketConnection&, const std::vector<uint8_t>&, boost::system::error_code)>;

        virtual ~WebSocketConnection() = default;

        /**
         *  Perform all handshakes needed to exchange messages.
         *
         *  \throws boost::system::system_error on any error.
         */
        virtual void handshake(const std::string& servername, const std::string& path, unsigned short port = 443,
                               const REST::HeadersMap& additionalHeaders = {}) = 0;

        /// \throws boost::system::system_error on any error.
        virtual void sendMessage(const std::vector<uint8_t>& message) = 0;

        /// Blocks until message is received. \throws boost::system::system_error on any error.
        virtual std::vector<uint8_t> readMessage() = 0;

        /// Callback is invoked from io_context, with non-zero error code if read failed.
        virtual void asyncReadMessage(AsyncReadCallback callback) = 0;

        /// Send close frame and drop connection.
        virtual void shutdown(const websocket::close_reason& reason = websocket::close_code::normal) = 0;

        virtual bool isSocketOpen() const = 0;

        /// Close code sent by server, -1 if connection is not closed by server.
        virtual int closeCode() const = 0;
    };

    /**
     *  \internal
     *
     *  High-level beast WebSockets wrapper. Provides basic I/O operations:
     *  read, send, async read.
     *
     *  One instance is one connection. Create new instance to reconnect.
     */
    class TLSWebSocket : public WebSocketConnection, public std::enable_shared_from_this<TLSWebSocket> {
        using TLSStream = ssl::stream<boost::asio::ip::tcp::socket>;
        using WSSStream = websocket::stream<TLSStream>;
        using tcp = boost::asio::ip::tcp;
    public:
        /**
         *  \internal
         *
         *  Construct unconnected WebSocket. use handshake for connection.
         */
        TLSWebSocket(boost::asio::io_context& ioContext);

        /**
         *  \internal
         *
         *  Closes TCP connection without sending close frame.
         */
        ~TLSWebSocket() override;

        /**
         *  \internal
         *
         *  Send message and block until transmittion finished.
         *
         *  \throws boost::system::system_error on any error.
         *
         *  This method is thread-safe.
         */
        void sendMessage(const std::vector<uint8_t>& message) override;

        /**
         *  \internal
         *
         *  Read message if any, blocks if there is no message.
         *
         *  \throws boost::system::system_error on any error.
         */
        std::vector<uint8_t> readMessage() override;

        /**
         *  \internal
         *
         *  Asynchronously read message and call callback when done (or error occured).
         *  Instance is kept alive until callback returns.
         *
         *  \warning TLSWebSocket *MUST* be stored in std::shared_ptr.
         */
        void asyncReadMessage(AsyncReadCallback callback) override;

        /**
         *  \internal
         *
         *  Perform TCP handshake, TLS handshake and WS handshake.
         *
         *  \throws boost::system::system_error on any error.
         */
        void handshake(const std::string& servername, const std::string& path, unsigned short port = 443,
                       const REST::HeadersMap& additionalHeaders = {}) override;

        /**
         *  \internal
         *
         *  Send close frame and teardown TCP connection.
         *  Errors caused by already closed connection are ignored.
         */
        void shutdown(const websocket::close_reason& reason = websocket::close_code::normal) override;

        bool isSocketOpen() const override {
            return wsStream.next_layer().lowest_layer().is_open();
        }

        /**
         *  Close code sent by server, -1 if connection is not closed by server.
         */
        int closeCode() const override;

    private:
        ssl::context tlsContext;
        WSSStream wsStream;

        std::mutex connectionMutex;
    };
} // namespace Harmonia

#endif // HARMONIA_WSS_HPP
