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

#include <harmonia/internal/wss.hpp>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <harmonia/config.hpp>

#if defined(HARMONIA_DEBUG_LOG)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr <<  "wss.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Harmonia {
    namespace {
        std::vector<uint8_t> bufferToVector(const boost::beast::flat_buffer& buffer) {
            auto data = static_cast<const uint8_t*>(buffer.data().data());
            return std::vector<uint8_t>(data, data + buffer.size());
        }
    }

    TLSWebSocket::TLSWebSocket(boost::asio::io_context& ioContext)
        : tlsContext(ssl::context::tlsv12_client)
        , wsStream(ioContext, tlsContext) {

        tlsContext.set_default_verify_paths();
        wsStream.next_layer().set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
    }

    TLSWebSocket::~TLSWebSocket() {
        if (!wsStream.next_layer().lowest_layer().is_open()) return;

        boost::system::error_code ec;
        wsStream.next_layer().shutdown(ec);
        wsStream.next_layer().lowest_layer().close(ec);
    }

    void TLSWebSocket::sendMessage(const std::vector<uint8_t>& message) {
        std::lock_guard<std::mutex> lock(connectionMutex);
        wsStream.text(true);
        wsStream.write(boost::asio::buffer(message.data(), message.size()));
    }

    std::vector<uint8_t> TLSWebSocket::readMessage() {
        boost::beast::flat_buffer buffer;
        wsStream.read(buffer);
        return bufferToVector(buffer);
    }

    void TLSWebSocket::asyncReadMessage(TLSWebSocket::AsyncReadCallback callback) {
        std::shared_ptr<boost::beast::flat_buffer> buffer(new boost::beast::flat_buffer);
        std::shared_ptr<TLSWebSocket> self = shared_from_this();

        wsStream.async_read(*buffer, [self, buffer, callback](boost::system::error_code ec, std::size_t) {
            callback(*self, ec ? std::vector<uint8_t>() : bufferToVector(*buffer), ec);
        });
    }

    void TLSWebSocket::handshake(const std::string& servername, const std::string& path, unsigned short port,
                                 const REST::HeadersMap& additionalHeaders) {
        std::lock_guard<std::mutex> lock(connectionMutex);
        DEBUG_MSG(std::string("WebSocket handshake with ") + servername + path);

        tcp::resolver resolver(wsStream.get_executor());
        auto resolutionResult = resolver.resolve(servername, std::to_string(port));

        if (!SSL_set_tlsext_host_name(wsStream.next_layer().native_handle(), servername.c_str())) {
            throw boost::system::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                                                        boost::asio::error::get_ssl_category()));
        }
        wsStream.next_layer().set_verify_callback(ssl::host_name_verification(servername));

        boost::asio::connect(wsStream.next_layer().next_layer(), resolutionResult);
        wsStream.next_layer().handshake(ssl::stream_base::client);

        wsStream.set_option(websocket::stream_base::decorator([additionalHeaders](websocket::request_type& request) {
            for (const auto& header : additionalHeaders) {
                request.set(header.first, header.second);
            }
        }));
        wsStream.handshake(servername, path);
    }

    void TLSWebSocket::shutdown(const websocket::close_reason& reason) {
        std::lock_guard<std::mutex> lock(connectionMutex);

        boost::system::error_code ec;
        wsStream.close(reason, ec);
        if (ec &&
            ec != boost::asio::ssl::error::stream_truncated &&
            ec != boost::asio::error::broken_pipe &&
            ec != boost::asio::error::connection_reset &&
            ec != boost::asio::error::eof &&
            ec != websocket::error::closed) {

            throw boost::system::system_error(ec);
        }

        wsStream.next_layer().shutdown(/* ignored */ ec);
        wsStream.next_layer().next_layer().close(ec);
    }

    int TLSWebSocket::closeCode() const {
        const websocket::close_reason& reason = wsStream.reason();
        if (!reason) return -1;
        return static_cast<int>(reason.code);
    }
} // namespace Harmonia
