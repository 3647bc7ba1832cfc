#ifndef HARMONIA_REST_HPP
#define HARMONIA_REST_HPP

#include <cstdint>                      // uint8_t
#include <string>                       // std::string
#include <vector>                       // std::vector
#include <utility>                      // std::pair
#include <unordered_map>                // std::unordered_map
#include <memory>                       // std::unique_ptr
#include <boost/asio/io_context.hpp>    // boost::asio::io_context
#include <boost/asio/ssl/stream.hpp>    // boost::asio::ssl::stream
#include <boost/asio/ssl/context.hpp>   // boost::asio::ssl::context
#include <boost/asio/ip/tcp.hpp>        // boost::asio::ip::tcp::socket

/**
 *  \file rest.hpp
 *  \internal
 *
 *  Minimal HTTP/1.1 client used by RestClient and CDN downloads.
 */

namespace Harmonia { namespace REST {
    namespace _detail {
        std::string stringToLower(const std::string& input);

        struct CaseInsensitiveStringEqual {
            inline bool operator()(const std::string& lhs, const std::string& rhs) const {
                return stringToLower(lhs) == stringToLower(rhs);
            }
        };

        struct CaseInsensitiveStringHash {
            inline std::size_t operator()(const std::string& str) const {
                return std::hash<std::string>()(stringToLower(str));
            }
        };
    }

    /// Hash-map with case-insensitive string keys.
    using HeadersMap = std::unordered_map<std::string, std::string,
                                          _detail::CaseInsensitiveStringHash,
                                          _detail::CaseInsensitiveStringEqual>;

    /// Ordered query variables, keys may repeat.
    using QueryParams = std::vector<std::pair<std::string, std::string> >;

    struct HTTPResponse {
        unsigned statusCode = 0;

        HeadersMap headers;
        std::vector<uint8_t> body;
    };

    struct HTTPRequest {
        std::string method;
        std::string path;

        unsigned version = 11;
        std::vector<uint8_t> body;
        HeadersMap headers;
    };

    /**
     *  Kept-alive connection to single server.
     *
     *  \ref HTTPSConnection is the only implementation used in production,
     *  other implementations can be injected into RestClient through
     *  connection factory.
     */
    class HTTPConnection {
    public:
        virtual ~HTTPConnection() = default;

        virtual void open() = 0;
        virtual void close() = 0;
        virtual bool isOpen() const = 0;

        /**
         *  Send request and block until response is received.
         *
         *  \throws boost::system::system_error on I/O error.
         */
        virtual HTTPResponse request(const HTTPRequest& request) = 0;

        /// Headers added to every request sent using this connection.
        HeadersMap connectionHeaders;
    };

    class HTTPSConnection : public HTTPConnection {
    public:
        HTTPSConnection(boost::asio::io_context& ioContext, const std::string& serverName);
        ~HTTPSConnection() override;

        void open() override;
        void close() override;
        bool isOpen() const override;

        HTTPResponse request(const HTTPRequest& request) override;

        const std::string serverName;

    private:
        using TLSStream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

        boost::asio::io_context& ioContext;
        boost::asio::ssl::context tlsctx;

        // SSL session can't be reused after shutdown, stream is recreated on every open().
        std::unique_ptr<TLSStream> stream;

        bool alive = false;
    };

    struct MultipartEntity {
        std::string name;
        std::string filename;
        HeadersMap additionalHeaders;

        std::vector<uint8_t> body;
    };

    /**
     *  Build request with multipart/form-data body. Only Content-Type header
     *  and body are filled.
     */
    HTTPRequest buildMultipartRequest(const std::vector<MultipartEntity>& elements);

}} // namespace Harmonia::REST

#endif // HARMONIA_REST_HPP
