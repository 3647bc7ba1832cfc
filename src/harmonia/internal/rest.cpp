#include <harmonia/internal/rest.hpp>

#include <cctype>                                   // std::tolower
#include <sstream>                                  // std::ostringstream
#include <openssl/ssl.h>                            // SSL_set_tlsext_host_name
#include <openssl/err.h>                            // ERR_get_error
#include <boost/asio/connect.hpp>                   // boost::asio::connect
#include <boost/asio/ssl/error.hpp>                 // boost::asio::ssl::error::stream_truncated
#include <boost/asio/ssl/host_name_verification.hpp>// boost::asio::ssl::host_name_verification
#include <boost/beast/http/write.hpp>               // boost::beast::http::write
#include <boost/beast/http/read.hpp>                // boost::beast::http::read
#include <boost/beast/http/vector_body.hpp>         // boost::beast::http::vector_body
#include <boost/beast/http/error.hpp>               // boost::beast::http::error::end_of_stream
#include <boost/beast/core/flat_buffer.hpp>         // boost::beast::flat_buffer
#include <harmonia/config.hpp>

#if defined(HARMONIA_DEBUG_LOG)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr <<  "rest.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace ssl  = boost::asio::ssl;
namespace http = boost::beast::http;
using     tcp  = boost::asio::ip::tcp;

namespace Harmonia { namespace REST {
namespace _detail {
    std::string stringToLower(const std::string& input) {
        std::string result;
        result.reserve(input.size());

        for (char ch : input) {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        return result;
    }
}

HTTPSConnection::HTTPSConnection(boost::asio::io_context& ioContext, const std::string& serverName)
    : serverName(serverName)
    , ioContext(ioContext)
    , tlsctx(ssl::context::tlsv12_client) {

    tlsctx.set_default_verify_paths();
    tlsctx.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
    tlsctx.set_verify_callback(ssl::host_name_verification(serverName));
}

HTTPSConnection::~HTTPSConnection() {
    if (!stream || !stream->lowest_layer().is_open()) return;

    boost::system::error_code ec;
    stream->shutdown(ec);
    stream->lowest_layer().close(ec);
}

void HTTPSConnection::open() {
    DEBUG_MSG(std::string("Connecting to ") + serverName + "...");

    stream.reset(new TLSStream(ioContext, tlsctx));

    tcp::resolver resolver(ioContext);
    auto resolutionResult = resolver.resolve(serverName, "https");

    // SNI, Cloudflare refuses handshake without it.
    if (!SSL_set_tlsext_host_name(stream->native_handle(), serverName.c_str())) {
        throw boost::system::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                                                    boost::asio::error::get_ssl_category()));
    }

    boost::asio::connect(stream->next_layer(), resolutionResult);
    stream->next_layer().set_option(tcp::no_delay(true));
    stream->handshake(ssl::stream_base::client);
    alive = true;
}

void HTTPSConnection::close() {
    alive = false;
    if (!stream) return;

    boost::system::error_code ec;
    stream->shutdown(ec);
    if (ec &&
        ec != boost::asio::error::eof &&
        ec != boost::asio::ssl::error::stream_truncated &&
        ec != boost::asio::error::broken_pipe &&
        ec != boost::asio::error::connection_reset) {

        throw boost::system::system_error(ec);
    }
    stream->next_layer().close(ec);
    stream.reset();
}

bool HTTPSConnection::isOpen() const {
    return stream && stream->lowest_layer().is_open() && alive;
}

HTTPResponse HTTPSConnection::request(const HTTPRequest& request) {
    //
    // Prepare request
    //
    http::request<http::vector_body<uint8_t> > rawRequest;

    rawRequest.method_string(request.method);
    rawRequest.target(request.path);
    rawRequest.version(request.version);

    // Set default headers.
    rawRequest.set(http::field::user_agent, "Generic HTTP 1.1 Client");
    rawRequest.set(http::field::connection, "keep-alive");
    rawRequest.set(http::field::accept,     "*/*");
    rawRequest.set(http::field::host,       serverName);
    if (!request.body.empty()) {
        rawRequest.set(http::field::content_type, "application/octet-stream");
    }

    // Set per-connection headers.
    for (const auto& header : connectionHeaders) {
        rawRequest.set(header.first, header.second);
    }

    // Set per-request
    for (const auto& header : request.headers) {
        rawRequest.set(header.first, header.second);
    }

    rawRequest.body() = request.body;
    rawRequest.prepare_payload();

    //
    // Perform request.
    //
    boost::system::error_code ec;

    if (!stream) throw boost::system::system_error(boost::asio::error::not_connected);

    alive = false;
    http::write(*stream, rawRequest, ec);
    if (ec && ec != http::error::end_of_stream) throw boost::system::system_error(ec);

    http::response<http::vector_body<uint8_t> > response;
    boost::beast::flat_buffer buffer;
    http::read(*stream, buffer, response);

    HTTPResponse responseStruct;
    responseStruct.statusCode = response.result_int();
    responseStruct.body       = std::move(response.body());
    for (const auto& header : response) {
        auto name  = header.name_string();
        auto value = header.value();
        responseStruct.headers[std::string(name.data(), name.size())] = std::string(value.data(), value.size());
    }
    alive = response.keep_alive();

    return responseStruct;
}

HTTPRequest buildMultipartRequest(const std::vector<MultipartEntity>& elements) {
    HTTPRequest request;
    std::ostringstream oss;

    // Fixed boundary. Must not appear in any part body, random-looking enough for JSON and images.
    const std::string boundary = "LPN3rnFZYl77S6RI2YHlqA1O1NbvBDelp1lOlMgjSm9VaOV7ufw5fh3qvy2JUq";

    request.headers["Content-Type"] = std::string("multipart/form-data; boundary=") + boundary;

    for (const auto& element : elements) {
        oss << "--" << boundary << "\r\n"
            << "Content-Disposition: form-data; name=\"" << element.name << "\"";
        if (!element.filename.empty()) {
            oss << "; filename=\"" << element.filename << '"';
        }
        oss << "\r\n";
        for (const auto& header : element.additionalHeaders) {
            oss << header.first << ": " << header.second << "\r\n";
        }
        oss << "\r\n";
        oss.write(reinterpret_cast<const char*>(element.body.data()), element.body.size());
        oss << "\r\n";
    }
    oss << "--" << boundary << "--\r\n";

    std::string resultStr = oss.str();
    request.body = std::vector<uint8_t>(resultStr.begin(), resultStr.end());
    return request;
}

}} // namespace Harmonia::REST
