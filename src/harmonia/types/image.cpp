#include <harmonia/types/image.hpp>

#include <boost/asio/io_context.hpp>   // boost::asio::io_context
#include <harmonia/internal/utils.hpp> // Utils::Magic, Utils::base64Encode
#include <harmonia/exceptions.hpp>     // LogicError
#include <harmonia/internal/rest.hpp>  // REST::HTTPSConnection

namespace Harmonia {

Image::Image(const File& file, ImageFormat format)
    : format(format == ImageFormat::Detect ? detectFormat(file) : format)
    , file(file)
{}

std::string Image::mimeType() const {
    switch (format) {
    case Jpeg: return "image/jpeg";
    case Png:  return "image/png";
    case Webp: return "image/webp";
    case Gif:  return "image/gif";
    default:   throw LogicError("Image format is not set.", -1);
    }
}

std::string Image::toDataUri() const {
    return std::string("data:") + mimeType() + ";base64," + Utils::base64Encode(file.bytes);
}

ImageFormat Image::detectFormat(const File& file) {
    if (Utils::Magic::isJfif(file.bytes)) return ImageFormat::Jpeg;
    if (Utils::Magic::isPng(file.bytes))  return ImageFormat::Png;
    if (Utils::Magic::isWebp(file.bytes)) return ImageFormat::Webp;
    if (Utils::Magic::isGif(file.bytes))  return ImageFormat::Gif;

    throw LogicError("Failed to detect image format.", -1);
}

namespace _detail {
    std::vector<uint8_t> cdnDownload(boost::asio::io_context& ioContext, const std::string& path) {
        REST::HTTPSConnection connection(ioContext, "cdn.discordapp.com");
        connection.open();

        REST::HTTPRequest request;
        request.method  = "GET";
        request.path    = path;
        request.version = 11;

        REST::HTTPResponse response = connection.request(request);
        if (response.statusCode != 200) {
            throw LogicError(std::string("HTTP status code: ") + std::to_string(response.statusCode), -1);
        }
        if (response.body.empty()) {
            throw LogicError("Response body is empty (are you trying to download non-animated avatar as GIF?)", -1);
        }

        return response.body;
    }
} // namespace _detail

} // namespace Harmonia
