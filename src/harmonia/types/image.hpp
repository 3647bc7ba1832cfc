#ifndef HARMONIA_TYPES_IMAGE_HPP
#define HARMONIA_TYPES_IMAGE_HPP

#include <vector>
#include <string>
#include <harmonia/exceptions.hpp>
#include <harmonia/types/snowflake.hpp>
#include <harmonia/types/file.hpp>

namespace boost { namespace asio { class io_context; }}

namespace Harmonia {

    /**
     * Image formats supported by API.
     */
    enum ImageFormat {
        Detect = 0,

        Jpeg = 1<<1,
        Png  = 1<<2,
        Webp = 1<<3,
        Gif  = 1<<4,
    };

    /**
     * Container for (format, file) pair.
     */
    struct Image {
        /**
         * Construct new image instance.
         *
         * If format is Detect and detection failed, LogicError
         * will be thrown.
         */
        Image(const File& file, ImageFormat format = Detect);

        /**
         * MIME type of \ref format, e.g. "image/png".
         */
        std::string mimeType() const;

        /**
         * Image encoded as data URI ("data:image/png;base64,...").
         * This is the form API accepts for avatars, icons and emojis.
         */
        std::string toDataUri() const;

        /**
         * Forced or detected (if Detect passed in c-tor) format.
         */
        ImageFormat format;
        File file;

    private:
        static ImageFormat detectFormat(const File& file);
    };

    enum ImageType {
        CustomEmoji       = (1<<5 ) | ImageFormat::Png | ImageFormat::Gif | ImageFormat::Webp,
        GuildIcon         = (1<<6 ) | ImageFormat::Png | ImageFormat::Jpeg | ImageFormat::Webp | ImageFormat::Gif,
        GuildSplash       = (1<<7 ) | ImageFormat::Png | ImageFormat::Jpeg | ImageFormat::Webp,
        DefaultUserAvatar = (1<<8 ) | ImageFormat::Png,
        UserAvatar        = (1<<9 ) | ImageFormat::Png | ImageFormat::Jpeg | ImageFormat::Webp | ImageFormat::Gif,
        ApplicationIcon   = (1<<10) | ImageFormat::Png | ImageFormat::Jpeg | ImageFormat::Webp,
        GuildBanner       = (1<<11) | ImageFormat::Png | ImageFormat::Jpeg | ImageFormat::Webp | ImageFormat::Gif,
    };
    // ^ enum values contain bitmask of supported formats, first element added
    // to make sure enum don't have same value.

    /**
     * Implementation details. Probably not what you looking for.
     */
    namespace _detail {
        constexpr const char* cdnBaseUrl = "https://cdn.discordapp.com";

        std::vector<uint8_t> cdnDownload(boost::asio::io_context& ioContext, const std::string& path);

        inline constexpr bool isPowerOfTwo(unsigned number) {
            return ((number != 0) && ((number & (~number + 1)) == number));
        }

        inline constexpr bool isSupportedFormat(ImageType type, ImageFormat format) {
            return (type & format) == format;
        }

        inline void checkSize(unsigned size) {
            if (!isPowerOfTwo(size) || size < 16 || size > 4096) {
                throw LogicError("Image size must be power of two between 16 and 4096.", -1);
            }
        }

        template<ImageType> std::string basePath();

        template<> inline std::string basePath<CustomEmoji>()       { return "/emojis";         }
        template<> inline std::string basePath<GuildIcon>()         { return "/icons";          }
        template<> inline std::string basePath<GuildSplash>()       { return "/splashes";       }
        template<> inline std::string basePath<DefaultUserAvatar>() { return "/embed/avatars";  }
        template<> inline std::string basePath<UserAvatar>()        { return "/avatars";        }
        template<> inline std::string basePath<ApplicationIcon>()   { return "/app-icons";      }
        template<> inline std::string basePath<GuildBanner>()       { return "/banners";        }

        template<ImageFormat> std::string formatExtension();

        template<> inline std::string formatExtension<Jpeg>() { return "jpg";  }
        template<> inline std::string formatExtension<Png>()  { return "png";  }
        template<> inline std::string formatExtension<Webp>() { return "webp"; }
        template<> inline std::string formatExtension<Gif>()  { return "gif";  }
    } // namespace _detail

    /**
     * Reference to remote image stored on Discord CDN.
     */
    template<ImageType Type>
    struct ImageReference {
        inline ImageReference(Snowflake id, const std::string& hash)
            : id(id)
            , hash(hash) {}

        /**
         * Return path for this image on cdn.discordapp.com, relative to host.
         *
         * size can be power of two between 16 and 4096.
         */
        template<ImageFormat Format>
        inline std::string path(unsigned size) const {
            static_assert(_detail::isSupportedFormat(Type, Format), "Format is not supported for this image type.");
            _detail::checkSize(size);

            // {base_path}/{id}/{hash}.{format_extension}?size={size}
            //   avatars/339355417366888458/35fa476e4898faf740cc48edb989f20c.png?size=2048
            return _detail::basePath<Type>() + "/" + id.toString() + "/" +
                   hash + "." + _detail::formatExtension<Format>() +
                   "?size=" + std::to_string(size);
        }

        /**
         * Return remote URL for this image.
         *
         * Can be useful if you want to reference image from message embed or
         * somewhere else without downloading it.
         */
        template<ImageFormat Format>
        inline std::string url(unsigned size) const {
            return std::string(_detail::cdnBaseUrl) + path<Format>(size);
        }

        /**
         * Check whatever image is animated (GIF).
         *
         * Animated avatars can be \ref download()'ed as PNG or other regular format, but
         * attempt to download regular avatar as GIF will throw LogicError.
         */
        inline bool isAnimated() const {
            // check if hash begins with "a_".
            return hash.size() >= 2 && hash[0] == 'a' && hash[1] == '_';
        }

        /**
         * Download this image. ioContext used to construct HTTP connection object.
         *
         * May throw LogicError if body is empty (see \ref isAnimated()) and
         * boost::system::system_error on connection error.
         */
        template<ImageFormat Format>
        inline Image download(boost::asio::io_context& ioContext, unsigned size) const {
            return Image(File(hash + "." + _detail::formatExtension<Format>(),
                              _detail::cdnDownload(ioContext, path<Format>(size))),
                         Format);
        }

        Snowflake id;
        std::string hash;
    };

    template<>
    struct ImageReference<CustomEmoji> {
        inline ImageReference(Snowflake emojiId)
            : id(emojiId) {}

        template<ImageFormat Format>
        inline std::string path(unsigned size) const {
            static_assert(_detail::isSupportedFormat(CustomEmoji, Format), "Format is not supported for this image type.");
            _detail::checkSize(size);

            return _detail::basePath<CustomEmoji>() + "/" + id.toString() + "." +
                   _detail::formatExtension<Format>() + "?size=" + std::to_string(size);
        }

        template<ImageFormat Format>
        inline std::string url(unsigned size) const {
            return std::string(_detail::cdnBaseUrl) + path<Format>(size);
        }

        template<ImageFormat Format>
        inline Image download(boost::asio::io_context& ioContext, unsigned size) const {
            return Image(File(id.toString() + "." + _detail::formatExtension<Format>(),
                              _detail::cdnDownload(ioContext, path<Format>(size))),
                         Format);
        }

        Snowflake id;
    };

    template<>
    struct ImageReference<DefaultUserAvatar> {
        /**
         * \param index Either legacy discriminator modulo 5 or (user_id >> 22) % 6
         *              for users migrated to unique usernames.
         */
        inline ImageReference(unsigned index)
            : index(index) {}

        /// Reference to default avatar of user with new (discriminator-less) username.
        static inline ImageReference forUser(Snowflake userId) {
            return ImageReference(static_cast<unsigned>((userId.value >> 22) % 6));
        }

        template<ImageFormat Format>
        inline std::string path(unsigned size) const {
            static_assert(_detail::isSupportedFormat(DefaultUserAvatar, Format), "Format is not supported for this image type.");
            _detail::checkSize(size);

            return _detail::basePath<DefaultUserAvatar>() + "/" +
                   std::to_string(index) + "." + _detail::formatExtension<Format>() +
                   "?size=" + std::to_string(size);
        }

        template<ImageFormat Format>
        inline std::string url(unsigned size) const {
            return std::string(_detail::cdnBaseUrl) + path<Format>(size);
        }

        constexpr inline bool isAnimated() const {
            return false;
        }

        template<ImageFormat Format>
        inline Image download(boost::asio::io_context& ioContext, unsigned size) const {
            return Image(File(std::to_string(index) + "." + _detail::formatExtension<Format>(),
                              _detail::cdnDownload(ioContext, path<Format>(size))),
                         Format);
        }

        unsigned index;
    };

} // namespace Harmonia

#endif // HARMONIA_TYPES_IMAGE_HPP
