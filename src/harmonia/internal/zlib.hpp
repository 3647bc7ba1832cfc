#ifndef HARMONIA_ZLIB_HPP
#define HARMONIA_ZLIB_HPP

#include <harmonia/config.hpp>
#ifdef HARMONIA_ZLIB

#include <cstdint>
#include <memory>
#include <vector>
#include <boost/optional.hpp>

namespace Harmonia { namespace Zlib {
    /**
     * \internal
     *
     * Decompressor for gateway zlib-stream transport compression.
     *
     * Whole connection is one zlib stream, so inflate context is kept
     * between messages and must be reset only when connection is reopened.
     * Message may be split into several WebSocket frames, each message ends
     * with Z_SYNC_FLUSH suffix (00 00 FF FF).
     */
    class Inflater {
    public:
        Inflater();
        ~Inflater();

        Inflater(const Inflater&) = delete;
        Inflater& operator=(const Inflater&) = delete;

        /**
         * Append frame to pending buffer.
         *
         * \returns Decompressed message if frame completes it, boost::none otherwise.
         * \throws RuntimeError if data is corrupted.
         */
        boost::optional<std::vector<uint8_t> > feed(const std::vector<uint8_t>& frame);

        /**
         * Drop pending data and start new stream.
         */
        void reset();

        static bool endsWithFlushSuffix(const std::vector<uint8_t>& bytes);

    private:
        std::vector<uint8_t> inflatePending();

        struct Stream;
        std::unique_ptr<Stream> stream;
        std::vector<uint8_t> pending;
    };
}} // namespace Harmonia::Zlib

#endif // HARMONIA_ZLIB
#endif // HARMONIA_ZLIB_HPP
