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

#include <harmonia/internal/zlib.hpp>
#ifdef HARMONIA_ZLIB

#include <string>
#include <zlib.h>
#include <harmonia/exceptions.hpp>

#if defined(HARMONIA_DEBUG_LOG)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr <<  "zlib.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

// Closer to trivial message size => better.
constexpr size_t ZlibBufferSize = 16 * 1024;

namespace Harmonia {
namespace Zlib {
    struct Inflater::Stream {
        z_stream zs;
    };

    namespace {
        void initStream(z_stream& zs) {
            zs.zalloc   = Z_NULL;
            zs.zfree    = Z_NULL;
            zs.opaque   = Z_NULL;
            zs.avail_in = 0;
            zs.next_in  = Z_NULL;

            int status = inflateInit(&zs);
            if (status != Z_OK) {
                throw RuntimeError(std::string("inflateInit failed: ") + (zs.msg ? zs.msg : "unknown error"), status);
            }
        }
    }

    Inflater::Inflater() : stream(new Stream) {
        initStream(stream->zs);
    }

    Inflater::~Inflater() {
        inflateEnd(&stream->zs);
    }

    bool Inflater::endsWithFlushSuffix(const std::vector<uint8_t>& bytes) {
        if (bytes.size() < 4) return false;

        auto end = bytes.end();
        return *(end - 4) == 0x00 && *(end - 3) == 0x00 &&
               *(end - 2) == 0xFF && *(end - 1) == 0xFF;
    }

    boost::optional<std::vector<uint8_t> > Inflater::feed(const std::vector<uint8_t>& frame) {
        pending.insert(pending.end(), frame.begin(), frame.end());
        if (!endsWithFlushSuffix(pending)) {
            DEBUG_MSG(std::string("Partial zlib message, buffered ") + std::to_string(pending.size()) + " bytes.");
            return boost::none;
        }

        std::vector<uint8_t> result = inflatePending();
        pending.clear();
        return result;
    }

    void Inflater::reset() {
        pending.clear();
        int status = inflateReset(&stream->zs);
        if (status != Z_OK) {
            throw RuntimeError("inflateReset failed.", status);
        }
    }

    std::vector<uint8_t> Inflater::inflatePending() {
        z_stream& zs = stream->zs;
        uint8_t out[ZlibBufferSize];

        zs.next_in  = pending.data();
        zs.avail_in = static_cast<uInt>(pending.size());

        std::vector<uint8_t> result;
        do {
            zs.avail_out = ZlibBufferSize;
            zs.next_out  = &out[0];

            int status = inflate(&zs, Z_SYNC_FLUSH);
            if (status != Z_OK && status != Z_STREAM_END && status != Z_BUF_ERROR) {
                std::string message = std::string("inflate failed: ") + (zs.msg ? zs.msg : "unknown error");
                DEBUG_MSG(message);
                throw RuntimeError(message, status);
            }

            result.insert(result.end(), out, out + (ZlibBufferSize - zs.avail_out));

            // Z_BUF_ERROR: no progress possible, everything consumed.
            if (status == Z_BUF_ERROR || status == Z_STREAM_END) break;
        } while (zs.avail_out == 0 || zs.avail_in != 0);

        return result;
    }
} // namespace Zlib
} // namespace Harmonia
#endif // HARMONIA_ZLIB
