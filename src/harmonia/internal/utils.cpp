#include <harmonia/internal/utils.hpp>
#include <algorithm>    // std::all_of, std::count_if
#include <cctype>       // std::isalnum, std::isdigit, std::isspace, std::tolower
#include <stdexcept>    // std::invalid_argument
#include <sstream>      // std::ostringstream, std::istringstream
#include <iomanip>      // std::setw
#include <unordered_map>

namespace Harmonia { namespace Utils {
    namespace Magic {
        bool isGif(const std::vector<uint8_t>& bytes) {
            // according to http://fileformats.archiveteam.org/wiki/GIF
            return bytes.size() >= 6 &&
                bytes[0] == 'G' &&  // should begin with 'GIF'
                bytes[1] == 'I' &&
                bytes[2] == 'F' &&
                bytes[3] == '8' &&  // then GIF version, '87a' or '89a'
                (bytes[4] == '7' || bytes[4] == '9') &&
                bytes[5] == 'a';
        }

        bool isJfif(const std::vector<uint8_t>& bytes) {
            // according to http://fileformats.archiveteam.org/wiki/JFIF
            return bytes.size() >= 3 &&
                bytes[0] == 0xFF &&
                bytes[1] == 0xD8 &&
                bytes[2] == 0xFF;
        }

        bool isPng(const std::vector<uint8_t>& bytes) {
            // according to https://www.w3.org/TR/PNG/#5PNG-file-signature
            return bytes.size() >= 12 && // signature + single no-data chunk size
                bytes[0] == 137 &&
                bytes[1] == 'P' &&
                bytes[2] == 'N' &&
                bytes[3] == 'G' &&
                bytes[4] == 13  && // CR
                bytes[5] == 10  && // LF
                bytes[6] == 26  && // SUB
                bytes[7] == 10;    // LF
        }

        bool isWebp(const std::vector<uint8_t>& bytes) {
            // "RIFF" <size:4> "WEBP"
            return bytes.size() >= 12 &&
                bytes[0] == 'R' && bytes[1] == 'I' && bytes[2] == 'F'  && bytes[3] == 'F' &&
                bytes[8] == 'W' && bytes[9] == 'E' && bytes[10] == 'B' && bytes[11] == 'P';
        }
    }

    std::string domainFromUrl(const std::string& url) {
        enum State {
            ReadingSchema,
            ReadingSchema_Colon,
            ReadingSchema_FirstSlash,
            ReadingSchema_SecondSlash,
            ReadingDomain,
            End
        } state = ReadingSchema;

        std::string result;
        for (char ch : url) {
            switch (state) {
            case ReadingSchema:
                if (ch == ':') {
                    state = ReadingSchema_Colon;
                } else if (!std::isalnum(static_cast<unsigned char>(ch))) {
                    throw std::invalid_argument("Missing colon after schema.");
                }
                break;
            case ReadingSchema_Colon:
                if (ch == '/') {
                    state = ReadingSchema_FirstSlash;
                } else {
                    throw std::invalid_argument("Missing slash after schema.");
                }
                break;
            case ReadingSchema_FirstSlash:
                if (ch == '/') {
                    state = ReadingSchema_SecondSlash;
                } else {
                    throw std::invalid_argument("Missing slash after schema.");
                }
                break;
            case ReadingSchema_SecondSlash:
                if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '_') {
                    state = ReadingDomain;
                    result += ch;
                } else {
                    throw std::invalid_argument("Invalid first domain character.");
                }
                break;
            case ReadingDomain:
                if (ch == '/' || ch == '?' || ch == '#' || ch == ':') {
                    state = End;
                } else {
                    result += ch;
                }
                break;
            case End:
                break;
            }
            if (state == End) break;
        }
        if (result.empty()) throw std::invalid_argument("URL doesn't contain domain.");
        return result;
    }

    std::string base64Encode(const std::vector<uint8_t>& data) {
        static constexpr char base64Map[65] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        // Use = signs so the end is properly padded.
        std::string result((((data.size() + 2) / 3) * 4), '=');
        size_t outpos = 0;
        int bitsCollected = 0;
        unsigned accumulator = 0;

        for (uint8_t byte : data) {
            accumulator = (accumulator << 8) | (byte & 0xffu);
            bitsCollected += 8;
            while (bitsCollected >= 6) {
                bitsCollected -= 6;
                result[outpos++] = base64Map[(accumulator >> bitsCollected) & 0x3fu];
            }
        }
        if (bitsCollected > 0) { // Any trailing bits that are missing.
            accumulator <<= 6 - bitsCollected;
            result[outpos++] = base64Map[accumulator & 0x3fu];
        }
        return result;
    }

    std::string urlEncode(const std::string& raw) {
        std::ostringstream resultStream;

        resultStream.fill('0');
        resultStream << std::hex << std::uppercase;

        for (char ch : raw) {
            unsigned char uch = static_cast<unsigned char>(ch);
            if (std::isalnum(uch) || ch == '.' || ch == '~' || ch == '_' || ch == '-') {
                resultStream << ch;
            } else {
                resultStream << '%' << std::setw(2) << unsigned(uch);
            }
        }
        return resultStream.str();
    }

    std::string makeQueryString(const std::vector<std::pair<std::string, std::string> >& queryVariables) {
        if (queryVariables.empty()) return "";

        std::string result = "?";
        for (const auto& variable : queryVariables) {
            if (result.size() != 1) result += '&';
            result += urlEncode(variable.first) + "=" + urlEncode(variable.second);
        }
        return result;
    }

    std::vector<std::string> split(const std::string& str, char delimiter) {
        std::vector<std::string> result;
        std::istringstream iss(str);
        std::string part;
        while (std::getline(iss, part, delimiter)) {
            result.push_back(part);
        }
        return result;
    }

    bool isNumber(const std::string& input) {
        return !input.empty() && std::all_of(input.begin(), input.end(), [](char ch) {
            return std::isdigit(static_cast<unsigned char>(ch)) != 0;
        });
    }

    std::string mimeTypeFromFilename(const std::string& filename) {
        static const std::unordered_map<std::string, std::string> extensionToMime {
            { "png",  "image/png"        },
            { "jpg",  "image/jpeg"       },
            { "jpeg", "image/jpeg"       },
            { "gif",  "image/gif"        },
            { "webp", "image/webp"       },
            { "json", "application/json" },
            { "txt",  "text/plain"       },
            { "mp3",  "audio/mpeg"       },
            { "ogg",  "audio/ogg"        },
            { "mp4",  "video/mp4"        },
        };

        auto dotPos = filename.rfind('.');
        if (dotPos == std::string::npos) return "application/octet-stream";

        std::string extension = filename.substr(dotPos + 1);
        std::transform(extension.begin(), extension.end(), extension.begin(), [](char ch) {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        });

        auto it = extensionToMime.find(extension);
        return it != extensionToMime.end() ? it->second : "application/octet-stream";
    }

    bool isBlank(const std::string& str) {
        return std::all_of(str.begin(), str.end(), [](char ch) {
            return std::isspace(static_cast<unsigned char>(ch)) != 0;
        });
    }

    std::size_t utf8Length(const std::string& str) {
        return std::count_if(str.begin(), str.end(), [](char ch) {
            return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
        });
    }
}} // namespace Harmonia::Utils
