#include <harmonia/types/voice_packet.hpp>
#include <harmonia/exceptions.hpp>

namespace Harmonia {
    namespace {
        template<typename T>
        void writeBigEndian(std::vector<uint8_t>& out, T value) {
            for (int shift = (sizeof(T) - 1) * 8; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }

        template<typename T>
        T readBigEndian(const std::vector<uint8_t>& in, std::size_t offset) {
            T result = 0;
            for (std::size_t i = 0; i < sizeof(T); ++i) {
                result = static_cast<T>((result << 8) | in[offset + i]);
            }
            return result;
        }
    }

    constexpr std::size_t VoicePacket::headerSize;

    std::vector<uint8_t> VoicePacket::header() const {
        std::vector<uint8_t> result;
        result.reserve(headerSize);

        result.push_back(versionAndFlags);
        result.push_back(payloadType);
        writeBigEndian(result, sequence);
        writeBigEndian(result, timestamp);
        writeBigEndian(result, ssrc);
        return result;
    }

    std::vector<uint8_t> VoicePacket::serialize() const {
        std::vector<uint8_t> result = header();
        result.insert(result.end(), encryptedAudio.begin(), encryptedAudio.end());
        return result;
    }

    VoicePacket VoicePacket::parse(const std::vector<uint8_t>& bytes) {
        if (bytes.size() < headerSize) {
            throw InvalidParameter("bytes", "voice packet is shorter than RTP header (12 bytes).");
        }

        VoicePacket packet;
        packet.versionAndFlags = bytes[0];
        packet.payloadType     = bytes[1];
        packet.sequence        = readBigEndian<uint16_t>(bytes, 2);
        packet.timestamp       = readBigEndian<uint32_t>(bytes, 4);
        packet.ssrc            = readBigEndian<uint32_t>(bytes, 8);
        packet.encryptedAudio.assign(bytes.begin() + headerSize, bytes.end());
        return packet;
    }
} // namespace Harmonia
