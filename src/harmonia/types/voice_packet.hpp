#ifndef HARMONIA_TYPES_VOICE_PACKET_HPP
#define HARMONIA_TYPES_VOICE_PACKET_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Harmonia {
    /**
     * RTP packet carrying encrypted Opus frame, as sent over voice UDP socket.
     *
     *     0       1       2       3       4       8       12
     *     [ 0x80 ][ 0x78 ][ seq  ][ timestamp ][ ssrc ][ audio... ]
     *
     * All integers are big-endian.
     */
    struct VoicePacket {
        static constexpr std::size_t headerSize = 12;

        uint8_t  versionAndFlags = 0x80;
        uint8_t  payloadType     = 0x78;
        uint16_t sequence        = 0;
        uint32_t timestamp       = 0;
        uint32_t ssrc            = 0;

        std::vector<uint8_t> encryptedAudio;

        /// 12-byte RTP header, used as nonce base for encryption.
        std::vector<uint8_t> header() const;

        std::vector<uint8_t> serialize() const;

        /**
         * \throws InvalidParameter if there are less than 12 bytes.
         */
        static VoicePacket parse(const std::vector<uint8_t>& bytes);
    };
} // namespace Harmonia

#endif // HARMONIA_TYPES_VOICE_PACKET_HPP
