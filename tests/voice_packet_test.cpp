#include <gtest/gtest.h>
#include <harmonia/exceptions.hpp>
#include <harmonia/types/voice_packet.hpp>

using namespace Harmonia;

TEST(VoicePacketTest, HeaderIsBigEndian) {
    VoicePacket packet;
    packet.sequence  = 0x0102;
    packet.timestamp = 0x03040506;
    packet.ssrc      = 0x0708090A;
    packet.encryptedAudio = { 0xAA, 0xBB };

    std::vector<uint8_t> expectedHeader = { 0x80, 0x78, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0A };
    EXPECT_EQ(packet.header(), expectedHeader);

    std::vector<uint8_t> expectedPacket = expectedHeader;
    expectedPacket.push_back(0xAA);
    expectedPacket.push_back(0xBB);
    EXPECT_EQ(packet.serialize(), expectedPacket);
}

TEST(VoicePacketTest, Parse) {
    VoicePacket packet = VoicePacket::parse({ 0x80, 0x78, 0xFF, 0xFE, 0, 0, 0x03, 0xC0, 0, 0, 0, 42, 1, 2, 3 });

    EXPECT_EQ(packet.sequence, 0xFFFE);
    EXPECT_EQ(packet.timestamp, 960u);
    EXPECT_EQ(packet.ssrc, 42u);
    EXPECT_EQ(packet.encryptedAudio, std::vector<uint8_t>({ 1, 2, 3 }));
}

TEST(VoicePacketTest, HeaderOnly) {
    VoicePacket packet = VoicePacket::parse(std::vector<uint8_t>(VoicePacket::headerSize, 0));

    EXPECT_TRUE(packet.encryptedAudio.empty());
}

TEST(VoicePacketTest, ShortPacketThrows) {
    EXPECT_THROW(VoicePacket::parse(std::vector<uint8_t>(11, 0)), InvalidParameter);
}
