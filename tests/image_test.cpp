#include <sstream>
#include <gtest/gtest.h>
#include <harmonia/exceptions.hpp>
#include <harmonia/types/image.hpp>

using namespace Harmonia;

namespace {
    const std::vector<uint8_t> pngBytes = { 137, 'P', 'N', 'G', 13, 10, 26, 10, 0, 0, 0, 13 };
    const std::vector<uint8_t> gifBytes = { 'G', 'I', 'F', '8', '9', 'a', 1, 0, 1, 0 };
}

TEST(ImageTest, DetectsFormat) {
    EXPECT_EQ(Image(File("a", pngBytes)).format, Png);
    EXPECT_EQ(Image(File("b", gifBytes)).format, Gif);
    EXPECT_EQ(Image(File("c", std::vector<uint8_t>{ 0xFF, 0xD8, 0xFF, 0xE0 })).format, Jpeg);
}

TEST(ImageTest, UnknownFormatThrows) {
    EXPECT_THROW(Image(File("d", std::vector<uint8_t>{ 1, 2, 3 })), LogicError);
}

TEST(ImageTest, ForcedFormatSkipsDetection) {
    Image image(File("e", std::vector<uint8_t>{ 1, 2, 3 }), Webp);

    EXPECT_EQ(image.mimeType(), "image/webp");
}

TEST(ImageTest, DataUri) {
    Image image(File("f", std::vector<uint8_t>{ 'f', 'o', 'o' }), Png);

    EXPECT_EQ(image.toDataUri(), "data:image/png;base64,Zm9v");
}

TEST(ImageTest, FileFromStream) {
    File file("notes.txt", std::istringstream("hello"));

    EXPECT_EQ(file.filename, "notes.txt");
    EXPECT_EQ(std::string(file.bytes.begin(), file.bytes.end()), "hello");
}

TEST(ImageTest, MissingFileThrows) {
    EXPECT_THROW(File("/nonexistent/harmonia/avatar.png"), RuntimeError);
}

TEST(ImageTest, UserAvatarReference) {
    ImageReference<UserAvatar> avatar(80351110224678912ull, "a_8342729096ea3675442027381ff50dfe");

    EXPECT_TRUE(avatar.isAnimated());
    EXPECT_EQ(avatar.path<Png>(128), "/avatars/80351110224678912/a_8342729096ea3675442027381ff50dfe.png?size=128");
    EXPECT_EQ(avatar.url<Gif>(4096),
              "https://cdn.discordapp.com/avatars/80351110224678912/a_8342729096ea3675442027381ff50dfe.gif?size=4096");
}

TEST(ImageTest, SizeMustBePowerOfTwo) {
    ImageReference<GuildIcon> icon(1, "hash");

    EXPECT_THROW(icon.path<Png>(100), LogicError);
    EXPECT_THROW(icon.path<Png>(8), LogicError);
    EXPECT_THROW(icon.path<Png>(8192), LogicError);
    EXPECT_NO_THROW(icon.path<Png>(16));
}

TEST(ImageTest, EmojiAndDefaultAvatar) {
    EXPECT_EQ(ImageReference<CustomEmoji>(41771983429993937ull).path<Png>(64),
              "/emojis/41771983429993937.png?size=64");

    EXPECT_EQ(ImageReference<DefaultUserAvatar>(3).path<Png>(256), "/embed/avatars/3.png?size=256");

    // (id >> 22) % 6
    ImageReference<DefaultUserAvatar> migrated = ImageReference<DefaultUserAvatar>::forUser(5ull << 22);
    EXPECT_EQ(migrated.index, 5u);
}
