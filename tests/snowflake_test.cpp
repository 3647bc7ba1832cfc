#include <unordered_set>
#include <gtest/gtest.h>
#include <harmonia/exceptions.hpp>
#include <harmonia/types/snowflake.hpp>

using namespace Harmonia;

TEST(SnowflakeTest, Components) {
    // Example from Discord documentation.
    Snowflake snowflake(175928847299117063ull);

    EXPECT_EQ(snowflake.timestamp(), 1462015105796ull);
    EXPECT_EQ(snowflake.unixTimestamp(), 1462015105);
    EXPECT_EQ(snowflake.workerId(), 1u);
    EXPECT_EQ(snowflake.processId(), 0u);
    EXPECT_EQ(snowflake.increment(), 7u);
}

TEST(SnowflakeTest, FromString) {
    Snowflake snowflake(std::string("175928847299117063"));

    EXPECT_EQ(snowflake.value, 175928847299117063ull);
    EXPECT_EQ(snowflake.toString(), "175928847299117063");
}

TEST(SnowflakeTest, MalformedStringRejected) {
    EXPECT_THROW(Snowflake(std::string("-1")), InvalidParameter);
    EXPECT_THROW(Snowflake(std::string("+5")), InvalidParameter);
    EXPECT_THROW(Snowflake(std::string(" 5")), InvalidParameter);
    EXPECT_THROW(Snowflake(std::string("")), InvalidParameter);
    EXPECT_THROW(Snowflake(std::string("12abc")), InvalidParameter);
    EXPECT_THROW(Snowflake(std::string("18446744073709551616")), InvalidParameter);

    EXPECT_EQ(Snowflake(std::string("18446744073709551615")).value, 18446744073709551615ull);
}

TEST(SnowflakeTest, MalformedJsonStringRejected) {
    EXPECT_THROW(nlohmann::json("-1").get<Snowflake>(), InvalidParameter);
}

TEST(SnowflakeTest, FromTimestamp) {
    Snowflake snowflake = Snowflake::fromTimestamp(1462015105796ull);

    EXPECT_EQ(snowflake.timestamp(), 1462015105796ull);
    EXPECT_EQ(snowflake.increment(), 0u);
    EXPECT_LT(uint64_t(snowflake), 175928847299117063ull);
}

TEST(SnowflakeTest, JsonIsString) {
    nlohmann::json json = Snowflake(42);

    ASSERT_TRUE(json.is_string());
    EXPECT_EQ(json.get<std::string>(), "42");
}

TEST(SnowflakeTest, JsonAcceptsStringAndNumber) {
    EXPECT_EQ(nlohmann::json("123").get<Snowflake>().value, 123u);
    EXPECT_EQ(nlohmann::json(456).get<Snowflake>().value, 456u);
}

TEST(SnowflakeTest, Hashable) {
    std::unordered_set<Snowflake> set = { Snowflake(1), Snowflake(2), Snowflake(1) };

    EXPECT_EQ(set.size(), 2u);
}
