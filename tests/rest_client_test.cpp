#include <gtest/gtest.h>
#include <harmonia/config.hpp>
#include <harmonia/exceptions.hpp>
#include <harmonia/rest_client.hpp>
#include "fake_connection.hpp"

using namespace Harmonia;
using namespace Harmonia::Testing;

TEST_F(RestClientTest, SendsAuthorizationAndUserAgent) {
    server->replyJson(200, {{ "id", "1" }});

    nlohmann::json result = client.getChannel(1);

    ASSERT_EQ(server->requests.size(), 1u);
    const REST::HTTPRequest& request = server->last();
    EXPECT_EQ(request.method, "GET");
    EXPECT_EQ(request.path, api("/channels/1"));
    EXPECT_EQ(header(request, "Authorization"), "Bot secret");
    EXPECT_EQ(header(request, "user-agent").find("DiscordBot ("), 0u);
    EXPECT_EQ(header(request, "Accept"), "application/json");
    EXPECT_FALSE(hasHeader(request, "Content-Type"));
    EXPECT_TRUE(request.body.empty());
    EXPECT_EQ(result["id"], "1");
}

TEST(RestClientTokenTest, BearerTokenPrefix) {
    auto server = std::make_shared<FakeServer>();
    RestClient client(fakeFactory(server), "oauth", TokenType::Bearer);

    client.getCurrentUser();

    EXPECT_EQ(header(server->last(), "Authorization"), "Bearer oauth");
    EXPECT_EQ(client.tokenType(), TokenType::Bearer);
}

TEST_F(RestClientTest, JsonPayloadHasContentType) {
    server->replyJson(200, {{ "id", "5" }});

    client.sendTextMessage(10, "hello");

    const REST::HTTPRequest& request = server->last();
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.path, api("/channels/10/messages"));
    EXPECT_EQ(header(request, "Content-Type"), "application/json");
    EXPECT_EQ(jsonOf(request), nlohmann::json({{ "content", "hello" }}));
}

TEST_F(RestClientTest, EmptyBodyReturnsNull) {
    server->reply(204);

    nlohmann::json result = client.sendRestRequest(Route("DELETE", "/channels/:channel_id",
                                                         {{ "channel_id", "3" }}));
    EXPECT_TRUE(result.is_null());
}

TEST_F(RestClientTest, AuditLogReasonIsUrlEncoded) {
    client.kickMember(1, 2, std::string("spam & flood"));

    const REST::HTTPRequest& request = server->last();
    EXPECT_EQ(request.method, "DELETE");
    EXPECT_EQ(request.path, api("/guilds/1/members/2"));
    EXPECT_EQ(header(request, "X-Audit-Log-Reason"), "spam%20%26%20flood");
}

TEST_F(RestClientTest, BlankReasonIsNotSent) {
    client.kickMember(1, 2, std::string("   "));
    EXPECT_FALSE(hasHeader(server->last(), "X-Audit-Log-Reason"));

    client.kickMember(1, 2);
    EXPECT_FALSE(hasHeader(server->last(), "X-Audit-Log-Reason"));
}

TEST_F(RestClientTest, FactoryCalledOnceOnConstruction) {
    EXPECT_EQ(server->connectionsCreated, 1u);
    EXPECT_TRUE(server->requests.empty());

    server->replyJson(200, {{ "id", "1" }});
    client.getUser(1);
    EXPECT_EQ(server->connectionsCreated, 1u);
}

TEST_F(RestClientTest, ReconnectsOnceWhenServerClosedConnection) {
    server->dropNext = 1;
    server->replyJson(200, {{ "id", "1" }});

    nlohmann::json result = client.getUser(1);

    EXPECT_EQ(result["id"], "1");
    EXPECT_EQ(server->connectionsCreated, 2u);
    ASSERT_EQ(server->requests.size(), 1u);
    // Connection headers survive reconnect.
    EXPECT_EQ(header(server->last(), "Authorization"), "Bot secret");
}

TEST_F(RestClientTest, SecondConnectionDropIsPropagated) {
    server->dropNext = 2;

    EXPECT_THROW(client.getUser(1), boost::system::system_error);
}

#ifndef HARMONIA_RATELIMIT_HIT_AS_ERROR
TEST_F(RestClientTest, RetriesAfterRateLimitHit) {
    server->replyJson(429, {{ "retry_after", 1.5 }, { "global", false }, { "message", "You are being rate limited." }});
    server->replyJson(200, {{ "id", "7" }});

    nlohmann::json result = client.getMessage(1, 7);

    EXPECT_EQ(result["id"], "7");
    EXPECT_EQ(server->requests.size(), 2u);
    EXPECT_NEAR(clock.totalSlept(), 1.5, 0.01);
}

TEST_F(RestClientTest, RetryAfterHeaderUsedWithoutBody) {
    server->reply(429, "", {{ "Retry-After", "2" }});
    server->replyJson(200, {{ "id", "7" }});

    client.getMessage(1, 7);

    EXPECT_NEAR(clock.totalSlept(), 2.0, 0.01);
}

TEST_F(RestClientTest, RetryAfterHeaderUsedWhenBodyLacksIt) {
    server->replyJson(429, {{ "message", "You are being blocked from accessing our API temporarily." }},
                      {{ "Retry-After", "2" }});
    server->replyJson(200, {{ "id", "7" }});

    client.getMessage(1, 7);

    EXPECT_EQ(server->requests.size(), 2u);
    EXPECT_NEAR(clock.totalSlept(), 2.0, 0.01);
}

TEST_F(RestClientTest, BodyRetryAfterPreferredOverHeader) {
    server->replyJson(429, {{ "retry_after", 0.25 }, { "global", false }}, {{ "Retry-After", "1" }});
    server->replyJson(200, {{ "id", "7" }});

    client.getMessage(1, 7);

    EXPECT_NEAR(clock.totalSlept(), 0.25, 0.01);
}

TEST_F(RestClientTest, GlobalRateLimitBlocksOtherRoutes) {
    server->replyJson(429, {{ "retry_after", 3.0 }, { "global", true }});
    server->replyJson(200, nlohmann::json::object());

    client.getChannel(1);

    EXPECT_NEAR(clock.totalSlept(), 3.0, 0.01);
    EXPECT_FALSE(client.ratelimitLock.globallyBlocked());
}

TEST_F(RestClientTest, ThrowsRatelimitHitWhenRetriesExhausted) {
    for (unsigned i = 0; i <= HARMONIA_MAX_RETRIES; ++i) {
        server->replyJson(429, {{ "retry_after", 0.5 }, { "global", false }});
    }

    try {
        client.getChannel(9);
        FAIL() << "RatelimitHit expected";
    } catch (const RatelimitHit& excp) {
        EXPECT_EQ(excp.httpCode, 429);
        EXPECT_DOUBLE_EQ(excp.retryAfter, 0.5);
        EXPECT_FALSE(excp.global);
        EXPECT_EQ(excp.route, "GET /channels/:channel_id");
    }
    EXPECT_EQ(server->requests.size(), HARMONIA_MAX_RETRIES + 1u);
}
#else
TEST_F(RestClientTest, RateLimitHitThrowsImmediately) {
    server->replyJson(429, {{ "retry_after", 0.5 }, { "global", false }});

    EXPECT_THROW(client.getChannel(9), RatelimitHit);
    EXPECT_EQ(server->requests.size(), 1u);
}
#endif

TEST_F(RestClientTest, MalformedRetryAfterStillReportsRatelimitHit) {
    for (unsigned i = 0; i <= HARMONIA_MAX_RETRIES; ++i) {
        server->reply(429, "", {{ "Retry-After", "abc" }});
    }

    EXPECT_THROW(client.getChannel(9), RatelimitHit);
}

TEST_F(RestClientTest, RatelimitHitDoesNotExposeWebhookToken) {
    for (unsigned i = 0; i <= HARMONIA_MAX_RETRIES; ++i) {
        server->replyJson(429, {{ "retry_after", 0.1 }, { "global", false }});
    }

    try {
        client.getWebhookWithToken(5, "s3cr3t-webhook-token");
        FAIL() << "RatelimitHit expected";
    } catch (const RatelimitHit& excp) {
        EXPECT_EQ(excp.route.find("s3cr3t"), std::string::npos);
        EXPECT_EQ(std::string(excp.what()).find("s3cr3t"), std::string::npos);
        EXPECT_EQ(excp.route, "GET /webhooks/:webhook_id/:webhook_token");
    }
}

TEST_F(RestClientTest, WaitsForBucketReset) {
    server->replyJson(200, nlohmann::json::object(), {
        { "X-RateLimit-Bucket",      "abcd" },
        { "X-RateLimit-Limit",       "5"    },
        { "X-RateLimit-Remaining",   "0"    },
        { "X-RateLimit-Reset-After", "2.5"  }
    });
    server->replyJson(200, nlohmann::json::object());

    client.getChannel(1);
    EXPECT_TRUE(clock.sleeps.empty());
    EXPECT_EQ(client.ratelimitLock.bucketFor(Route("GET", "/channels/:channel_id", {{ "channel_id", "1" }})), "abcd");

    client.getChannel(1);
    EXPECT_NEAR(clock.totalSlept(), 2.5, 0.01);
}

TEST_F(RestClientTest, OtherChannelIsNotDelayed) {
    server->replyJson(200, nlohmann::json::object(), {
        { "X-RateLimit-Bucket",      "abcd" },
        { "X-RateLimit-Limit",       "5"    },
        { "X-RateLimit-Remaining",   "0"    },
        { "X-RateLimit-Reset-After", "2.5"  }
    });

    client.getChannel(1);
    client.getChannel(2);

    EXPECT_TRUE(clock.sleeps.empty());
}

TEST_F(RestClientTest, UnknownEntityError) {
    server->replyJson(404, {{ "code", 10003 }, { "message", "Unknown Channel" }});

    try {
        client.getChannel(1);
        FAIL() << "UnknownEntity expected";
    } catch (const UnknownEntity& excp) {
        EXPECT_EQ(excp.entityType, UnknownEntity::Channel);
        EXPECT_EQ(excp.code, 10003);
        EXPECT_EQ(excp.httpCode, 404);
        EXPECT_EQ(excp.message, "Unknown Channel");
    }
}

TEST_F(RestClientTest, LimitReachedError) {
    server->replyJson(400, {{ "code", 30003 }, { "message", "Maximum number of pins reached (50)" }});

    try {
        client.pinMessage(1, 2);
        FAIL() << "LimitReached expected";
    } catch (const LimitReached& excp) {
        EXPECT_EQ(excp.type, LimitReached::Pins);
    }
}

TEST_F(RestClientTest, NestedFieldErrorBecomesInvalidParameter) {
    server->replyJson(400, {
        { "code", 50035 },
        { "message", "Invalid Form Body" },
        { "errors", {
            { "embeds", {
                { "0", {
                    { "title", {
                        { "_errors", {{
                            { "code", "BASE_TYPE_MAX_LENGTH" },
                            { "message", "Must be 256 or fewer in length." }
                        }}}
                    }}
                }}
            }}
        }}
    });

    try {
        client.sendTextMessage(1, "x");
        FAIL() << "InvalidParameter expected";
    } catch (const InvalidParameter& excp) {
        EXPECT_EQ(excp.parameter, "embeds.0.title");
        EXPECT_EQ(excp.description, "Must be 256 or fewer in length.");
        EXPECT_EQ(excp.code, 50035);
        EXPECT_TRUE(excp.errors.is_object());
    }
}

TEST_F(RestClientTest, LegacyFieldErrorBecomesInvalidParameter) {
    server->replyJson(400, {{ "name", { "Must be between 2 and 100 in length." } }});

    try {
        client.setChannelName(1, "ok");
        FAIL() << "InvalidParameter expected";
    } catch (const InvalidParameter& excp) {
        EXPECT_EQ(excp.parameter, "name");
        EXPECT_EQ(excp.description, "Must be between 2 and 100 in length.");
    }
}

TEST_F(RestClientTest, HttpStatusErrors) {
    server->replyJson(401, {{ "code", 0 }, { "message", "401: Unauthorized" }});
    EXPECT_THROW(client.getCurrentUser(), Unauthorized);

    server->replyJson(403, {{ "code", 50013 }, { "message", "Missing Permissions" }});
    EXPECT_THROW(client.deleteChannel(1), Forbidden);

    server->replyJson(404, {{ "code", 0 }, { "message", "404: Not Found" }});
    EXPECT_THROW(client.getCurrentUser(), NotFound);

    server->reply(413, "");
    EXPECT_THROW(client.getCurrentUser(), RequestTooLarge);

    server->reply(502, "<html>Bad Gateway</html>");
    EXPECT_THROW(client.getCurrentUser(), ServerError);

    server->replyJson(500, {{ "code", 130000 }, { "message", "API resource is currently overloaded." }});
    try {
        client.getCurrentUser();
        FAIL() << "ServerError expected";
    } catch (const ServerError& excp) {
        EXPECT_EQ(excp.httpCode, 500);
        EXPECT_EQ(excp.code, 130000);
        EXPECT_EQ(excp.message, "API resource is currently overloaded.");
    }

    server->replyJson(405, {{ "code", 0 }, { "message", "405: Method Not Allowed" }});
    try {
        client.getCurrentUser();
        FAIL() << "RESTError expected";
    } catch (const RESTError& excp) {
        EXPECT_EQ(excp.httpCode, 405);
        EXPECT_EQ(excp.message, "405: Method Not Allowed");
    }
}

TEST_F(RestClientTest, MultipartPutsPayloadJsonFirst) {
    server->replyJson(200, {{ "id", "1" }});

    OutgoingMessage message("look & see");
    message.files.push_back(File("cat.png", std::vector<uint8_t>{ 1, 2, 3 }));
    client.createMessage(5, message);

    const REST::HTTPRequest& request = server->last();
    EXPECT_EQ(header(request, "Content-Type").find("multipart/form-data; boundary="), 0u);

    std::string body = bodyOf(request);
    auto payloadPos = body.find("name=\"payload_json\"");
    auto filePos    = body.find("name=\"files[0]\"; filename=\"cat.png\"");
    ASSERT_NE(payloadPos, std::string::npos);
    ASSERT_NE(filePos, std::string::npos);
    EXPECT_LT(payloadPos, filePos);

    // payload_json is sent as is, not URL-encoded.
    EXPECT_NE(body.find("\"content\":\"look & see\""), std::string::npos);
    EXPECT_NE(body.find("\"filename\":\"cat.png\""), std::string::npos);
    EXPECT_NE(body.find("Content-Type: image/png"), std::string::npos);
}

TEST_F(RestClientTest, GatewayUrlBot) {
    server->replyJson(200, {
        { "url", "wss://gateway.discord.gg" },
        { "shards", 4 },
        { "session_start_limit", {{ "total", 1000 }, { "remaining", 999 }} }
    });

    std::pair<std::string, int> gateway = client.getGatewayUrlBot();

    EXPECT_EQ(server->last().path, api("/gateway/bot"));
    EXPECT_EQ(gateway.first, "wss://gateway.discord.gg");
    EXPECT_EQ(gateway.second, 4);
}

TEST_F(RestClientTest, RawEndpointOverload) {
    server->replyJson(200, nlohmann::json::array());

    client.sendRestRequest("GET", "/users/@me/guilds", nullptr, {{ "limit", "10" }});

    EXPECT_EQ(server->last().path, api("/users/@me/guilds?limit=10"));
}
