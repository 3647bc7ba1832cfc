#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <harmonia/exceptions.hpp>
#include <harmonia/gateway_client.hpp>
#include "fake_gateway.hpp"

using namespace Harmonia;
using namespace Harmonia::Testing;

namespace {
    const std::string gatewayUrl = "wss://gateway.discord.gg";

    nlohmann::json hello(unsigned heartbeatIntervalMs = 45000) {
        return {{ "op", 10 }, { "d", {{ "heartbeat_interval", heartbeatIntervalMs }} }};
    }

    nlohmann::json dispatch(const std::string& type, int sequence, const nlohmann::json& data) {
        return {{ "op", 0 }, { "t", type }, { "s", sequence }, { "d", data }};
    }

    nlohmann::json ready(const std::string& sessionId) {
        return dispatch("READY", 1, {{ "session_id", sessionId },
                                     { "resume_gateway_url", "wss://resume.discord.gg" }});
    }

    nlohmann::json opcode(int code, const nlohmann::json& data = nullptr) {
        return {{ "op", code }, { "d", data }};
    }
}

class GatewayClientTest : public ::testing::Test {
protected:
    GatewayClientTest()
        : gateway(std::make_shared<FakeGateway>())
        , client(io, fakeGatewayFactory(io, gateway), "secret",
                 [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); }) {}

    // Scripts first connection with Hello and READY and connects.
    void connect(unsigned heartbeatIntervalMs = 45000) {
        gateway->nextConnection().frames = { hello(heartbeatIntervalMs), ready("abc") };
        client.connect(gatewayUrl);
    }

    boost::asio::io_context io;
    std::shared_ptr<FakeGateway> gateway;
    std::vector<std::chrono::milliseconds> sleeps;
    GatewayClient client;
};

TEST(GatewayClientStaticTest, FatalCloseCodes) {
    EXPECT_TRUE(GatewayClient::isFatalCloseCode(4004));
    for (int code = 4010; code <= 4014; ++code) {
        EXPECT_TRUE(GatewayClient::isFatalCloseCode(code)) << code;
    }

    EXPECT_FALSE(GatewayClient::isFatalCloseCode(1000));
    EXPECT_FALSE(GatewayClient::isFatalCloseCode(4000));
    EXPECT_FALSE(GatewayClient::isFatalCloseCode(4009));
    EXPECT_FALSE(GatewayClient::isFatalCloseCode(4015));
}

TEST(GatewayClientStaticTest, GatewayPath) {
#ifdef HARMONIA_ZLIB
    EXPECT_EQ(GatewayClient::gatewayPath(),
              "/?v=" + std::to_string(HARMONIA_API_VERSION) + "&encoding=json&compress=zlib-stream");
#else
    EXPECT_EQ(GatewayClient::gatewayPath(), "/?v=" + std::to_string(HARMONIA_API_VERSION) + "&encoding=json");
#endif
}

TEST_F(GatewayClientTest, ConnectIdentifiesAndKeepsSession) {
    bool readyDispatched = false;
    client.eventDispatcher.addHandler(Event::Ready, [&readyDispatched](const nlohmann::json& payload) {
        readyDispatched = payload["session_id"] == "abc";
    });

    connect();

    ASSERT_EQ(gateway->connectionsCreated, 1u);
    EXPECT_EQ(gateway->hosts[0], "gateway.discord.gg");
    EXPECT_EQ(gateway->paths[0], GatewayClient::gatewayPath());

    ASSERT_EQ(gateway->sent[0].size(), 1u);
    EXPECT_EQ(gateway->sent[0][0]["op"], 2);
    EXPECT_EQ(gateway->sent[0][0]["d"]["token"], "secret");

    EXPECT_TRUE(readyDispatched);
    EXPECT_TRUE(client.isConnected());
    EXPECT_EQ(client.sessionId(), "abc");
    EXPECT_EQ(client.resumeGatewayUrl(), "wss://resume.discord.gg");
    EXPECT_EQ(client.lastSequenceNumber(), 1);
}

TEST_F(GatewayClientTest, MissingHelloIsGatewayError) {
    gateway->nextConnection().frames = { ready("abc") };

    EXPECT_THROW(client.connect(gatewayUrl), GatewayError);
}

TEST_F(GatewayClientTest, EventsDispatchedAndSequenceTracked) {
    connect();

    std::string content;
    client.eventDispatcher.addHandler(Event::MessageCreate, [&content](const nlohmann::json& payload) {
        content = payload["content"].get<std::string>();
    });

    gateway->current()->push(dispatch("MESSAGE_CREATE", 5, {{ "content", "hi" }}));
    io.poll();

    EXPECT_EQ(content, "hi");
    EXPECT_EQ(client.lastSequenceNumber(), 5);
}

TEST_F(GatewayClientTest, HeartbeatRequestAnsweredImmediately) {
    connect();

    gateway->current()->push(opcode(1));
    io.poll();

    ASSERT_EQ(gateway->sent[0].size(), 2u);
    EXPECT_EQ(gateway->sent[0][1], opcode(1, 1));

    gateway->current()->push(dispatch("TYPING_START", 7, nlohmann::json::object()));
    io.poll();
    gateway->current()->push(opcode(1));
    io.poll();

    ASSERT_EQ(gateway->sent[0].size(), 3u);
    EXPECT_EQ(gateway->sent[0][2], opcode(1, 7));
}

TEST_F(GatewayClientTest, ReconnectRequestResumesOnResumeUrl) {
    connect();
    gateway->nextConnection().frames = { hello(), dispatch("RESUMED", 2, nlohmann::json::object()) };

    gateway->current()->push(opcode(7));
    io.poll();

    ASSERT_EQ(gateway->connectionsCreated, 2u);
    // Old connection dropped without Close frame, session stays valid.
    EXPECT_EQ(gateway->closeFrames[0], -1);
    EXPECT_EQ(gateway->hosts[1], "resume.discord.gg");

    ASSERT_EQ(gateway->sent[1].size(), 1u);
    EXPECT_EQ(gateway->sent[1][0]["op"], 6);
    EXPECT_EQ(gateway->sent[1][0]["d"]["session_id"], "abc");
    EXPECT_EQ(gateway->sent[1][0]["d"]["seq"], 1);

    EXPECT_TRUE(client.isConnected());
    EXPECT_EQ(client.lastSequenceNumber(), 2);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(GatewayClientTest, ResumableInvalidSessionResumes) {
    connect();
    gateway->nextConnection().frames = { hello(), dispatch("RESUMED", 2, nlohmann::json::object()) };

    gateway->current()->push(opcode(9, true));
    io.poll();

    ASSERT_EQ(gateway->connectionsCreated, 2u);
    ASSERT_EQ(gateway->sent[1].size(), 1u);
    EXPECT_EQ(gateway->sent[1][0]["op"], 6);
    EXPECT_EQ(client.sessionId(), "abc");
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(GatewayClientTest, NonResumableInvalidSessionIdentifiesAfterDelay) {
    connect();
    gateway->nextConnection().frames = { hello(), ready("def") };

    gateway->current()->push(opcode(9, false));
    io.poll();

    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_GE(sleeps[0].count(), 1000);
    EXPECT_LE(sleeps[0].count(), 5000);

    ASSERT_EQ(gateway->connectionsCreated, 2u);
    EXPECT_EQ(gateway->hosts[1], "gateway.discord.gg");
    ASSERT_EQ(gateway->sent[1].size(), 1u);
    EXPECT_EQ(gateway->sent[1][0]["op"], 2);
    EXPECT_EQ(client.sessionId(), "def");
}

TEST_F(GatewayClientTest, TwoMissedHeartbeatsReconnect) {
    connect(/* heartbeatIntervalMs: */ 1);
    gateway->nextConnection().frames = { hello(), dispatch("RESUMED", 2, nlohmann::json::object()) };

    // Each run_one fires heartbeat timer once, nothing is read meanwhile.
    io.run_one();
    io.run_one();

    ASSERT_EQ(gateway->sent[0].size(), 3u);
    EXPECT_EQ(gateway->sent[0][1], opcode(1, 1));
    EXPECT_EQ(gateway->sent[0][2], opcode(1, 1));
    EXPECT_EQ(gateway->connectionsCreated, 1u);

    io.run_one();

    ASSERT_EQ(gateway->connectionsCreated, 2u);
    EXPECT_EQ(gateway->sent[0].size(), 3u);
    ASSERT_EQ(gateway->sent[1].size(), 1u);
    EXPECT_EQ(gateway->sent[1][0]["op"], 6);
}

TEST_F(GatewayClientTest, InvalidSessionDuringIdentifyIsGatewayError) {
    gateway->nextConnection().frames = { hello(), opcode(9, false) };

    EXPECT_THROW(client.connect(gatewayUrl), GatewayError);
    EXPECT_EQ(gateway->connectionsCreated, 1u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(GatewayClientTest, InvalidSessionDuringResumeIsGatewayError) {
    gateway->nextConnection().frames = { hello(), opcode(9, false) };

    EXPECT_THROW(client.resume(gatewayUrl, "abc", 10), GatewayError);

    ASSERT_EQ(gateway->sent[0].size(), 1u);
    EXPECT_EQ(gateway->sent[0][0]["op"], 6);
    EXPECT_EQ(gateway->sent[0][0]["d"]["seq"], 10);
    EXPECT_EQ(gateway->connectionsCreated, 1u);
}

TEST_F(GatewayClientTest, FatalCloseDuringHandshakeKeepsCode) {
    FakeGateway::Script& script = gateway->nextConnection();
    script.frames    = { hello() };
    script.closeCode = 4004;

    try {
        client.connect(gatewayUrl);
        FAIL() << "GatewayError expected";
    } catch (const GatewayError& excp) {
        EXPECT_EQ(excp.disconnectCode, 4004);
    }
}

TEST_F(GatewayClientTest, DisconnectSendsCloseCode) {
    connect();

    client.disconnect(4000);

    EXPECT_EQ(gateway->closeFrames[0], 4000);
    EXPECT_FALSE(client.isConnected());
}
