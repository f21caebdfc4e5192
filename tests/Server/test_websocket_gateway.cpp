/**
 * @file test_websocket_gateway.cpp
 * @brief Loopback tests for the player WebSocket gateway
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include "../TestHarness.hpp"
#include "WebSocketGateway.hpp"
#include <Ascent/Game/Protocol.hpp>
#include <Ascent/Game/RoundEngine.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace Ascent;
using namespace Ascent::Game;
using namespace Ascent::Testing;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace beast = boost::beast;
namespace net = boost::asio;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

/// Blocking player client over loopback
class PlayerClient {
public:
    explicit PlayerClient(uint16_t port)
        : m_ws(m_ioc) {
        tcp::resolver resolver(m_ioc);
        const auto results = resolver.resolve("127.0.0.1", std::to_string(port));
        net::connect(m_ws.next_layer(), results);
        m_ws.handshake("127.0.0.1", "/");
    }

    void send(const std::string& text) {
        m_ws.text(true);
        m_ws.write(net::buffer(text));
    }

    json read() {
        beast::flat_buffer buffer;
        m_ws.read(buffer);
        return json::parse(beast::buffers_to_string(buffer.data()));
    }

    /// Skip frames until one of the given type arrives
    json readUntil(const std::string& type) {
        for (;;) {
            json message = read();
            if (message["type"] == type) {
                return message;
            }
        }
    }

    void close() {
        beast::error_code ec;
        m_ws.close(websocket::close_code::normal, ec);
    }

private:
    net::io_context m_ioc;
    websocket::stream<tcp::socket> m_ws;
};

} // namespace

class WebSocketGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_unique<RoundEngine>(
            config, scheduler, FairnessCommitment(config.edgeFactor, fixedSeeds({FIXTURE_SEED})));
        gateway = std::make_unique<Server::WebSocketGateway>(*engine, "127.0.0.1", 0, 1024, 2);
        ASSERT_RESULT_SUCCESS(gateway->Start());
        ASSERT_NE(gateway->LocalPort(), 0);
    }

    void TearDown() override {
        gateway->Stop();
        engine->stop();
    }

    /// Poll until the engine holds the expected number of sessions
    bool waitForSessions(size_t expected) {
        for (int i = 0; i < 500; ++i) {
            if (engine->ledger().size() == expected) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }

    GameConfig config;
    ManualScheduler scheduler;
    std::unique_ptr<RoundEngine> engine;
    std::unique_ptr<Server::WebSocketGateway> gateway;
};

TEST_F(WebSocketGatewayTest, StartTwiceFails) {
    EXPECT_TRUE(gateway->IsRunning());
    EXPECT_RESULT_ERROR(gateway->Start(), ErrorCode::InvalidState);
}

TEST_F(WebSocketGatewayTest, UnbindableAddressReported) {
    Server::WebSocketGateway bad(*engine, "not-an-address", 0, 16);
    EXPECT_RESULT_ERROR(bad.Start(), ErrorCode::InvalidArgument);
}

TEST_F(WebSocketGatewayTest, NewConnectionIsGreeted) {
    ASSERT_RESULT_SUCCESS(engine->start());
    PlayerClient client(gateway->LocalPort());

    json welcome = client.read();
    EXPECT_EQ(welcome["type"], "WELCOME");
    EXPECT_EQ(welcome["balance"], 1000);
    EXPECT_EQ(welcome["gameState"], "WAITING");
    EXPECT_EQ(welcome["sessionId"].get<std::string>().rfind("Guest_", 0), 0u);

    json start = client.read();
    EXPECT_EQ(start["type"], "ROUND_START");
    EXPECT_EQ(start["serverSeedHash"], FIXTURE_HASH);

    json tick = client.read();
    EXPECT_EQ(tick["type"], "WAITING_TICK");
    EXPECT_EQ(tick["seconds"], 5);

    EXPECT_TRUE(waitForSessions(1));
    EXPECT_EQ(gateway->GetConnectionCount(), 1u);
    client.close();
}

TEST_F(WebSocketGatewayTest, BetAndCashoutOverTheWire) {
    ASSERT_RESULT_SUCCESS(engine->start());
    PlayerClient client(gateway->LocalPort());
    const std::string sessionId = client.readUntil("WELCOME")["sessionId"].get<std::string>();

    client.send(R"({"type":"PLACE_BET","amount":200})");
    json bet = client.readUntil("BET_CONFIRMED");
    EXPECT_EQ(bet["amount"], 200);
    EXPECT_EQ(bet["balance"], 800);

    scheduler.advance(5000ms);
    EXPECT_EQ(client.readUntil("STATE")["state"], "RUNNING");

    scheduler.advance(15000ms);
    client.send(R"({"type":"CASHOUT"})");
    json cashout = client.readUntil("CASHOUT_CONFIRMED");
    EXPECT_DOUBLE_EQ(cashout["multiplier"].get<double>(), 2.5);
    EXPECT_EQ(cashout["win"], 500);
    EXPECT_EQ(cashout["balance"], 1300);

    auto session = engine->ledger().find(sessionId);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->balance, 130000);
    client.close();
}

TEST_F(WebSocketGatewayTest, MalformedFrameAnsweredWithError) {
    ASSERT_RESULT_SUCCESS(engine->start());
    PlayerClient client(gateway->LocalPort());
    client.readUntil("WELCOME");

    client.send("definitely not json");
    EXPECT_EQ(client.readUntil("ERROR")["message"], "Malformed message");

    // The connection stays usable
    client.send(R"({"type":"PLACE_BET","amount":1})");
    EXPECT_EQ(client.readUntil("BET_CONFIRMED")["balance"], 999);
    client.close();
}

TEST_F(WebSocketGatewayTest, ClosingConnectionEndsSession) {
    PlayerClient client(gateway->LocalPort());
    client.readUntil("WELCOME");
    ASSERT_TRUE(waitForSessions(1));

    client.close();
    EXPECT_TRUE(waitForSessions(0));
    EXPECT_EQ(engine->hub().subscriberCount(), 0u);
}

TEST_F(WebSocketGatewayTest, BroadcastReachesEveryPlayer) {
    PlayerClient alice(gateway->LocalPort());
    PlayerClient bob(gateway->LocalPort());
    alice.readUntil("WELCOME");
    bob.readUntil("WELCOME");
    ASSERT_TRUE(waitForSessions(2));

    ASSERT_RESULT_SUCCESS(engine->start());
    EXPECT_EQ(alice.readUntil("ROUND_START")["roundId"], 1);
    EXPECT_EQ(bob.readUntil("ROUND_START")["roundId"], 1);

    alice.close();
    bob.close();
}
