/*
MarketStream — Log Tests
Role: Verify level parsing, filtering and that credentials never reach log output
Testing Strategy: Capture lines through Log::setWriter → assert on the text
Coverage: parseLevel, level threshold, line format, token redaction across a hub connect cycle
*/
#include <gtest/gtest.h>
#include "marketstream/Log.hpp"
#include "marketstream/hub/ConnectionHub.hpp"
#include "fixtures/manual_scheduler.hpp"
#include "fixtures/mock_transport.hpp"
#include <string>
#include <vector>

using namespace MarketStream;

// =============================================================================
// Test Fixture
// =============================================================================

class LogCaptureTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = Log::runtimeLevel();
        Log::setWriter([this](Log::Level, std::string_view line) { lines.emplace_back(line); });
    }

    void TearDown() override {
        Log::setWriter({});
        Log::setLevel(previous_);
    }

    bool anyLineContains(const std::string& needle) const {
        for (const auto& line : lines) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::string> lines;

private:
    Log::Level previous_{Log::Level::INFO};
};

// =============================================================================
// Level Parsing
// =============================================================================

TEST(Log, ParseLevel) {
    EXPECT_EQ(Log::parseLevel(nullptr), Log::Level::INFO);
    EXPECT_EQ(Log::parseLevel("trace"), Log::Level::TRACE);
    EXPECT_EQ(Log::parseLevel("DEBUG"), Log::Level::DEBUG);
    EXPECT_EQ(Log::parseLevel("Warning"), Log::Level::WARN);
    EXPECT_EQ(Log::parseLevel("verbose"), Log::Level::ERROR);
}

// =============================================================================
// Output
// =============================================================================

TEST_F(LogCaptureTest, LinesBelowThresholdAreDropped) {
    Log::setLevel(Log::Level::WARN);
    LOG_I("hub", "quiet {}", 1);
    LOG_W("hub", "loud {}", 2);

    ASSERT_EQ(lines.size(), 1);
    EXPECT_NE(lines[0].find("[WARN][hub][test_log.cpp:"), std::string::npos);
    EXPECT_NE(lines[0].find("loud 2"), std::string::npos);
}

TEST_F(LogCaptureTest, FirstNStopsAfterLimit) {
    Log::setLevel(Log::Level::TRACE);
    for (int i = 0; i < 5; ++i) {
        LOG_FIRST_N(INFO, 2, "realtime", "attempt {}", i);
    }
    EXPECT_EQ(lines.size(), 2);
}

TEST_F(LogCaptureTest, TokenNeverLogged) {
    Log::setLevel(Log::Level::TRACE);
    const std::string token = "super-secret-token";

    fixtures::ManualScheduler scheduler;
    fixtures::MockTransportFactory transports;
    HubConfig config;
    config.host = "gw.example";
    ConnectionHub hub{scheduler, transports.factory(), config};

    HubSubscriber subscriber;
    subscriber.tokenProvider = [&token] { return token; };
    auto sub = hub.subscribe("ws", std::move(subscriber));
    transports.latest().closeWith(1006, "handshake failed");
    scheduler.advance(std::chrono::milliseconds(10000));
    transports.latest().open();
    transports.latest().closeWith(4401);
    sub->dispose();

    ASSERT_FALSE(lines.empty());
    EXPECT_TRUE(anyLineContains("token=REDACTED"));
    EXPECT_FALSE(anyLineContains(token));
}
