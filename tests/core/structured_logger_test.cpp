// WatchParty - Watch-party signaling and process supervision core
// Tests for Structured Logging Component
//
// Covers:
// - Configurable log levels (debug, info, warning, error)
// - Session events with timestamps and peer details
// - JSON structured log format
// - Error records carrying nickname, peer address, port and process name

#include <gtest/gtest.h>
#include "watchparty/core/json_value.hpp"
#include "watchparty/core/structured_logger.hpp"
#include "watchparty/pal/log_pal.hpp"
#include "watchparty/pal/pal_types.hpp"

#include <mutex>
#include <regex>
#include <thread>
#include <vector>

namespace watchparty {
namespace core {
namespace test {

// =============================================================================
// Test Sink for Capturing Log Output
// =============================================================================

class TestLogSink : public pal::ILogSink {
public:
    struct Entry {
        pal::LogLevel level;
        std::string message;
        std::string category;
        pal::LogContext context;
    };

    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogContext& context) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{level, message, category, context});
    }

    void flush() override {
        flushCount_++;
    }

    std::string getName() const override {
        return "TestLogSink";
    }

    std::vector<Entry> getEntries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    int getFlushCount() const {
        return flushCount_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::atomic<int> flushCount_{0};
};

// =============================================================================
// StructuredLogger Basic Tests
// =============================================================================

class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testSink_ = std::make_shared<TestLogSink>();
        logger_ = std::make_unique<StructuredLogger>();
        logger_->addSink(testSink_);
    }

    void TearDown() override {
        logger_.reset();
        testSink_.reset();
    }

    std::unique_ptr<StructuredLogger> logger_;
    std::shared_ptr<TestLogSink> testSink_;
};

TEST_F(StructuredLoggerTest, FiltersMessagesBelowConfiguredLevel) {
    logger_->setLevel(LogLevelConfig::Warning);

    logger_->debug("debug message");
    logger_->info("info message");
    logger_->warning("warning message");
    logger_->error("error message");

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_NE(entries[0].message.find("warning message"), std::string::npos);
    EXPECT_EQ(entries[0].level, pal::LogLevel::Warning);
    EXPECT_NE(entries[1].message.find("error message"), std::string::npos);
}

TEST_F(StructuredLoggerTest, PlainTextCarriesTimestampLevelAndCategory) {
    logger_->info("Listening on port 10086", "Coordinator");

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 1u);

    std::regex pattern(R"(\[\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z\] \[info\] \[Coordinator\] Listening on port 10086)");
    EXPECT_TRUE(std::regex_match(entries[0].message, pattern)) << entries[0].message;
    EXPECT_EQ(entries[0].category, "Coordinator");
}

TEST_F(StructuredLoggerTest, JsonFormatProducesParseableRecords) {
    logger_->setJsonFormat(true);
    logger_->warning("relay \"client_Saber_10000\" restarting", "Relay");

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 1u);

    auto parsed = parseJson(entries[0].message);
    ASSERT_TRUE(parsed.isSuccess()) << entries[0].message;
    EXPECT_EQ(parsed.value()["level"].getString(), "warning");
    EXPECT_EQ(parsed.value()["category"].getString(), "Relay");
    EXPECT_EQ(parsed.value()["message"].getString(), "relay \"client_Saber_10000\" restarting");
    EXPECT_TRUE(parsed.value().contains("timestamp"));
}

TEST_F(StructuredLoggerTest, SessionEventIncludesPeerDetails) {
    SessionLogContext ctx;
    ctx.nickname = "Saber";
    ctx.clientIP = "192.168.1.20";
    ctx.clientPort = 50123;
    ctx.streamPort = 10000;

    logger_->logSessionEvent(SessionEventType::Authenticated, ctx);

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 1u);
    const std::string& msg = entries[0].message;
    EXPECT_NE(msg.find("Event: authenticated"), std::string::npos);
    EXPECT_NE(msg.find("Nickname: Saber"), std::string::npos);
    EXPECT_NE(msg.find("Client: 192.168.1.20:50123"), std::string::npos);
    EXPECT_NE(msg.find("StreamPort: 10000"), std::string::npos);
}

TEST_F(StructuredLoggerTest, JsonSessionEventHasEventField) {
    logger_->setJsonFormat(true);

    SessionLogContext ctx;
    ctx.nickname = "Saber_2";
    ctx.processName = "client_Saber_2_10001";
    logger_->logSessionEvent(SessionEventType::RelayStarted, ctx);

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 1u);

    auto parsed = parseJson(entries[0].message);
    ASSERT_TRUE(parsed.isSuccess()) << entries[0].message;
    EXPECT_EQ(parsed.value()["event"].getString(), "relay_started");
    EXPECT_EQ(parsed.value()["nickname"].getString(), "Saber_2");
    EXPECT_EQ(parsed.value()["process"].getString(), "client_Saber_2_10001");
    EXPECT_FALSE(parsed.value().contains("client_port"));
}

TEST_F(StructuredLoggerTest, ErrorWithContextIncludesErrorCode) {
    SessionLogContext ctx;
    ctx.nickname = "Lancer";
    ctx.errorCode = 208;

    logger_->errorWithContext("No free stream port", ctx, "Coordinator");

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, pal::LogLevel::Error);
    EXPECT_NE(entries[0].message.find("ErrorCode: 208"), std::string::npos);
    EXPECT_NE(entries[0].message.find("Nickname: Lancer"), std::string::npos);
}

TEST_F(StructuredLoggerTest, SessionEventsAreFilteredAboveInfo) {
    logger_->setLevel(LogLevelConfig::Error);
    logger_->logSessionEvent(SessionEventType::Connected, SessionLogContext{});

    EXPECT_EQ(testSink_->size(), 0u);
}

// =============================================================================
// ILogSink Role
// =============================================================================

TEST_F(StructuredLoggerTest, FormatsRecordsFromLogPal) {
    logger_->setJsonFormat(true);
    pal::LogContext source{"supervisor.cpp", 42, "start", {}};

    logger_->write(pal::LogLevel::Critical, "fork failed", "Supervisor", source);

    auto entries = testSink_->getEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, pal::LogLevel::Critical);

    auto parsed = parseJson(entries[0].message);
    ASSERT_TRUE(parsed.isSuccess());
    EXPECT_EQ(parsed.value()["level"].getString(), "error");
    EXPECT_EQ(parsed.value()["file"].getString(), "supervisor.cpp");
    EXPECT_EQ(parsed.value()["line"].getInt(), 42);
    EXPECT_EQ(parsed.value()["function"].getString(), "start");
}

TEST_F(StructuredLoggerTest, PalRecordsBelowLevelAreDropped) {
    logger_->setLevel(LogLevelConfig::Info);

    logger_->write(pal::LogLevel::Trace, "trace", "Client", pal::LogContext{});
    logger_->write(pal::LogLevel::Debug, "debug", "Client", pal::LogContext{});
    logger_->write(pal::LogLevel::Off, "off", "Client", pal::LogContext{});

    EXPECT_EQ(testSink_->size(), 0u);
}

TEST_F(StructuredLoggerTest, RemovedSinkStopsReceiving) {
    logger_->info("first");
    logger_->removeSink(testSink_);
    logger_->info("second");

    EXPECT_EQ(testSink_->size(), 1u);
}

TEST_F(StructuredLoggerTest, FlushReachesSinks) {
    logger_->flush();
    EXPECT_GE(testSink_->getFlushCount(), 1);
}

TEST_F(StructuredLoggerTest, ConcurrentLoggingKeepsEveryRecord) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 50; ++i) {
                logger_->info("thread " + std::to_string(t) + " message " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(testSink_->size(), 200u);
}

// =============================================================================
// Level Helpers
// =============================================================================

TEST(LogLevelHelpersTest, StringConversionIsCaseInsensitive) {
    EXPECT_EQ(stringToLogLevel("DEBUG"), LogLevelConfig::Debug);
    EXPECT_EQ(stringToLogLevel("Warn"), LogLevelConfig::Warning);
    EXPECT_EQ(stringToLogLevel("critical"), LogLevelConfig::Error);
    EXPECT_EQ(stringToLogLevel("nonsense"), LogLevelConfig::Info);
    EXPECT_EQ(logLevelToString(LogLevelConfig::Warning), "warning");
}

TEST(LogLevelHelpersTest, MapsOntoPalLevels) {
    EXPECT_EQ(toPalLogLevel(LogLevelConfig::Debug), pal::LogLevel::Debug);
    EXPECT_EQ(toPalLogLevel(LogLevelConfig::Error), pal::LogLevel::Error);
}

} // namespace test
} // namespace core
} // namespace watchparty
