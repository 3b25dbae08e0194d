// WatchParty - Watch-party signaling and process supervision core
// Tests for Session Client
//
// Runs the client against a live coordinator on the loopback interface.
//
// Covers:
// - Argument and state validation in connect()
// - Admission, assigned nickname and stream endpoint
// - Wildcard server address substitution
// - Wrong verification code is terminal
// - System notices for joins and leaves, member lists
// - Bounded reconnect against a dead endpoint
// - disconnect() idempotence

#include <gtest/gtest.h>
#include "watchparty/signaling/session_client.hpp"
#include "watchparty/signaling/session_coordinator.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace watchparty {
namespace signaling {
namespace test {

using namespace std::chrono_literals;

namespace {

bool waitUntil(const std::function<bool()>& condition,
               std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return condition();
}

class StubRelayLauncher : public IRelayLauncher {
public:
    core::Result<std::string, core::Error> startViewerRelay(const std::string& nickname,
                                                            uint16_t srtPort,
                                                            const std::string&) override {
        return core::Result<std::string, core::Error>::success(
            nickname + ":" + std::to_string(srtPort));
    }

    core::Result<void, core::Error> stopRelay(const std::string&) override {
        return core::Result<void, core::Error>::success();
    }
};

class AlwaysFreeProbe : public net::IPortProbe {
public:
    core::Result<void, pal::NetworkError> probe(pal::AddressFamily, uint16_t) override {
        return core::Result<void, pal::NetworkError>::success();
    }
};

/**
 * @brief Collects everything a client reports through its callbacks.
 */
class ClientRecorder {
public:
    void attach(SessionClient& client) {
        client.setAuthenticatedCallback([this](const std::string& address, uint16_t port) {
            std::lock_guard<std::mutex> lock(mutex_);
            admissions_.emplace_back(address, port);
        });
        client.setChatCallback([this](const std::string& who, const std::string& text) {
            std::lock_guard<std::mutex> lock(mutex_);
            chats_.emplace_back(who, text);
        });
        client.setMemberListCallback([this](const std::vector<core::Member>& members) {
            std::lock_guard<std::mutex> lock(mutex_);
            memberLists_.push_back(members);
        });
        client.setErrorCallback([this](const core::Error& error) {
            std::lock_guard<std::mutex> lock(mutex_);
            errors_.push_back(error.code);
        });
    }

    std::vector<std::pair<std::string, uint16_t>> admissions() {
        std::lock_guard<std::mutex> lock(mutex_);
        return admissions_;
    }

    std::vector<std::pair<std::string, std::string>> chats() {
        std::lock_guard<std::mutex> lock(mutex_);
        return chats_;
    }

    bool sawChat(const std::string& who, const std::string& text) {
        auto all = chats();
        return std::find(all.begin(), all.end(), std::make_pair(who, text)) != all.end();
    }

    std::vector<std::vector<core::Member>> memberLists() {
        std::lock_guard<std::mutex> lock(mutex_);
        return memberLists_;
    }

    std::vector<core::ErrorCode> errors() {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

    bool sawError(core::ErrorCode code) {
        auto all = errors();
        return std::find(all.begin(), all.end(), code) != all.end();
    }

private:
    std::mutex mutex_;
    std::vector<std::pair<std::string, uint16_t>> admissions_;
    std::vector<std::pair<std::string, std::string>> chats_;
    std::vector<std::vector<core::Member>> memberLists_;
    std::vector<core::ErrorCode> errors_;
};

/// A loopback port with nothing listening on it
uint16_t closedPort() {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor(
        ioc, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

} // anonymous namespace

class SessionClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        hostSettings_.bindAddress = "127.0.0.1";
        hostSettings_.port = 0;
        clientSettings_.reconnectInterval = 100ms;
        clientSettings_.maxReconnectAttempts = 2;
        clientSettings_.connectTimeout = 2000ms;
    }

    void TearDown() override {
        clients_.clear();
        if (coordinator_) {
            coordinator_->stop();
        }
    }

    uint16_t startHost() {
        coordinator_ = std::make_unique<SessionCoordinator>(
            hostSettings_, std::make_shared<StubRelayLauncher>(),
            std::make_shared<net::PortAllocator>(std::make_shared<AlwaysFreeProbe>()));
        auto started = coordinator_->start();
        EXPECT_TRUE(started.isSuccess()) << started.error().toString();
        return coordinator_->boundPort();
    }

    SessionClient& newClient(ClientRecorder& recorder) {
        clients_.push_back(std::make_unique<SessionClient>(clientSettings_));
        recorder.attach(*clients_.back());
        return *clients_.back();
    }

    CoordinatorSettings hostSettings_;
    ClientSettings clientSettings_;
    std::unique_ptr<SessionCoordinator> coordinator_;
    std::vector<std::unique_ptr<SessionClient>> clients_;
};

// =============================================================================
// Validation
// =============================================================================

TEST_F(SessionClientTest, ConnectValidatesArguments) {
    ClientRecorder recorder;
    auto& client = newClient(recorder);

    EXPECT_EQ(client.connect("", 10086, "Saber", "114514").error().code,
              core::ErrorCode::InvalidArgument);
    EXPECT_EQ(client.connect("[]", 10086, "Saber", "114514").error().code,
              core::ErrorCode::InvalidArgument);
    EXPECT_EQ(client.connect("127.0.0.1", 0, "Saber", "114514").error().code,
              core::ErrorCode::InvalidArgument);
    EXPECT_EQ(client.connect("127.0.0.1", 10086, "", "114514").error().code,
              core::ErrorCode::InvalidArgument);
    EXPECT_EQ(client.state(), ClientState::Idle);
}

TEST_F(SessionClientTest, SendChatRequiresAuthentication) {
    ClientRecorder recorder;
    auto& client = newClient(recorder);

    auto result = client.sendChat("hello");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::NotAuthenticated);
}

TEST_F(SessionClientTest, StateNames) {
    EXPECT_STREQ(clientStateToString(ClientState::Idle), "Idle");
    EXPECT_STREQ(clientStateToString(ClientState::Authenticated), "Authenticated");
    EXPECT_STREQ(clientStateToString(ClientState::Reconnecting), "Reconnecting");
    EXPECT_STREQ(clientStateToString(ClientState::Disconnected), "Disconnected");
}

TEST_F(SessionClientTest, SettingsFromConfiguration) {
    core::Configuration config;
    config.network.reconnectIntervalMs = 1500;
    config.network.maxReconnectAttempts = 9;
    config.network.preferIpv6 = false;

    auto settings = ClientSettings::fromConfig(config);

    EXPECT_EQ(settings.reconnectInterval, 1500ms);
    EXPECT_EQ(settings.maxReconnectAttempts, 9u);
    EXPECT_FALSE(settings.preferIpv6);
}

// =============================================================================
// Admission
// =============================================================================

TEST_F(SessionClientTest, AuthenticatesAndReportsStreamEndpoint) {
    uint16_t port = startHost();
    ClientRecorder recorder;
    auto& client = newClient(recorder);

    ASSERT_TRUE(client.connect("127.0.0.1", port, "Saber", "114514").isSuccess());

    ASSERT_TRUE(waitUntil([&]() { return !recorder.admissions().empty(); }));
    EXPECT_EQ(recorder.admissions()[0], std::make_pair(std::string("127.0.0.1"), uint16_t(10000)));
    EXPECT_TRUE(client.isAuthenticated());
    EXPECT_EQ(client.state(), ClientState::Authenticated);
    EXPECT_EQ(client.nickname(), "Saber");
    EXPECT_EQ(client.srtPort(), 10000);
    EXPECT_EQ(client.serverAddress(), "127.0.0.1");

    ASSERT_TRUE(waitUntil([&]() { return !recorder.memberLists().empty(); }));
    std::vector<core::Member> expected{{"Host", core::Role::Sender}, {"Saber", core::Role::Receiver}};
    EXPECT_EQ(recorder.memberLists().back(), expected);

    auto again = client.connect("127.0.0.1", port, "Saber", "114514");
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, core::ErrorCode::InvalidState);
}

TEST_F(SessionClientTest, WildcardAnnouncementUsesConnectedAddress) {
    hostSettings_.bindAddress = "0.0.0.0";
    uint16_t port = startHost();
    ClientRecorder recorder;
    auto& client = newClient(recorder);

    ASSERT_TRUE(client.connect("127.0.0.1", port, "Saber", "114514").isSuccess());

    ASSERT_TRUE(waitUntil([&]() { return client.isAuthenticated(); }));
    EXPECT_EQ(client.serverAddress(), "127.0.0.1");
}

TEST_F(SessionClientTest, WrongCodeIsTerminal) {
    uint16_t port = startHost();
    ClientRecorder recorder;
    auto& client = newClient(recorder);

    ASSERT_TRUE(client.connect("127.0.0.1", port, "Saber", "000000").isSuccess());

    ASSERT_TRUE(waitUntil([&]() { return client.state() == ClientState::Disconnected; }));
    EXPECT_TRUE(recorder.sawError(core::ErrorCode::AuthenticationFailed));
    EXPECT_TRUE(recorder.admissions().empty());

    // No reconnect follows
    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(client.state(), ClientState::Disconnected);
    EXPECT_EQ(client.reconnectAttempts(), 0u);
    EXPECT_FALSE(recorder.sawError(core::ErrorCode::ReconnectLimitReached));
}

TEST_F(SessionClientTest, DuplicateNicknameIsSuffixed) {
    uint16_t port = startHost();
    ClientRecorder first;
    ClientRecorder second;
    auto& a = newClient(first);
    auto& b = newClient(second);

    ASSERT_TRUE(a.connect("127.0.0.1", port, "Saber", "114514").isSuccess());
    ASSERT_TRUE(waitUntil([&]() { return a.isAuthenticated(); }));
    ASSERT_TRUE(b.connect("127.0.0.1", port, "Saber", "114514").isSuccess());
    ASSERT_TRUE(waitUntil([&]() { return b.isAuthenticated(); }));

    EXPECT_EQ(a.nickname(), "Saber");
    EXPECT_EQ(b.nickname(), "Saber_2");
    EXPECT_NE(a.srtPort(), b.srtPort());
}

// =============================================================================
// Room Traffic
// =============================================================================

TEST_F(SessionClientTest, JoinAndLeaveArriveAsSystemChat) {
    uint16_t port = startHost();
    ClientRecorder watcher;
    ClientRecorder visitor;
    auto& a = newClient(watcher);
    auto& b = newClient(visitor);
    ASSERT_TRUE(a.connect("127.0.0.1", port, "Saber", "114514").isSuccess());
    ASSERT_TRUE(waitUntil([&]() { return a.isAuthenticated(); }));

    ASSERT_TRUE(b.connect("127.0.0.1", port, "Archer", "114514").isSuccess());
    ASSERT_TRUE(waitUntil([&]() { return watcher.sawChat("System", "Archer joined"); }));

    b.disconnect();
    b.disconnect();

    EXPECT_TRUE(waitUntil([&]() { return watcher.sawChat("System", "Archer left"); }));
    EXPECT_TRUE(waitUntil([&]() { return b.state() == ClientState::Disconnected; }));
    EXPECT_TRUE(waitUntil([&]() { return coordinator_->onlineMembers().size() == 2; }));
    EXPECT_FALSE(visitor.sawError(core::ErrorCode::TransportDisconnected));
}

TEST_F(SessionClientTest, ChatIsDeliveredToEveryone) {
    uint16_t port = startHost();
    ClientRecorder first;
    ClientRecorder second;
    auto& a = newClient(first);
    auto& b = newClient(second);
    ASSERT_TRUE(a.connect("127.0.0.1", port, "Saber", "114514").isSuccess());
    ASSERT_TRUE(b.connect("127.0.0.1", port, "Archer", "114514").isSuccess());
    ASSERT_TRUE(waitUntil([&]() { return a.isAuthenticated() && b.isAuthenticated(); }));

    ASSERT_TRUE(a.sendChat("hello").isSuccess());

    EXPECT_TRUE(waitUntil([&]() { return first.sawChat("Saber", "hello"); }));
    EXPECT_TRUE(waitUntil([&]() { return second.sawChat("Saber", "hello"); }));

    ASSERT_TRUE(coordinator_->sendChat("welcome").isSuccess());
    EXPECT_TRUE(waitUntil([&]() { return second.sawChat("Host", "welcome"); }));
}

TEST_F(SessionClientTest, HeartbeatsKeepSessionAlive) {
    clientSettings_.heartbeatInterval = 50ms;
    uint16_t port = startHost();
    ClientRecorder recorder;
    auto& client = newClient(recorder);
    ASSERT_TRUE(client.connect("127.0.0.1", port, "Saber", "114514").isSuccess());
    ASSERT_TRUE(waitUntil([&]() { return client.isAuthenticated(); }));

    std::this_thread::sleep_for(300ms);

    EXPECT_TRUE(client.isAuthenticated());
    EXPECT_TRUE(recorder.errors().empty());
    ASSERT_TRUE(client.sendChat("still here").isSuccess());
    EXPECT_TRUE(waitUntil([&]() { return recorder.sawChat("Saber", "still here"); }));
}

// =============================================================================
// Reconnect
// =============================================================================

TEST_F(SessionClientTest, GivesUpAfterReconnectLimit) {
    uint16_t port = closedPort();
    ClientRecorder recorder;
    auto& client = newClient(recorder);

    ASSERT_TRUE(client.connect("127.0.0.1", port, "Saber", "114514").isSuccess());

    ASSERT_TRUE(waitUntil([&]() { return recorder.sawError(core::ErrorCode::ReconnectLimitReached); }));
    EXPECT_TRUE(waitUntil([&]() { return client.state() == ClientState::Disconnected; }));
    EXPECT_EQ(client.reconnectAttempts(), 2u);
    EXPECT_TRUE(recorder.sawError(core::ErrorCode::ConnectionFailed));
    EXPECT_TRUE(recorder.admissions().empty());
}

TEST_F(SessionClientTest, ReconnectsWhenHostComesBack) {
    clientSettings_.maxReconnectAttempts = 50;
    uint16_t port = startHost();
    ClientRecorder recorder;
    auto& client = newClient(recorder);
    ASSERT_TRUE(client.connect("127.0.0.1", port, "Saber", "114514").isSuccess());
    ASSERT_TRUE(waitUntil([&]() { return client.isAuthenticated(); }));

    coordinator_->stop();
    ASSERT_TRUE(waitUntil([&]() { return recorder.sawError(core::ErrorCode::TransportDisconnected); }));

    hostSettings_.port = port;
    startHost();

    EXPECT_TRUE(waitUntil([&]() { return recorder.admissions().size() == 2; }));
    EXPECT_TRUE(client.isAuthenticated());
    EXPECT_EQ(client.reconnectAttempts(), 0u);
}

TEST_F(SessionClientTest, ChatWhileReconnectingIsSafe) {
    uint16_t port = startHost();
    ClientRecorder recorder;
    auto& client = newClient(recorder);
    ASSERT_TRUE(client.connect("127.0.0.1", port, "Saber", "114514").isSuccess());
    ASSERT_TRUE(waitUntil([&]() { return client.isAuthenticated(); }));

    std::atomic<bool> chatting{true};
    std::thread chatter([&]() {
        while (chatting) {
            auto sent = client.sendChat("ping");
            if (sent.isError()) {
                EXPECT_EQ(sent.error().code, core::ErrorCode::NotAuthenticated);
            }
        }
    });

    bool cycled = true;
    for (int round = 0; round < 3 && cycled; ++round) {
        client.disconnect();
        cycled = waitUntil([&]() { return client.state() == ClientState::Disconnected; }) &&
                 client.connect("127.0.0.1", port, "Saber", "114514").isSuccess() &&
                 waitUntil([&]() { return client.isAuthenticated(); });
    }

    chatting = false;
    chatter.join();
    ASSERT_TRUE(cycled);
    EXPECT_TRUE(client.sendChat("done").isSuccess());
}

TEST_F(SessionClientTest, DisconnectBeforeConnectIsHarmless) {
    ClientRecorder recorder;
    auto& client = newClient(recorder);

    client.disconnect();

    EXPECT_EQ(client.state(), ClientState::Idle);
    EXPECT_TRUE(recorder.errors().empty());
}

} // namespace test
} // namespace signaling
} // namespace watchparty
