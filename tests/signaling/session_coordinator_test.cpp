// WatchParty - Watch-party signaling and process supervision core
// Tests for Session Coordinator
//
// Covers:
// - Listener lifecycle, ephemeral port, bind failures
// - Admission: wrong code, nickname suffixes, distinct ports
// - Rollback when the port search or the relay launch fails
// - Frames pipelined after a rejection are dropped
// - Stream port cursor only moves forward
// - Pre-auth and malformed traffic keeps the connection open
// - Chat fan-out, heartbeat echo, host chat
// - Disconnect cleanup and stop (also from a callback)

#include <gtest/gtest.h>
#include "watchparty/signaling/session_coordinator.hpp"

#include "watchparty/core/json_value.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

namespace watchparty {
namespace signaling {
namespace test {

using namespace std::chrono_literals;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

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

core::JsonValue parse(const std::string& text) {
    auto parsed = core::parseJson(text);
    EXPECT_TRUE(parsed.isSuccess()) << text;
    return parsed.isSuccess() ? parsed.value() : core::JsonValue();
}

// =============================================================================
// Fakes
// =============================================================================

class FakeRelayLauncher : public IRelayLauncher {
public:
    core::Result<std::string, core::Error> startViewerRelay(const std::string& nickname,
                                                            uint16_t srtPort,
                                                            const std::string& bindAddress) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failures_ > 0) {
            --failures_;
            return core::Result<std::string, core::Error>::error(
                core::Error(core::ErrorCode::ProcessLaunchFailed, "scripted failure"));
        }
        started_.emplace_back(nickname, srtPort, bindAddress);
        return core::Result<std::string, core::Error>::success(
            "relay_" + nickname + "_" + std::to_string(srtPort));
    }

    core::Result<void, core::Error> stopRelay(const std::string& relayName) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.push_back(relayName);
        return core::Result<void, core::Error>::success();
    }

    void failNext(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_ = count;
    }

    std::vector<std::tuple<std::string, uint16_t, std::string>> started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    std::vector<std::string> stopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

private:
    mutable std::mutex mutex_;
    int failures_ = 0;
    std::vector<std::tuple<std::string, uint16_t, std::string>> started_;
    std::vector<std::string> stopped_;
};

class FakePortProbe : public net::IPortProbe {
public:
    core::Result<void, pal::NetworkError> probe(pal::AddressFamily, uint16_t port) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (allBusy_ || busy_.count(port) != 0) {
            return core::Result<void, pal::NetworkError>::error(
                pal::NetworkError(pal::NetworkErrorCode::AddressInUse, "busy"));
        }
        return core::Result<void, pal::NetworkError>::success();
    }

    void setBusy(uint16_t port) {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_.insert(port);
    }

    void setAllBusy(bool busy) {
        std::lock_guard<std::mutex> lock(mutex_);
        allBusy_ = busy;
    }

private:
    std::mutex mutex_;
    std::set<uint16_t> busy_;
    bool allBusy_ = false;
};

// =============================================================================
// Test Peer
// =============================================================================

/**
 * @brief Minimal WebSocket peer with bounded waits.
 */
class TestPeer {
public:
    explicit TestPeer(uint16_t port) : ws_(ioc_) {
        tcp::resolver resolver(ioc_);
        auto results = resolver.resolve("127.0.0.1", std::to_string(port));
        beast::get_lowest_layer(ws_).connect(results);
        ws_.handshake("127.0.0.1:" + std::to_string(port), "/");
    }

    void send(const std::string& text) {
        ws_.text(true);
        ws_.write(asio::buffer(text));
    }

    void auth(const std::string& nickname, const std::string& code = "114514") {
        send(R"({"type":"auth","code":")" + code + R"(","nickname":")" + nickname + R"("})");
    }

    /**
     * @brief Next text frame, or nullopt on timeout or closure.
     */
    std::optional<std::string> read(std::chrono::milliseconds timeout = 3000ms) {
        if (failed_) {
            return std::nullopt;
        }
        beast::flat_buffer buffer;
        beast::error_code result;
        bool done = false;
        ws_.async_read(buffer, [&](beast::error_code ec, std::size_t) {
            result = ec;
            done = true;
        });
        ioc_.restart();
        ioc_.run_for(timeout);
        if (!done) {
            beast::get_lowest_layer(ws_).cancel();
            ioc_.restart();
            ioc_.run();
            failed_ = true;
            return std::nullopt;
        }
        if (result) {
            closedBy_ = result;
            failed_ = true;
            return std::nullopt;
        }
        return beast::buffers_to_string(buffer.data());
    }

    /**
     * @brief Next frame parsed; an empty object on timeout.
     */
    core::JsonValue next(std::chrono::milliseconds timeout = 3000ms) {
        auto text = read(timeout);
        return text ? parse(*text) : core::JsonValue::object();
    }

    core::JsonValue nextOfType(const std::string& type) {
        for (int i = 0; i < 10; ++i) {
            auto frame = next();
            if (frame["type"].getString() == type || !frame.contains("type")) {
                return frame;
            }
        }
        return core::JsonValue::object();
    }

    bool closedByServer(std::chrono::milliseconds timeout = 3000ms) {
        while (read(timeout)) {
        }
        // A timeout leaves closedBy_ unset
        return static_cast<bool>(closedBy_);
    }

    void close() {
        beast::error_code ec;
        ws_.close(websocket::close_code::normal, ec);
    }

private:
    asio::io_context ioc_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::error_code closedBy_;
    bool failed_ = false;
};

} // anonymous namespace

// =============================================================================
// Fixture
// =============================================================================

class SessionCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.bindAddress = "127.0.0.1";
        settings_.port = 0;
        relays_ = std::make_shared<FakeRelayLauncher>();
        probe_ = std::make_shared<FakePortProbe>();
    }

    void TearDown() override {
        coordinator_.reset();
    }

    SessionCoordinator& coordinator() {
        if (!coordinator_) {
            coordinator_ = std::make_unique<SessionCoordinator>(
                settings_, relays_, std::make_shared<net::PortAllocator>(probe_));
            coordinator_->setChatCallback([this](const std::string& who, const std::string& text) {
                std::lock_guard<std::mutex> lock(mutex_);
                chats_.emplace_back(who, text);
            });
            coordinator_->setMemberListCallback([this](const std::vector<core::Member>& members) {
                std::lock_guard<std::mutex> lock(mutex_);
                memberLists_.push_back(members);
            });
            coordinator_->setSessionEventCallback(
                [this](core::SessionEventType type, const core::SessionLogContext&) {
                    std::lock_guard<std::mutex> lock(mutex_);
                    events_.push_back(type);
                });
        }
        return *coordinator_;
    }

    uint16_t startCoordinator() {
        auto started = coordinator().start();
        EXPECT_TRUE(started.isSuccess()) << started.error().toString();
        return coordinator().boundPort();
    }

    /**
     * @brief Connect and authenticate; consumes auth_success and members.
     */
    std::unique_ptr<TestPeer> join(uint16_t port, const std::string& nickname,
                                   core::JsonValue* success = nullptr) {
        auto peer = std::make_unique<TestPeer>(port);
        peer->auth(nickname);
        auto reply = peer->next();
        EXPECT_EQ(reply["type"].getString(), "auth_success");
        EXPECT_EQ(peer->next()["type"].getString(), "members");
        if (success) {
            *success = reply;
        }
        return peer;
    }

    std::vector<std::pair<std::string, std::string>> chats() {
        std::lock_guard<std::mutex> lock(mutex_);
        return chats_;
    }

    size_t eventCount(core::SessionEventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(events_.begin(), events_.end(), type));
    }

    CoordinatorSettings settings_;
    std::shared_ptr<FakeRelayLauncher> relays_;
    std::shared_ptr<FakePortProbe> probe_;
    std::unique_ptr<SessionCoordinator> coordinator_;

    std::mutex mutex_;
    std::vector<std::pair<std::string, std::string>> chats_;
    std::vector<std::vector<core::Member>> memberLists_;
    std::vector<core::SessionEventType> events_;
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(SessionCoordinatorTest, StartsOnEphemeralPort) {
    uint16_t port = startCoordinator();

    EXPECT_NE(port, 0);
    EXPECT_TRUE(coordinator().isRunning());

    auto again = coordinator().start();
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, core::ErrorCode::InvalidState);

    coordinator().stop();
    EXPECT_FALSE(coordinator().isRunning());
    EXPECT_EQ(coordinator().boundPort(), 0);
    coordinator().stop();
}

TEST_F(SessionCoordinatorTest, RestartsAfterStop) {
    startCoordinator();
    coordinator().stop();

    uint16_t port = startCoordinator();

    auto peer = join(port, "Saber");
    EXPECT_EQ(coordinator().onlineMembers().size(), 2u);
}

TEST_F(SessionCoordinatorTest, RejectsInvalidBindAddress) {
    settings_.bindAddress = "not-an-address";

    auto result = coordinator().start();

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::InvalidAddress);
    EXPECT_FALSE(coordinator().isRunning());
}

TEST_F(SessionCoordinatorTest, ReportsPortInUse) {
    uint16_t port = startCoordinator();
    CoordinatorSettings clash = settings_;
    clash.port = port;
    SessionCoordinator second(clash, relays_, std::make_shared<net::PortAllocator>(probe_));

    auto result = second.start();

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::AddressInUse);
}

TEST_F(SessionCoordinatorTest, SettingsFromConfiguration) {
    core::Configuration config;
    config.network.websocketPort = 12000;
    config.network.verificationCode = "999";
    config.network.hostNickname = "Rin";
    config.network.srtBasePort = 20000;

    auto settings = CoordinatorSettings::fromConfig(config);

    EXPECT_EQ(settings.port, 12000);
    EXPECT_EQ(settings.verificationCode, "999");
    EXPECT_EQ(settings.hostNickname, "Rin");
    EXPECT_EQ(settings.srtBasePort, 20000);
    EXPECT_EQ(settings.bindAddress, "0.0.0.0");
}

// =============================================================================
// Admission
// =============================================================================

TEST_F(SessionCoordinatorTest, AdmitsViewerWithRelay) {
    uint16_t port = startCoordinator();
    TestPeer peer(port);

    peer.auth("Saber");

    auto success = peer.next();
    EXPECT_EQ(success["type"].getString(), "auth_success");
    EXPECT_EQ(success["nickname"].getString(), "Saber");
    EXPECT_EQ(success["srt_port"].getInt(), 10000);
    EXPECT_EQ(success["server_ip"].getString(), "127.0.0.1");

    auto members = peer.next();
    ASSERT_EQ(members["type"].getString(), "members");
    ASSERT_EQ(members["members"].size(), 2u);
    EXPECT_EQ(members["members"].items()[0]["nickname"].getString(), "Host");
    EXPECT_EQ(members["members"].items()[0]["role"].getString(), "sender");
    EXPECT_EQ(members["members"].items()[1]["nickname"].getString(), "Saber");
    EXPECT_EQ(members["members"].items()[1]["role"].getString(), "receiver");

    auto started = relays_->started();
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0], std::make_tuple(std::string("Saber"), uint16_t(10000), std::string("127.0.0.1")));
    EXPECT_TRUE(waitUntil([&]() { return eventCount(core::SessionEventType::Authenticated) == 1; }));
}

TEST_F(SessionCoordinatorTest, DuplicateNicknamesGetSuffixAndDistinctPorts) {
    uint16_t port = startCoordinator();
    core::JsonValue first;
    core::JsonValue second;

    auto saber = join(port, "Saber", &first);
    auto saber2 = join(port, "Saber", &second);

    EXPECT_EQ(first["nickname"].getString(), "Saber");
    EXPECT_EQ(second["nickname"].getString(), "Saber_2");
    EXPECT_NE(first["srt_port"].getInt(), second["srt_port"].getInt());

    auto joinNotice = saber->next();
    EXPECT_EQ(joinNotice["type"].getString(), "join");
    EXPECT_EQ(joinNotice["nickname"].getString(), "Saber_2");
    EXPECT_EQ(joinNotice["message"].getString(), "Saber_2 joined");

    std::vector<core::Member> expected{
        {"Host", core::Role::Sender},
        {"Saber", core::Role::Receiver},
        {"Saber_2", core::Role::Receiver}};
    EXPECT_EQ(coordinator().onlineMembers(), expected);
    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_FALSE(memberLists_.empty());
    EXPECT_EQ(memberLists_.back(), expected);
}

TEST_F(SessionCoordinatorTest, HostNicknameIsReserved) {
    uint16_t port = startCoordinator();
    core::JsonValue success;

    auto peer = join(port, "Host", &success);

    EXPECT_EQ(success["nickname"].getString(), "Host_2");
}

TEST_F(SessionCoordinatorTest, WrongCodeIsRejectedAndClosed) {
    uint16_t port = startCoordinator();
    TestPeer peer(port);

    peer.auth("Saber", "000000");

    auto reply = peer.next();
    EXPECT_EQ(reply["type"].getString(), "auth_failed");
    EXPECT_FALSE(reply["message"].getString().empty());
    EXPECT_TRUE(peer.closedByServer());
    EXPECT_TRUE(relays_->started().empty());
    EXPECT_EQ(coordinator().onlineMembers().size(), 1u);
    EXPECT_TRUE(waitUntil([&]() {
        return eventCount(core::SessionEventType::AuthenticationFailed) == 1;
    }));
}

TEST_F(SessionCoordinatorTest, FramesAfterWrongCodeAreIgnored) {
    uint16_t port = startCoordinator();
    auto saber = join(port, "Saber");
    TestPeer mallory(port);

    mallory.auth("Mallory", "000000");
    mallory.auth("Mallory");

    EXPECT_EQ(mallory.next()["type"].getString(), "auth_failed");
    EXPECT_TRUE(mallory.closedByServer());
    EXPECT_FALSE(saber->read(500ms).has_value());
    EXPECT_EQ(relays_->started().size(), 1u);
    EXPECT_EQ(coordinator().onlineMembers().size(), 2u);
    EXPECT_EQ(eventCount(core::SessionEventType::Authenticated), 1u);
}

TEST_F(SessionCoordinatorTest, FramesAfterRejectionAreIgnored) {
    uint16_t port = startCoordinator();
    auto saber = join(port, "Saber");
    TestPeer peer(port);

    peer.auth("   ");
    peer.auth("Archer");

    auto reply = peer.next();
    EXPECT_EQ(reply["type"].getString(), "error");
    EXPECT_EQ(reply["message"].getString(), "nickname required");
    EXPECT_TRUE(peer.closedByServer());
    EXPECT_FALSE(saber->read(500ms).has_value());
    EXPECT_EQ(relays_->started().size(), 1u);
    EXPECT_EQ(coordinator().onlineMembers().size(), 2u);
}

TEST_F(SessionCoordinatorTest, RelayFailureCommitsNothing) {
    uint16_t port = startCoordinator();
    relays_->failNext(1);
    TestPeer rejected(port);

    rejected.auth("Saber");

    auto reply = rejected.next();
    EXPECT_EQ(reply["type"].getString(), "error");
    EXPECT_EQ(reply["message"].getString(), "failed to start stream relay");
    EXPECT_TRUE(rejected.closedByServer());

    core::JsonValue success;
    auto peer = join(port, "Saber", &success);
    EXPECT_EQ(success["nickname"].getString(), "Saber");
    EXPECT_EQ(success["srt_port"].getInt(), 10000);
}

TEST_F(SessionCoordinatorTest, PortExhaustionIsRejected) {
    settings_.portSearchAttempts = 5;
    uint16_t port = startCoordinator();
    probe_->setAllBusy(true);
    TestPeer peer(port);

    peer.auth("Saber");

    auto reply = peer.next();
    EXPECT_EQ(reply["type"].getString(), "error");
    EXPECT_EQ(reply["message"].getString(), "no stream port available");
    EXPECT_TRUE(peer.closedByServer());
    EXPECT_TRUE(relays_->started().empty());
}

TEST_F(SessionCoordinatorTest, BusyPortsAreSkipped) {
    uint16_t port = startCoordinator();
    probe_->setBusy(10000);
    probe_->setBusy(10001);
    core::JsonValue success;

    auto peer = join(port, "Saber", &success);

    EXPECT_EQ(success["srt_port"].getInt(), 10002);
}

TEST_F(SessionCoordinatorTest, PortCursorNeverMovesBack) {
    settings_.srtBasePort = 65534;
    uint16_t port = startCoordinator();
    core::JsonValue a;
    core::JsonValue b;

    auto first = join(port, "A", &a);
    auto second = join(port, "B", &b);
    first->close();
    EXPECT_TRUE(waitUntil([&]() { return coordinator().onlineMembers().size() == 2; }));

    // 65534 is free again but was claimed earlier in this session
    TestPeer third(port);
    third.auth("C");
    auto reply = third.next();

    EXPECT_EQ(a["srt_port"].getInt(), 65534);
    EXPECT_EQ(b["srt_port"].getInt(), 65535);
    EXPECT_EQ(reply["type"].getString(), "error");
    EXPECT_EQ(reply["message"].getString(), "no stream port available");
    EXPECT_EQ(relays_->started().size(), 2u);
}

TEST_F(SessionCoordinatorTest, PortCursorSkipsReleasedPorts) {
    uint16_t port = startCoordinator();
    core::JsonValue a;
    core::JsonValue b;

    auto first = join(port, "A", &a);
    first->close();
    EXPECT_TRUE(waitUntil([&]() { return coordinator().onlineMembers().size() == 1; }));
    auto second = join(port, "B", &b);

    EXPECT_EQ(a["srt_port"].getInt(), 10000);
    EXPECT_EQ(b["srt_port"].getInt(), 10001);
}

// =============================================================================
// Traffic
// =============================================================================

TEST_F(SessionCoordinatorTest, MessagesBeforeAuthAreRefused) {
    uint16_t port = startCoordinator();
    TestPeer peer(port);

    peer.send(R"({"type":"chat","message":"hi"})");
    auto reply = peer.next();
    EXPECT_EQ(reply["type"].getString(), "error");
    EXPECT_EQ(reply["message"].getString(), "authentication required");

    peer.auth("Saber");
    EXPECT_EQ(peer.next()["type"].getString(), "auth_success");
    EXPECT_TRUE(chats().empty());
}

TEST_F(SessionCoordinatorTest, MalformedFramesKeepConnectionOpen) {
    uint16_t port = startCoordinator();
    TestPeer peer(port);

    peer.send("{not json");
    auto malformed = peer.next();
    EXPECT_EQ(malformed["type"].getString(), "error");
    EXPECT_EQ(malformed["message"].getString(), "malformed message");

    peer.send(R"({"type":"auth","nickname":"Saber"})");
    EXPECT_EQ(peer.next()["message"].getString(), "malformed message");

    peer.auth("Saber");
    EXPECT_EQ(peer.next()["type"].getString(), "auth_success");
}

TEST_F(SessionCoordinatorTest, ChatReachesEveryViewerOnce) {
    uint16_t port = startCoordinator();
    auto a = join(port, "A");
    auto b = join(port, "B");
    auto c = join(port, "C");
    // Drain join notices and member lists caused by later joins
    for (int i = 0; i < 4; ++i) {
        a->next();
    }
    for (int i = 0; i < 2; ++i) {
        b->next();
    }

    a->send(R"({"type":"chat","message":"hello"})");

    for (auto* peer : {a.get(), b.get(), c.get()}) {
        auto chat = peer->next();
        EXPECT_EQ(chat["type"].getString(), "chat");
        EXPECT_EQ(chat["nickname"].getString(), "A");
        EXPECT_EQ(chat["message"].getString(), "hello");
        EXPECT_FALSE(chat["timestamp"].getString().empty());

        // Per-connection order: the echo proves no duplicate was queued
        peer->send(R"({"type":"heartbeat"})");
        EXPECT_EQ(peer->next()["type"].getString(), "heartbeat");
    }

    auto seen = chats();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], std::make_pair(std::string("A"), std::string("hello")));
}

TEST_F(SessionCoordinatorTest, HeartbeatIsEchoedVerbatim) {
    uint16_t port = startCoordinator();
    auto peer = join(port, "Saber");
    const std::string heartbeat = R"({"type":"heartbeat","seq":7})";

    peer->send(heartbeat);

    EXPECT_EQ(peer->read(), heartbeat);
}

TEST_F(SessionCoordinatorTest, SecondAuthIsRefused) {
    uint16_t port = startCoordinator();
    auto peer = join(port, "Saber");

    peer->auth("Archer");

    auto reply = peer->next();
    EXPECT_EQ(reply["type"].getString(), "error");
    EXPECT_EQ(reply["message"].getString(), "already authenticated");
    EXPECT_EQ(relays_->started().size(), 1u);
}

TEST_F(SessionCoordinatorTest, HostChatIsBroadcast) {
    uint16_t port = startCoordinator();
    auto peer = join(port, "Saber");

    ASSERT_TRUE(coordinator().sendChat("welcome").isSuccess());

    auto chat = peer->next();
    EXPECT_EQ(chat["type"].getString(), "chat");
    EXPECT_EQ(chat["nickname"].getString(), "Host");
    EXPECT_EQ(chat["message"].getString(), "welcome");
    EXPECT_TRUE(waitUntil([&]() { return chats().size() == 1; }));
    EXPECT_EQ(chats()[0].first, "Host");
}

TEST_F(SessionCoordinatorTest, HostChatRequiresRunningServer) {
    auto result = coordinator().sendChat("hello");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::InvalidState);
}

// =============================================================================
// Teardown
// =============================================================================

TEST_F(SessionCoordinatorTest, DisconnectReleasesEverything) {
    uint16_t port = startCoordinator();
    auto saber = join(port, "Saber");
    auto saber2 = join(port, "Saber");
    saber->nextOfType("members");

    saber2->close();

    auto leave = saber->next();
    EXPECT_EQ(leave["type"].getString(), "leave");
    EXPECT_EQ(leave["nickname"].getString(), "Saber_2");
    EXPECT_EQ(leave["message"].getString(), "Saber_2 left");
    auto members = saber->next();
    EXPECT_EQ(members["type"].getString(), "members");
    EXPECT_EQ(members["members"].size(), 2u);

    EXPECT_TRUE(waitUntil([&]() { return relays_->stopped().size() == 1; }));
    EXPECT_EQ(relays_->stopped()[0], "relay_Saber_2_10001");

    // The nickname is free again
    core::JsonValue success;
    auto again = join(port, "Saber", &success);
    EXPECT_EQ(success["nickname"].getString(), "Saber_2");
}

TEST_F(SessionCoordinatorTest, StopClosesViewersAndRelays) {
    uint16_t port = startCoordinator();
    auto a = join(port, "A");
    auto b = join(port, "B");

    coordinator().stop();

    auto stopped = relays_->stopped();
    std::sort(stopped.begin(), stopped.end());
    ASSERT_EQ(stopped.size(), 2u);
    EXPECT_EQ(stopped[0], "relay_A_10000");
    EXPECT_EQ(stopped[1], "relay_B_10001");
    EXPECT_TRUE(b->closedByServer());
    EXPECT_EQ(coordinator().onlineMembers().size(), 1u);
}

TEST_F(SessionCoordinatorTest, StopFromCallbackDoesNotDeadlock) {
    uint16_t port = startCoordinator();
    coordinator().setChatCallback([this](const std::string&, const std::string&) {
        coordinator_->stop();
    });
    auto peer = join(port, "Saber");

    peer->send(R"({"type":"chat","message":"bye"})");

    EXPECT_TRUE(waitUntil([&]() { return !coordinator().isRunning(); }));
    EXPECT_TRUE(waitUntil([&]() { return relays_->stopped().size() == 1; }));
}

} // namespace test
} // namespace signaling
} // namespace watchparty
