// WatchParty - Watch-party signaling and process supervision core
// Integration Tests for the Watch-Party Flow
//
// Host coordinator with real relay supervision (a script stands in for
// ffmpeg) and viewers connecting through SessionClient.
//
// Covers:
// - Two viewers asking for the same nickname
// - One supervised relay per viewer, each on its own port
// - Wrong verification code leaves no trace
// - Chat delivered exactly once per participant
// - Relay teardown on leave and on host shutdown

#include <gtest/gtest.h>
#include "watchparty/process/process_supervisor.hpp"
#include "watchparty/process/relay_manager.hpp"
#include "watchparty/signaling/session_client.hpp"
#include "watchparty/signaling/session_coordinator.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace watchparty {
namespace integration {
namespace test {

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

// Stream ports are only handed out when both IPv4 and IPv6 can bind them
bool hostHasIpv6() {
    int fd = socket(AF_INET6, SOCK_STREAM, 0);
    if (fd < 0) {
        return false;
    }
    sockaddr_in6 addr{};
    addr.sin6_family = AF_INET6;
    addr.sin6_addr = in6addr_any;
    bool bound = bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    close(fd);
    return bound;
}

bool waitUntil(const std::function<bool()>& condition,
               std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }
    return condition();
}

struct Viewer {
    std::unique_ptr<signaling::SessionClient> client;
    std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> chats;
    std::vector<core::ErrorCode> errors;

    size_t chatCount(const std::string& who, const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<size_t>(std::count(chats.begin(), chats.end(), std::make_pair(who, text)));
    }

    bool sawError(core::ErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex);
        return std::find(errors.begin(), errors.end(), code) != errors.end();
    }
};

} // anonymous namespace

class WatchPartyFlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!hostHasIpv6()) {
            GTEST_SKIP() << "host has no IPv6 stack";
        }
        dir_ = fs::temp_directory_path() /
               ("watchparty_flow_test_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        fs::path ffmpeg = dir_ / "ffmpeg";
        {
            std::ofstream script(ffmpeg);
            script << "#!/bin/sh\nexec sleep 30\n";
        }
        chmod(ffmpeg.c_str(), 0755);

        supervisor_ = std::make_shared<process::ProcessSupervisor>(nullptr, 50ms);
        process::RelaySettings relaySettings;
        relaySettings.ffmpegPath = ffmpeg.string();
        relaySettings.logDirectory = (dir_ / "logs").string();
        relaySettings.stopTimeout = 1000ms;
        relays_ = std::make_shared<process::RelayManager>(supervisor_, relaySettings);

        signaling::CoordinatorSettings settings;
        settings.bindAddress = "127.0.0.1";
        settings.port = 0;
        settings.verificationCode = "114514";
        settings.srtBasePort = 41000;
        coordinator_ = std::make_unique<signaling::SessionCoordinator>(settings, relays_);
        coordinator_->setChatCallback([this](const std::string& who, const std::string& text) {
            std::lock_guard<std::mutex> lock(mutex_);
            hostChats_.emplace_back(who, text);
        });
        auto started = coordinator_->start();
        ASSERT_TRUE(started.isSuccess()) << started.error().toString();
    }

    void TearDown() override {
        viewers_.clear();
        coordinator_.reset();
        relays_.reset();
        if (supervisor_) {
            supervisor_->shutdown();
        }
        std::error_code ec;
        if (!dir_.empty()) {
            fs::remove_all(dir_, ec);
        }
    }

    Viewer& connectViewer(const std::string& nickname, const std::string& code = "114514") {
        viewers_.push_back(std::make_unique<Viewer>());
        Viewer& viewer = *viewers_.back();
        signaling::ClientSettings settings;
        settings.reconnectInterval = 100ms;
        settings.maxReconnectAttempts = 1;
        viewer.client = std::make_unique<signaling::SessionClient>(settings);
        viewer.client->setChatCallback([&viewer](const std::string& who, const std::string& text) {
            std::lock_guard<std::mutex> lock(viewer.mutex);
            viewer.chats.emplace_back(who, text);
        });
        viewer.client->setErrorCallback([&viewer](const core::Error& error) {
            std::lock_guard<std::mutex> lock(viewer.mutex);
            viewer.errors.push_back(error.code);
        });
        auto result = viewer.client->connect("127.0.0.1", coordinator_->boundPort(), nickname, code);
        EXPECT_TRUE(result.isSuccess());
        return viewer;
    }

    size_t hostChatCount(const std::string& who, const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(
            std::count(hostChats_.begin(), hostChats_.end(), std::make_pair(who, text)));
    }

    fs::path dir_;
    std::shared_ptr<process::ProcessSupervisor> supervisor_;
    std::shared_ptr<process::RelayManager> relays_;
    std::unique_ptr<signaling::SessionCoordinator> coordinator_;
    std::vector<std::unique_ptr<Viewer>> viewers_;

    std::mutex mutex_;
    std::vector<std::pair<std::string, std::string>> hostChats_;
};

TEST_F(WatchPartyFlowTest, SameNicknameTwiceGetsTwoRelays) {
    Viewer& first = connectViewer("Saber");
    ASSERT_TRUE(waitUntil([&]() { return first.client->isAuthenticated(); }));
    Viewer& second = connectViewer("Saber");
    ASSERT_TRUE(waitUntil([&]() { return second.client->isAuthenticated(); }));

    EXPECT_EQ(first.client->nickname(), "Saber");
    EXPECT_EQ(second.client->nickname(), "Saber_2");
    uint16_t firstPort = first.client->srtPort();
    uint16_t secondPort = second.client->srtPort();
    EXPECT_NE(firstPort, secondPort);
    EXPECT_GE(firstPort, 41000);
    EXPECT_GE(secondPort, 41000);

    EXPECT_TRUE(relays_->isRunning(process::RelayManager::viewerRelayName("Saber", firstPort)));
    EXPECT_TRUE(relays_->isRunning(process::RelayManager::viewerRelayName("Saber_2", secondPort)));

    std::vector<core::Member> expected{
        {"Host", core::Role::Sender},
        {"Saber", core::Role::Receiver},
        {"Saber_2", core::Role::Receiver}};
    EXPECT_EQ(coordinator_->onlineMembers(), expected);
}

TEST_F(WatchPartyFlowTest, WrongCodeLeavesNoTrace) {
    Viewer& intruder = connectViewer("Mallory", "000000");

    ASSERT_TRUE(waitUntil([&]() {
        return intruder.client->state() == signaling::ClientState::Disconnected;
    }));
    EXPECT_TRUE(intruder.sawError(core::ErrorCode::AuthenticationFailed));
    EXPECT_EQ(coordinator_->onlineMembers().size(), 1u);
    EXPECT_TRUE(relays_->activeRelays().empty());
}

TEST_F(WatchPartyFlowTest, ChatIsDeliveredOncePerParticipant) {
    Viewer& a = connectViewer("Saber");
    Viewer& b = connectViewer("Archer");
    ASSERT_TRUE(waitUntil([&]() {
        return a.client->isAuthenticated() && b.client->isAuthenticated();
    }));

    ASSERT_TRUE(a.client->sendChat("movie time").isSuccess());
    ASSERT_TRUE(waitUntil([&]() { return b.chatCount("Saber", "movie time") == 1; }));

    // A later line from the host marks the end of anything queued before it
    ASSERT_TRUE(coordinator_->sendChat("enjoy").isSuccess());
    ASSERT_TRUE(waitUntil([&]() {
        return a.chatCount("Host", "enjoy") == 1 && b.chatCount("Host", "enjoy") == 1;
    }));

    EXPECT_EQ(a.chatCount("Saber", "movie time"), 1u);
    EXPECT_EQ(b.chatCount("Saber", "movie time"), 1u);
    EXPECT_EQ(hostChatCount("Saber", "movie time"), 1u);
}

TEST_F(WatchPartyFlowTest, LeavingStopsTheViewerRelay) {
    Viewer& stays = connectViewer("Saber");
    Viewer& leaves = connectViewer("Archer");
    ASSERT_TRUE(waitUntil([&]() {
        return stays.client->isAuthenticated() && leaves.client->isAuthenticated();
    }));
    std::string relay = process::RelayManager::viewerRelayName("Archer", leaves.client->srtPort());
    ASSERT_TRUE(relays_->isRunning(relay));

    leaves.client->disconnect();

    EXPECT_TRUE(waitUntil([&]() { return stays.chatCount("System", "Archer left") == 1; }));
    EXPECT_TRUE(waitUntil([&]() { return !relays_->isRunning(relay); }));
    EXPECT_EQ(relays_->activeRelays().size(), 1u);
}

TEST_F(WatchPartyFlowTest, HostShutdownStopsEverything) {
    Viewer& viewer = connectViewer("Saber");
    ASSERT_TRUE(waitUntil([&]() { return viewer.client->isAuthenticated(); }));

    coordinator_->stop();

    EXPECT_TRUE(relays_->activeRelays().empty());
    EXPECT_TRUE(waitUntil([&]() {
        return viewer.client->state() == signaling::ClientState::Disconnected;
    }));
    EXPECT_TRUE(viewer.sawError(core::ErrorCode::TransportDisconnected));
}

} // namespace test
} // namespace integration
} // namespace watchparty
