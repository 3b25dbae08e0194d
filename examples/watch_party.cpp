// WatchParty Console Example
// Host a watch party or join one; chat lines are read from stdin

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "watchparty/watchparty.hpp"

using namespace watchparty;

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "WatchParty v0.1.0\n"
              << "Usage: " << programName << " (--host | --join HOST:PORT) [options]\n"
              << "\nModes:\n"
              << "  --host                Start the stream server, ingest relay and signaling host\n"
              << "  --join HOST:PORT      Join a host (IPv6 as [addr]:port)\n"
              << "\nOptions:\n"
              << "  -c, --config FILE     JSON or YAML configuration file\n"
              << "  -n, --nickname NAME   Nickname (default: host nickname from config)\n"
              << "  -k, --code CODE       Verification code (default: from config)\n"
              << "  -h, --help            Show this help\n"
              << "\nSend your screen to the host with e.g.:\n"
              << "  ffmpeg -re -i input.mp4 -c copy -f mpegts srt://HOST:9001?mode=caller\n"
              << std::endl;
}

/**
 * @brief Poll stdin so a signal can end the loop between lines.
 */
bool readLine(std::string& line) {
    while (g_running) {
        struct pollfd fd = {STDIN_FILENO, POLLIN, 0};
        int ready = ::poll(&fd, 1, 200);
        if (ready > 0) {
            if (!std::getline(std::cin, line)) {
                g_running = false;
                return false;
            }
            return true;
        }
    }
    return false;
}

std::shared_ptr<pal::ILogPAL> setUpLogging(const core::Configuration& config) {
    auto logPal = std::make_shared<pal::linux::LinuxLogPAL>("watchparty", false);
    logPal->setMinLevel(core::toPalLogLevel(config.logging.level));

    auto structured = std::make_shared<core::StructuredLogger>();
    structured->setLevel(config.logging.level);
    structured->setJsonFormat(config.logging.enableJson);
    if (config.logging.enableConsole) {
        structured->addSink(std::make_shared<core::ConsoleSink>());
    }
    if (config.logging.enableFile) {
        auto policy = core::RotationPolicy::sizeBased(
            static_cast<uint64_t>(config.logging.maxFileSizeMB) * 1024 * 1024,
            config.logging.maxFiles);
        auto file = std::make_shared<core::FileSink>(config.logging.filePath, policy);
        if (file->isOpen()) {
            structured->addSink(file);
        } else {
            std::cerr << "[WARN] Cannot open log file " << config.logging.filePath << std::endl;
        }
    }
    logPal->addSink(structured);
    return logPal;
}

void reportStop(const char* what, const core::Result<void, core::Error>& result) {
    if (result.isError()) {
        std::cerr << "[WARN] " << what << ": " << result.error().toString() << std::endl;
    }
}

void chatLoop(const std::function<core::Result<void, core::Error>(const std::string&)>& send) {
    std::string line;
    while (g_running && readLine(line)) {
        if (line.empty()) {
            continue;
        }
        auto sent = send(line);
        if (sent.isError()) {
            std::cerr << "[CHAT] " << core::userFacingMessage(sent.error().code) << std::endl;
        }
    }
}

// =============================================================================
// Host Mode
// =============================================================================

int runHost(const core::Configuration& config, const std::shared_ptr<pal::ILogPAL>& logger,
            const std::string& nickname, const std::string& code) {
    auto supervisor = std::make_shared<process::ProcessSupervisor>(
        logger, std::chrono::milliseconds(config.relay.restartDelayMs));

    process::StreamServer streamServer(supervisor, process::StreamServerSettings::fromConfig(config), logger);
    auto served = streamServer.start();
    if (served.isError()) {
        std::cerr << "[ERROR] Stream server: " << served.error().toString() << std::endl;
        return 1;
    }

    auto relays = std::make_shared<process::RelayManager>(
        supervisor, process::RelaySettings::fromConfig(config), logger);
    auto ingest = relays->startIngestRelay(config.network.srtInputPort, config.network.bindAddress);
    if (ingest.isError()) {
        std::cerr << "[ERROR] Ingest relay: " << ingest.error().toString() << std::endl;
        supervisor->shutdown();
        return 1;
    }

    process::MediaPlayer player(supervisor, core::Role::Sender,
                                process::PlayerSettings::fromConfig(config), logger);
    auto playing = player.playRtmp(streamServer.rtmpUrl());
    if (playing.isError()) {
        std::cerr << "[WARN] Player: " << playing.error().toString() << std::endl;
    }

    auto settings = signaling::CoordinatorSettings::fromConfig(config);
    settings.hostNickname = nickname;
    settings.verificationCode = code;
    signaling::SessionCoordinator coordinator(settings, relays,
                                              std::make_shared<net::PortAllocator>(
                                                  std::make_shared<net::SocketPortProbe>(), logger),
                                              logger);
    coordinator.setChatCallback([](const std::string& who, const std::string& text) {
        std::cout << who << ": " << text << std::endl;
    });
    coordinator.setMemberListCallback([](const std::vector<core::Member>& members) {
        std::cout << "[ROOM]";
        for (const auto& member : members) {
            std::cout << " " << member.nickname << "(" << core::roleToString(member.role) << ")";
        }
        std::cout << std::endl;
    });

    auto started = coordinator.start();
    if (started.isError()) {
        std::cerr << "[ERROR] Signaling: " << started.error().toString() << std::endl;
        supervisor->shutdown();
        return 1;
    }

    std::cout << "[INFO] Hosting on port " << coordinator.boundPort()
              << ", code " << settings.verificationCode << std::endl;
    std::cout << "[INFO] SRT input: srt://" << net::formatHostForUrl(config.network.bindAddress)
              << ":" << config.network.srtInputPort << std::endl;
    std::cout << "[INFO] Type to chat, Ctrl+C to stop." << std::endl;

    chatLoop([&coordinator](const std::string& text) { return coordinator.sendChat(text); });

    std::cout << "[INFO] Stopping..." << std::endl;
    coordinator.stop();
    reportStop("Player", player.stop());
    relays->stopAll();
    reportStop("Stream server", streamServer.stop());
    supervisor->shutdown();
    return 0;
}

// =============================================================================
// Join Mode
// =============================================================================

int runJoin(const core::Configuration& config, const std::shared_ptr<pal::ILogPAL>& logger,
            const std::string& target, const std::string& nickname, const std::string& code) {
    auto address = net::parseAddress(target);
    if (address.isError()) {
        std::cerr << "[ERROR] " << address.error().toString() << std::endl;
        return 1;
    }
    uint16_t port = address.value().port.value_or(config.network.websocketPort);

    auto supervisor = std::make_shared<process::ProcessSupervisor>(
        logger, std::chrono::milliseconds(config.relay.restartDelayMs));
    process::MediaPlayer player(supervisor, core::Role::Receiver,
                                process::PlayerSettings::fromConfig(config), logger);

    signaling::SessionClient client(signaling::ClientSettings::fromConfig(config), logger);
    client.setAuthenticatedCallback([&player](const std::string& server, uint16_t srtPort) {
        std::cout << "[INFO] Admitted, stream at " << net::formatHostForUrl(server)
                  << ":" << srtPort << std::endl;
        auto playing = player.playSrt(server, srtPort);
        if (playing.isError()) {
            std::cerr << "[WARN] Player: " << playing.error().toString() << std::endl;
        }
    });
    client.setChatCallback([](const std::string& who, const std::string& text) {
        std::cout << who << ": " << text << std::endl;
    });
    client.setMemberListCallback([](const std::vector<core::Member>& members) {
        std::cout << "[ROOM] " << members.size() << " online" << std::endl;
    });
    client.setErrorCallback([](const core::Error& error) {
        std::cerr << "[ERROR] " << core::userFacingMessage(error.code)
                  << " (" << error.message << ")" << std::endl;
    });
    client.setStateCallback([](signaling::ClientState state) {
        if (state == signaling::ClientState::Disconnected) {
            g_running = false;
        }
    });

    auto connected = client.connect(address.value().host, port, nickname, code);
    if (connected.isError()) {
        std::cerr << "[ERROR] " << connected.error().toString() << std::endl;
        return 1;
    }

    chatLoop([&client](const std::string& text) { return client.sendChat(text); });

    client.disconnect();
    reportStop("Player", player.stop());
    supervisor->shutdown();
    return 0;
}

int main(int argc, char* argv[]) {
    bool host = false;
    std::string target;
    std::string configPath;
    std::string nickname;
    std::string code;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--host") {
            host = true;
        } else if (arg == "--join" && i + 1 < argc) {
            target = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if ((arg == "-n" || arg == "--nickname") && i + 1 < argc) {
            nickname = argv[++i];
        } else if ((arg == "-k" || arg == "--code") && i + 1 < argc) {
            code = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }
    if (host == !target.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    core::ConfigManager configManager;
    configManager.setLogCallback([](const std::string& message) {
        std::cout << "[CONFIG] " << message << std::endl;
    });
    auto loaded = configPath.empty() ? configManager.loadDefaults()
                                     : configManager.loadFromFile(configPath);
    if (loaded.isError()) {
        std::cerr << "[ERROR] Configuration: " << loaded.error().message << std::endl;
        return 1;
    }
    configManager.applyEnvironmentOverrides();
    auto valid = configManager.validate();
    if (valid.isError()) {
        std::cerr << "[ERROR] Configuration: " << valid.error().message << std::endl;
        return 1;
    }
    core::Configuration config = configManager.getConfig();

    if (nickname.empty()) {
        nickname = host ? config.network.hostNickname : "Viewer";
    }
    if (code.empty()) {
        code = config.network.verificationCode;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto logger = setUpLogging(config);
    WATCHPARTY_LOG_INFO(logger, "App", host ? "Starting in host mode" : "Joining " + target);

    int status = host ? runHost(config, logger, nickname, code)
                      : runJoin(config, logger, target, nickname, code);
    logger->flush();
    return status;
}
