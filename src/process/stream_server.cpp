// WatchParty - Watch-party signaling and process supervision core
// Stream Server implementation

#include "watchparty/process/stream_server.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <thread>

namespace watchparty {
namespace process {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // anonymous namespace

StreamServerSettings StreamServerSettings::fromConfig(const core::Configuration& config) {
    StreamServerSettings settings;
    settings.nginxPath = config.programs.nginxPath;
    settings.rtmpPort = config.network.rtmpPort;
    settings.rtmpApp = config.relay.rtmpApp;
    settings.streamKey = config.relay.streamKey;
    settings.stopTimeout = std::chrono::milliseconds(config.relay.stopTimeoutMs);
    return settings;
}

StreamServer::StreamServer(std::shared_ptr<ProcessSupervisor> supervisor,
                           StreamServerSettings settings,
                           std::shared_ptr<pal::ILogPAL> logger)
    : supervisor_(std::move(supervisor))
    , settings_(std::move(settings))
    , logger_(std::move(logger))
{
}

StreamServer::~StreamServer() {
    auto result = stop();
    if (result.isError()) {
        WATCHPARTY_LOG_WARNING(logger_, "StreamServer",
            "Stop on destruction failed: " + result.error().toString());
    }
}

core::Result<void, core::Error> StreamServer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ && supervisor_->isRunning(PROCESS_NAME)) {
        WATCHPARTY_LOG_WARNING(logger_, "StreamServer", "nginx is already running");
        return core::Result<void, core::Error>::success();
    }

    LaunchSpec spec;
    spec.command = {settings_.nginxPath};
    spec.workingDirectory = std::filesystem::path(settings_.nginxPath).parent_path().string();
    spec.onStdout = [this](const std::string& line) {
        WATCHPARTY_LOG_DEBUG(logger_, "StreamServer", "[nginx] " + line);
    };
    spec.onStderr = [this](const std::string& line) { handleStderr(line); };
    spec.processTree = true;

    auto launched = supervisor_->start(PROCESS_NAME, std::move(spec));
    if (launched.isError()) {
        WATCHPARTY_LOG_ERROR(logger_, "StreamServer",
            "Failed to start nginx: " + launched.error().toString());
        return launched;
    }

    std::this_thread::sleep_for(settings_.settleDelay);

    if (!supervisor_->isRunning(PROCESS_NAME)) {
        WATCHPARTY_LOG_ERROR(logger_, "StreamServer", "nginx exited right after start");
        auto cleanup = supervisor_->stop(PROCESS_NAME, settings_.stopTimeout);
        if (cleanup.isError() && cleanup.error().code != core::ErrorCode::ProcessNotFound) {
            WATCHPARTY_LOG_WARNING(logger_, "StreamServer", cleanup.error().toString());
        }
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::ProcessExitedEarly, "nginx exited right after start",
                        settings_.nginxPath));
    }

    started_ = true;
    WATCHPARTY_LOG_INFO(logger_, "StreamServer",
        "nginx RTMP server started (port " + std::to_string(settings_.rtmpPort) + ")");
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> StreamServer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
        return core::Result<void, core::Error>::success();
    }

    auto stopped = supervisor_->stopTree(PROCESS_NAME, settings_.stopTimeout);
    started_ = false;
    if (stopped.isError() && stopped.error().code != core::ErrorCode::ProcessNotFound) {
        WATCHPARTY_LOG_ERROR(logger_, "StreamServer",
            "Failed to stop nginx: " + stopped.error().toString());
        return stopped;
    }

    WATCHPARTY_LOG_DEBUG(logger_, "StreamServer", "nginx RTMP server stopped");
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> StreamServer::restart() {
    WATCHPARTY_LOG_DEBUG(logger_, "StreamServer", "Restarting nginx");

    bool wasRunning;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wasRunning = started_;
    }
    if (wasRunning) {
        auto stopped = stop();
        if (stopped.isError()) {
            return stopped;
        }
        std::this_thread::sleep_for(settings_.portReleaseDelay);
    }
    return start();
}

bool StreamServer::isRunning() const {
    return supervisor_->isRunning(PROCESS_NAME);
}

std::string StreamServer::rtmpUrl(const std::string& streamKey) const {
    const std::string& key = streamKey.empty() ? settings_.streamKey : streamKey;
    return "rtmp://127.0.0.1:" + std::to_string(settings_.rtmpPort) + "/" +
           settings_.rtmpApp + "/" + key;
}

// nginx writes notices to stderr too
void StreamServer::handleStderr(const std::string& line) {
    std::string lower = toLower(line);
    if (lower.find("error") != std::string::npos || lower.find("failed") != std::string::npos) {
        WATCHPARTY_LOG_ERROR(logger_, "StreamServer", "[nginx] " + line);
    } else if (lower.find("warn") != std::string::npos) {
        WATCHPARTY_LOG_WARNING(logger_, "StreamServer", "[nginx] " + line);
    } else {
        WATCHPARTY_LOG_DEBUG(logger_, "StreamServer", "[nginx] " + line);
    }
}

} // namespace process
} // namespace watchparty
