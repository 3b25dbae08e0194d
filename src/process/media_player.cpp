// WatchParty - Watch-party signaling and process supervision core
// Media Player implementation

#include "watchparty/process/media_player.hpp"

#include "watchparty/net/address_utils.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

namespace watchparty {
namespace process {

namespace {

const std::vector<std::string> SENDER_ARGS = {
    "--cache=yes",
    "--cache-secs=300",
    "--demuxer-max-bytes=150M",
    "--demuxer-max-back-bytes=75M",
    "--hwdec=auto",
    "--vo=gpu",
    "--gpu-api=auto",
    "--video-sync=audio",
    "--keep-open=yes",
    "--force-window=yes",
    "--osc=yes",
    "--osd-bar=yes",
    "--network-timeout=60",
    "--stream-lavf-o=rtmp_live=1",
    "--title=WatchParty - Sender"
};

const std::vector<std::string> RECEIVER_ARGS = {
    "--cache=yes",
    "--cache-secs=300",
    "--demuxer-max-bytes=150M",
    "--demuxer-max-back-bytes=75M",
    "--hwdec=auto",
    "--vo=gpu",
    "--gpu-api=auto",
    "--video-sync=audio",
    "--keep-open=no",
    "--force-window=immediate",
    "--osc=yes",
    "--osd-bar=yes",
    "--network-timeout=60",
    "--demuxer-lavf-o=protocol_whitelist=[srt,crypto,file,rtp,tcp,udp]",
    "--title=WatchParty - Receiver"
};

const std::vector<std::string> COMMON_ARGS = {
    "--input-default-bindings=yes",
    "--input-vo-keyboard=yes",
    "--sub-auto=fuzzy",
    "--audio-channels=stereo",
    "--volume=100",
    "--volume-max=150",
    "--msg-level=all=info"
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // anonymous namespace

struct MediaPlayer::State {
    std::mutex mutex;
    std::condition_variable cv;
    bool playing = false;
    bool retrying = false;
    bool stopRetry = false;
    ClosedCallback closed;
};

PlayerSettings PlayerSettings::fromConfig(const core::Configuration& config) {
    PlayerSettings settings;
    settings.mpvPath = config.programs.mpvPath;
    settings.viewerLatencyMs = config.relay.viewerLatencyMs;
    settings.stopTimeout = std::chrono::milliseconds(config.relay.stopTimeoutMs);
    return settings;
}

std::vector<std::string> buildPlayerCommand(core::Role role,
                                            const PlayerSettings& settings,
                                            const std::string& url) {
    std::vector<std::string> command{settings.mpvPath};
    const auto& roleArgs = role == core::Role::Sender ? SENDER_ARGS : RECEIVER_ARGS;
    command.insert(command.end(), roleArgs.begin(), roleArgs.end());
    command.insert(command.end(), COMMON_ARGS.begin(), COMMON_ARGS.end());
    command.push_back(url);
    return command;
}

std::string srtCallerUrl(const std::string& host, uint16_t port, uint32_t latencyMs) {
    return "srt://" + net::formatHostForUrl(host) + ":" + std::to_string(port) +
           "?mode=caller&latency=" + std::to_string(latencyMs);
}

// =============================================================================
// MediaPlayer
// =============================================================================

MediaPlayer::MediaPlayer(std::shared_ptr<ProcessSupervisor> supervisor,
                         core::Role role,
                         PlayerSettings settings,
                         std::shared_ptr<pal::ILogPAL> logger)
    : supervisor_(std::move(supervisor))
    , role_(role)
    , settings_(std::move(settings))
    , logger_(std::move(logger))
    , processName_(std::string("mpv_") + core::roleToString(role))
    , state_(std::make_shared<State>())
{
}

MediaPlayer::~MediaPlayer() {
    auto result = stop();
    if (result.isError()) {
        WATCHPARTY_LOG_WARNING(logger_, "Player",
            "Stop on destruction failed: " + result.error().toString());
    }
}

core::Result<void, core::Error> MediaPlayer::playRtmp(const std::string& url, bool retry) {
    std::lock_guard<std::mutex> control(controlMutex_);
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->playing || state_->retrying) {
            WATCHPARTY_LOG_WARNING(logger_, "Player", "Player is already playing");
            return core::Result<void, core::Error>::success();
        }
    }

    if (!retry) {
        return launch(url);
    }

    // A finished loop from an earlier call
    if (retryThread_.joinable()) {
        retryThread_.join();
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopRetry = false;
        state_->retrying = true;
    }
    retryThread_ = std::thread(&MediaPlayer::retryLoop, this, url);
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> MediaPlayer::playSrt(const std::string& host, uint16_t port) {
    std::lock_guard<std::mutex> control(controlMutex_);
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->playing) {
            WATCHPARTY_LOG_WARNING(logger_, "Player", "Player is already playing");
            return core::Result<void, core::Error>::success();
        }
    }
    return launch(srtCallerUrl(host, port, settings_.viewerLatencyMs));
}

core::Result<void, core::Error> MediaPlayer::stop() {
    std::lock_guard<std::mutex> control(controlMutex_);
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopRetry = true;
    }
    state_->cv.notify_all();
    if (retryThread_.joinable()) {
        retryThread_.join();
    }

    bool wasPlaying;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        wasPlaying = state_->playing;
        state_->playing = false;
    }
    if (!wasPlaying) {
        return core::Result<void, core::Error>::success();
    }

    auto stopped = supervisor_->stop(processName_, settings_.stopTimeout);
    if (stopped.isError() && stopped.error().code != core::ErrorCode::ProcessNotFound) {
        WATCHPARTY_LOG_ERROR(logger_, "Player",
            "Failed to stop player: " + stopped.error().toString());
        return stopped;
    }

    WATCHPARTY_LOG_DEBUG(logger_, "Player", "Player stopped");
    return core::Result<void, core::Error>::success();
}

bool MediaPlayer::isRunning() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->playing) {
            return false;
        }
    }
    return supervisor_->isRunning(processName_);
}

bool MediaPlayer::isRetrying() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->retrying;
}

void MediaPlayer::setClosedCallback(ClosedCallback callback) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->closed = std::move(callback);
}

// =============================================================================
// Launch
// =============================================================================

core::Result<void, core::Error> MediaPlayer::launch(const std::string& url) {
    auto logger = logger_;
    auto state = state_;

    LaunchSpec spec;
    spec.command = buildPlayerCommand(role_, settings_, url);
    spec.onStdout = [logger](const std::string& line) {
        if (line.find("Playing:") != std::string::npos) {
            WATCHPARTY_LOG_DEBUG(logger, "Player", "[mpv] playing");
        } else if (line.find("Video:") != std::string::npos ||
                   line.find("Audio:") != std::string::npos) {
            WATCHPARTY_LOG_DEBUG(logger, "Player", "[mpv] stream info loaded");
        }
    };
    spec.onStderr = [logger](const std::string& line) {
        std::string lower = toLower(line);
        bool failure = lower.find("error") != std::string::npos ||
                       lower.find("failed") != std::string::npos;
        // "No stream found" is expected while waiting for the stream
        if (failure && line.find("No stream found") == std::string::npos) {
            WATCHPARTY_LOG_ERROR(logger, "Player", "[mpv] playback error: " + line);
        }
    };
    spec.onExit = [logger, state](int exitStatus) {
        ClosedCallback closed;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->playing = false;
            closed = state->closed;
        }
        WATCHPARTY_LOG_DEBUG(logger, "Player",
            "Player closed (status " + std::to_string(exitStatus) + ")");
        if (closed) {
            try {
                closed();
            } catch (const std::exception& e) {
                WATCHPARTY_LOG_ERROR(logger, "Player",
                    std::string("Closed callback failed: ") + e.what());
            }
        }
    };

    // Marked first so an immediate exit is not overwritten
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->playing = true;
    }

    auto started = supervisor_->start(processName_, std::move(spec));
    if (started.isError()) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->playing = false;
        }
        WATCHPARTY_LOG_ERROR(logger_, "Player",
            "Failed to start player: " + started.error().toString());
        return started;
    }

    WATCHPARTY_LOG_INFO(logger_, "Player", "Player started: " + url);
    return core::Result<void, core::Error>::success();
}

void MediaPlayer::retryLoop(std::string url) {
    WATCHPARTY_LOG_INFO(logger_, "Player", "Trying to play RTMP stream " + url);

    uint32_t attempts = 0;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->stopRetry) {
                break;
            }
        }

        if (launch(url).isSuccess()) {
            break;
        }

        ++attempts;
        WATCHPARTY_LOG_INFO(logger_, "Player",
            "RTMP stream not available yet, retrying in " +
            std::to_string(settings_.retryInterval.count()) + " ms (attempt " +
            std::to_string(attempts) + ")");

        std::unique_lock<std::mutex> lock(state_->mutex);
        if (state_->cv.wait_for(lock, settings_.retryInterval,
                                [&]() { return state_->stopRetry; })) {
            WATCHPARTY_LOG_INFO(logger_, "Player", "Stopped retrying RTMP playback");
            break;
        }
    }

    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->retrying = false;
}

} // namespace process
} // namespace watchparty
