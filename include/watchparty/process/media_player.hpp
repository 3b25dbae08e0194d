// WatchParty - Watch-party signaling and process supervision core
// Media Player
//
// Lifecycle of the mpv playback window: the host previews the local RTMP
// stream, a viewer plays its SRT endpoint in caller mode.
//
// Covers:
// - Role-specific mpv arguments (sender / receiver)
// - RTMP playback with a cancellable retry loop
// - SRT caller URL with the viewer latency, IPv6 bracketing
// - Closed notification when the window is closed by the user

#ifndef WATCHPARTY_PROCESS_MEDIA_PLAYER_HPP
#define WATCHPARTY_PROCESS_MEDIA_PLAYER_HPP

#include "watchparty/core/config_manager.hpp"
#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/result.hpp"
#include "watchparty/core/types.hpp"
#include "watchparty/pal/log_pal.hpp"
#include "watchparty/process/process_supervisor.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace watchparty {
namespace process {

struct PlayerSettings {
    std::string mpvPath = "./mpv";
    uint32_t viewerLatencyMs = 3000;
    std::chrono::milliseconds retryInterval{3000};
    std::chrono::milliseconds stopTimeout{5000};

    static PlayerSettings fromConfig(const core::Configuration& config);
};

/**
 * @brief Full mpv command line for @p role playing @p url.
 */
std::vector<std::string> buildPlayerCommand(core::Role role,
                                            const PlayerSettings& settings,
                                            const std::string& url);

/**
 * @brief "srt://<host>:<port>?mode=caller&latency=<ms>".
 */
std::string srtCallerUrl(const std::string& host, uint16_t port, uint32_t latencyMs);

/**
 * @brief One mpv instance, named "mpv_sender" or "mpv_receiver".
 *
 * Thread Safety: all public methods are thread-safe. The closed callback
 * runs on a supervisor thread.
 */
class MediaPlayer {
public:
    using ClosedCallback = std::function<void()>;

    MediaPlayer(std::shared_ptr<ProcessSupervisor> supervisor,
                core::Role role,
                PlayerSettings settings,
                std::shared_ptr<pal::ILogPAL> logger = nullptr);

    /**
     * @brief Calls stop().
     */
    ~MediaPlayer();

    MediaPlayer(const MediaPlayer&) = delete;
    MediaPlayer& operator=(const MediaPlayer&) = delete;

    /**
     * @brief Play an RTMP stream (host preview).
     *
     * With @p retry the launch happens on a background thread that keeps
     * trying every retryInterval until it succeeds or stop() is called;
     * the call itself then always succeeds.
     */
    core::Result<void, core::Error> playRtmp(const std::string& url, bool retry = true);

    /**
     * @brief Play a viewer's SRT endpoint in caller mode.
     */
    core::Result<void, core::Error> playSrt(const std::string& host, uint16_t port);

    /**
     * @brief Cancel any retry loop and close the player.
     */
    core::Result<void, core::Error> stop();

    bool isRunning() const;
    bool isRetrying() const;

    /**
     * @brief Invoked once each time the player exits on its own.
     */
    void setClosedCallback(ClosedCallback callback);

    const std::string& processName() const { return processName_; }

private:
    struct State;

    core::Result<void, core::Error> launch(const std::string& url);
    void retryLoop(std::string url);

    std::shared_ptr<ProcessSupervisor> supervisor_;
    core::Role role_;
    PlayerSettings settings_;
    std::shared_ptr<pal::ILogPAL> logger_;
    std::string processName_;

    // Shared with supervisor callbacks, which may outlive a stop() race
    std::shared_ptr<State> state_;

    std::mutex controlMutex_;           ///< Serializes play and stop
    std::thread retryThread_;
};

} // namespace process
} // namespace watchparty

#endif // WATCHPARTY_PROCESS_MEDIA_PLAYER_HPP
