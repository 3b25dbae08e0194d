// WatchParty - Watch-party signaling and process supervision core
// Stream Server
//
// Lifecycle of the local RTMP distribution server (nginx with the RTMP
// module) that the host's ingest relay publishes to and every viewer
// relay reads from.

#ifndef WATCHPARTY_PROCESS_STREAM_SERVER_HPP
#define WATCHPARTY_PROCESS_STREAM_SERVER_HPP

#include "watchparty/core/config_manager.hpp"
#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/result.hpp"
#include "watchparty/pal/log_pal.hpp"
#include "watchparty/process/process_supervisor.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace watchparty {
namespace process {

struct StreamServerSettings {
    std::string nginxPath = "./rtmp/nginx";
    uint16_t rtmpPort = 1935;
    std::string rtmpApp = "live";
    std::string streamKey = "stream";
    std::chrono::milliseconds settleDelay{1000};        ///< Alive check after launch
    std::chrono::milliseconds portReleaseDelay{2000};   ///< Pause between stop and start on restart
    std::chrono::milliseconds stopTimeout{5000};

    static StreamServerSettings fromConfig(const core::Configuration& config);
};

/**
 * @brief nginx-rtmp under the process supervisor, named "nginx_rtmp".
 *
 * nginx forks workers, so it is always stopped as a process tree. It is
 * launched with its own directory as working directory so the relative
 * paths of its configuration resolve.
 */
class StreamServer {
public:
    static constexpr const char* PROCESS_NAME = "nginx_rtmp";

    StreamServer(std::shared_ptr<ProcessSupervisor> supervisor,
                 StreamServerSettings settings,
                 std::shared_ptr<pal::ILogPAL> logger = nullptr);

    ~StreamServer();

    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;

    /**
     * @brief Launch nginx and check it survives the settle delay.
     *
     * Succeeds without relaunching when already running.
     *
     * @return ProcessLaunchFailed if it cannot be executed,
     *         ProcessExitedEarly if it died during the settle delay
     */
    core::Result<void, core::Error> start();

    /**
     * @brief Tree stop; succeeds when not running.
     */
    core::Result<void, core::Error> stop();

    /**
     * @brief stop(), wait for the port to be released, start().
     */
    core::Result<void, core::Error> restart();

    bool isRunning() const;

    /**
     * @brief "rtmp://127.0.0.1:<port>/<app>/<key>"; empty key uses the
     *        configured stream key.
     */
    std::string rtmpUrl(const std::string& streamKey = std::string()) const;

private:
    void handleStderr(const std::string& line);

    std::shared_ptr<ProcessSupervisor> supervisor_;
    StreamServerSettings settings_;
    std::shared_ptr<pal::ILogPAL> logger_;

    std::mutex mutex_;
    bool started_ = false;
};

} // namespace process
} // namespace watchparty

#endif // WATCHPARTY_PROCESS_STREAM_SERVER_HPP
