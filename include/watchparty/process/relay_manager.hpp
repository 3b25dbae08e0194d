// WatchParty - Watch-party signaling and process supervision core
// Relay Manager
//
// Builds and supervises the ffmpeg relays that move the host's stream
// between SRT and the local RTMP distribution server.
//
// Covers:
// - Host ingest relay (SRT listener -> RTMP), restarted when it exits
// - Per-viewer relay (RTMP -> SRT listener), never restarted
// - Per-relay log files under <logDir>/ffmpeg/
// - Progress line parsing (fps, bitrate, media time)
// - Summaries of notable ffmpeg errors on the main log

#ifndef WATCHPARTY_PROCESS_RELAY_MANAGER_HPP
#define WATCHPARTY_PROCESS_RELAY_MANAGER_HPP

#include "watchparty/core/config_manager.hpp"
#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/log_rotation.hpp"
#include "watchparty/core/result.hpp"
#include "watchparty/core/types.hpp"
#include "watchparty/pal/log_pal.hpp"
#include "watchparty/process/process_supervisor.hpp"
#include "watchparty/signaling/relay_launcher.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace watchparty {
namespace process {

// =============================================================================
// Relay Types
// =============================================================================

enum class RelayType {
    Ingest,     ///< SRT listener -> local RTMP stream (host side)
    Viewer      ///< Local RTMP stream -> per-viewer SRT listener
};

/**
 * @brief "srt_to_rtmp" or "rtmp_to_srt".
 */
const char* relayTypeToString(RelayType type);

/**
 * @brief Settings shared by every relay.
 */
struct RelaySettings {
    std::string ffmpegPath = "./ffmpeg";
    std::string rtmpUrl = "rtmp://127.0.0.1:1935/live/stream";
    uint32_t ingestLatencyMs = 120;
    uint32_t viewerLatencyMs = 3000;
    std::chrono::milliseconds stopTimeout{5000};
    std::string logDirectory = "logs";      ///< Empty disables per-relay log files

    static RelaySettings fromConfig(const core::Configuration& config);
};

/**
 * @brief Snapshot of a running relay.
 */
struct RelayInfo {
    std::string name;
    RelayType type = RelayType::Viewer;
    uint16_t srtPort = 0;
    std::string rtmpUrl;
    std::string bindAddress;
    core::SystemClock::time_point startTime;
    std::chrono::seconds uptime{0};
    bool running = false;
    pid_t pid = -1;
    uint32_t restartCount = 0;
    std::optional<ProcessStats> stats;
    std::string logFile;                    ///< Empty when file logging is off
};

// =============================================================================
// Command Lines and Output Parsing
// =============================================================================

/**
 * @brief ffmpeg command for the host ingest relay.
 *
 * IPv6 bind addresses are bracketed in the SRT URL.
 */
std::vector<std::string> buildIngestCommand(const RelaySettings& settings,
                                            uint16_t srtPort,
                                            const std::string& bindAddress);

/**
 * @brief ffmpeg command for a per-viewer relay.
 */
std::vector<std::string> buildViewerCommand(const RelaySettings& settings,
                                            uint16_t srtPort,
                                            const std::string& bindAddress);

/**
 * @brief Parse an ffmpeg progress line ("frame= 50 fps= 25 ... time=...
 *        bitrate=2516.6kbits/s ...").
 *
 * @return nullopt if the line has no "fps=" field or no field parses
 */
std::optional<ProcessStats> parseProgressLine(const std::string& line);

enum class OutputSeverity {
    Ignore,
    Debug,
    Warning,
    Error
};

struct OutputClassification {
    OutputSeverity severity = OutputSeverity::Ignore;
    std::string summary;
};

/**
 * @brief Decide whether an ffmpeg stderr line deserves the main log.
 *
 * Lines mentioning an error or failure are summarized; connection
 * refused/reset and invalid input data get dedicated summaries, and
 * "dimensions not set" is ignored.
 */
OutputClassification classifyStderrLine(const std::string& line);

// =============================================================================
// RelayManager
// =============================================================================

/**
 * @brief Starts, tracks and stops ffmpeg relays on a shared supervisor.
 *
 * Every stdout/stderr line of a relay is appended to its own log file;
 * progress lines are parsed into the supervisor's stats for that relay.
 * A relay that ends on its own (a viewer relay exiting, or an ingest
 * relay whose relaunch failed) is forgotten and a warning is logged.
 *
 * ## Thread Safety
 * All public methods are thread-safe.
 *
 * ## Usage Example
 * @code
 * RelayManager relays(supervisor, RelaySettings::fromConfig(config), logPal);
 * relays.startIngestRelay(9001, "0.0.0.0");
 * auto name = relays.startViewerRelay("Saber", 10000, "0.0.0.0");
 * ...
 * relays.stopAll();
 * @endcode
 */
class RelayManager : public signaling::IRelayLauncher {
public:
    RelayManager(std::shared_ptr<ProcessSupervisor> supervisor,
                 RelaySettings settings,
                 std::shared_ptr<pal::ILogPAL> logger = nullptr);

    /**
     * @brief Stops every relay this manager started.
     */
    ~RelayManager() override;

    RelayManager(const RelayManager&) = delete;
    RelayManager& operator=(const RelayManager&) = delete;

    static std::string ingestRelayName(uint16_t srtPort);
    static std::string viewerRelayName(const std::string& nickname, uint16_t srtPort);

    /**
     * @brief Start the host's SRT -> RTMP relay, relaunched when it exits.
     *
     * @return Relay name "srt_to_rtmp_<port>"
     */
    core::Result<std::string, core::Error> startIngestRelay(
        uint16_t srtPort,
        const std::string& bindAddress = "0.0.0.0");

    /**
     * @brief Start a viewer's RTMP -> SRT relay, never relaunched.
     *
     * @return Relay name "client_<nickname>_<port>"
     */
    core::Result<std::string, core::Error> startViewerRelay(
        const std::string& nickname,
        uint16_t srtPort,
        const std::string& bindAddress) override;

    core::Result<void, core::Error> stopRelay(const std::string& relayName) override;

    void stopAll();

    bool isRunning(const std::string& relayName) const;

    std::vector<std::string> activeRelays() const;

    std::optional<RelayInfo> relayInfo(const std::string& relayName) const;

    const RelaySettings& settings() const { return settings_; }

private:
    struct Entry {
        RelayInfo info;
        std::shared_ptr<core::FileSink> log;
    };

    core::Result<std::string, core::Error> startRelay(const std::string& name,
                                                      RelayType type,
                                                      std::vector<std::string> command,
                                                      uint16_t srtPort,
                                                      const std::string& bindAddress);

    std::shared_ptr<core::FileSink> openRelayLog(const std::string& name) const;
    void handleStdout(const std::string& name, const std::string& line,
                      const std::shared_ptr<core::FileSink>& log);
    void handleStderr(const std::string& name, const std::string& line,
                      const std::shared_ptr<core::FileSink>& log);
    void handleExit(const std::string& name, int exitStatus);

    std::shared_ptr<ProcessSupervisor> supervisor_;
    RelaySettings settings_;
    std::shared_ptr<pal::ILogPAL> logger_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> relays_;
};

} // namespace process
} // namespace watchparty

#endif // WATCHPARTY_PROCESS_RELAY_MANAGER_HPP
