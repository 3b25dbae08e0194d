// WatchParty - Watch-party signaling and process supervision core
// Process Supervisor
//
// Starts, monitors, restarts and terminates named external programs
// (transcoder relays, the distribution server, the media player) and
// delivers their output line by line.
//
// Covers:
// - One live run per logical name
// - Own process group, stdin on /dev/null, exec failure detection
// - Automatic relaunch after a cancellable back-off
// - Graceful stop with force-kill after a timeout, optionally for the
//   whole descendant tree
// - Inspection of pid, start time, restart count and progress stats

#ifndef WATCHPARTY_PROCESS_PROCESS_SUPERVISOR_HPP
#define WATCHPARTY_PROCESS_PROCESS_SUPERVISOR_HPP

#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/result.hpp"
#include "watchparty/core/types.hpp"
#include "watchparty/pal/log_pal.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace watchparty {
namespace process {

/**
 * @brief Receives one output line without its line terminator.
 */
using OutputCallback = std::function<void(const std::string& line)>;

/**
 * @brief Receives the exit status of a run that ended on its own.
 *
 * The value is the exit code, or 128 + signal number for a signaled
 * process, or -1 when a relaunch could not be started.
 */
using ExitCallback = std::function<void(int exitStatus)>;

/**
 * @brief Everything needed to launch (and relaunch) a program.
 */
struct LaunchSpec {
    std::vector<std::string> command;   ///< Executable followed by its arguments
    std::string workingDirectory;       ///< Empty keeps the current directory
    OutputCallback onStdout;
    OutputCallback onStderr;
    ExitCallback onExit;                ///< Natural exit with no relaunch following
    bool restartOnExit = false;
    bool processTree = false;           ///< stopAll terminates the whole tree
};

/**
 * @brief Last progress figures reported by a transcoder.
 */
struct ProcessStats {
    double fps = 0.0;
    double bitrateKbps = 0.0;
    std::string time;                   ///< Media time, "HH:MM:SS.ss"
};

/**
 * @brief Snapshot of a tracked process.
 */
struct ProcessInfo {
    std::string name;
    pid_t pid = -1;                     ///< -1 while backing off before a relaunch
    core::SystemClock::time_point startTime;
    uint32_t restartCount = 0;
    bool running = false;
    std::optional<ProcessStats> stats;
    uint64_t residentKb = 0;            ///< From /proc, 0 if unavailable
    uint32_t threadCount = 0;
};

/**
 * @brief Table of supervised external programs.
 *
 * Each tracked name owns one monitor thread that spans restarts and is the
 * only place its child is reaped, plus one reader thread per output stream
 * and run. Output callbacks run on the reader of their stream, in order;
 * they must not stop their own process.
 *
 * Output is split on both CR and LF so that progress lines a transcoder
 * rewrites in place arrive as separate lines; empty lines are skipped.
 *
 * ## Thread Safety
 * All public methods are thread-safe. One mutex guards the table; it is
 * never held while joining a thread or invoking a callback.
 *
 * ## Usage Example
 * @code
 * auto supervisor = std::make_shared<ProcessSupervisor>(logPal);
 * LaunchSpec spec;
 * spec.command = {"./ffmpeg", "-i", input, output};
 * spec.onStderr = [](const std::string& line) { ... };
 * spec.restartOnExit = true;
 * auto started = supervisor->start("srt_to_rtmp_9001", std::move(spec));
 * ...
 * supervisor->stop("srt_to_rtmp_9001");
 * @endcode
 */
class ProcessSupervisor {
public:
    static constexpr std::chrono::milliseconds DEFAULT_STOP_TIMEOUT{5000};
    static constexpr std::chrono::milliseconds DEFAULT_RESTART_DELAY{3000};
    static constexpr std::chrono::milliseconds KILL_GRACE{2000};

    explicit ProcessSupervisor(
        std::shared_ptr<pal::ILogPAL> logger = nullptr,
        std::chrono::milliseconds restartDelay = DEFAULT_RESTART_DELAY
    );

    /**
     * @brief Calls shutdown().
     */
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;
    ProcessSupervisor(ProcessSupervisor&&) = delete;
    ProcessSupervisor& operator=(ProcessSupervisor&&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Launch a program under a logical name.
     *
     * @return ProcessAlreadyRunning if the name is tracked,
     *         ProcessLaunchFailed if fork/exec fails (missing or
     *         non-executable program, bad working directory),
     *         InvalidArgument for an empty command,
     *         InvalidState after shutdown()
     */
    core::Result<void, core::Error> start(const std::string& name, LaunchSpec spec);

    /**
     * @brief SIGTERM, wait up to @p timeout, then SIGKILL.
     *
     * The record is removed whichever path ends the process.
     *
     * @return ProcessNotFound if the name is not tracked
     */
    core::Result<void, core::Error> stop(
        const std::string& name,
        std::chrono::milliseconds timeout = DEFAULT_STOP_TIMEOUT);

    /**
     * @brief Like stop(), for the process and all of its descendants.
     *
     * Descendants are collected before signaling; survivors of the timeout
     * are force-killed individually.
     */
    core::Result<void, core::Error> stopTree(
        const std::string& name,
        std::chrono::milliseconds timeout = DEFAULT_STOP_TIMEOUT);

    /**
     * @brief Stop every tracked process (tree stop where flagged) and join
     *        all monitor threads.
     */
    void stopAll(std::chrono::milliseconds timeout = DEFAULT_STOP_TIMEOUT);

    /**
     * @brief Refuse further starts and restarts, then stopAll().
     */
    void shutdown();

    bool isShutdown() const;

    // =========================================================================
    // Inspection
    // =========================================================================

    /**
     * @brief Tracked and the current run has not exited.
     */
    bool isRunning(const std::string& name) const;

    std::optional<ProcessInfo> info(const std::string& name) const;

    std::vector<std::string> trackedNames() const;

    /**
     * @brief Store the latest progress figures for a tracked process.
     *
     * Ignored for untracked names.
     */
    void updateStats(const std::string& name, const ProcessStats& stats);

private:
    struct Record;
    struct Child;

    core::Result<Child, core::Error> launch(const std::string& name, const LaunchSpec& spec);
    void monitorLoop(std::shared_ptr<Record> record, pid_t pid, int stdoutFd, int stderrFd);
    void readStream(int fd, const OutputCallback& callback, const std::string& name,
                    const std::atomic<bool>& runFinished);

    core::Result<void, core::Error> terminate(const std::string& name,
                                              std::chrono::milliseconds timeout,
                                              bool wholeTree);
    void reapFinished();

    std::shared_ptr<pal::ILogPAL> logger_;
    std::chrono::milliseconds restartDelay_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::shared_ptr<Record>> records_;
    std::vector<std::thread> finished_;
    bool shuttingDown_ = false;
};

} // namespace process
} // namespace watchparty

#endif // WATCHPARTY_PROCESS_PROCESS_SUPERVISOR_HPP
