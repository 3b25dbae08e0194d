// WatchParty - Watch-party signaling and process supervision core
// Linux Log PAL Implementation
//
// Routes records to syslog, optionally echoes them to stderr, and fans them
// out to the registered sinks.

#ifndef WATCHPARTY_PAL_LINUX_LINUX_LOG_PAL_HPP
#define WATCHPARTY_PAL_LINUX_LINUX_LOG_PAL_HPP

#include "watchparty/pal/log_pal.hpp"
#include "watchparty/pal/pal_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#if defined(__linux__)

namespace watchparty {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of ILogPAL.
 *
 * - Routes log messages to syslog under the configured ident
 * - Echoes "[LEVEL] [category] message" to stderr when enabled
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Sink management uses a mutex for protection
 * - syslog is inherently thread-safe
 */
class LinuxLogPAL : public ILogPAL {
public:
    /**
     * @brief Construct a Linux log PAL.
     *
     * @param ident syslog identifier
     * @param echoToStderr Also write each record to stderr. The console
     *        sink replaces this when the application configures sinks.
     */
    explicit LinuxLogPAL(std::string ident = "watchparty", bool echoToStderr = true);

    /**
     * @brief Flushes all sinks and closes syslog.
     */
    ~LinuxLogPAL() override;

    LinuxLogPAL(const LinuxLogPAL&) = delete;
    LinuxLogPAL& operator=(const LinuxLogPAL&) = delete;
    LinuxLogPAL(LinuxLogPAL&&) = delete;
    LinuxLogPAL& operator=(LinuxLogPAL&&) = delete;

    // =========================================================================
    // ILogPAL Implementation
    // =========================================================================

    void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) override;

    void setMinLevel(LogLevel level) override;
    LogLevel getMinLevel() const override;
    void flush() override;
    void addSink(std::shared_ptr<ILogSink> sink) override;
    void removeSink(std::shared_ptr<ILogSink> sink) override;

    /**
     * @brief Enable or disable the stderr echo.
     */
    void setEchoToStderr(bool enabled);

    /**
     * @brief Enable or disable syslog output.
     */
    void setSyslogEnabled(bool enabled);

    /**
     * @brief Number of registered sinks.
     */
    size_t sinkCount() const;

private:
    void logToPlatform(
        LogLevel level,
        const std::string& message,
        const std::string& category
    );

    int toSyslogPriority(LogLevel level) const;

    std::string ident_;
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    std::atomic<bool> echoToStderr_;
    std::atomic<bool> syslogEnabled_{true};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;

    bool syslogOpened_{false};
};

} // namespace linux
} // namespace pal
} // namespace watchparty

#endif // defined(__linux__)
#endif // WATCHPARTY_PAL_LINUX_LINUX_LOG_PAL_HPP
