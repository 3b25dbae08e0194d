// WatchParty - Watch-party signaling and process supervision core
// Structured Logging Component
//
// Formats log records as plain text or JSON and forwards them to downstream
// sinks (rotating file, console). Registered as a sink on the log PAL so
// every component's WATCHPARTY_LOG_* call passes through it.
//
// Covers:
// - Configurable log levels (debug, info, warning, error)
// - Session events with timestamps and peer details
// - JSON format for log aggregation
// - Error records with nickname, peer address, port and process context

#ifndef WATCHPARTY_CORE_STRUCTURED_LOGGER_HPP
#define WATCHPARTY_CORE_STRUCTURED_LOGGER_HPP

#include "watchparty/core/types.hpp"
#include "watchparty/pal/log_pal.hpp"
#include "watchparty/pal/pal_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace watchparty {
namespace core {

/**
 * @brief Configurable log levels.
 *
 * Messages below the configured level are filtered out.
 */
enum class LogLevelConfig {
    Debug = 0,    ///< Detailed debugging information
    Info = 1,     ///< Informational messages about normal operation
    Warning = 2,  ///< Warning conditions that should be addressed
    Error = 3     ///< Error conditions that affect operation
};

std::string logLevelToString(LogLevelConfig level);

/**
 * @brief Convert string to log level (case-insensitive).
 * @return Corresponding LogLevelConfig, defaults to Info for unknown
 */
LogLevelConfig stringToLogLevel(const std::string& str);

/**
 * @brief Map a configured level onto the PAL level scale.
 */
pal::LogLevel toPalLogLevel(LogLevelConfig level);

/**
 * @brief Session lifecycle events.
 */
enum class SessionEventType {
    Connected,            ///< Transport accepted
    Authenticated,        ///< Viewer passed the verification code check
    AuthenticationFailed, ///< Viewer presented a wrong code
    Disconnected,         ///< Transport closed
    RelayStarted,         ///< Per-viewer relay launched
    RelayStopped          ///< Per-viewer relay terminated
};

std::string sessionEventTypeToString(SessionEventType eventType);

/**
 * @brief Context attached to session events and contextual errors.
 *
 * Empty / zero fields are omitted from the output.
 */
struct SessionLogContext {
    std::string nickname;
    std::string clientIP;
    uint16_t clientPort = 0;
    uint16_t streamPort = 0;
    std::string processName;
    int32_t errorCode = 0;

    SessionLogContext() = default;
};

/**
 * @brief Structured logger with JSON format support.
 *
 * Acts both as a direct logger (debug/info/..., logSessionEvent,
 * errorWithContext) and as a pal::ILogSink that formats records coming
 * from the log PAL.
 *
 * ## Thread Safety
 * All methods are thread-safe. Log messages from different threads may
 * interleave but will not corrupt data structures.
 *
 * ## Usage Example
 * @code
 * auto logger = std::make_shared<StructuredLogger>();
 * logger->setJsonFormat(true);
 * logger->addSink(std::make_shared<FileSink>("logs/watchparty.log"));
 * logPal->addSink(logger);
 *
 * SessionLogContext ctx;
 * ctx.nickname = "Saber";
 * ctx.streamPort = 10000;
 * logger->logSessionEvent(SessionEventType::Authenticated, ctx);
 * @endcode
 */
class StructuredLogger : public pal::ILogSink {
public:
    StructuredLogger();

    /**
     * @brief Flushes all sinks before destruction.
     */
    ~StructuredLogger() override;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&) = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    void setLevel(LogLevelConfig level);
    LogLevelConfig getLevel() const;

    /**
     * @brief Enable or disable JSON structured format.
     *
     * When enabled, records are JSON objects with timestamp, level,
     * category, message and any context fields.
     */
    void setJsonFormat(bool enabled);
    bool isJsonFormat() const;

    // =========================================================================
    // Direct Logging
    // =========================================================================

    void debug(const std::string& message, const std::string& category = "WatchParty");
    void info(const std::string& message, const std::string& category = "WatchParty");
    void warning(const std::string& message, const std::string& category = "WatchParty");
    void error(const std::string& message, const std::string& category = "WatchParty");

    /**
     * @brief Log a session event at Info level.
     */
    void logSessionEvent(SessionEventType eventType, const SessionLogContext& context);

    /**
     * @brief Log an error with its session context.
     */
    void errorWithContext(
        const std::string& message,
        const SessionLogContext& context,
        const std::string& category = "WatchParty"
    );

    // =========================================================================
    // pal::ILogSink
    // =========================================================================

    /**
     * @brief Format a record received from the log PAL and forward it.
     *
     * Source location is included in JSON output when present.
     */
    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogContext& context) override;
    void flush() override;
    std::string getName() const override;

    // =========================================================================
    // Downstream Sinks
    // =========================================================================

    void addSink(std::shared_ptr<pal::ILogSink> sink);
    void removeSink(std::shared_ptr<pal::ILogSink> sink);

private:
    bool isEnabled(LogLevelConfig level) const;

    void log(LogLevelConfig level, const std::string& message, const std::string& category);

    void dispatch(pal::LogLevel level, const std::string& formatted,
                  const std::string& category, const pal::LogContext& context);

    std::string formatJson(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const SessionLogContext* session,
        const pal::LogContext* source
    ) const;

    std::string formatPlainText(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const SessionLogContext* session
    ) const;

    static LogLevelConfig fromPalLogLevel(pal::LogLevel level);

    std::atomic<LogLevelConfig> level_{LogLevelConfig::Info};
    std::atomic<bool> jsonFormat_{false};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<pal::ILogSink>> sinks_;
};

} // namespace core
} // namespace watchparty

#endif // WATCHPARTY_CORE_STRUCTURED_LOGGER_HPP
