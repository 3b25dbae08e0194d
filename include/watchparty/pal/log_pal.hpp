// WatchParty - Watch-party signaling and process supervision core
// Platform Abstraction Layer - Logging Interface
//
// Every component receives an ILogPAL and logs through the WATCHPARTY_LOG_*
// macros below. Output destinations are ILogSink instances registered on
// the PAL (structured formatter, rotating file, console).

#ifndef WATCHPARTY_PAL_LOG_PAL_HPP
#define WATCHPARTY_PAL_LOG_PAL_HPP

#include "watchparty/pal/pal_types.hpp"

#include <memory>
#include <string>

namespace watchparty {
namespace pal {

/**
 * @brief Interface for log output sinks.
 *
 * Log sinks receive log records and handle output to their respective
 * destinations (console, file, another formatter).
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write a log message.
     *
     * @param level Log level of the message
     * @param message Log message
     * @param category Log category (e.g., "Supervisor", "Coordinator")
     * @param context Source context (file, line, function)
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    /**
     * @brief Flush any buffered output.
     */
    virtual void flush() = 0;

    /**
     * @brief Get the sink name for debugging.
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Abstract interface for platform-specific logging.
 *
 * ## Thread Safety
 * - All methods are thread-safe
 * - Log messages from different threads may interleave
 * - Sinks must handle concurrent write calls
 *
 * @invariant Messages below minLevel are not processed
 * @invariant All registered sinks receive qualifying messages
 */
class ILogPAL {
public:
    virtual ~ILogPAL() = default;

    // =========================================================================
    // Logging Operations
    // =========================================================================

    /**
     * @brief Log a message.
     *
     * @param level Severity level of the message
     * @param message The log message
     * @param category Category for filtering/routing
     * @param context Source location context
     *
     * @code
     * logPal->log(LogLevel::Info, "Listening on port 10086", "Coordinator",
     *             WATCHPARTY_LOG_CONTEXT());
     * @endcode
     */
    virtual void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    /**
     * @brief Set the minimum log level. Takes effect immediately.
     */
    virtual void setMinLevel(LogLevel level) = 0;

    /**
     * @brief Get the current minimum log level.
     */
    virtual LogLevel getMinLevel() const = 0;

    /**
     * @brief Flush all log sinks.
     */
    virtual void flush() = 0;

    // =========================================================================
    // Sink Management
    // =========================================================================

    /**
     * @brief Register a sink. Ownership is shared.
     */
    virtual void addSink(std::shared_ptr<ILogSink> sink) = 0;

    /**
     * @brief Unregister a sink. No effect if the sink is not registered.
     */
    virtual void removeSink(std::shared_ptr<ILogSink> sink) = 0;
};

// =============================================================================
// Convenience Macros for Logging
// =============================================================================

/**
 * Shortcuts that capture the source location. The logger argument may be a
 * raw pointer or a shared_ptr and may be null.
 *
 * Usage:
 *   WATCHPARTY_LOG_INFO(logger_, "Relay", "Started " + name);
 */

#define WATCHPARTY_LOG_CONTEXT() \
    ::watchparty::pal::LogContext{__FILE__, __LINE__, __FUNCTION__, {}}

#define WATCHPARTY_LOG(logger, level, category, message) \
    do { \
        if ((logger) != nullptr) { \
            (logger)->log((level), (message), (category), WATCHPARTY_LOG_CONTEXT()); \
        } \
    } while (0)

#define WATCHPARTY_LOG_TRACE(logger, category, message) \
    WATCHPARTY_LOG(logger, ::watchparty::pal::LogLevel::Trace, category, message)

#define WATCHPARTY_LOG_DEBUG(logger, category, message) \
    WATCHPARTY_LOG(logger, ::watchparty::pal::LogLevel::Debug, category, message)

#define WATCHPARTY_LOG_INFO(logger, category, message) \
    WATCHPARTY_LOG(logger, ::watchparty::pal::LogLevel::Info, category, message)

#define WATCHPARTY_LOG_WARNING(logger, category, message) \
    WATCHPARTY_LOG(logger, ::watchparty::pal::LogLevel::Warning, category, message)

#define WATCHPARTY_LOG_ERROR(logger, category, message) \
    WATCHPARTY_LOG(logger, ::watchparty::pal::LogLevel::Error, category, message)

#define WATCHPARTY_LOG_CRITICAL(logger, category, message) \
    WATCHPARTY_LOG(logger, ::watchparty::pal::LogLevel::Critical, category, message)

} // namespace pal
} // namespace watchparty

#endif // WATCHPARTY_PAL_LOG_PAL_HPP
