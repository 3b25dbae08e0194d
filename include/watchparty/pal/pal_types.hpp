// WatchParty - Watch-party signaling and process supervision core
// Platform Abstraction Layer - Common Types
//
// Types shared by the PAL interfaces: log levels and source context,
// address families and the low-level network error reported by socket probes.

#ifndef WATCHPARTY_PAL_PAL_TYPES_HPP
#define WATCHPARTY_PAL_PAL_TYPES_HPP

#include <cstdint>
#include <string>

namespace watchparty {
namespace pal {

// =============================================================================
// Network Types
// =============================================================================

/**
 * @brief IP address family.
 */
enum class AddressFamily {
    IPv4,
    IPv6
};

inline const char* addressFamilyToString(AddressFamily family) {
    return family == AddressFamily::IPv4 ? "IPv4" : "IPv6";
}

/**
 * @brief Network operation error codes.
 */
enum class NetworkErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,

    // Socket errors
    SocketCreationFailed = 200,
    BindFailed = 201,
    ListenFailed = 202,
    ConnectFailed = 203,

    // Address errors
    AddressInUse = 400,
    AddressNotAvailable = 401,
    InvalidAddress = 402,
    FamilyNotSupported = 403,

    // Permission errors
    PermissionDenied = 600,
};

/**
 * @brief Detailed network error information.
 *
 * Contains the error code, a human-readable message, and the underlying
 * errno value for debugging purposes.
 */
struct NetworkError {
    NetworkErrorCode code;
    std::string message;
    int32_t systemErrorCode;  ///< errno captured at the failing call

    NetworkError(NetworkErrorCode c = NetworkErrorCode::Unknown,
                 std::string msg = "",
                 int32_t sysErr = 0)
        : code(c)
        , message(std::move(msg))
        , systemErrorCode(sysErr) {}
};

// =============================================================================
// Logging Types
// =============================================================================

/**
 * @brief Log levels for the logging PAL.
 *
 * Levels are ordered from most verbose (Trace) to least verbose (Critical).
 */
enum class LogLevel : uint32_t {
    Trace = 0,      ///< Extremely detailed tracing information
    Debug = 1,      ///< Debug-level messages for development
    Info = 2,       ///< Informational messages about normal operation
    Warning = 3,    ///< Warning conditions that should be addressed
    Error = 4,      ///< Error conditions that affect operation
    Critical = 5,   ///< Critical conditions requiring immediate attention
    Off = 6         ///< Disable all logging
};

inline const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/**
 * @brief Source location attached to a log record.
 */
struct LogContext {
    const char* file = nullptr;     ///< Source file name
    int line = 0;                   ///< Source line number
    const char* function = nullptr; ///< Function name
    std::string threadName;         ///< Current thread name
};

} // namespace pal
} // namespace watchparty

#endif // WATCHPARTY_PAL_PAL_TYPES_HPP
