// WatchParty - Watch-party signaling and process supervision core
// Common error codes and Error structure

#ifndef WATCHPARTY_CORE_ERROR_CODES_HPP
#define WATCHPARTY_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>

namespace watchparty {
namespace core {

/**
 * @brief Error codes shared by every WatchParty component.
 *
 * Codes are grouped in ranges by layer. The session taxonomy
 * (AuthenticationFailed, NicknameCollision, PortExhausted,
 * ProcessLaunchFailed, TransportDisconnected, ProtocolViolation) is what
 * the presentation layer sees through the error callbacks.
 */
enum class ErrorCode : uint32_t {
    // General errors (0-99)
    Success = 0,
    Unknown = 1,
    InvalidArgument = 2,
    InvalidState = 3,
    NotFound = 4,
    AlreadyExists = 5,

    // Timeout and cancellation (100-199)
    Timeout = 100,
    Cancelled = 101,

    // Network errors (200-299)
    NetworkError = 200,
    ConnectionFailed = 201,
    TransportDisconnected = 202,
    ReconnectLimitReached = 203,
    BindFailed = 204,
    ListenFailed = 205,
    AddressInUse = 206,
    InvalidAddress = 207,
    PortExhausted = 208,

    // Protocol errors (300-399)
    ProtocolViolation = 300,
    MalformedMessage = 301,
    UnknownMessageType = 302,

    // Session errors (400-499)
    AuthenticationFailed = 400,
    NicknameCollision = 401,
    NotAuthenticated = 402,
    ServerRejected = 403,

    // Process errors (500-599)
    ProcessLaunchFailed = 500,
    ProcessAlreadyRunning = 501,
    ProcessNotFound = 502,
    ProcessSignalFailed = 503,
    ProcessExitedEarly = 504,

    // Configuration errors (600-699)
    ConfigError = 600,
    ConfigInvalid = 601,

    // I/O errors (900-999)
    IOError = 900,
    FileNotFound = 901,
    FileWriteError = 902,
};

/**
 * @brief Convert error code to its short diagnostic name.
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::TransportDisconnected: return "Transport disconnected";
        case ErrorCode::ReconnectLimitReached: return "Reconnect limit reached";
        case ErrorCode::BindFailed: return "Bind failed";
        case ErrorCode::ListenFailed: return "Listen failed";
        case ErrorCode::AddressInUse: return "Address in use";
        case ErrorCode::InvalidAddress: return "Invalid address";
        case ErrorCode::PortExhausted: return "Port exhausted";
        case ErrorCode::ProtocolViolation: return "Protocol violation";
        case ErrorCode::MalformedMessage: return "Malformed message";
        case ErrorCode::UnknownMessageType: return "Unknown message type";
        case ErrorCode::AuthenticationFailed: return "Authentication failed";
        case ErrorCode::NicknameCollision: return "Nickname collision";
        case ErrorCode::NotAuthenticated: return "Not authenticated";
        case ErrorCode::ServerRejected: return "Server rejected connection";
        case ErrorCode::ProcessLaunchFailed: return "Process launch failed";
        case ErrorCode::ProcessAlreadyRunning: return "Process already running";
        case ErrorCode::ProcessNotFound: return "Process not found";
        case ErrorCode::ProcessSignalFailed: return "Process signal failed";
        case ErrorCode::ProcessExitedEarly: return "Process exited early";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::ConfigInvalid: return "Configuration invalid";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileWriteError: return "File write error";
        default: return "Unknown error code";
    }
}

/**
 * @brief Text shown to a person using the application.
 *
 * Diagnostic detail stays in the logs; this is the wording the
 * presentation layer displays for each failure class.
 */
inline const char* userFacingMessage(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed:
        case ErrorCode::TransportDisconnected:
            return "Connection failed, please check the network settings";
        case ErrorCode::ReconnectLimitReached:
            return "Unable to connect to the server";
        case ErrorCode::AuthenticationFailed:
            return "The verification code is incorrect";
        case ErrorCode::PortExhausted:
        case ErrorCode::AddressInUse:
            return "No stream port is available, please try again later";
        case ErrorCode::ProcessLaunchFailed:
        case ErrorCode::ProcessExitedEarly:
            return "The video stream could not be started";
        case ErrorCode::ProtocolViolation:
        case ErrorCode::MalformedMessage:
        case ErrorCode::UnknownMessageType:
        case ErrorCode::NotAuthenticated:
            return "The server sent an unexpected response";
        case ErrorCode::ServerRejected:
            return "The server refused the connection";
        default:
            return "An internal error occurred";
    }
}

/**
 * @brief Error code plus diagnostic message and optional context.
 *
 * Context carries the identifiers that help locate the failure
 * (nickname, process name, port).
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error(ErrorCode c = ErrorCode::Unknown,
          std::string msg = "",
          std::string ctx = "")
        : code(c)
        , message(std::move(msg))
        , context(std::move(ctx)) {}

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == ErrorCode::Success;
    }

    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }
};

} // namespace core
} // namespace watchparty

#endif // WATCHPARTY_CORE_ERROR_CODES_HPP
