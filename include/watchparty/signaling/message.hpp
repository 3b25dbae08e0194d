// WatchParty - Watch-party signaling and process supervision core
// Signaling messages
//
// Closed set of control-channel messages exchanged as JSON text frames.
// Frames are parsed once at the transport boundary; everything past it
// works on the typed variant.
//
// Covers:
// - auth, auth_success, auth_failed, chat, join, leave, members,
//   srt_port, error, heartbeat
// - Required field checks, unknown types reported separately

#ifndef WATCHPARTY_SIGNALING_MESSAGE_HPP
#define WATCHPARTY_SIGNALING_MESSAGE_HPP

#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/result.hpp"
#include "watchparty/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace watchparty {
namespace signaling {

enum class MessageType {
    Auth,
    AuthSuccess,
    AuthFailed,
    Chat,
    Join,
    Leave,
    Members,
    SrtPort,
    Error,
    Heartbeat
};

/**
 * @brief Wire name of a message type ("auth", "auth_success", ...).
 */
const char* messageTypeToString(MessageType type);

std::optional<MessageType> messageTypeFromString(const std::string& text);

// =============================================================================
// Message Structs
// =============================================================================

/// Client -> server
struct AuthRequest {
    std::string code;
    std::string nickname;
};

/// Server -> client; nickname is the one actually assigned
struct AuthSuccess {
    std::string nickname;
    uint16_t srtPort = 0;
    std::string serverIp;
};

struct AuthFailed {
    std::string message;
};

/// Both directions; nickname and timestamp are set by the server
struct ChatMessage {
    std::string nickname;
    std::string message;
    std::string timestamp;
};

struct JoinNotice {
    std::string nickname;
    std::string message;
};

struct LeaveNotice {
    std::string nickname;
    std::string message;
};

struct MemberList {
    std::vector<core::Member> members;
};

struct SrtPortNotice {
    uint16_t srtPort = 0;
};

struct ErrorMessage {
    std::string message;
};

struct Heartbeat {};

using Message = std::variant<
    AuthRequest,
    AuthSuccess,
    AuthFailed,
    ChatMessage,
    JoinNotice,
    LeaveNotice,
    MemberList,
    SrtPortNotice,
    ErrorMessage,
    Heartbeat
>;

MessageType messageType(const Message& message);

// =============================================================================
// Codec
// =============================================================================

/**
 * @brief Parse one text frame.
 *
 * @return MalformedMessage if the text is not JSON,
 *         ProtocolViolation if it is not an object, lacks a string "type"
 *         or a required field,
 *         UnknownMessageType for a "type" outside the closed set
 *         (context holds the type name)
 */
core::Result<Message, core::Error> parseMessage(const std::string& text);

/**
 * @brief Compact JSON with keys in sorted order.
 */
std::string serialize(const Message& message);

} // namespace signaling
} // namespace watchparty

#endif // WATCHPARTY_SIGNALING_MESSAGE_HPP
