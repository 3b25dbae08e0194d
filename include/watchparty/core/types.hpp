// WatchParty - Watch-party signaling and process supervision core
// Common type definitions

#ifndef WATCHPARTY_CORE_TYPES_HPP
#define WATCHPARTY_CORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace watchparty {
namespace core {

// Type aliases for handles and IDs
using ConnectionId = uint64_t;

constexpr ConnectionId INVALID_CONNECTION_ID = 0;

/**
 * @brief Role of a session member.
 *
 * The host feeds the stream (sender); every viewer receives it.
 */
enum class Role {
    Sender,
    Receiver
};

/**
 * @brief Wire name of a role ("sender" / "receiver").
 */
const char* roleToString(Role role);

/**
 * @brief Parse a wire role name.
 * @return The role, or nullopt for an unrecognized name
 */
std::optional<Role> roleFromString(const std::string& text);

/**
 * @brief One entry of the session member list.
 */
struct Member {
    std::string nickname;
    Role role = Role::Receiver;

    Member() = default;
    Member(std::string n, Role r)
        : nickname(std::move(n)), role(r) {}

    bool operator==(const Member& other) const {
        return nickname == other.nickname && role == other.role;
    }

    bool operator!=(const Member& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Remote peer address as seen by the transport.
 */
struct ClientInfo {
    std::string ip;
    uint16_t port = 0;
};

/**
 * @brief Time utilities.
 */
using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;

/**
 * @brief Format a wall-clock time as ISO 8601 UTC with milliseconds.
 *
 * Example: "2024-05-01T12:30:45.123Z"
 */
std::string formatIso8601(SystemClock::time_point time);

/**
 * @brief Current wall-clock time as ISO 8601 UTC with milliseconds.
 */
std::string iso8601Now();

/**
 * @brief Local time formatted for file names: "YYYYmmdd_HHMMSS".
 */
std::string fileTimestamp(SystemClock::time_point time);

} // namespace core
} // namespace watchparty

#endif // WATCHPARTY_CORE_TYPES_HPP
