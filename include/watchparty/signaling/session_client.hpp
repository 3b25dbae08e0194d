// WatchParty - Watch-party signaling and process supervision core
// Session Client (viewer side)
//
// Connects to a host's signaling endpoint, authenticates with the shared
// verification code and relays chat and room updates to the application.
//
// Responsibilities:
// - ws://host:port/ connection with IPv6 literals bracketed
// - Authentication handshake and assigned stream endpoint
// - Bounded reconnect with a fixed interval
// - Periodic heartbeat while authenticated
// - Terminal outcomes: wrong code, server rejection, reconnect limit

#ifndef WATCHPARTY_SIGNALING_SESSION_CLIENT_HPP
#define WATCHPARTY_SIGNALING_SESSION_CLIENT_HPP

#include "watchparty/core/config_manager.hpp"
#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/result.hpp"
#include "watchparty/pal/log_pal.hpp"
#include "watchparty/signaling/callbacks.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace watchparty {
namespace signaling {

enum class ClientState {
    Idle,           ///< Never connected
    Connecting,     ///< Resolving, connecting or in the WebSocket handshake
    Connected,      ///< Handshake done, auth not yet sent
    Authenticating, ///< auth sent, waiting for the verdict
    Authenticated,  ///< Admitted to the room
    Reconnecting,   ///< Waiting before the next attempt
    Disconnected    ///< Closed for good; connect() may be called again
};

const char* clientStateToString(ClientState state);

struct ClientSettings {
    /// Deadline for TCP connect and the WebSocket handshake
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds reconnectInterval{3000};
    /// Consecutive failed attempts before giving up
    uint32_t maxReconnectAttempts = 5;
    std::chrono::milliseconds heartbeatInterval{30000};
    /// Try IPv6 addresses first when a host name resolves to both families
    bool preferIpv6 = true;

    static ClientSettings fromConfig(const core::Configuration& config);
};

/**
 * @brief Admission result: where the viewer's stream can be pulled from.
 *
 * @p serverAddress is the address announced by the host, or the address
 * this client connected to when the host announced a wildcard.
 */
using AuthenticatedCallback = std::function<void(const std::string& serverAddress, uint16_t srtPort)>;

using ClientErrorCallback = std::function<void(const core::Error& error)>;

using ClientStateCallback = std::function<void(ClientState state)>;

/**
 * @brief Viewer-side signaling connection.
 *
 * Runs its own event-loop thread; every callback is invoked on it.
 *
 * Errors reported through the error callback:
 * - AuthenticationFailed: wrong verification code (terminal)
 * - ServerRejected: an "error" frame from the host; terminal when it
 *   arrives before authentication and the host then closes
 * - TransportDisconnected / ConnectionFailed: before a reconnect attempt
 * - ReconnectLimitReached: attempts exhausted (terminal)
 *
 * ## Thread Safety
 * All public methods are thread-safe. disconnect() may be called from
 * inside a callback; the destructor must not be.
 */
class SessionClient {
public:
    explicit SessionClient(ClientSettings settings = ClientSettings(),
                           std::shared_ptr<pal::ILogPAL> logger = nullptr);

    /**
     * @brief Drops the connection without a closing handshake.
     */
    ~SessionClient();

    SessionClient(const SessionClient&) = delete;
    SessionClient& operator=(const SessionClient&) = delete;

    /**
     * @brief Start connecting; the outcome arrives through callbacks.
     *
     * @return InvalidArgument for an empty host or nickname, InvalidState
     *         while a connection is active or when called from a callback
     */
    core::Result<void, core::Error> connect(const std::string& host,
                                            uint16_t port,
                                            const std::string& nickname,
                                            const std::string& code);

    /**
     * @brief Close the connection and never reconnect. Idempotent.
     */
    void disconnect();

    /**
     * @brief Queue a chat line; never blocks on the network.
     *
     * @return NotAuthenticated (and nothing is sent) before admission
     */
    core::Result<void, core::Error> sendChat(const std::string& message);

    ClientState state() const;
    bool isAuthenticated() const;

    /// Nickname assigned by the host (may carry a _k suffix)
    std::string nickname() const;
    uint16_t srtPort() const;
    std::string serverAddress() const;
    /// Failed attempts since the last successful connect
    uint32_t reconnectAttempts() const;

    // Callbacks (invoked on the client's event-loop thread)
    void setAuthenticatedCallback(AuthenticatedCallback callback);
    void setChatCallback(ChatCallback callback);
    void setMemberListCallback(MemberListCallback callback);
    void setErrorCallback(ClientErrorCallback callback);
    void setStateCallback(ClientStateCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace signaling
} // namespace watchparty

#endif // WATCHPARTY_SIGNALING_SESSION_CLIENT_HPP
