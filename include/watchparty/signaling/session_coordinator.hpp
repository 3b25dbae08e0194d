// WatchParty - Watch-party signaling and process supervision core
// Session Coordinator (host side)
//
// WebSocket host that admits viewers with the shared verification code,
// assigns each one a unique nickname and a private stream port, starts a
// viewer relay for it and fans chat out to everyone in the room.
//
// Responsibilities:
// - Listener and per-connection state machine
//   (Connected -> Authenticated -> Disconnected)
// - Nickname collision resolution and port assignment
// - Atomic admission: nothing is committed unless the relay started
// - Chat fan-out, join/leave notices, member list publication
// - Relay teardown on disconnect and on stop

#ifndef WATCHPARTY_SIGNALING_SESSION_COORDINATOR_HPP
#define WATCHPARTY_SIGNALING_SESSION_COORDINATOR_HPP

#include "watchparty/core/config_manager.hpp"
#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/result.hpp"
#include "watchparty/core/structured_logger.hpp"
#include "watchparty/core/types.hpp"
#include "watchparty/net/port_allocator.hpp"
#include "watchparty/pal/log_pal.hpp"
#include "watchparty/signaling/callbacks.hpp"
#include "watchparty/signaling/relay_launcher.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace watchparty {
namespace signaling {

// =============================================================================
// Settings
// =============================================================================

struct CoordinatorSettings {
    /// Listener address; IPv4 or IPv6 literal, brackets allowed
    std::string bindAddress = "0.0.0.0";
    /// Listener port (0 = ephemeral, see boundPort())
    uint16_t port = 10086;
    std::string verificationCode = "114514";
    std::string hostNickname = "Host";
    /// First candidate port for viewer relays
    uint16_t srtBasePort = 10000;
    uint32_t portSearchAttempts = 100;
    /// WebSocket handshake deadline
    std::chrono::milliseconds handshakeTimeout{10000};
    /// Silence after which a peer that ignores pings is dropped
    std::chrono::milliseconds idleTimeout{30000};
    /// Threads that stop viewer relays off the event loop
    uint32_t relayStopWorkers = 2;

    static CoordinatorSettings fromConfig(const core::Configuration& config);
};

// =============================================================================
// Callbacks
// =============================================================================

using SessionEventCallback = std::function<void(
    core::SessionEventType type,
    const core::SessionLogContext& context
)>;

// =============================================================================
// Session Coordinator
// =============================================================================

/**
 * @brief Host-side signaling endpoint.
 *
 * Network I/O runs on a dedicated event-loop thread that is also the only
 * writer of the connection table, the nickname set and the port cursor.
 * Callbacks are invoked on that thread. sendChat() may be called from any
 * thread; the call is posted to the loop. Blocking relay termination runs
 * on a small worker pool.
 *
 * ## Thread Safety
 * All public methods are thread-safe. stop() may be called from inside a
 * callback. The coordinator must not be destroyed from one of its own
 * callbacks.
 *
 * ## Usage Example
 * @code
 * auto relays = std::make_shared<process::RelayManager>(supervisor, settings);
 * SessionCoordinator coordinator(CoordinatorSettings::fromConfig(config), relays);
 * coordinator.setChatCallback([](const std::string& who, const std::string& text) {
 *     std::cout << who << ": " << text << std::endl;
 * });
 * auto started = coordinator.start();
 * @endcode
 */
class SessionCoordinator {
public:
    SessionCoordinator(
        CoordinatorSettings settings,
        std::shared_ptr<IRelayLauncher> relays,
        std::shared_ptr<net::PortAllocator> ports = std::make_shared<net::PortAllocator>(),
        std::shared_ptr<pal::ILogPAL> logger = nullptr,
        std::shared_ptr<core::StructuredLogger> sessionLog = nullptr
    );

    /**
     * @brief Stops the coordinator and waits for relay teardown.
     */
    ~SessionCoordinator();

    // Non-copyable, non-movable
    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /**
     * @brief Bind, listen and start the event loop.
     *
     * @return InvalidState if already running, InvalidAddress for an
     *         unparsable bind address, AddressInUse / BindFailed /
     *         ListenFailed from the listener setup
     */
    core::Result<void, core::Error> start();

    /**
     * @brief Close every connection, stop viewer relays, stop the loop.
     *
     * Idempotent. Called from outside the loop it returns after the loop
     * thread has exited and every relay stop has completed; called from a
     * callback it returns immediately and the teardown finishes on the
     * worker pool.
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Port the listener is bound to, 0 while stopped.
     */
    uint16_t boundPort() const;

    // -------------------------------------------------------------------------
    // Room
    // -------------------------------------------------------------------------

    /**
     * @brief Broadcast a chat line from the host nickname.
     *
     * The chat callback also receives the line.
     *
     * @return InvalidState when not running, InvalidArgument for empty text
     */
    core::Result<void, core::Error> sendChat(const std::string& message);

    /**
     * @brief Host as sender, then authenticated viewers in join order.
     */
    std::vector<core::Member> onlineMembers() const;

    const CoordinatorSettings& settings() const { return settings_; }

    // -------------------------------------------------------------------------
    // Callbacks (invoked on the event-loop thread)
    // -------------------------------------------------------------------------

    /// Chat seen by the room, the host's own lines included
    void setChatCallback(ChatCallback callback);
    void setMemberListCallback(MemberListCallback callback);
    void setSessionEventCallback(SessionEventCallback callback);

private:
    struct Impl;
    class Connection;

    CoordinatorSettings settings_;
    std::unique_ptr<Impl> impl_;
};

} // namespace signaling
} // namespace watchparty

#endif // WATCHPARTY_SIGNALING_SESSION_COORDINATOR_HPP
