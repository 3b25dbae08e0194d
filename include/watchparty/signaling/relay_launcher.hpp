// WatchParty - Watch-party signaling and process supervision core
// Relay launcher interface
//
// The session coordinator starts and stops one relay per authenticated
// viewer through this interface, so it can be driven by a fake in tests.

#ifndef WATCHPARTY_SIGNALING_RELAY_LAUNCHER_HPP
#define WATCHPARTY_SIGNALING_RELAY_LAUNCHER_HPP

#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/result.hpp"

#include <cstdint>
#include <string>

namespace watchparty {
namespace signaling {

/**
 * @brief Starts and stops per-viewer relays.
 *
 * Implementations must be callable from any thread; stopRelay may block
 * until the relay has terminated.
 */
class IRelayLauncher {
public:
    virtual ~IRelayLauncher() = default;

    /**
     * @brief Start the relay feeding one viewer's stream endpoint.
     *
     * @param nickname Resolved nickname of the viewer
     * @param srtPort Port the relay listens on
     * @param bindAddress Address the relay binds to
     * @return Relay name used to stop it later, or ProcessLaunchFailed /
     *         ProcessAlreadyRunning
     */
    virtual core::Result<std::string, core::Error> startViewerRelay(
        const std::string& nickname,
        uint16_t srtPort,
        const std::string& bindAddress) = 0;

    /**
     * @brief Stop a relay started by startViewerRelay.
     *
     * @return ProcessNotFound if the relay is unknown or already gone
     */
    virtual core::Result<void, core::Error> stopRelay(const std::string& relayName) = 0;
};

} // namespace signaling
} // namespace watchparty

#endif // WATCHPARTY_SIGNALING_RELAY_LAUNCHER_HPP
