// WatchParty - Watch-party signaling and process supervision core
// Main header file

#ifndef WATCHPARTY_WATCHPARTY_HPP
#define WATCHPARTY_WATCHPARTY_HPP

/**
 * @file watchparty.hpp
 * @brief Main header file for the WatchParty library
 *
 * One host shares a stream and a chat room; viewers join with a shared
 * verification code, get a private SRT endpoint fed by a supervised ffmpeg
 * relay and chat over a WebSocket signaling channel.
 *
 * Layers:
 * - core: results, errors, JSON, configuration, structured logging
 * - net: address helpers and stream port allocation
 * - process: external program supervision (ffmpeg, nginx, mpv)
 * - signaling: wire messages, host coordinator, viewer client
 */

#define WATCHPARTY_VERSION_MAJOR 0
#define WATCHPARTY_VERSION_MINOR 1
#define WATCHPARTY_VERSION_PATCH 0
#define WATCHPARTY_VERSION_STRING "0.1.0"

#include "watchparty/core/config_manager.hpp"
#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/log_rotation.hpp"
#include "watchparty/core/result.hpp"
#include "watchparty/core/structured_logger.hpp"
#include "watchparty/core/types.hpp"
#include "watchparty/net/address_utils.hpp"
#include "watchparty/net/port_allocator.hpp"
#include "watchparty/pal/linux/linux_log_pal.hpp"
#include "watchparty/process/media_player.hpp"
#include "watchparty/process/process_supervisor.hpp"
#include "watchparty/process/relay_manager.hpp"
#include "watchparty/process/stream_server.hpp"
#include "watchparty/signaling/message.hpp"
#include "watchparty/signaling/session_client.hpp"
#include "watchparty/signaling/session_coordinator.hpp"

namespace watchparty {

/**
 * @brief Library version as "major.minor.patch".
 */
inline const char* version() {
    return WATCHPARTY_VERSION_STRING;
}

} // namespace watchparty

#endif // WATCHPARTY_WATCHPARTY_HPP
