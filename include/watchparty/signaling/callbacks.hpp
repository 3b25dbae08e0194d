// WatchParty - Watch-party signaling and process supervision core
// Callback types shared by the coordinator and the client

#ifndef WATCHPARTY_SIGNALING_CALLBACKS_HPP
#define WATCHPARTY_SIGNALING_CALLBACKS_HPP

#include "watchparty/core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace watchparty {
namespace signaling {

/**
 * @brief One chat line as shown to the user.
 *
 * Join and leave notices reach clients with the nickname "System".
 */
using ChatCallback = std::function<void(const std::string& nickname, const std::string& message)>;

/**
 * @brief Member list after every join or leave; host first as sender.
 */
using MemberListCallback = std::function<void(const std::vector<core::Member>& members)>;

} // namespace signaling
} // namespace watchparty

#endif // WATCHPARTY_SIGNALING_CALLBACKS_HPP
