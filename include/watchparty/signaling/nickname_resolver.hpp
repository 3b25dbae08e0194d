// WatchParty - Watch-party signaling and process supervision core
// Nickname collision resolution

#ifndef WATCHPARTY_SIGNALING_NICKNAME_RESOLVER_HPP
#define WATCHPARTY_SIGNALING_NICKNAME_RESOLVER_HPP

#include <set>
#include <string>

namespace watchparty {
namespace signaling {

/**
 * @brief Pick the nickname a joining viewer will actually get.
 *
 * Returns @p requested when it is free, otherwise "<requested>_<k>" with
 * the smallest k >= 2 not in @p inUse.
 */
std::string resolveNickname(const std::string& requested, const std::set<std::string>& inUse);

/**
 * @brief Trim surrounding whitespace from a requested nickname.
 */
std::string normalizeNickname(const std::string& requested);

} // namespace signaling
} // namespace watchparty

#endif // WATCHPARTY_SIGNALING_NICKNAME_RESOLVER_HPP
