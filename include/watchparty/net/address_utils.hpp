// WatchParty - Watch-party signaling and process supervision core
// Address helpers
//
// Validation of IP literals, bracket formatting for URIs and host:port
// splitting. Used wherever an address is embedded in a ws://, srt:// or
// rtmp:// URI.

#ifndef WATCHPARTY_NET_ADDRESS_UTILS_HPP
#define WATCHPARTY_NET_ADDRESS_UTILS_HPP

#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace watchparty {
namespace net {

bool isValidIpv4(const std::string& text);

/**
 * @brief Validate an IPv6 literal.
 *
 * Surrounding brackets and a "%scope" suffix are tolerated.
 */
bool isValidIpv6(const std::string& text);

bool isValidIp(const std::string& text);

/**
 * @brief Host text suitable for the authority part of a URI.
 *
 * IPv6 literals are wrapped in brackets (already bracketed input is
 * returned unchanged); IPv4 literals and host names pass through.
 */
std::string formatHostForUrl(const std::string& host);

/**
 * @brief Host and optional port split out of user input.
 */
struct HostPort {
    std::string host;               ///< Without brackets
    std::optional<uint16_t> port;
};

/**
 * @brief Split "host:port", "[v6]:port", "[v6]", bare IPv6 or bare host.
 *
 * @return InvalidAddress for empty input, unbalanced brackets, a
 *         malformed port or a bracketed host that is not IPv6
 */
core::Result<HostPort, core::Error> parseAddress(const std::string& text);

} // namespace net
} // namespace watchparty

#endif // WATCHPARTY_NET_ADDRESS_UTILS_HPP
