// WatchParty - Watch-party signaling and process supervision core
// Address helpers implementation

#include "watchparty/net/address_utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cctype>

namespace watchparty {
namespace net {

namespace {

std::string stripBrackets(const std::string& text) {
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

std::optional<uint16_t> parsePort(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    if (!std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    unsigned long value = std::stoul(text);
    if (value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

core::Result<HostPort, core::Error> invalid(const std::string& text, const std::string& why) {
    return core::Result<HostPort, core::Error>::error(
        core::Error(core::ErrorCode::InvalidAddress, why, text));
}

} // anonymous namespace

bool isValidIpv4(const std::string& text) {
    in_addr addr{};
    return inet_pton(AF_INET, text.c_str(), &addr) == 1;
}

bool isValidIpv6(const std::string& text) {
    std::string candidate = stripBrackets(text);

    size_t scope = candidate.find('%');
    if (scope != std::string::npos) {
        if (scope + 1 == candidate.size()) {
            return false;
        }
        candidate.erase(scope);
    }

    in6_addr addr{};
    return inet_pton(AF_INET6, candidate.c_str(), &addr) == 1;
}

bool isValidIp(const std::string& text) {
    return isValidIpv4(text) || isValidIpv6(text);
}

std::string formatHostForUrl(const std::string& host) {
    if (!host.empty() && host.front() == '[') {
        return host;
    }
    if (host.find(':') != std::string::npos && isValidIpv6(host)) {
        return "[" + host + "]";
    }
    return host;
}

core::Result<HostPort, core::Error> parseAddress(const std::string& input) {
    std::string text = input;
    text.erase(0, text.find_first_not_of(" \t"));
    text.erase(text.find_last_not_of(" \t") + 1);

    if (text.empty()) {
        return invalid(input, "empty address");
    }

    HostPort result;

    if (text.front() == '[') {
        size_t close = text.find(']');
        if (close == std::string::npos) {
            return invalid(input, "missing ']'");
        }
        result.host = text.substr(1, close - 1);
        if (!isValidIpv6(result.host)) {
            return invalid(input, "bracketed host is not an IPv6 address");
        }

        std::string rest = text.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return invalid(input, "unexpected text after ']'");
            }
            result.port = parsePort(rest.substr(1));
            if (!result.port) {
                return invalid(input, "invalid port");
            }
        }
        return core::Result<HostPort, core::Error>::success(std::move(result));
    }

    size_t colons = static_cast<size_t>(std::count(text.begin(), text.end(), ':'));
    if (colons == 0) {
        result.host = text;
        return core::Result<HostPort, core::Error>::success(std::move(result));
    }

    if (colons > 1) {
        if (!isValidIpv6(text)) {
            return invalid(input, "not a valid IPv6 address");
        }
        result.host = text;
        return core::Result<HostPort, core::Error>::success(std::move(result));
    }

    size_t colon = text.find(':');
    result.host = text.substr(0, colon);
    if (result.host.empty()) {
        return invalid(input, "missing host");
    }
    result.port = parsePort(text.substr(colon + 1));
    if (!result.port) {
        return invalid(input, "invalid port");
    }
    return core::Result<HostPort, core::Error>::success(std::move(result));
}

} // namespace net
} // namespace watchparty
