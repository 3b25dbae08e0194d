// WatchParty - Watch-party signaling and process supervision core
// Port Allocator implementation

#include "watchparty/net/port_allocator.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>

namespace watchparty {
namespace net {

namespace {

pal::NetworkError errnoToNetworkError(int err, const std::string& operation) {
    pal::NetworkErrorCode code;
    switch (err) {
        case EADDRINUSE:
            code = pal::NetworkErrorCode::AddressInUse;
            break;
        case EADDRNOTAVAIL:
            code = pal::NetworkErrorCode::AddressNotAvailable;
            break;
        case EAFNOSUPPORT:
        case EPROTONOSUPPORT:
            code = pal::NetworkErrorCode::FamilyNotSupported;
            break;
        case EACCES:
        case EPERM:
            code = pal::NetworkErrorCode::PermissionDenied;
            break;
        default:
            code = operation == "listen" ? pal::NetworkErrorCode::ListenFailed
                                         : pal::NetworkErrorCode::BindFailed;
            break;
    }
    return pal::NetworkError(code, operation + " failed: " + strerror(err), err);
}

bool familyUnsupported(const pal::NetworkError& error) {
    return error.code == pal::NetworkErrorCode::FamilyNotSupported ||
           error.code == pal::NetworkErrorCode::AddressNotAvailable;
}

} // anonymous namespace

// =============================================================================
// SocketPortProbe
// =============================================================================

core::Result<void, pal::NetworkError> SocketPortProbe::probe(pal::AddressFamily family,
                                                             uint16_t port) {
    const int domain = family == pal::AddressFamily::IPv4 ? AF_INET : AF_INET6;

    int fd = socket(domain, SOCK_STREAM, 0);
    if (fd < 0) {
        int err = errno;
        pal::NetworkError error = errnoToNetworkError(err, "socket");
        if (!familyUnsupported(error)) {
            error.code = pal::NetworkErrorCode::SocketCreationFailed;
        }
        return core::Result<void, pal::NetworkError>::error(error);
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    int rc;
    if (family == pal::AddressFamily::IPv4) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        rc = bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    } else {
        setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &opt, sizeof(opt));
        sockaddr_in6 addr{};
        addr.sin6_family = AF_INET6;
        addr.sin6_port = htons(port);
        addr.sin6_addr = in6addr_any;
        rc = bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    }

    if (rc < 0) {
        int err = errno;
        close(fd);
        return core::Result<void, pal::NetworkError>::error(errnoToNetworkError(err, "bind"));
    }

    if (listen(fd, 1) < 0) {
        int err = errno;
        close(fd);
        return core::Result<void, pal::NetworkError>::error(errnoToNetworkError(err, "listen"));
    }

    close(fd);
    return core::Result<void, pal::NetworkError>::success();
}

// =============================================================================
// PortAllocator
// =============================================================================

PortAllocator::PortAllocator(std::shared_ptr<IPortProbe> probe,
                             std::shared_ptr<pal::ILogPAL> logger)
    : probe_(std::move(probe))
    , logger_(std::move(logger))
{
}

bool PortAllocator::isAvailable(uint16_t port) const {
    for (auto family : {pal::AddressFamily::IPv4, pal::AddressFamily::IPv6}) {
        auto result = probe_->probe(family, port);
        if (result.isSuccess()) {
            continue;
        }

        const auto& error = result.error();
        if (familyUnsupported(error)) {
            WATCHPARTY_LOG_WARNING(logger_, "PortAllocator",
                std::string(pal::addressFamilyToString(family)) +
                " not available on this host, port " + std::to_string(port) + " rejected");
            return false;
        }

        WATCHPARTY_LOG_DEBUG(logger_, "PortAllocator",
            "Port " + std::to_string(port) + " rejected (" +
            pal::addressFamilyToString(family) + "): " + error.message);
        return false;
    }

    return true;
}

core::Result<uint16_t, core::Error> PortAllocator::findAvailable(uint16_t start,
                                                                 uint32_t attempts) const {
    if (start == 0 || attempts == 0) {
        return core::Result<uint16_t, core::Error>::error(
            core::Error(core::ErrorCode::InvalidArgument,
                        "start port and attempt budget must be non-zero"));
    }

    uint32_t candidate = start;
    for (uint32_t i = 0; i < attempts && candidate <= 65535; ++i, ++candidate) {
        if (isAvailable(static_cast<uint16_t>(candidate))) {
            WATCHPARTY_LOG_DEBUG(logger_, "PortAllocator",
                "Allocated port " + std::to_string(candidate));
            return core::Result<uint16_t, core::Error>::success(
                static_cast<uint16_t>(candidate));
        }
    }

    std::string range = std::to_string(start) + "-" + std::to_string(candidate - 1);
    WATCHPARTY_LOG_WARNING(logger_, "PortAllocator", "No free port in range " + range);
    return core::Result<uint16_t, core::Error>::error(
        core::Error(core::ErrorCode::PortExhausted, "no free port", range));
}

} // namespace net
} // namespace watchparty
