// WatchParty - Watch-party signaling and process supervision core
// Port Allocator
//
// Finds a free port for a viewer's stream endpoint by test-binding
// successive candidates. Nothing is reserved: the port may be taken again
// between the probe and the relay's own bind, which the caller reports as
// a relay launch failure.

#ifndef WATCHPARTY_NET_PORT_ALLOCATOR_HPP
#define WATCHPARTY_NET_PORT_ALLOCATOR_HPP

#include "watchparty/core/error_codes.hpp"
#include "watchparty/core/result.hpp"
#include "watchparty/pal/log_pal.hpp"
#include "watchparty/pal/pal_types.hpp"

#include <cstdint>
#include <memory>

namespace watchparty {
namespace net {

/**
 * @brief Test whether a port can be bound for one address family.
 *
 * Implementations must not keep the port open after returning.
 */
class IPortProbe {
public:
    virtual ~IPortProbe() = default;

    /**
     * @brief Try bind + listen on the wildcard address of @p family.
     *
     * @return Success if the port is usable. FamilyNotSupported (or
     *         AddressNotAvailable) when the host has no stack for the family;
     *         AddressInUse, PermissionDenied or another code otherwise.
     */
    virtual core::Result<void, pal::NetworkError> probe(pal::AddressFamily family,
                                                        uint16_t port) = 0;
};

/**
 * @brief Probe using real sockets.
 *
 * IPv4 binds 0.0.0.0; IPv6 binds :: with IPV6_V6ONLY. SO_REUSEADDR is set on
 * both so ports in TIME_WAIT count as free.
 */
class SocketPortProbe : public IPortProbe {
public:
    core::Result<void, pal::NetworkError> probe(pal::AddressFamily family,
                                                uint16_t port) override;
};

/**
 * @brief Ascending search for a port usable on both IPv4 and IPv6.
 *
 * ## Thread Safety
 * findAvailable may be called concurrently if the probe allows it; the
 * allocator itself holds no mutable state.
 */
class PortAllocator {
public:
    static constexpr uint32_t DEFAULT_SEARCH_ATTEMPTS = 100;

    explicit PortAllocator(
        std::shared_ptr<IPortProbe> probe = std::make_shared<SocketPortProbe>(),
        std::shared_ptr<pal::ILogPAL> logger = nullptr
    );

    /**
     * @brief Return the first port in [start, start + attempts) that probes
     *        free on both IPv4 and IPv6.
     *
     * Any failure rejects the port, including a family the host has no
     * stack for. The search stops early at 65535.
     *
     * @return PortExhausted when no candidate qualifies, InvalidArgument for
     *         start 0 or a zero budget
     */
    core::Result<uint16_t, core::Error> findAvailable(
        uint16_t start,
        uint32_t attempts = DEFAULT_SEARCH_ATTEMPTS) const;

    /**
     * @brief Probe a single port.
     */
    bool isAvailable(uint16_t port) const;

private:
    std::shared_ptr<IPortProbe> probe_;
    std::shared_ptr<pal::ILogPAL> logger_;
};

} // namespace net
} // namespace watchparty

#endif // WATCHPARTY_NET_PORT_ALLOCATOR_HPP
