// WatchParty - Watch-party signaling and process supervision core
// Common type helpers

#include "watchparty/core/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace watchparty {
namespace core {

const char* roleToString(Role role) {
    switch (role) {
        case Role::Sender:
            return "sender";
        case Role::Receiver:
            return "receiver";
    }
    return "receiver";
}

std::optional<Role> roleFromString(const std::string& text) {
    if (text == "sender") {
        return Role::Sender;
    }
    if (text == "receiver") {
        return Role::Receiver;
    }
    return std::nullopt;
}

std::string formatIso8601(SystemClock::time_point time) {
    auto timeT = SystemClock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    gmtime_r(&timeT, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    oss << "Z";
    return oss.str();
}

std::string iso8601Now() {
    return formatIso8601(SystemClock::now());
}

std::string fileTimestamp(SystemClock::time_point time) {
    auto timeT = SystemClock::to_time_t(time);

    std::tm tmBuf{};
    localtime_r(&timeT, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace core
} // namespace watchparty
