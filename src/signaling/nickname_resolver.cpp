// WatchParty - Watch-party signaling and process supervision core
// Nickname collision resolution

#include "watchparty/signaling/nickname_resolver.hpp"

namespace watchparty {
namespace signaling {

std::string resolveNickname(const std::string& requested, const std::set<std::string>& inUse) {
    if (inUse.count(requested) == 0) {
        return requested;
    }

    for (unsigned suffix = 2;; ++suffix) {
        std::string candidate = requested + "_" + std::to_string(suffix);
        if (inUse.count(candidate) == 0) {
            return candidate;
        }
    }
}

std::string normalizeNickname(const std::string& requested) {
    const char* blanks = " \t\r\n";
    auto begin = requested.find_first_not_of(blanks);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = requested.find_last_not_of(blanks);
    return requested.substr(begin, end - begin + 1);
}

} // namespace signaling
} // namespace watchparty
