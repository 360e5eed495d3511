#pragma once

#include <string>

namespace extronctl::buildinfo {

inline std::string version() {
#ifdef EXTRONCTL_VERSION
    return std::string(EXTRONCTL_VERSION);
#else
    return "0.0";
#endif
}

inline std::string git_commit() {
#ifdef EXTRONCTL_GIT_COMMIT
    return std::string(EXTRONCTL_GIT_COMMIT);
#else
    return "unknown";
#endif
}

inline std::string build_time_utc_approx() {
    // Not truly UTC, but stable and available without runtime deps.
    return std::string(__DATE__) + " " + std::string(__TIME__);
}

} // namespace extronctl::buildinfo
