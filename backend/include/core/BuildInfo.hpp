#pragma once

#include <string>

namespace wmn::buildinfo {

inline std::string git_commit() {
#ifdef WMN_GIT_COMMIT
    return std::string(WMN_GIT_COMMIT);
#else
    return "unknown";
#endif
}

inline std::string build_time_utc_approx() {
    return std::string(__DATE__) + " " + std::string(__TIME__);
}

inline std::string version() {
#ifdef WMN_VERSION
    return std::string(WMN_VERSION);
#else
    return "0.0.0";
#endif
}

} // namespace wmn::buildinfo
