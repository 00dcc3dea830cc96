#pragma once

#include <string>

namespace routesim {

// Identity of the running binary, reported in the startup banner and by GET /health.
struct BuildInfo {
    std::string version;
    std::string git_commit;
    std::string compiled_at;   // compiler __DATE__/__TIME__, local time of the build host
};

inline BuildInfo current_build() {
    BuildInfo info;
#ifdef ROUTESIM_VERSION
    info.version = ROUTESIM_VERSION;
#else
    info.version = "dev";
#endif
#ifdef ROUTESIM_GIT_COMMIT
    info.git_commit = ROUTESIM_GIT_COMMIT;
#else
    info.git_commit = "unknown";
#endif
    info.compiled_at = std::string(__DATE__) + " " + __TIME__;
    return info;
}

} // namespace routesim
