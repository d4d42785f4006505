#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace bluegate {

// Identity of the running binary, reported in the startup banner and in
// get_status. CMake supplies BLUEGATE_VERSION and BLUEGATE_GIT_COMMIT.
struct BuildInfo {
    std::string version;
    std::string commit;
    std::string built;

    static BuildInfo current() {
        BuildInfo b;
#ifdef BLUEGATE_VERSION
        b.version = BLUEGATE_VERSION;
#else
        b.version = "dev";
#endif
#ifdef BLUEGATE_GIT_COMMIT
        b.commit = BLUEGATE_GIT_COMMIT;
#else
        b.commit = "unknown";
#endif
        b.built = std::string(__DATE__) + " " + __TIME__;
        return b;
    }

    // "BlueGate 0.1.0 (commit abc1234)"
    std::string banner() const {
        return "BlueGate " + version + " (commit " + commit + ")";
    }
};

inline void to_json(nlohmann::json& j, const BuildInfo& b) {
    j = nlohmann::json{ {"version", b.version}, {"commit", b.commit}, {"built", b.built} };
}

} // namespace bluegate
