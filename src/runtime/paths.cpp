#include "runtime/paths.hpp"

#include <cstdlib>
#include <string>
#include <unistd.h>

namespace km::paths {

namespace {
std::filesystem::path testRoot_;

std::filesystem::path fromEnv(const char* var, const std::filesystem::path& def) {
    if (const char* v = std::getenv(var); v && *v) return v;
    return def;
}
}

std::filesystem::path getConfigPath() {
    return fromEnv("KEYMAINT_CONFIG", "/etc/keymaint/config.yaml");
}

std::filesystem::path getLogPath() {
    if (testMode) return testRoot_ / "log";
    return fromEnv("KEYMAINT_LOG_DIR", "/var/log/keymaint");
}

std::filesystem::path getStatePath() {
    if (testMode) return testRoot_ / "state";
    return fromEnv("KEYMAINT_STATE_DIR", "/var/lib/keymaint");
}

void enableTestMode() {
    testMode = true;
    testRoot_ = std::filesystem::temp_directory_path() / ("keymaint_test_" + std::to_string(::getpid()));
    std::filesystem::create_directories(testRoot_ / "log");
    std::filesystem::create_directories(testRoot_ / "state");
}

}
