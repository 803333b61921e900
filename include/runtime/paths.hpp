#pragma once

#include <filesystem>

namespace km::paths {

inline bool testMode = false;

std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();
std::filesystem::path getStatePath();

// Redirects log and state paths under a fresh temp directory.
void enableTestMode();

}
