#pragma once

#include "config/Config.hpp"
#include "runtime/paths.hpp"

#include <mutex>

namespace km::config {

class ConfigRegistry {
public:
    // Loads path once; a missing file leaves the compiled-in defaults.
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace km::config
