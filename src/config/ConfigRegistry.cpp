#include "config/ConfigRegistry.hpp"

#include <iostream>
#include <stdexcept>

namespace km::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        // Logging is configured from this very file, so report through stderr.
        if (std::filesystem::exists(path)) config_ = loadConfig(path);
        else std::cerr << "[ConfigRegistry] No config at " << path << ", using defaults" << std::endl;
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace km::config
