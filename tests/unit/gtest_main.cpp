#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"
#include "runtime/paths.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        km::paths::enableTestMode();
        km::config::ConfigRegistry::init(km::paths::getStatePath() / "no-such-config.yaml");
        km::log::Registry::init(km::paths::getLogPath());
        km::crypto::util::ensure_sodium();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize keymaint test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
