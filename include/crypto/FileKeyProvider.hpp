#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <filesystem>

namespace km::crypto {

// Master key kept in an owner-only file under dir. Generated on first init().
class FileKeyProvider {
public:
    FileKeyProvider(std::filesystem::path dir, std::string name = "master");

    void init();  // load or generate
    [[nodiscard]] const std::vector<uint8_t>& getMasterKey() const;

    // Replaces the stored key with a fresh one; the previous key is unrecoverable afterwards.
    void rotate();

    [[nodiscard]] bool sealedExists() const;

private:
    std::vector<uint8_t> masterKey_;
    std::filesystem::path dir_;
    std::string name_;

    [[nodiscard]] std::filesystem::path keyPath() const;
    void generate_and_store();
    void load();
};

} // namespace km::crypto
