#include "crypto/FileKeyProvider.hpp"
#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <stdexcept>

namespace km::crypto {

static std::vector<uint8_t> slurp(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open " + p.string());
    return {std::istreambuf_iterator<char>(f), {}};
}

static void dump(const std::filesystem::path& p, const std::vector<uint8_t>& buf) {
    namespace fs = std::filesystem;
    fs::create_directories(p.parent_path());

    const auto tmp = fs::path(p).concat(".tmp");
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("Failed to write " + tmp.string());
        f.write(reinterpret_cast<const char*>(buf.data()), static_cast<long>(buf.size()));
        if (!f.flush()) throw std::runtime_error("Failed to flush " + tmp.string());
    }
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    fs::rename(tmp, p);
}

FileKeyProvider::FileKeyProvider(std::filesystem::path dir, std::string name)
    : dir_(std::move(dir)), name_(std::move(name)) {}

std::filesystem::path FileKeyProvider::keyPath() const { return dir_ / (name_ + ".key"); }

void FileKeyProvider::init() {
    if (sealedExists()) {
        load();
        return;
    }
    generate_and_store();
}

const std::vector<uint8_t>& FileKeyProvider::getMasterKey() const {
    if (masterKey_.empty()) throw std::runtime_error("FileKeyProvider used before init()");
    return masterKey_;
}

void FileKeyProvider::rotate() {
    util::wipe(masterKey_);
    generate_and_store();
}

bool FileKeyProvider::sealedExists() const { return std::filesystem::exists(keyPath()); }

void FileKeyProvider::generate_and_store() {
    masterKey_ = util::random_bytes(util::AES_KEY_SIZE);
    dump(keyPath(), masterKey_);
    log::Registry::crypto()->debug("[FileKeyProvider] Stored new {} key in {}", name_, dir_.string());
}

void FileKeyProvider::load() {
    masterKey_ = slurp(keyPath());
    if (masterKey_.size() != util::AES_KEY_SIZE)
        throw std::runtime_error("Corrupt master key file: " + keyPath().string());
    log::Registry::crypto()->debug("[FileKeyProvider] Loaded {} key from {}", name_, dir_.string());
}

} // namespace km::crypto
