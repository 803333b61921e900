#include "backend/SoftwareBackend.hpp"
#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <fstream>

using namespace km::backend;
using namespace km::maintenance;
using namespace km::types;
using namespace km::crypto;

namespace {

constexpr std::array<uint8_t, 4> BLOB_MAGIC{'K', 'M', 'S', 'B'};
constexpr uint8_t BLOB_VERSION = 1;
constexpr size_t BLOB_HEADER_SIZE = BLOB_MAGIC.size() + 1;

constexpr uint8_t FLAG_ROLLBACK_RESISTANT = 1 << 0;
constexpr uint8_t FLAG_EARLY_BOOT_ONLY    = 1 << 1;

constexpr size_t KEY_MATERIAL_SIZE = 32;
constexpr size_t PLAINTEXT_SIZE = sizeof(uint64_t) + 1 + KEY_MATERIAL_SIZE;

void put_u64(std::vector<uint8_t>& out, const uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

uint64_t get_u64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(p[i]) << (8 * i);
    return v;
}

Error invalidBlob(const std::string& why) { return Error::backend(error::INVALID_KEY_BLOB, "Invalid key blob: " + why); }

}

SoftwareBackend::SoftwareBackend(const SecurityLevel level, const std::filesystem::path& stateDir)
    : level_(level),
      dir_(stateDir / to_string(level)),
      master_(dir_, "master") {
    std::filesystem::create_directories(dir_);
    master_.init();
    loadSlots();
    log::Registry::backend()->info("[SoftwareBackend] {} device ready at {} ({} live keys)",
                                   to_string(level_), dir_.string(), slots_.size());
}

Result<std::vector<uint8_t>> SoftwareBackend::createKey(const KeyParameters& params) {
    std::scoped_lock lock(mutex_);

    if (params.early_boot_only && earlyBootEnded_)
        return Error::backend(error::EARLY_BOOT_ENDED, "Early boot has ended, cannot create early-boot-only key");

    try {
        const uint64_t slot = nextSlot_++;

        std::vector<uint8_t> plaintext;
        plaintext.reserve(PLAINTEXT_SIZE);
        put_u64(plaintext, slot);
        uint8_t flags = 0;
        if (params.rollback_resistant) flags |= FLAG_ROLLBACK_RESISTANT;
        if (params.early_boot_only) flags |= FLAG_EARLY_BOOT_ONLY;
        plaintext.push_back(flags);
        auto material = util::random_bytes(KEY_MATERIAL_SIZE);
        plaintext.insert(plaintext.end(), material.begin(), material.end());
        util::wipe(material);

        std::vector<uint8_t> iv;
        const auto ciphertext = util::encrypt_aes256_gcm(plaintext, master_.getMasterKey(), iv);
        util::wipe(plaintext);

        std::vector<uint8_t> blob(BLOB_MAGIC.begin(), BLOB_MAGIC.end());
        blob.push_back(BLOB_VERSION);
        blob.insert(blob.end(), iv.begin(), iv.end());
        blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());

        slots_.insert(slot);
        persistSlots();

        log::Registry::backend()->debug("[SoftwareBackend] {} created key in slot {}", to_string(level_), slot);
        return blob;
    } catch (const std::exception& e) {
        log::Registry::backend()->error("[SoftwareBackend] {} createKey failed: {}", to_string(level_), e.what());
        return Error::backend(error::UNKNOWN_ERROR, e.what());
    }
}

Status SoftwareBackend::destroyKey(const std::vector<uint8_t>& blob) {
    std::scoped_lock lock(mutex_);

    const auto sealed = unseal(blob);
    if (!sealed) return sealed.error();

    const auto slot = sealed.value().slot;
    if (!slots_.contains(slot)) return invalidBlob(fmt::format("slot {} already destroyed", slot));

    try {
        slots_.erase(slot);
        persistSlots();
    } catch (const std::exception& e) {
        slots_.insert(slot);
        log::Registry::backend()->error("[SoftwareBackend] {} failed to destroy slot {}: {}", to_string(level_), slot, e.what());
        return Error::backend(error::UNKNOWN_ERROR, e.what());
    }

    log::Registry::backend()->debug("[SoftwareBackend] {} destroyed slot {}", to_string(level_), slot);
    return ok();
}

Status SoftwareBackend::destroyAllKeys() {
    std::scoped_lock lock(mutex_);

    try {
        master_.rotate();
        slots_.clear();
        persistSlots();
    } catch (const std::exception& e) {
        log::Registry::backend()->error("[SoftwareBackend] {} destroyAllKeys failed: {}", to_string(level_), e.what());
        return Error::backend(error::UNKNOWN_ERROR, e.what());
    }

    log::Registry::backend()->warn("[SoftwareBackend] {} destroyed all keys and rotated master key", to_string(level_));
    return ok();
}

Status SoftwareBackend::earlyBootEnded() {
    std::scoped_lock lock(mutex_);
    if (!earlyBootEnded_) log::Registry::backend()->info("[SoftwareBackend] {} early boot ended", to_string(level_));
    earlyBootEnded_ = true;
    return ok();
}

Status SoftwareBackend::checkKeyUsable(const std::vector<uint8_t>& blob) const {
    std::scoped_lock lock(mutex_);

    const auto sealed = unseal(blob);
    if (!sealed) return sealed.error();

    const auto& key = sealed.value();
    if (!slots_.contains(key.slot)) return invalidBlob(fmt::format("slot {} destroyed", key.slot));
    if (key.early_boot_only && earlyBootEnded_)
        return Error::backend(error::EARLY_BOOT_ENDED, "Early-boot-only key used after early boot");
    return ok();
}

size_t SoftwareBackend::liveKeyCount() const {
    std::scoped_lock lock(mutex_);
    return slots_.size();
}

Result<SoftwareBackend::SealedKey> SoftwareBackend::unseal(const std::vector<uint8_t>& blob) const {
    if (blob.size() < BLOB_HEADER_SIZE + util::AES_IV_SIZE + util::AES_TAG_SIZE)
        return invalidBlob("too short");
    if (!std::equal(BLOB_MAGIC.begin(), BLOB_MAGIC.end(), blob.begin()))
        return invalidBlob("bad magic");
    if (blob[BLOB_MAGIC.size()] != BLOB_VERSION)
        return invalidBlob(fmt::format("unsupported version {}", blob[BLOB_MAGIC.size()]));

    const auto ivBegin = blob.begin() + BLOB_HEADER_SIZE;
    const std::vector<uint8_t> iv(ivBegin, ivBegin + util::AES_IV_SIZE);
    const std::vector<uint8_t> ciphertext(ivBegin + util::AES_IV_SIZE, blob.end());

    std::vector<uint8_t> plaintext;
    try {
        plaintext = util::decrypt_aes256_gcm(ciphertext, master_.getMasterKey(), iv);
    } catch (const std::exception& e) {
        return invalidBlob(e.what());
    }

    if (plaintext.size() != PLAINTEXT_SIZE) {
        util::wipe(plaintext);
        return invalidBlob("unexpected payload size");
    }

    SealedKey key;
    key.slot = get_u64(plaintext.data());
    const uint8_t flags = plaintext[sizeof(uint64_t)];
    key.rollback_resistant = (flags & FLAG_ROLLBACK_RESISTANT) != 0;
    key.early_boot_only = (flags & FLAG_EARLY_BOOT_ONLY) != 0;
    util::wipe(plaintext);
    return key;
}

void SoftwareBackend::loadSlots() {
    const auto path = dir_ / "slots.json";
    if (!std::filesystem::exists(path)) {
        persistSlots();
        return;
    }

    std::ifstream f(path);
    if (!f) throw std::runtime_error("Failed to open " + path.string());
    const auto j = nlohmann::json::parse(f);
    nextSlot_ = j.at("next_slot").get<uint64_t>();
    slots_ = j.at("live").get<std::set<uint64_t>>();
}

void SoftwareBackend::persistSlots() const {
    const auto path = dir_ / "slots.json";
    const auto tmp = dir_ / "slots.json.tmp";

    const nlohmann::json j = {
        {"level", to_string(level_)},
        {"next_slot", nextSlot_},
        {"live", slots_}
    };

    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw std::runtime_error("Failed to write " + tmp.string());
        f << j.dump(2);
        if (!f.flush()) throw std::runtime_error("Failed to flush " + tmp.string());
    }
    std::filesystem::rename(tmp, path);
}
