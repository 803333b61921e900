#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace km::crypto::util {

void ensure_sodium() {
    static std::once_flag flag;
    static bool ok = false;
    std::call_once(flag, [] { ok = sodium_init() >= 0; });
    if (!ok) throw std::runtime_error("Failed to initialize libsodium");
}

static void require_aes_gcm() {
    ensure_sodium();
    if (crypto_aead_aes256gcm_is_available() == 0)
        throw std::runtime_error("AES256-GCM not supported on this CPU");
}

std::vector<uint8_t> random_bytes(const size_t n) {
    ensure_sodium();
    std::vector<uint8_t> out(n);
    randombytes_buf(out.data(), n);
    return out;
}

std::vector<uint8_t> encrypt_aes256_gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_iv)
{
    if (key.size() != AES_KEY_SIZE) {
        log::Registry::crypto()->error("[encrypt_aes256_gcm] Invalid AES-256 key size: {} bytes", key.size());
        throw std::invalid_argument("Invalid AES-256 key size");
    }

    require_aes_gcm();

    out_iv.resize(AES_IV_SIZE);
    randombytes_buf(out_iv.data(), AES_IV_SIZE);

    std::vector<uint8_t> ciphertext(plaintext.size() + AES_TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    crypto_aead_aes256gcm_encrypt(
        ciphertext.data(), &ciphertext_len,
        plaintext.data(), plaintext.size(),
        nullptr, 0,  // no AAD
        nullptr, out_iv.data(), key.data());

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::vector<uint8_t> decrypt_aes256_gcm(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv)
{
    if (key.size() != AES_KEY_SIZE || iv.size() != AES_IV_SIZE) {
        log::Registry::crypto()->error("[decrypt_aes256_gcm] Invalid key or IV size: "
                                     "key size = {}, iv size = {}",
                                     key.size(), iv.size());
        throw std::invalid_argument("Invalid key or IV size");
    }

    if (ciphertext_with_tag.size() < AES_TAG_SIZE)
        throw std::runtime_error("Decryption failed: ciphertext too short");

    require_aes_gcm();

    std::vector<uint8_t> decrypted(ciphertext_with_tag.size() - AES_TAG_SIZE);
    unsigned long long decrypted_len = 0;

    if (crypto_aead_aes256gcm_decrypt(
            decrypted.data(), &decrypted_len,
            nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            nullptr, 0,  // no AAD
            iv.data(), key.data()) != 0)
    {
        throw std::runtime_error("Decryption failed: authentication error");
    }

    decrypted.resize(decrypted_len);
    return decrypted;
}

std::vector<uint8_t> derive_password_key(
    const std::vector<uint8_t>& password,
    const std::vector<uint8_t>& salt,
    const unsigned long long opsLimit,
    const size_t memLimit)
{
    ensure_sodium();
    if (salt.size() != crypto_pwhash_SALTBYTES) throw std::invalid_argument("Invalid KDF salt size");

    const auto ops = std::max<unsigned long long>(opsLimit, crypto_pwhash_OPSLIMIT_MIN);
    const auto mem = std::max<size_t>(memLimit, crypto_pwhash_MEMLIMIT_MIN);

    std::vector<uint8_t> key(AES_KEY_SIZE);
    if (crypto_pwhash(key.data(), key.size(),
                      reinterpret_cast<const char*>(password.data()), password.size(),
                      salt.data(), ops, mem, crypto_pwhash_ALG_ARGON2ID13) != 0) {
        log::Registry::crypto()->error("[derive_password_key] crypto_pwhash ran out of memory (limit {} bytes)", mem);
        throw std::runtime_error("Password key derivation failed");
    }
    return key;
}

void wipe(std::vector<uint8_t>& buf) {
    if (!buf.empty()) sodium_memzero(buf.data(), buf.size());
    buf.clear();
}

}
