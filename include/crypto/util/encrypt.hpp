#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace km::crypto::util {

constexpr size_t AES_KEY_SIZE = 32;      // 256-bit
constexpr size_t AES_IV_SIZE  = 12;      // GCM standard nonce
constexpr size_t AES_TAG_SIZE = 16;      // GCM auth tag
constexpr size_t KDF_SALT_SIZE = 16;     // crypto_pwhash_SALTBYTES

// Throws if libsodium cannot be initialized.
void ensure_sodium();

std::vector<uint8_t> random_bytes(size_t n);

std::vector<uint8_t> encrypt_aes256_gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_iv);

// Throws std::runtime_error on authentication failure.
std::vector<uint8_t> decrypt_aes256_gcm(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv);

// Argon2id password stretching to an AES_KEY_SIZE key.
std::vector<uint8_t> derive_password_key(
    const std::vector<uint8_t>& password,
    const std::vector<uint8_t>& salt,
    unsigned long long opsLimit,
    size_t memLimit);

void wipe(std::vector<uint8_t>& buf);

}
