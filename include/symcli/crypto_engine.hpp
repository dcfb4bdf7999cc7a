#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "symcli/sym_status.hpp"

namespace symcli {

constexpr std::size_t kKeyByteCount = 32;
constexpr std::size_t kNonceByteCount = 24;
constexpr std::size_t kTagByteCount = 16;
constexpr std::size_t kSaltByteCount = 16;
constexpr unsigned int kPasswordIterations = 100000;

using KeyBytes = std::array<std::uint8_t, kKeyByteCount>;
using Nonce = std::array<std::uint8_t, kNonceByteCount>;
using Tag = std::array<std::uint8_t, kTagByteCount>;
using Salt = std::array<std::uint8_t, kSaltByteCount>;

// Thin status-returning layer over Crypto++. No Crypto++ exception escapes.
class CryptoEngine {
public:
    static SymStatus XChaCha20Poly1305Encrypt(
        const KeyBytes& key_bytes,
        const Nonce& nonce,
        const std::vector<std::uint8_t>& plaintext,
        std::vector<std::uint8_t>& out_ciphertext,
        Tag& out_tag);

    static SymStatus XChaCha20Poly1305DecryptVerify(
        const KeyBytes& key_bytes,
        const Nonce& nonce,
        const std::vector<std::uint8_t>& ciphertext,
        const Tag& tag,
        std::vector<std::uint8_t>& out_plaintext,
        bool& out_auth_ok);

    static SymStatus FillRandom(std::uint8_t* out, std::size_t length);

    // PBKDF2-HMAC-SHA256.
    static SymStatus DerivePasswordKey(
        std::string_view password,
        const Salt& salt,
        unsigned int iterations,
        KeyBytes& out_key);

    static KeyBytes Sha256(std::string_view data);
    static std::string Sha256Hex(std::string_view data);

    // Unpadded URL-safe base64.
    static std::string Base64UrlEncode(const std::vector<std::uint8_t>& data);
    static bool Base64UrlDecode(std::string_view encoded, std::vector<std::uint8_t>& out_bytes);

    static void SecureWipe(void* data, std::size_t len);
    static void SecureWipeBytes(std::vector<std::uint8_t>& bytes);
    static void SecureWipeString(std::string& value);
    static void SecureWipeKey(KeyBytes& key);
};

}  // namespace symcli
