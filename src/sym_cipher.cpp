#include "symcli/sym_cipher.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "symcli/crypto_engine.hpp"
#include "symcli/key_generator.hpp"
#include "symcli/text_util.hpp"

namespace symcli {

namespace {

constexpr std::array<char, 4> kMessageMagic = {'S', 'Y', 'M', '1'};
constexpr std::size_t kHeaderSize = kMessageMagic.size() + kNonceByteCount + kTagByteCount;

}  // namespace

SymStatus SymCipher::Encrypt(
    const std::string& plaintext,
    const std::string& key,
    std::string& out_ciphertext) const {
    KeyBytes key_bytes{};
    SymStatus status = KeyGenerator::Decode(key, key_bytes);
    if (status != SymStatus::Ok) {
        return status;
    }

    Nonce nonce{};
    status = CryptoEngine::FillRandom(nonce.data(), nonce.size());
    if (status != SymStatus::Ok) {
        CryptoEngine::SecureWipeKey(key_bytes);
        return status;
    }

    std::vector<std::uint8_t> plain(plaintext.begin(), plaintext.end());
    std::vector<std::uint8_t> sealed;
    Tag tag{};
    status = CryptoEngine::XChaCha20Poly1305Encrypt(key_bytes, nonce, plain, sealed, tag);
    CryptoEngine::SecureWipeKey(key_bytes);
    CryptoEngine::SecureWipeBytes(plain);
    if (status != SymStatus::Ok) {
        return status;
    }

    std::vector<std::uint8_t> message;
    message.reserve(kHeaderSize + sealed.size());
    message.insert(message.end(), kMessageMagic.begin(), kMessageMagic.end());
    message.insert(message.end(), nonce.begin(), nonce.end());
    message.insert(message.end(), tag.begin(), tag.end());
    message.insert(message.end(), sealed.begin(), sealed.end());
    out_ciphertext = CryptoEngine::Base64UrlEncode(message);
    return SymStatus::Ok;
}

SymStatus SymCipher::Decrypt(
    const std::string& ciphertext,
    const std::string& key,
    std::string& out_plaintext) const {
    KeyBytes key_bytes{};
    SymStatus status = KeyGenerator::Decode(key, key_bytes);
    if (status != SymStatus::Ok) {
        return status;
    }

    std::vector<std::uint8_t> message;
    if (!CryptoEngine::Base64UrlDecode(TrimAsciiWhitespace(ciphertext), message) ||
        message.size() < kHeaderSize ||
        !std::equal(kMessageMagic.begin(), kMessageMagic.end(), message.begin())) {
        CryptoEngine::SecureWipeKey(key_bytes);
        return SymStatus::CorruptCiphertext;
    }

    std::size_t pos = kMessageMagic.size();
    Nonce nonce{};
    Tag tag{};
    std::copy_n(message.begin() + static_cast<std::ptrdiff_t>(pos), nonce.size(), nonce.begin());
    pos += nonce.size();
    std::copy_n(message.begin() + static_cast<std::ptrdiff_t>(pos), tag.size(), tag.begin());
    pos += tag.size();
    const std::vector<std::uint8_t> sealed(message.begin() + static_cast<std::ptrdiff_t>(pos), message.end());

    std::vector<std::uint8_t> plain;
    bool auth_ok = false;
    status = CryptoEngine::XChaCha20Poly1305DecryptVerify(key_bytes, nonce, sealed, tag, plain, auth_ok);
    CryptoEngine::SecureWipeKey(key_bytes);
    if (status != SymStatus::Ok) {
        return status;
    }
    if (!auth_ok) {
        return SymStatus::AuthenticationFailed;
    }
    out_plaintext.assign(plain.begin(), plain.end());
    CryptoEngine::SecureWipeBytes(plain);
    return SymStatus::Ok;
}

SymStatus SymCipher::GenerateKey(std::string& out_key) const {
    KeyBytes key_bytes{};
    const SymStatus status = KeyGenerator::Generate(key_bytes);
    if (status != SymStatus::Ok) {
        return status;
    }
    out_key = KeyGenerator::Encode(key_bytes);
    CryptoEngine::SecureWipeKey(key_bytes);
    return SymStatus::Ok;
}

SymStatus SymCipher::ProtectKey(
    const std::string& key,
    const std::string_view password,
    std::string& out_protected_key) const {
    KeyBytes key_bytes{};
    SymStatus status = KeyGenerator::Decode(key, key_bytes);
    if (status != SymStatus::Ok) {
        return status;
    }
    status = KeyGenerator::Protect(key_bytes, password, out_protected_key);
    CryptoEngine::SecureWipeKey(key_bytes);
    return status;
}

SymStatus SymCipher::UnlockKey(
    const std::string& protected_key,
    const std::string_view password,
    std::string& out_key) const {
    KeyBytes key_bytes{};
    const SymStatus status = KeyGenerator::Unlock(protected_key, password, key_bytes);
    if (status != SymStatus::Ok) {
        return status;
    }
    out_key = KeyGenerator::Encode(key_bytes);
    CryptoEngine::SecureWipeKey(key_bytes);
    return SymStatus::Ok;
}

bool SymCipher::IsPasswordProtected(const std::string& key) const {
    return KeyGenerator::IsProtected(key);
}

}  // namespace symcli
