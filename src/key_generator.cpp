#include "symcli/key_generator.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "symcli/text_util.hpp"

namespace symcli {

namespace {

constexpr std::array<char, 5> kProtectedMagic = {'S', 'Y', 'M', 'K', '1'};
constexpr std::size_t kProtectedSize =
    kProtectedMagic.size() + kSaltByteCount + kNonceByteCount + kTagByteCount + kKeyByteCount;

bool HasProtectedMagic(const std::vector<std::uint8_t>& bytes) {
    return bytes.size() >= kProtectedMagic.size() &&
           std::equal(kProtectedMagic.begin(), kProtectedMagic.end(), bytes.begin());
}

}  // namespace

SymStatus KeyGenerator::Generate(KeyBytes& out_key) {
    return CryptoEngine::FillRandom(out_key.data(), out_key.size());
}

std::string KeyGenerator::Encode(const KeyBytes& key) {
    std::vector<std::uint8_t> bytes(key.begin(), key.end());
    std::string encoded = CryptoEngine::Base64UrlEncode(bytes);
    CryptoEngine::SecureWipeBytes(bytes);
    return encoded;
}

SymStatus KeyGenerator::Decode(const std::string_view encoded, KeyBytes& out_key) {
    std::vector<std::uint8_t> bytes;
    if (!CryptoEngine::Base64UrlDecode(TrimAsciiWhitespace(encoded), bytes) || bytes.size() != kKeyByteCount) {
        CryptoEngine::SecureWipeBytes(bytes);
        return SymStatus::InvalidKey;
    }
    std::copy(bytes.begin(), bytes.end(), out_key.begin());
    CryptoEngine::SecureWipeBytes(bytes);
    return SymStatus::Ok;
}

SymStatus KeyGenerator::Protect(const KeyBytes& key, const std::string_view password, std::string& out_protected) {
    if (password.size() < kMinPasswordLength) {
        return SymStatus::PasswordTooShort;
    }

    Salt salt{};
    Nonce nonce{};
    SymStatus status = CryptoEngine::FillRandom(salt.data(), salt.size());
    if (status == SymStatus::Ok) {
        status = CryptoEngine::FillRandom(nonce.data(), nonce.size());
    }
    if (status != SymStatus::Ok) {
        return status;
    }

    KeyBytes wrapping_key{};
    status = CryptoEngine::DerivePasswordKey(password, salt, kPasswordIterations, wrapping_key);
    if (status != SymStatus::Ok) {
        return status;
    }

    std::vector<std::uint8_t> plain(key.begin(), key.end());
    std::vector<std::uint8_t> wrapped;
    Tag tag{};
    status = CryptoEngine::XChaCha20Poly1305Encrypt(wrapping_key, nonce, plain, wrapped, tag);
    CryptoEngine::SecureWipeKey(wrapping_key);
    CryptoEngine::SecureWipeBytes(plain);
    if (status != SymStatus::Ok) {
        return status;
    }

    std::vector<std::uint8_t> out;
    out.reserve(kProtectedSize);
    out.insert(out.end(), kProtectedMagic.begin(), kProtectedMagic.end());
    out.insert(out.end(), salt.begin(), salt.end());
    out.insert(out.end(), nonce.begin(), nonce.end());
    out.insert(out.end(), tag.begin(), tag.end());
    out.insert(out.end(), wrapped.begin(), wrapped.end());
    out_protected = CryptoEngine::Base64UrlEncode(out);
    return SymStatus::Ok;
}

SymStatus KeyGenerator::Unlock(const std::string_view protected_key, const std::string_view password, KeyBytes& out_key) {
    std::vector<std::uint8_t> bytes;
    if (!CryptoEngine::Base64UrlDecode(TrimAsciiWhitespace(protected_key), bytes) ||
        bytes.size() != kProtectedSize || !HasProtectedMagic(bytes)) {
        return SymStatus::InvalidKey;
    }

    std::size_t pos = kProtectedMagic.size();
    Salt salt{};
    Nonce nonce{};
    Tag tag{};
    std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(pos), salt.size(), salt.begin());
    pos += salt.size();
    std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(pos), nonce.size(), nonce.begin());
    pos += nonce.size();
    std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(pos), tag.size(), tag.begin());
    pos += tag.size();
    const std::vector<std::uint8_t> wrapped(bytes.begin() + static_cast<std::ptrdiff_t>(pos), bytes.end());

    KeyBytes wrapping_key{};
    SymStatus status = CryptoEngine::DerivePasswordKey(password, salt, kPasswordIterations, wrapping_key);
    if (status != SymStatus::Ok) {
        return status;
    }

    std::vector<std::uint8_t> plain;
    bool auth_ok = false;
    status = CryptoEngine::XChaCha20Poly1305DecryptVerify(wrapping_key, nonce, wrapped, tag, plain, auth_ok);
    CryptoEngine::SecureWipeKey(wrapping_key);
    if (status != SymStatus::Ok) {
        return status;
    }
    if (!auth_ok || plain.size() != kKeyByteCount) {
        CryptoEngine::SecureWipeBytes(plain);
        return SymStatus::WrongPassword;
    }
    std::copy(plain.begin(), plain.end(), out_key.begin());
    CryptoEngine::SecureWipeBytes(plain);
    return SymStatus::Ok;
}

bool KeyGenerator::IsProtected(const std::string_view encoded) {
    std::vector<std::uint8_t> bytes;
    if (!CryptoEngine::Base64UrlDecode(TrimAsciiWhitespace(encoded), bytes)) {
        return false;
    }
    return bytes.size() == kProtectedSize && HasProtectedMagic(bytes);
}

}  // namespace symcli
