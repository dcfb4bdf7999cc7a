#include "symcli/crypto_engine.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <cryptopp/base64.h>
#include <cryptopp/chachapoly.h>
#include <cryptopp/filters.h>
#include <cryptopp/misc.h>
#include <cryptopp/osrng.h>
#include <cryptopp/pwdbased.h>
#include <cryptopp/sha.h>

namespace symcli {

namespace {

bool IsBase64UrlChar(const char ch) {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
           ch == '-' || ch == '_';
}

}  // namespace

SymStatus CryptoEngine::XChaCha20Poly1305Encrypt(
    const KeyBytes& key_bytes,
    const Nonce& nonce,
    const std::vector<std::uint8_t>& plaintext,
    std::vector<std::uint8_t>& out_ciphertext,
    Tag& out_tag) {
    out_ciphertext.resize(plaintext.size());
    out_tag.fill(0U);
    try {
        CryptoPP::XChaCha20Poly1305::Encryption enc;
        enc.SetKeyWithIV(key_bytes.data(), key_bytes.size(), nonce.data(), nonce.size());
        enc.EncryptAndAuthenticate(
            out_ciphertext.empty() ? nullptr : out_ciphertext.data(),
            out_tag.data(),
            out_tag.size(),
            nonce.data(),
            static_cast<int>(nonce.size()),
            nullptr,
            0,
            plaintext.empty() ? nullptr : plaintext.data(),
            plaintext.size());
    } catch (const CryptoPP::Exception&) {
        SecureWipeBytes(out_ciphertext);
        SecureWipe(out_tag.data(), out_tag.size());
        return SymStatus::UnknownOp;
    }
    return SymStatus::Ok;
}

SymStatus CryptoEngine::XChaCha20Poly1305DecryptVerify(
    const KeyBytes& key_bytes,
    const Nonce& nonce,
    const std::vector<std::uint8_t>& ciphertext,
    const Tag& tag,
    std::vector<std::uint8_t>& out_plaintext,
    bool& out_auth_ok) {
    out_auth_ok = false;
    out_plaintext.resize(ciphertext.size());
    try {
        CryptoPP::XChaCha20Poly1305::Decryption dec;
        dec.SetKeyWithIV(key_bytes.data(), key_bytes.size(), nonce.data(), nonce.size());
        out_auth_ok = dec.DecryptAndVerify(
            out_plaintext.empty() ? nullptr : out_plaintext.data(),
            tag.data(),
            tag.size(),
            nonce.data(),
            static_cast<int>(nonce.size()),
            nullptr,
            0,
            ciphertext.empty() ? nullptr : ciphertext.data(),
            ciphertext.size());
    } catch (const CryptoPP::Exception&) {
        SecureWipeBytes(out_plaintext);
        return SymStatus::UnknownOp;
    }

    if (!out_auth_ok) {
        SecureWipeBytes(out_plaintext);
    }
    return SymStatus::Ok;
}

SymStatus CryptoEngine::FillRandom(std::uint8_t* out, const std::size_t length) {
    if (length == 0) {
        return SymStatus::Ok;
    }
    if (out == nullptr) {
        return SymStatus::MissingRngBytes;
    }
    try {
        CryptoPP::AutoSeededRandomPool rng;
        rng.GenerateBlock(out, length);
    } catch (const CryptoPP::Exception&) {
        return SymStatus::MissingRngBytes;
    }
    return SymStatus::Ok;
}

SymStatus CryptoEngine::DerivePasswordKey(
    const std::string_view password,
    const Salt& salt,
    const unsigned int iterations,
    KeyBytes& out_key) {
    try {
        CryptoPP::PKCS5_PBKDF2_HMAC<CryptoPP::SHA256> pbkdf;
        pbkdf.DeriveKey(
            out_key.data(),
            out_key.size(),
            0,
            reinterpret_cast<const CryptoPP::byte*>(password.data()),
            password.size(),
            salt.data(),
            salt.size(),
            iterations,
            0.0);
    } catch (const CryptoPP::Exception&) {
        SecureWipeKey(out_key);
        return SymStatus::UnknownOp;
    }
    return SymStatus::Ok;
}

KeyBytes CryptoEngine::Sha256(const std::string_view data) {
    KeyBytes digest{};
    CryptoPP::SHA256 hash;
    hash.CalculateDigest(
        digest.data(),
        reinterpret_cast<const CryptoPP::byte*>(data.data()),
        data.size());
    return digest;
}

std::string CryptoEngine::Sha256Hex(const std::string_view data) {
    static constexpr char kHex[] = "0123456789abcdef";
    const KeyBytes digest = Sha256(data);
    std::string out;
    out.reserve(digest.size() * 2U);
    for (const std::uint8_t b : digest) {
        out.push_back(kHex[(b >> 4U) & 0x0FU]);
        out.push_back(kHex[b & 0x0FU]);
    }
    return out;
}

std::string CryptoEngine::Base64UrlEncode(const std::vector<std::uint8_t>& data) {
    std::string encoded;
    CryptoPP::StringSource source(
        data.data(),
        data.size(),
        true,
        new CryptoPP::Base64URLEncoder(new CryptoPP::StringSink(encoded), false));
    return encoded;
}

bool CryptoEngine::Base64UrlDecode(const std::string_view encoded, std::vector<std::uint8_t>& out_bytes) {
    out_bytes.clear();
    if (encoded.empty()) {
        return false;
    }
    // Crypto++ skips characters outside the alphabet; reject them up front.
    std::size_t end = encoded.size();
    while (end > 0 && encoded[end - 1] == '=') {
        --end;
    }
    for (std::size_t i = 0; i < end; ++i) {
        if (!IsBase64UrlChar(encoded[i])) {
            return false;
        }
    }
    if (end % 4U == 1U) {
        return false;
    }

    std::string decoded;
    CryptoPP::StringSource source(
        reinterpret_cast<const CryptoPP::byte*>(encoded.data()),
        end,
        true,
        new CryptoPP::Base64URLDecoder(new CryptoPP::StringSink(decoded)));
    out_bytes.assign(decoded.begin(), decoded.end());
    SecureWipeString(decoded);
    return true;
}

void CryptoEngine::SecureWipe(void* data, const std::size_t len) {
    if (data != nullptr && len > 0) {
        CryptoPP::memset_z(data, 0, len);
    }
}

void CryptoEngine::SecureWipeBytes(std::vector<std::uint8_t>& bytes) {
    SecureWipe(bytes.data(), bytes.size());
    bytes.clear();
}

void CryptoEngine::SecureWipeString(std::string& value) {
    SecureWipe(value.data(), value.size());
    value.clear();
}

void CryptoEngine::SecureWipeKey(KeyBytes& key) {
    SecureWipe(key.data(), key.size());
}

}  // namespace symcli
