#include "symcli/password_cache.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include "symcli/crypto_engine.hpp"

namespace symcli {

namespace {

std::int64_t NowSeconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

KeyBytes SealingKeyFor(const std::string& protected_key) {
    return CryptoEngine::Sha256("sym-password-cache:" + protected_key);
}

}  // namespace

std::filesystem::path PasswordCache::DefaultDirectory() {
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir != nullptr && runtime_dir[0] != '\0') {
        return std::filesystem::path(runtime_dir) / "symcli";
    }
    std::error_code ec;
    std::filesystem::path base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    return base / ("symcli-" + std::to_string(static_cast<unsigned long>(getuid())));
}

std::filesystem::path PasswordCache::EntryPath(const std::string& protected_key) const {
    return directory_ / (CryptoEngine::Sha256Hex(protected_key).substr(0, 32) + ".entry");
}

bool PasswordCache::Lookup(const std::string& protected_key, std::string& out_password) {
    if (!enabled_) {
        return false;
    }
    const std::filesystem::path path = EntryPath(protected_key);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    std::int64_t expires_at = 0;
    std::string sealed_text;
    in >> expires_at >> sealed_text;
    in.close();
    if (sealed_text.empty() || NowSeconds() >= expires_at) {
        Forget(protected_key);
        return false;
    }

    std::vector<std::uint8_t> sealed;
    if (!CryptoEngine::Base64UrlDecode(sealed_text, sealed) || sealed.size() < kNonceByteCount + kTagByteCount) {
        Forget(protected_key);
        return false;
    }
    Nonce nonce{};
    Tag tag{};
    std::copy_n(sealed.begin(), nonce.size(), nonce.begin());
    std::copy_n(sealed.begin() + static_cast<std::ptrdiff_t>(nonce.size()), tag.size(), tag.begin());
    const std::vector<std::uint8_t> ciphertext(
        sealed.begin() + static_cast<std::ptrdiff_t>(nonce.size() + tag.size()), sealed.end());

    KeyBytes sealing_key = SealingKeyFor(protected_key);
    std::vector<std::uint8_t> plain;
    bool auth_ok = false;
    const SymStatus status =
        CryptoEngine::XChaCha20Poly1305DecryptVerify(sealing_key, nonce, ciphertext, tag, plain, auth_ok);
    CryptoEngine::SecureWipeKey(sealing_key);
    if (status != SymStatus::Ok || !auth_ok) {
        Forget(protected_key);
        return false;
    }
    out_password.assign(plain.begin(), plain.end());
    CryptoEngine::SecureWipeBytes(plain);
    return true;
}

SymStatus PasswordCache::Store(const std::string& protected_key, const std::string_view password) {
    if (!enabled_) {
        return SymStatus::Ok;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return SymStatus::FileIOError;
    }
    std::filesystem::permissions(directory_, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
    if (ec) {
        return SymStatus::FileIOError;
    }

    Nonce nonce{};
    SymStatus status = CryptoEngine::FillRandom(nonce.data(), nonce.size());
    if (status != SymStatus::Ok) {
        return status;
    }
    KeyBytes sealing_key = SealingKeyFor(protected_key);
    std::vector<std::uint8_t> plain(password.begin(), password.end());
    std::vector<std::uint8_t> ciphertext;
    Tag tag{};
    status = CryptoEngine::XChaCha20Poly1305Encrypt(sealing_key, nonce, plain, ciphertext, tag);
    CryptoEngine::SecureWipeKey(sealing_key);
    CryptoEngine::SecureWipeBytes(plain);
    if (status != SymStatus::Ok) {
        return status;
    }

    std::vector<std::uint8_t> sealed;
    sealed.reserve(nonce.size() + tag.size() + ciphertext.size());
    sealed.insert(sealed.end(), nonce.begin(), nonce.end());
    sealed.insert(sealed.end(), tag.begin(), tag.end());
    sealed.insert(sealed.end(), ciphertext.begin(), ciphertext.end());

    const std::filesystem::path path = EntryPath(protected_key);
    {
        std::ofstream touch(path, std::ios::binary | std::ios::trunc);
        if (!touch.is_open()) {
            return SymStatus::FileIOError;
        }
    }
    std::filesystem::permissions(
        path,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace,
        ec);
    if (ec) {
        return SymStatus::FileIOError;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return SymStatus::FileIOError;
    }
    const std::int64_t now = NowSeconds();
    const std::int64_t expires_at = timeout_.count() > std::numeric_limits<std::int64_t>::max() - now
                                        ? std::numeric_limits<std::int64_t>::max()
                                        : now + timeout_.count();
    out << expires_at << "\n" << CryptoEngine::Base64UrlEncode(sealed) << "\n";
    out.flush();
    return out.good() ? SymStatus::Ok : SymStatus::FileIOError;
}

void PasswordCache::Forget(const std::string& protected_key) {
    std::error_code ec;
    std::filesystem::remove(EntryPath(protected_key), ec);
}

}  // namespace symcli
