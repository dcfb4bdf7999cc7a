#pragma once

#include <string>
#include <string_view>

#include "symcli/crypto_service.hpp"

namespace symcli {

// XChaCha20-Poly1305 messages: base64url("SYM1" | nonce | tag | ciphertext).
class SymCipher final : public ICryptoService {
public:
    SymStatus Encrypt(
        const std::string& plaintext,
        const std::string& key,
        std::string& out_ciphertext) const override;

    SymStatus Decrypt(
        const std::string& ciphertext,
        const std::string& key,
        std::string& out_plaintext) const override;

    SymStatus GenerateKey(std::string& out_key) const override;

    SymStatus ProtectKey(
        const std::string& key,
        std::string_view password,
        std::string& out_protected_key) const override;

    SymStatus UnlockKey(
        const std::string& protected_key,
        std::string_view password,
        std::string& out_key) const override;

    bool IsPasswordProtected(const std::string& key) const override;
};

}  // namespace symcli
