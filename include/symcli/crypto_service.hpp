#pragma once

#include <string>
#include <string_view>

#include "symcli/sym_status.hpp"

namespace symcli {

// Cryptography collaborator. Keys travel as their printable encoding.
class ICryptoService {
public:
    virtual ~ICryptoService() = default;

    virtual SymStatus Encrypt(
        const std::string& plaintext,
        const std::string& key,
        std::string& out_ciphertext) const = 0;

    virtual SymStatus Decrypt(
        const std::string& ciphertext,
        const std::string& key,
        std::string& out_plaintext) const = 0;

    virtual SymStatus GenerateKey(std::string& out_key) const = 0;

    virtual SymStatus ProtectKey(
        const std::string& key,
        std::string_view password,
        std::string& out_protected_key) const = 0;

    virtual SymStatus UnlockKey(
        const std::string& protected_key,
        std::string_view password,
        std::string& out_key) const = 0;

    virtual bool IsPasswordProtected(const std::string& key) const = 0;
};

}  // namespace symcli
