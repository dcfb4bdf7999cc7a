#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "symcli/crypto_engine.hpp"
#include "symcli/sym_status.hpp"

namespace symcli {

constexpr std::size_t kMinPasswordLength = 7;

class KeyGenerator {
public:
    static SymStatus Generate(KeyBytes& out_key);

    static std::string Encode(const KeyBytes& key);
    static SymStatus Decode(std::string_view encoded, KeyBytes& out_key);

    // Wraps the key under a password-derived key.
    static SymStatus Protect(const KeyBytes& key, std::string_view password, std::string& out_protected);
    static SymStatus Unlock(std::string_view protected_key, std::string_view password, KeyBytes& out_key);
    static bool IsProtected(std::string_view encoded);
};

}  // namespace symcli
