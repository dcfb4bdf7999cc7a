#pragma once

#include <memory>
#include <string>

#include "symcli/sym_status.hpp"

namespace symcli {

constexpr const char* kKeychainService = "sym";

class IKeychain {
public:
    virtual ~IKeychain() = default;

    // KeychainMiss when no entry exists under label.
    virtual SymStatus Read(const std::string& label, std::string& out_key) = 0;
    virtual SymStatus Write(const std::string& label, const std::string& key) = 0;
};

// True when this build carries an OS keychain backend.
bool KeychainSupported();

// nullptr when KeychainSupported() is false.
std::unique_ptr<IKeychain> CreateSystemKeychain();

}  // namespace symcli
