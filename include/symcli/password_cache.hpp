#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "symcli/sym_status.hpp"

namespace symcli {

constexpr std::int64_t kDefaultPasswordTimeoutSeconds = 300;

// Per-user, on-disk cache of key passwords. Entries are keyed by the hash of
// the protected key, sealed under a key derived from it and expire after the
// configured timeout.
class PasswordCache {
public:
    PasswordCache(std::filesystem::path directory, std::chrono::seconds timeout, bool enabled)
        : directory_(std::move(directory)), timeout_(timeout), enabled_(enabled) {}

    // $XDG_RUNTIME_DIR/symcli, or <tmp>/symcli-<uid>.
    static std::filesystem::path DefaultDirectory();

    bool enabled() const { return enabled_; }
    std::chrono::seconds timeout() const { return timeout_; }

    bool Lookup(const std::string& protected_key, std::string& out_password);
    SymStatus Store(const std::string& protected_key, std::string_view password);
    void Forget(const std::string& protected_key);

private:
    std::filesystem::path EntryPath(const std::string& protected_key) const;

    std::filesystem::path directory_;
    std::chrono::seconds timeout_;
    bool enabled_;
};

}  // namespace symcli
