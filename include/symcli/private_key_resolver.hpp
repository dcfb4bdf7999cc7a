#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "symcli/command_selector.hpp"
#include "symcli/crypto_service.hpp"
#include "symcli/keychain.hpp"
#include "symcli/options.hpp"
#include "symcli/password_cache.hpp"
#include "symcli/secret_prompt.hpp"
#include "symcli/sym_status.hpp"

namespace symcli {

enum class KeySourceKind { None, Generated, Interactive, InlineString, KeyFile, Keychain };

std::string_view ToString(KeySourceKind kind);

struct KeySource {
    KeySourceKind kind = KeySourceKind::None;
    std::string value;  // key text, file path or keychain label

    bool operator==(const KeySource& other) const = default;
};

struct KeyPlan {
    KeySource source;
    std::string source_flag;  // flag that selected the source, e.g. "--generate"
    bool password_protect = false;
    std::chrono::seconds cache_timeout{kDefaultPasswordTimeoutSeconds};
    bool cache_enabled = true;
    std::optional<std::string> store_label;  // keychain entry for a generated key
    std::vector<std::string> ignored_flags;  // lower-precedence sources also present
};

struct KeyServices {
    const ICryptoService& crypto;
    IKeychain* keychain;  // nullptr without keychain support
    ISecretPrompt& prompt;
};

class PrivateKeyResolver {
public:
    // Pure: the same options always give the same plan.
    static SymStatus Resolve(
        const Options& options,
        CommandKind command,
        KeyPlan& out_plan,
        std::string& out_error);

    // Performs the I/O the plan calls for and returns the key text as stored
    // (possibly still password protected).
    static SymStatus Acquire(
        const KeyPlan& plan,
        const KeyServices& services,
        std::string& out_key,
        std::string& out_error);
};

}  // namespace symcli
