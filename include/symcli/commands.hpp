#pragma once

#include <istream>
#include <string>

#include "symcli/cli_log.hpp"
#include "symcli/command_selector.hpp"
#include "symcli/crypto_service.hpp"
#include "symcli/keychain.hpp"
#include "symcli/password_cache.hpp"
#include "symcli/private_key_resolver.hpp"
#include "symcli/secret_prompt.hpp"
#include "symcli/sym_status.hpp"

namespace symcli {

struct ExecutionContext {
    const CommandPlan& command;
    const KeyPlan& key_plan;
    const ICryptoService& crypto;
    IKeychain* keychain;
    ISecretPrompt& prompt;
    PasswordCache& password_cache;
    std::istream& in;
    const CliLog& log;
};

struct ExecutionResult {
    SymStatus status = SymStatus::Ok;
    std::string payload;
    bool has_payload = true;  // false for edit, which reports through message
    std::string message;      // status text on success, error text on failure
    std::string detail;       // additional context shown with --trace
};

class CommandRunner {
public:
    // Runs the selected command with the acquired key text.
    static ExecutionResult Execute(const ExecutionContext& context, const std::string& key);

    // Returns the usable key, prompting for (or recalling) a password when
    // the key is password protected.
    static SymStatus UnlockKey(
        const ExecutionContext& context,
        const std::string& key,
        std::string& out_key,
        std::string& out_error);
};

}  // namespace symcli
