#include "symcli/private_key_resolver.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "symcli/crypto_engine.hpp"
#include "symcli/text_util.hpp"

namespace symcli {

std::string_view ToString(const KeySourceKind kind) {
    switch (kind) {
        case KeySourceKind::None:
            return "none";
        case KeySourceKind::Generated:
            return "generated";
        case KeySourceKind::Interactive:
            return "interactive";
        case KeySourceKind::InlineString:
            return "private-key";
        case KeySourceKind::KeyFile:
            return "keyfile";
        case KeySourceKind::Keychain:
            return "keychain";
    }
    return "unknown";
}

SymStatus PrivateKeyResolver::Resolve(
    const Options& options,
    const CommandKind command,
    KeyPlan& out_plan,
    std::string& out_error) {
    struct Candidate {
        bool present;
        KeySourceKind kind;
        std::string_view flag;
        const std::optional<std::string>* value;
    };
    // Highest precedence first.
    const std::array<Candidate, 5> candidates = {{
        {options.generate, KeySourceKind::Generated, "--generate", nullptr},
        {options.interactive, KeySourceKind::Interactive, "--interactive", nullptr},
        {options.private_key.has_value(), KeySourceKind::InlineString, "--private-key", &options.private_key},
        {options.keyfile.has_value(), KeySourceKind::KeyFile, "--keyfile", &options.keyfile},
        {options.keychain.has_value() && command != CommandKind::Generate, KeySourceKind::Keychain, "--keychain",
         &options.keychain},
    }};

    KeyPlan plan;
    for (const Candidate& candidate : candidates) {
        if (!candidate.present) {
            continue;
        }
        if (plan.source.kind == KeySourceKind::None) {
            plan.source.kind = candidate.kind;
            plan.source_flag = candidate.flag;
            if (candidate.value != nullptr) {
                plan.source.value = **candidate.value;
            }
        } else {
            plan.ignored_flags.emplace_back(candidate.flag);
        }
    }

    if (plan.source.kind == KeySourceKind::None) {
        out_error = "No private key specified: use --private-key, --keyfile, --interactive or a keychain entry";
        return SymStatus::NoKeySpecified;
    }

    if (command == CommandKind::Generate && options.keychain.has_value()) {
        plan.store_label = *options.keychain;
    }
    plan.password_protect = options.password;
    if (options.password_timeout.has_value()) {
        plan.cache_timeout = std::chrono::seconds(*options.password_timeout);
    }
    plan.cache_enabled = !options.no_password_cache;
    out_plan = std::move(plan);
    return SymStatus::Ok;
}

SymStatus PrivateKeyResolver::Acquire(
    const KeyPlan& plan,
    const KeyServices& services,
    std::string& out_key,
    std::string& out_error) {
    switch (plan.source.kind) {
        case KeySourceKind::None:
            out_error = "No private key specified";
            return SymStatus::NoKeySpecified;

        case KeySourceKind::Generated: {
            const SymStatus status = services.crypto.GenerateKey(out_key);
            if (status != SymStatus::Ok) {
                out_error = "Unable to generate a new private key";
            }
            return status;
        }

        case KeySourceKind::Interactive: {
            std::string entered;
            const SymStatus status = services.prompt.PromptSecret("Private Key: ", entered);
            const std::string_view trimmed = TrimAsciiWhitespace(entered);
            if (status != SymStatus::Ok || trimmed.empty()) {
                CryptoEngine::SecureWipeString(entered);
                out_error = "No private key was entered";
                return SymStatus::InteractiveAborted;
            }
            out_key.assign(trimmed);
            CryptoEngine::SecureWipeString(entered);
            return SymStatus::Ok;
        }

        case KeySourceKind::InlineString:
            out_key.assign(TrimAsciiWhitespace(plan.source.value));
            if (out_key.empty()) {
                out_error = "The private key given with --private-key is empty";
                return SymStatus::InvalidKey;
            }
            return SymStatus::Ok;

        case KeySourceKind::KeyFile: {
            const std::filesystem::path path(plan.source.value);
            std::error_code ec;
            if (!std::filesystem::exists(path, ec) || ec) {
                out_error = "Key file " + plan.source.value + " does not exist";
                return SymStatus::KeyFileNotFound;
            }
            std::ifstream in(path, std::ios::binary);
            if (!std::filesystem::is_regular_file(path, ec) || ec || !in.is_open()) {
                out_error = "Key file " + plan.source.value + " is not readable";
                return SymStatus::KeyFileUnreadable;
            }
            std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            if (in.bad()) {
                CryptoEngine::SecureWipeString(raw);
                out_error = "Key file " + plan.source.value + " is not readable";
                return SymStatus::KeyFileUnreadable;
            }
            out_key.assign(TrimAsciiWhitespace(raw));
            CryptoEngine::SecureWipeString(raw);
            if (out_key.empty()) {
                out_error = "Key file " + plan.source.value + " is empty";
                return SymStatus::InvalidKey;
            }
            return SymStatus::Ok;
        }

        case KeySourceKind::Keychain: {
            if (services.keychain == nullptr) {
                out_error = "The OS keychain is not available on this system";
                return SymStatus::KeychainUnavailable;
            }
            const SymStatus status = services.keychain->Read(plan.source.value, out_key);
            if (status != SymStatus::Ok) {
                out_error = "No key named '" + plan.source.value + "' was found in the keychain";
            }
            return status;
        }
    }
    out_error = "Unknown key source";
    return SymStatus::NoKeySpecified;
}

}  // namespace symcli
