#include "symcli/options.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace symcli {

namespace {

constexpr std::string_view kGroupModes = "Modes";
constexpr std::string_view kGroupCreate = "Create a new private key";
constexpr std::string_view kGroupRead = "Read existing private key from";
constexpr std::string_view kGroupData = "Data to encrypt/decrypt";
constexpr std::string_view kGroupFlags = "Flags";
constexpr std::string_view kGroupUtility = "Utility";
constexpr std::string_view kGroupHelp = "Help & examples";

constexpr FlagSpec BoolFlag(
    const char short_name,
    const std::string_view long_name,
    const std::string_view description,
    const std::string_view group,
    bool Options::*field) {
    return FlagSpec{short_name, long_name, FlagType::Bool, "", description, group, false, field, nullptr, nullptr};
}

constexpr FlagSpec StringFlag(
    const char short_name,
    const std::string_view long_name,
    const std::string_view placeholder,
    const std::string_view description,
    const std::string_view group,
    std::optional<std::string> Options::*field,
    const bool requires_keychain = false) {
    return FlagSpec{
        short_name, long_name, FlagType::String, placeholder, description, group, requires_keychain,
        nullptr, field, nullptr};
}

const std::array<FlagSpec, 24>& FlagTable() {
    static const std::array<FlagSpec, 24> table = {
        BoolFlag('e', "encrypt", "encrypt mode", kGroupModes, &Options::encrypt),
        BoolFlag('d', "decrypt", "decrypt mode", kGroupModes, &Options::decrypt),
        BoolFlag('t', "edit", "decrypt, open an encrypted file in $EDITOR, re-encrypt", kGroupModes, &Options::edit),

        BoolFlag('g', "generate", "generate a new private key", kGroupCreate, &Options::generate),
        BoolFlag('p', "password", "encrypt the key with a password", kGroupCreate, &Options::password),
        StringFlag('x', "keychain", "key-name", "add to (or read from) the OS keychain", kGroupCreate,
                   &Options::keychain, true),
        FlagSpec{'M', "password-timeout", FlagType::Integer, "timeout",
                 "when cached passwords expire (in seconds)", kGroupCreate, false,
                 nullptr, nullptr, &Options::password_timeout},
        BoolFlag('P', "no-password-cache", "disables caching of key passwords", kGroupCreate,
                 &Options::no_password_cache),

        BoolFlag('i', "interactive", "paste or type the key interactively", kGroupRead, &Options::interactive),
        StringFlag('k', "private-key", "key", "private key as a string", kGroupRead, &Options::private_key),
        StringFlag('K', "keyfile", "key-file", "private key from a file", kGroupRead, &Options::keyfile),

        StringFlag('s', "string", "string", "specify a string to encrypt/decrypt", kGroupData, &Options::string),
        StringFlag('f', "file", "file", "filename to read from", kGroupData, &Options::file),
        StringFlag('o', "output", "file", "filename to write to", kGroupData, &Options::output),

        BoolFlag('b', "backup", "create a backup file in the edit mode", kGroupFlags, &Options::backup),
        BoolFlag('v', "verbose", "show additional information", kGroupFlags, &Options::verbose),
        BoolFlag('T', "trace", "print the full context of any errors", kGroupFlags, &Options::trace),
        BoolFlag('D', "debug", "print debugging information", kGroupFlags, &Options::debug),
        BoolFlag('q', "quiet", "silence all output", kGroupFlags, &Options::quiet),
        BoolFlag('V', "version", "print library version", kGroupFlags, &Options::version),
        BoolFlag('N', "no-color", "disable color output", kGroupFlags, &Options::no_color),

        StringFlag('a', "bash-completion", "file", "append shell completion to a file", kGroupUtility,
                   &Options::bash_completion),

        BoolFlag('E', "examples", "show several examples", kGroupHelp, &Options::examples),
        BoolFlag('h', "help", "show help", kGroupHelp, &Options::help),
    };
    return table;
}

bool ParseNonNegative(const std::string& text, std::int64_t& out_value) {
    if (text.empty()) {
        return false;
    }
    std::int64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc() || result.ptr != end || value < 0) {
        return false;
    }
    out_value = value;
    return true;
}

}  // namespace

std::vector<FlagSpec> OptionParser::Flags(const Capabilities& capabilities) {
    std::vector<FlagSpec> flags;
    for (const FlagSpec& flag : FlagTable()) {
        if (flag.requires_keychain && !capabilities.keychain) {
            continue;
        }
        flags.push_back(flag);
    }
    return flags;
}

SymStatus OptionParser::Parse(
    const std::vector<std::string>& args,
    const Capabilities& capabilities,
    Options& out_options,
    std::string& out_error) {
    out_options = Options{};
    const std::vector<FlagSpec> flags = Flags(capabilities);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() < 2 || arg[0] != '-') {
            out_error = "Unexpected argument: " + arg;
            return SymStatus::UnexpectedArgument;
        }

        std::optional<std::string> inline_value;
        const FlagSpec* flag = nullptr;
        if (arg.rfind("--", 0) == 0) {
            std::string name = arg.substr(2);
            const std::size_t eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name.resize(eq);
            }
            const auto it = std::find_if(flags.begin(), flags.end(), [&](const FlagSpec& f) {
                return f.long_name == name;
            });
            if (it != flags.end()) {
                flag = &*it;
            }
        } else if (arg.size() == 2) {
            const auto it = std::find_if(flags.begin(), flags.end(), [&](const FlagSpec& f) {
                return f.short_name == arg[1];
            });
            if (it != flags.end()) {
                flag = &*it;
            }
        }

        if (flag == nullptr) {
            out_error = "Unknown option: " + arg;
            return SymStatus::UnknownFlag;
        }

        const std::string flag_name = "--" + std::string(flag->long_name);
        if (flag->type == FlagType::Bool) {
            if (inline_value.has_value()) {
                out_error = "Option " + flag_name + " does not take a value";
                return SymStatus::InvalidValue;
            }
            out_options.*(flag->bool_field) = true;
            continue;
        }

        std::string value;
        if (inline_value.has_value()) {
            value = std::move(*inline_value);
        } else {
            if (i + 1 >= args.size()) {
                out_error = "Missing value for " + flag_name;
                return SymStatus::MissingValue;
            }
            value = args[++i];
        }

        if (flag->type == FlagType::Integer) {
            std::int64_t parsed = 0;
            if (!ParseNonNegative(value, parsed)) {
                out_error = "Invalid value for " + flag_name + ": expected a non-negative integer";
                return SymStatus::InvalidValue;
            }
            out_options.*(flag->integer_field) = parsed;
        } else {
            out_options.*(flag->string_field) = std::move(value);
        }
    }
    return SymStatus::Ok;
}

bool OptionParser::StripDictionaryFlag(std::vector<std::string>& args) {
    const auto it = std::remove(args.begin(), args.end(), std::string(kDictionaryFlag));
    const bool found = it != args.end();
    args.erase(it, args.end());
    return found;
}

std::string OptionParser::Dictionary(const Capabilities& capabilities) {
    std::vector<std::string> names;
    for (const FlagSpec& flag : Flags(capabilities)) {
        names.push_back("--" + std::string(flag.long_name));
    }
    std::sort(names.begin(), names.end());

    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out.push_back(' ');
        }
        out += names[i];
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> OptionParser::Describe(
    const Options& options,
    const Capabilities& capabilities) {
    std::vector<std::pair<std::string, std::string>> out;
    for (const FlagSpec& flag : Flags(capabilities)) {
        const std::string name(flag.long_name);
        switch (flag.type) {
            case FlagType::Bool:
                if (options.*(flag.bool_field)) {
                    out.emplace_back(name, "true");
                }
                break;
            case FlagType::String: {
                const auto& value = options.*(flag.string_field);
                if (value.has_value()) {
                    if (flag.long_name == "private-key") {
                        out.emplace_back(name, "[redacted]");
                    } else if (flag.long_name == "string") {
                        out.emplace_back(name, "[redacted, " + std::to_string(value->size()) + " bytes]");
                    } else {
                        out.emplace_back(name, *value);
                    }
                }
                break;
            }
            case FlagType::Integer: {
                const auto& value = options.*(flag.integer_field);
                if (value.has_value()) {
                    out.emplace_back(name, std::to_string(*value));
                }
                break;
            }
        }
    }
    return out;
}

}  // namespace symcli
