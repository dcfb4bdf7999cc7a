#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "symcli/sym_status.hpp"

namespace symcli {

// Platform features resolved once at startup and injected into the parser.
struct Capabilities {
    bool keychain = false;

    static Capabilities Detect();
};

struct Options {
    // Modes.
    bool encrypt = false;
    bool decrypt = false;
    bool edit = false;
    bool generate = false;

    // Key creation and input.
    bool password = false;
    bool interactive = false;
    std::optional<std::string> keychain;
    std::optional<std::string> private_key;
    std::optional<std::string> keyfile;

    // Key caching.
    std::optional<std::int64_t> password_timeout;
    bool no_password_cache = false;

    // Data.
    std::optional<std::string> string;
    std::optional<std::string> file;
    std::optional<std::string> output;

    // Flags.
    bool backup = false;
    bool verbose = false;
    bool trace = false;
    bool debug = false;
    bool quiet = false;
    bool version = false;
    bool no_color = false;

    // Utility, help and examples.
    std::optional<std::string> bash_completion;
    bool examples = false;
    bool help = false;

    bool operator==(const Options& other) const = default;
};

enum class FlagType { Bool, String, Integer };

struct FlagSpec {
    char short_name;
    std::string_view long_name;
    FlagType type;
    std::string_view placeholder;
    std::string_view description;
    std::string_view group;
    bool requires_keychain;
    bool Options::*bool_field;
    std::optional<std::string> Options::*string_field;
    std::optional<std::int64_t> Options::*integer_field;
};

class OptionParser {
public:
    static constexpr std::string_view kDictionaryFlag = "--dictionary";

    // Every flag known to the tool, in help order, filtered by capability.
    static std::vector<FlagSpec> Flags(const Capabilities& capabilities);

    // Parses arguments (program name excluded). On failure out_error names
    // the offending flag or value.
    static SymStatus Parse(
        const std::vector<std::string>& args,
        const Capabilities& capabilities,
        Options& out_options,
        std::string& out_error);

    // Removes every --dictionary occurrence; returns true if one was present.
    static bool StripDictionaryFlag(std::vector<std::string>& args);

    // Sorted, space-joined canonical long flag names.
    static std::string Dictionary(const Capabilities& capabilities);

    // (long name, value) pairs for every flag that is set. The private key is
    // replaced by "[redacted]" and the literal data string by its length.
    static std::vector<std::pair<std::string, std::string>> Describe(
        const Options& options,
        const Capabilities& capabilities);
};

}  // namespace symcli
