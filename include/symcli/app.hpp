#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "symcli/crypto_service.hpp"
#include "symcli/keychain.hpp"
#include "symcli/options.hpp"
#include "symcli/render_mode.hpp"
#include "symcli/secret_prompt.hpp"
#include "symcli/sym_status.hpp"

namespace symcli {

// Everything the application touches outside its own memory.
struct AppServices {
    const ICryptoService& crypto;
    IKeychain* keychain;  // nullptr without keychain support
    ISecretPrompt& prompt;
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
    Capabilities capabilities;
    std::filesystem::path password_cache_dir;
    bool out_is_terminal = false;
    bool err_is_terminal = false;
};

struct ErrorRecord {
    ErrorKind kind = ErrorKind::None;
    SymStatus status = SymStatus::Ok;
    std::string stage;
    std::string message;
    std::string detail;
    std::vector<std::pair<std::string, std::string>> options;  // secrets redacted
};

class SymApp {
public:
    explicit SymApp(AppServices services) : services_(std::move(services)) {}

    // Runs one invocation (program name excluded) and returns the exit code.
    int Run(std::vector<std::string> args);

    // Set when the last Run failed.
    const std::optional<ErrorRecord>& last_error() const { return last_error_; }

private:
    int Fail(ErrorRecord record, const Options& options, const RenderMode& mode);

    AppServices services_;
    std::optional<ErrorRecord> last_error_;
};

}  // namespace symcli
