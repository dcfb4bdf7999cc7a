#include "symcli/cli_log.hpp"

#include <ostream>
#include <string_view>

namespace symcli {

void CliLog::Info(const std::string_view message) const {
    if (quiet_ || !(verbose_ || debug_)) {
        return;
    }
    err_ << "[log] " << message << "\n";
}

void CliLog::Debug(const std::string_view message) const {
    if (quiet_ || !debug_) {
        return;
    }
    err_ << "[debug] " << message << "\n";
}

void CliLog::Warn(const std::string_view message) const {
    if (quiet_) {
        return;
    }
    err_ << "[warn] " << message << "\n";
}

}  // namespace symcli
