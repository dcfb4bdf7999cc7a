#pragma once

#include <ostream>
#include <string_view>

namespace symcli {

// Diagnostic side channel on the error stream. Never pass secrets in.
class CliLog {
public:
    CliLog(std::ostream& err, bool verbose, bool debug, bool quiet)
        : err_(err), verbose_(verbose), debug_(debug), quiet_(quiet) {}

    void Info(std::string_view message) const;
    void Debug(std::string_view message) const;
    void Warn(std::string_view message) const;

private:
    std::ostream& err_;
    bool verbose_;
    bool debug_;
    bool quiet_;
};

}  // namespace symcli
