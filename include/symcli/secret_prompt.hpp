#pragma once

#include <istream>
#include <ostream>
#include <string>

#include "symcli/sym_status.hpp"

namespace symcli {

class ISecretPrompt {
public:
    virtual ~ISecretPrompt() = default;

    // Reads one line without echo. InteractiveAborted on EOF.
    virtual SymStatus PromptSecret(const std::string& label, std::string& out_secret) = 0;
};

class TerminalPrompt final : public ISecretPrompt {
public:
    TerminalPrompt(std::istream& in, std::ostream& err, int input_fd)
        : in_(in), err_(err), input_fd_(input_fd) {}

    SymStatus PromptSecret(const std::string& label, std::string& out_secret) override;

private:
    std::istream& in_;
    std::ostream& err_;
    int input_fd_;
};

}  // namespace symcli
