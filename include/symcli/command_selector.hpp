#pragma once

#include <string>
#include <string_view>

#include "symcli/options.hpp"
#include "symcli/sym_status.hpp"

namespace symcli {

enum class CommandKind { Generate, Encrypt, Decrypt, Edit };

std::string_view ToString(CommandKind kind);

enum class InputKind { String, File, Stdin };

struct InputSource {
    InputKind kind = InputKind::Stdin;
    std::string value;  // text for String, path for File
};

struct CommandPlan {
    CommandKind kind = CommandKind::Encrypt;
    InputSource input;
    bool backup = false;
    bool backup_ignored = false;  // --backup given outside of edit mode
};

class CommandSelector {
public:
    static SymStatus Select(const Options& options, CommandPlan& out_plan, std::string& out_error);
};

}  // namespace symcli
