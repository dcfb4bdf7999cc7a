#include "symcli/command_selector.hpp"

#include <array>
#include <string>
#include <string_view>

namespace symcli {

std::string_view ToString(const CommandKind kind) {
    switch (kind) {
        case CommandKind::Generate:
            return "generate";
        case CommandKind::Encrypt:
            return "encrypt";
        case CommandKind::Decrypt:
            return "decrypt";
        case CommandKind::Edit:
            return "edit";
    }
    return "unknown";
}

SymStatus CommandSelector::Select(const Options& options, CommandPlan& out_plan, std::string& out_error) {
    struct ModeFlag {
        bool set;
        CommandKind kind;
    };
    const std::array<ModeFlag, 4> modes = {{
        {options.generate, CommandKind::Generate},
        {options.encrypt, CommandKind::Encrypt},
        {options.decrypt, CommandKind::Decrypt},
        {options.edit, CommandKind::Edit},
    }};

    int selected = 0;
    CommandKind kind = CommandKind::Encrypt;
    for (const ModeFlag& mode : modes) {
        if (mode.set) {
            ++selected;
            kind = mode.kind;
        }
    }
    if (selected == 0) {
        out_error = "No mode specified: use one of --generate, --encrypt, --decrypt or --edit";
        return SymStatus::NoModeSpecified;
    }
    if (selected > 1) {
        out_error = "Conflicting modes: only one of --generate, --encrypt, --decrypt or --edit is allowed";
        return SymStatus::ConflictingModes;
    }

    if (kind == CommandKind::Edit && !options.file.has_value()) {
        out_error = "--edit requires --file: strings and stdin can not be edited";
        return SymStatus::EditRequiresFile;
    }
    if (options.string.has_value() && options.file.has_value()) {
        out_error = "Conflicting inputs: use either --string or --file, not both";
        return SymStatus::ConflictingInputs;
    }

    CommandPlan plan;
    plan.kind = kind;
    if (options.string.has_value()) {
        plan.input = InputSource{InputKind::String, *options.string};
    } else if (options.file.has_value()) {
        plan.input = InputSource{InputKind::File, *options.file};
    } else {
        plan.input = InputSource{InputKind::Stdin, ""};
    }
    plan.backup = kind == CommandKind::Edit && options.backup;
    plan.backup_ignored = kind != CommandKind::Edit && options.backup;
    out_plan = plan;
    return SymStatus::Ok;
}

}  // namespace symcli
