#include "symcli/help_text.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace symcli {

namespace {

std::string FlagColumn(const FlagSpec& flag) {
    std::string column = "-";
    column.push_back(flag.short_name);
    column += ", --";
    column += flag.long_name;
    if (flag.type != FlagType::Bool) {
        column += " [";
        column += flag.placeholder;
        column += "]";
    }
    return column;
}

}  // namespace

std::string HelpText::VersionLine() {
    return std::string("sym (version ") + kVersion + ")";
}

std::string HelpText::Usage(const Capabilities& capabilities, const RenderMode& mode) {
    const std::string key_inputs = capabilities.keychain ? "[ -k key | -K keyfile | -x keychain | -i ]"
                                                         : "[ -k key | -K keyfile | -i ]";
    std::ostringstream out;
    out << mode.Paint("Sym (" + std::string(kVersion) + ") - encrypt/decrypt data with a private key", Color::Bold)
        << "\n\n";
    out << mode.Paint("Usage:", Color::Yellow) << "\n";
    out << mode.Paint("   # Generate a new key:", Color::Dim) << "\n";
    out << "   " << mode.Paint("sym -g", Color::Green)
        << (capabilities.keychain ? " [ -p ] [ -x keychain ] [ -o keyfile | -q ]" : " [ -p ] [ -o keyfile | -q ]")
        << "\n\n";
    out << mode.Paint("   # Encrypt/Decrypt", Color::Dim) << "\n";
    out << "   " << mode.Paint("sym [ -d | -e ]", Color::Green) << " [ -f <file> | -s <string> ]\n";
    out << "        " << key_inputs << "\n";
    out << "        [ -o <output file> ]\n\n";
    out << mode.Paint("   # Edit an encrypted file in $EDITOR", Color::Dim) << "\n";
    out << "   " << mode.Paint("sym -t -f <file> [ -b ]", Color::Green) << " " << key_inputs << "\n";

    const std::vector<FlagSpec> flags = OptionParser::Flags(capabilities);
    std::size_t width = 0;
    for (const FlagSpec& flag : flags) {
        width = std::max(width, FlagColumn(flag).size());
    }
    std::string_view group;
    for (const FlagSpec& flag : flags) {
        if (flag.group != group) {
            group = flag.group;
            out << "\n" << mode.Paint(std::string(group) + ":", Color::Yellow) << "\n";
        }
        const std::string column = FlagColumn(flag);
        out << "  " << mode.Paint(column, Color::Blue) << std::string(width - column.size() + 3, ' ')
            << flag.description << "\n";
    }
    return out.str();
}

std::string HelpText::Examples(const RenderMode& mode) {
    struct Example {
        std::string_view comment;
        std::string_view command;
    };
    static const Example kExamples[] = {
        {"generate a new private key into an environment variable",
         "export mykey=$(sym -g)"},
        {"generate a new password-protected key and save it to a file",
         "sym -g -p -o ~/.sym.key"},
        {"encrypt a plain text string with a key from the environment",
         "sym -e -s 'secret string' -k $mykey"},
        {"encrypt a file using a key file, and save the output to another file",
         "sym -e -f secrets.yml -K ~/.sym.key -o secrets.yml.enc"},
        {"decrypt an encrypted file and print it to standard output",
         "sym -d -f secrets.yml.enc -K ~/.sym.key"},
        {"decrypt data piped through standard input",
         "cat secrets.yml.enc | sym -d -k $mykey"},
        {"edit an encrypted file in $EDITOR, keeping a backup of the original",
         "sym -t -f secrets.yml.enc -K ~/.sym.key -b"},
        {"add shell completion for sym to your bash profile",
         "sym -a ~/.bash_profile"},
    };

    std::ostringstream out;
    for (const Example& example : kExamples) {
        out << mode.Paint(std::string("# ") + std::string(example.comment), Color::Dim) << "\n";
        out << mode.Paint(example.command, Color::Green) << "\n\n";
    }
    return out.str();
}

std::string HelpText::CompletionScript(const Capabilities& capabilities) {
    std::string words;
    for (const FlagSpec& flag : OptionParser::Flags(capabilities)) {
        if (!words.empty()) {
            words += " ";
        }
        words += "-";
        words.push_back(flag.short_name);
        words += " --";
        words += flag.long_name;
    }

    std::ostringstream out;
    out << kCompletionMarker << "\n";
    out << "_sym_complete() {\n";
    out << "  local cur prev\n";
    out << "  cur=\"${COMP_WORDS[COMP_CWORD]}\"\n";
    out << "  prev=\"${COMP_WORDS[COMP_CWORD-1]}\"\n";
    out << "  case \"$prev\" in\n";
    out << "    -f|--file|-o|--output|-K|--keyfile|-a|--bash-completion)\n";
    out << "      COMPREPLY=( $(compgen -f -- \"$cur\") )\n";
    out << "      return 0\n";
    out << "      ;;\n";
    out << "  esac\n";
    out << "  COMPREPLY=( $(compgen -W \"" << words << "\" -- \"$cur\") )\n";
    out << "}\n";
    out << "complete -F _sym_complete sym\n";
    return out.str();
}

SymStatus HelpText::AppendCompletion(
    const std::string& path,
    const Capabilities& capabilities,
    bool& out_appended,
    std::string& out_error) {
    out_appended = false;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            out_error = "Unable to read " + path;
            return SymStatus::WriteFailed;
        }
        const std::string existing((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (existing.find(kCompletionMarker) != std::string::npos) {
            return SymStatus::Ok;
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        out_error = "Unable to open " + path + " for writing";
        return SymStatus::WriteFailed;
    }
    out << "\n" << CompletionScript(capabilities);
    out.flush();
    if (!out) {
        out_error = "Unable to write to " + path;
        return SymStatus::WriteFailed;
    }
    out_appended = true;
    return SymStatus::Ok;
}

}  // namespace symcli
