#pragma once

#include <string>

#include "symcli/options.hpp"
#include "symcli/render_mode.hpp"
#include "symcli/sym_status.hpp"

namespace symcli {

constexpr const char* kVersion = "1.0.0";
constexpr const char* kCompletionMarker = "# sym completion";

class HelpText {
public:
    // "sym (version x.y.z)".
    static std::string VersionLine();

    // Banner, synopsis and the flag table grouped in help order.
    static std::string Usage(const Capabilities& capabilities, const RenderMode& mode);

    static std::string Examples(const RenderMode& mode);

    // Bash completion function listing every flag of this build.
    static std::string CompletionScript(const Capabilities& capabilities);

    // Appends CompletionScript to path unless the marker is already there.
    static SymStatus AppendCompletion(
        const std::string& path,
        const Capabilities& capabilities,
        bool& out_appended,
        std::string& out_error);
};

}  // namespace symcli
