#pragma once

#include <ostream>
#include <string>

#include "symcli/options.hpp"
#include "symcli/sym_status.hpp"

namespace symcli {

enum class SinkKind { File, Stdout, Suppressed };

struct OutputSink {
    SinkKind kind = SinkKind::Stdout;
    std::string path;  // only for File

    bool operator==(const OutputSink& other) const = default;
};

class OutputSelector {
public:
    // Never fails: an unwritable --output is reported by Write.
    static OutputSink Select(const Options& options);

    static SymStatus Write(
        const OutputSink& sink,
        const std::string& payload,
        std::ostream& out,
        std::string& out_error);
};

}  // namespace symcli
