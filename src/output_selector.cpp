#include "symcli/output_selector.hpp"

#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>

namespace symcli {

OutputSink OutputSelector::Select(const Options& options) {
    if (options.output.has_value()) {
        return OutputSink{SinkKind::File, *options.output};
    }
    if (options.quiet) {
        return OutputSink{SinkKind::Suppressed, ""};
    }
    return OutputSink{SinkKind::Stdout, ""};
}

SymStatus OutputSelector::Write(
    const OutputSink& sink,
    const std::string& payload,
    std::ostream& out,
    std::string& out_error) {
    switch (sink.kind) {
        case SinkKind::Suppressed:
            return SymStatus::Ok;
        case SinkKind::Stdout:
            out << payload;
            if (payload.empty() || payload.back() != '\n') {
                out << "\n";
            }
            out.flush();
            if (!out.good()) {
                out_error = "Unable to write to standard output";
                return SymStatus::WriteFailed;
            }
            return SymStatus::Ok;
        case SinkKind::File: {
            const std::filesystem::path path(sink.path);
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                out_error = "Unable to open " + sink.path + " for writing";
                return SymStatus::WriteFailed;
            }
            if (!payload.empty()) {
                file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
            }
            file.flush();
            if (!file.good()) {
                out_error = "Unable to write to " + sink.path;
                return SymStatus::WriteFailed;
            }
            return SymStatus::Ok;
        }
    }
    out_error = "Unknown output sink";
    return SymStatus::WriteFailed;
}

}  // namespace symcli
