#include "symcli/app.hpp"

#include <string>
#include <utility>
#include <vector>

#include "symcli/cli_log.hpp"
#include "symcli/command_selector.hpp"
#include "symcli/commands.hpp"
#include "symcli/crypto_engine.hpp"
#include "symcli/help_text.hpp"
#include "symcli/output_selector.hpp"
#include "symcli/password_cache.hpp"
#include "symcli/private_key_resolver.hpp"

namespace symcli {

namespace {

ErrorRecord MakeRecord(const SymStatus status, std::string stage, std::string message, std::string detail = {}) {
    ErrorRecord record;
    record.kind = KindOf(status);
    record.status = status;
    record.stage = std::move(stage);
    record.message = std::move(message);
    record.detail = std::move(detail);
    return record;
}

}  // namespace

int SymApp::Fail(ErrorRecord record, const Options& options, const RenderMode& mode) {
    std::ostream& err = services_.err;
    record.options = OptionParser::Describe(options, services_.capabilities);

    err << mode.Paint("Error: " + record.message, Color::Red) << "\n";
    if (options.trace) {
        err << "  stage: " << record.stage << "\n";
        err << "  kind: " << ToString(record.kind) << "\n";
        err << "  status: " << ToString(record.status) << "\n";
        if (!record.detail.empty()) {
            err << "  detail: " << record.detail << "\n";
        }
    }
    if (options.debug) {
        err << "  options:\n";
        for (const auto& [name, value] : record.options) {
            err << "    --" << name << " = " << value << "\n";
        }
    }
    err.flush();

    const int code = ExitCodeFor(record.kind);
    last_error_ = std::move(record);
    return code;
}

int SymApp::Run(std::vector<std::string> args) {
    last_error_.reset();
    std::ostream& out = services_.out;
    const Capabilities& capabilities = services_.capabilities;

    if (OptionParser::StripDictionaryFlag(args)) {
        out << OptionParser::Dictionary(capabilities) << "\n";
        return 0;
    }
    if (args.empty()) {
        out << HelpText::Usage(capabilities, RenderMode::Detect(false, services_.out_is_terminal));
        return 0;
    }

    Options options;
    std::string error;
    SymStatus status = OptionParser::Parse(args, capabilities, options, error);
    if (status != SymStatus::Ok) {
        return Fail(
            MakeRecord(status, "ParseOptions", error + " (see sym --help)"),
            Options{},
            RenderMode::Detect(false, services_.err_is_terminal));
    }

    const RenderMode out_mode = RenderMode::Detect(options.no_color, services_.out_is_terminal);
    const RenderMode err_mode = RenderMode::Detect(options.no_color, services_.err_is_terminal);
    const CliLog log(services_.err, options.verbose, options.debug, options.quiet);

    if (options.version) {
        out << HelpText::VersionLine() << "\n";
        return 0;
    }
    if (options.help) {
        out << HelpText::Usage(capabilities, out_mode);
        return 0;
    }
    if (options.examples) {
        out << HelpText::Examples(out_mode);
        return 0;
    }
    if (options.bash_completion.has_value()) {
        const std::string& path = *options.bash_completion;
        bool appended = false;
        status = HelpText::AppendCompletion(path, capabilities, appended, error);
        if (status != SymStatus::Ok) {
            return Fail(MakeRecord(status, "Emit", error), options, err_mode);
        }
        if (!options.quiet) {
            out << (appended ? "completion for sym was appended to " : "completion for sym is already in ") << path
                << "\n";
        }
        return 0;
    }

    CommandPlan command;
    status = CommandSelector::Select(options, command, error);
    if (status != SymStatus::Ok) {
        return Fail(MakeRecord(status, "SelectCommand", error), options, err_mode);
    }
    log.Debug("command: " + std::string(ToString(command.kind)));
    if (command.backup_ignored) {
        log.Warn("--backup only applies to --edit; ignoring it");
    }

    KeyPlan key_plan;
    status = PrivateKeyResolver::Resolve(options, command.kind, key_plan, error);
    if (status != SymStatus::Ok) {
        return Fail(MakeRecord(status, "ResolveKey", error), options, err_mode);
    }
    log.Debug("key source: " + std::string(ToString(key_plan.source.kind)));
    for (const std::string& flag : key_plan.ignored_flags) {
        log.Warn(flag + " ignored: " + key_plan.source_flag + " takes precedence");
    }

    const OutputSink sink = OutputSelector::Select(options);
    if (command.kind == CommandKind::Edit && options.output.has_value()) {
        log.Warn("--output is ignored in edit mode");
    }

    std::string key;
    const KeyServices key_services{services_.crypto, services_.keychain, services_.prompt};
    status = PrivateKeyResolver::Acquire(key_plan, key_services, key, error);
    if (status != SymStatus::Ok) {
        return Fail(MakeRecord(status, "AcquireKey", error), options, err_mode);
    }

    PasswordCache password_cache(services_.password_cache_dir, key_plan.cache_timeout, key_plan.cache_enabled);
    const ExecutionContext context{
        command, key_plan, services_.crypto, services_.keychain, services_.prompt, password_cache, services_.in, log};
    ExecutionResult result = CommandRunner::Execute(context, key);
    CryptoEngine::SecureWipeString(key);
    if (result.status != SymStatus::Ok) {
        return Fail(MakeRecord(result.status, "Execute", result.message, result.detail), options, err_mode);
    }

    if (!result.has_payload) {
        if (!options.quiet) {
            out << result.message << "\n";
        }
        return 0;
    }
    status = OutputSelector::Write(sink, result.payload, out, error);
    CryptoEngine::SecureWipeString(result.payload);
    if (status != SymStatus::Ok) {
        return Fail(MakeRecord(status, "Emit", error), options, err_mode);
    }
    if (sink.kind == SinkKind::File) {
        log.Info("output written to " + sink.path);
    }
    return 0;
}

}  // namespace symcli
