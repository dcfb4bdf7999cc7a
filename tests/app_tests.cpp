#include "symcli/app.hpp"
#include "symcli/command_selector.hpp"
#include "symcli/output_selector.hpp"
#include "symcli/private_key_resolver.hpp"
#include "symcli/render_mode.hpp"
#include "symcli/sym_cipher.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        ++failures;
    }
}

struct RunResult {
    int exit_code = EXIT_FAILURE;
    std::string out;
    std::string err;
    std::optional<symcli::ErrorRecord> error;
};

// One environment per test: cipher, fakes, and a private cache directory.
struct Harness {
    symcli::SymCipher cipher{};
    symcli_test::FakeKeychain keychain;
    symcli_test::ScriptedPrompt prompt;
    symcli_test::TempDir dir;
    bool keychain_supported = true;

    RunResult run(std::initializer_list<const char*> args, const std::string& stdin_text = "") {
        std::istringstream in(stdin_text);
        std::ostringstream out;
        std::ostringstream err;
        symcli::AppServices services{
            cipher,
            keychain_supported ? &keychain : nullptr,
            prompt,
            in,
            out,
            err,
            symcli::Capabilities{keychain_supported},
            dir.path() / "password-cache",
            false,
            false,
        };
        symcli::SymApp app(std::move(services));
        const int code = app.Run(std::vector<std::string>(args.begin(), args.end()));
        return RunResult{code, out.str(), err.str(), app.last_error()};
    }

    std::string key() {
        std::string generated;
        cipher.GenerateKey(generated);
        return generated;
    }
};

std::string trimmed(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

void test_empty_args_print_usage() {
    Harness h;
    const auto result = h.run({});
    expect_true(result.exit_code == 0, "no arguments should succeed");
    expect_true(result.out.find("Usage:") != std::string::npos, "no arguments should print usage");
}

void test_dictionary_wins_over_everything() {
    Harness h;
    const auto result = h.run({"--not-a-flag", "-e", "--dictionary", "-k"});
    expect_true(result.exit_code == 0, "dictionary should exit 0 even with bad flags");
    expect_true(result.out.rfind("--backup --bash-completion --debug --decrypt", 0) == 0,
                "dictionary should print the sorted flag names");
    expect_true(result.out.find("--dictionary") == std::string::npos, "dictionary should not list itself");
    expect_true(result.err.empty(), "dictionary should print no errors");
}

void test_version_and_display_precedence() {
    Harness h;
    auto result = h.run({"-V", "-h", "-E"});
    expect_true(result.exit_code == 0, "--version should succeed");
    expect_true(result.out == "sym (version 1.0.0)\n", "version should win over help and examples");

    result = h.run({"-h", "-E"});
    expect_true(result.out.find("Modes:") != std::string::npos, "help should win over examples");
    expect_true(result.out.find("--dictionary") == std::string::npos, "help should not mention --dictionary");
    expect_true(result.out.find('\x1b') == std::string::npos, "help to a non-terminal should have no color");

    result = h.run({"-E"});
    expect_true(result.out.find("sym -e -s") != std::string::npos, "examples should be printed");
}

void test_help_follows_keychain_capability() {
    Harness h;
    auto result = h.run({"--help"});
    expect_true(result.out.find("--keychain") != std::string::npos, "help should list keychain when supported");

    h.keychain_supported = false;
    result = h.run({"--help"});
    expect_true(result.out.find("--keychain") == std::string::npos, "help should omit keychain otherwise");
    result = h.run({"-e", "-x", "work"});
    expect_true(result.exit_code == 2, "keychain flag should be unknown without support");
}

void test_parse_error_exit_code() {
    Harness h;
    const auto result = h.run({"--bogus"});
    expect_true(result.exit_code == 2, "parse errors should exit 2");
    expect_true(result.err.find("Error: Unknown option: --bogus") != std::string::npos,
                "parse error should name the flag");
}

void test_mode_errors_exit_code() {
    Harness h;
    auto result = h.run({"-k", "abc"});
    expect_true(result.exit_code == 3, "missing mode should exit 3");

    result = h.run({"-e", "-d", "-k", "abc"});
    expect_true(result.exit_code == 3, "conflicting modes should exit 3");
    expect_true(result.error && result.error->kind == symcli::ErrorKind::CommandAmbiguous,
                "conflicting modes should be CommandAmbiguous");
}

void test_edit_without_file_stops_before_key_resolution() {
    Harness h;
    h.prompt.answers = {"should-not-be-read"};
    const auto result = h.run({"-t", "-s", "x", "-i"});
    expect_true(result.exit_code == 3, "edit without file should exit 3");
    expect_true(result.error && result.error->status == symcli::SymStatus::EditRequiresFile,
                "edit without file should report EditRequiresFile");
    expect_true(result.error && result.error->stage == "SelectCommand", "failure should happen at SelectCommand");
    expect_true(h.prompt.labels.empty(), "the key prompt should never run");
}

void test_missing_keyfile_before_decryption() {
    Harness h;
    const std::string data = h.dir.file("missing.enc");
    const std::string keyfile = h.dir.file("missing.key");
    const auto result = h.run({"-d", "-f", data.c_str(), "-K", keyfile.c_str()});
    expect_true(result.exit_code == 4, "missing key file should exit 4");
    expect_true(result.error && result.error->status == symcli::SymStatus::KeyFileNotFound,
                "missing key file should be KeyFileNotFound");
    expect_true(result.error && result.error->stage == "AcquireKey", "failure should happen before execution");
}

void test_no_key_specified() {
    Harness h;
    const auto result = h.run({"-e", "-s", "hello"});
    expect_true(result.exit_code == 4, "encrypt without key should exit 4");
    expect_true(result.error && result.error->status == symcli::SymStatus::NoKeySpecified,
                "encrypt without key should be NoKeySpecified");
}

void test_inline_key_plan() {
    symcli::Options options;
    std::string error;
    const std::vector<std::string> args = {"-e", "-s", "hello", "-k", "mykey"};
    symcli::OptionParser::Parse(args, symcli::Capabilities{false}, options, error);

    symcli::CommandPlan command;
    expect_true(symcli::CommandSelector::Select(options, command, error) == symcli::SymStatus::Ok,
                "encrypt plan should be selected");
    expect_true(command.kind == symcli::CommandKind::Encrypt, "command should be encrypt");
    expect_true(command.input.kind == symcli::InputKind::String && command.input.value == "hello",
                "payload should be the literal string");

    symcli::KeyPlan key_plan;
    symcli::PrivateKeyResolver::Resolve(options, command.kind, key_plan, error);
    expect_true(key_plan.source.kind == symcli::KeySourceKind::InlineString && key_plan.source.value == "mykey",
                "key should come from the inline string");
    expect_true(symcli::OutputSelector::Select(options).kind == symcli::SinkKind::Stdout, "output should be stdout");
}

void test_encrypt_then_decrypt() {
    Harness h;
    const std::string key = h.key();
    const auto encrypted = h.run({"-e", "-s", "hello", "-k", key.c_str()});
    expect_true(encrypted.exit_code == 0, "encrypt should succeed");
    const std::string ciphertext = trimmed(encrypted.out);
    expect_true(!ciphertext.empty() && ciphertext != "hello", "encrypt should print ciphertext");

    const auto decrypted = h.run({"-d", "-k", key.c_str()}, ciphertext + "\n");
    expect_true(decrypted.exit_code == 0, "decrypt from stdin should succeed");
    expect_true(decrypted.out == "hello\n", "decrypt should print the plaintext");

    const auto wrong = h.run({"-d", "-s", ciphertext.c_str(), "-k", h.key().c_str()});
    expect_true(wrong.exit_code == 1, "wrong key should exit 1");
    expect_true(wrong.error && wrong.error->status == symcli::SymStatus::AuthenticationFailed,
                "wrong key should fail authentication");
}

void test_file_input_and_output() {
    Harness h;
    const std::string key_path = h.dir.file("sym.key");
    auto result = h.run({"-g", "-o", key_path.c_str()});
    expect_true(result.exit_code == 0 && result.out.empty(), "generate to a file should print nothing");
    expect_true(trimmed(symcli_test::ReadFile(key_path)).size() == 43, "key file should hold a key");

    const std::string plain = h.dir.file("plain.txt");
    const std::string sealed = h.dir.file("plain.txt.enc");
    symcli_test::WriteFile(plain, "line one\nline two\n");
    result = h.run({"-e", "-f", plain.c_str(), "-K", key_path.c_str(), "-o", sealed.c_str()});
    expect_true(result.exit_code == 0, "encrypting a file should succeed");

    result = h.run({"-d", "-f", sealed.c_str(), "-K", key_path.c_str(), "-q"});
    expect_true(result.exit_code == 0 && result.out.empty(), "quiet decrypt should suppress the payload");

    const std::string restored = h.dir.file("restored.txt");
    result = h.run({"-q", "-d", "-f", sealed.c_str(), "-K", key_path.c_str(), "-o", restored.c_str()});
    expect_true(result.exit_code == 0, "quiet decrypt to a file should succeed");
    expect_true(symcli_test::ReadFile(restored) == "line one\nline two\n", "output should beat quiet");

    const std::string unwritable = h.dir.file("no/such/dir/out.enc");
    result = h.run({"-e", "-s", "x", "-K", key_path.c_str(), "-o", unwritable.c_str()});
    expect_true(result.exit_code == 5, "unwritable output should exit 5");
}

void test_ignored_sources_warn_unless_quiet() {
    Harness h;
    const std::string key = h.key();
    const std::string keyfile = h.dir.file("unused.key");
    auto result = h.run({"-e", "-s", "x", "-k", key.c_str(), "-K", keyfile.c_str()});
    expect_true(result.exit_code == 0, "lower-precedence source should not be an error");
    expect_true(result.err.find("[warn] --keyfile ignored: --private-key takes precedence") != std::string::npos,
                "ignored source should warn and name the winning flag");

    result = h.run({"-g", "-k", "x"});
    expect_true(result.exit_code == 0, "generate with an extra key flag should succeed");
    expect_true(result.err.find("--private-key ignored: --generate takes precedence") != std::string::npos,
                "generate should be named by its real flag");
    expect_true(result.err.find("--generated") == std::string::npos, "no made-up flag name should be printed");

    result = h.run({"-e", "-s", "x", "-k", key.c_str(), "-K", keyfile.c_str(), "-q", "-o",
                    h.dir.file("out").c_str()});
    expect_true(result.err.empty(), "quiet should silence warnings");

    result = h.run({"-e", "-s", "x", "-k", key.c_str(), "-b"});
    expect_true(result.err.find("--backup") != std::string::npos, "backup outside edit should warn");
}

void test_generate_password_protected_key() {
    Harness h;
    const std::string key_path = h.dir.file("key.enc");
    h.prompt.answers = {"long password", "long password"};
    auto result = h.run({"-g", "-p", "-o", key_path.c_str()});
    expect_true(result.exit_code == 0, "generate with password should succeed");
    expect_true(h.prompt.labels.size() == 2 && h.prompt.labels[0] == "New Password: " &&
                    h.prompt.labels[1] == "Confirm Password: ",
                "generate should ask for a password twice");
    const std::string protected_key = trimmed(symcli_test::ReadFile(key_path));
    expect_true(h.cipher.IsPasswordProtected(protected_key), "written key should be password protected");

    h.prompt.labels.clear();
    h.prompt.answers = {"long password"};
    result = h.run({"-e", "-s", "hello", "-K", key_path.c_str()});
    expect_true(result.exit_code == 0, "protected key should unlock with the right password");
    expect_true(h.prompt.labels.size() == 1 && h.prompt.labels[0] == "Password: ", "password should be prompted");
    const std::string ciphertext = trimmed(result.out);

    h.prompt.labels.clear();
    result = h.run({"-d", "-s", ciphertext.c_str(), "-K", key_path.c_str()});
    expect_true(result.exit_code == 0 && result.out == "hello\n", "cached password should be reused");
    expect_true(h.prompt.labels.empty(), "no prompt should be needed within the timeout");

    result = h.run({"-d", "-s", ciphertext.c_str(), "-K", key_path.c_str(), "-P"});
    expect_true(result.exit_code == 4, "disabled cache should prompt and abort without input");
    expect_true(h.prompt.labels.size() == 1, "disabled cache should ask for the password");

    h.prompt.answers = {"not the password"};
    result = h.run({"-d", "-s", ciphertext.c_str(), "-K", key_path.c_str(), "-P"});
    expect_true(result.error && result.error->status == symcli::SymStatus::WrongPassword,
                "wrong password should fail");
}

void test_generate_password_errors() {
    Harness h;
    h.prompt.answers = {"long password", "other password"};
    auto result = h.run({"-g", "-p"});
    expect_true(result.error && result.error->status == symcli::SymStatus::PasswordMismatch,
                "mismatched confirmation should fail");
    expect_true(result.out.empty(), "no key should be printed on failure");

    h.prompt.answers = {"short", "short"};
    result = h.run({"-g", "-p"});
    expect_true(result.error && result.error->status == symcli::SymStatus::PasswordTooShort,
                "short password should fail");
}

void test_generate_into_keychain() {
    Harness h;
    auto result = h.run({"-g", "-x", "work"});
    expect_true(result.exit_code == 0, "generate into keychain should succeed");
    expect_true(h.keychain.entries.count("work") == 1, "key should be stored under the label");
    expect_true(trimmed(result.out) == h.keychain.entries["work"], "stored key should also be printed");

    result = h.run({"-e", "-s", "from keychain", "-x", "work"});
    expect_true(result.exit_code == 0, "encrypt with a keychain key should succeed");

    result = h.run({"-e", "-s", "x", "-x", "absent"});
    expect_true(result.error && result.error->status == symcli::SymStatus::KeychainMiss,
                "unknown label should miss");
    expect_true(result.exit_code == 4, "keychain miss should exit 4");

    h.keychain.fail_writes = true;
    result = h.run({"-g", "-x", "broken"});
    expect_true(result.error && result.error->status == symcli::SymStatus::KeychainWriteFailed,
                "keychain write failure should be reported");
}

void test_trace_and_debug_rendering() {
    Harness h;
    const std::string secret = h.key();
    const auto result = h.run({"-d", "-s", "x", "-k", secret.c_str(), "-T", "-D", "-N"});
    expect_true(result.exit_code == 1, "corrupt input should exit 1");
    expect_true(result.err.find("Error: The input is not valid encrypted data") != std::string::npos,
                "error message should be printed");
    expect_true(result.err.find("stage: Execute") != std::string::npos, "trace should print the stage");
    expect_true(result.err.find("status: CorruptCiphertext") != std::string::npos, "trace should print the status");
    expect_true(result.err.find("--private-key = [redacted]") != std::string::npos,
                "debug should print redacted options");
    expect_true(result.err.find(secret) == std::string::npos, "the key must never be printed");

    const auto quiet = h.run({"-d", "-s", "x", "-k", secret.c_str(), "-q"});
    expect_true(quiet.err.find("Error:") != std::string::npos, "quiet should not hide fatal errors");
}

void test_bash_completion_is_idempotent() {
    Harness h;
    const std::string profile = h.dir.file("bash_profile");
    symcli_test::WriteFile(profile, "export PATH=/bin\n");
    auto result = h.run({"-a", profile.c_str()});
    expect_true(result.exit_code == 0, "completion should be appended");
    const std::string once = symcli_test::ReadFile(profile);
    expect_true(once.rfind("export PATH=/bin\n", 0) == 0, "existing content should be kept");
    expect_true(once.find("complete -F _sym_complete sym") != std::string::npos, "completion should be installed");

    result = h.run({"--bash-completion", profile.c_str()});
    expect_true(result.exit_code == 0, "second install should succeed");
    expect_true(symcli_test::ReadFile(profile) == once, "completion should not be appended twice");
}

void test_render_mode() {
    unsetenv("NO_COLOR");
    expect_true(symcli::RenderMode::Detect(false, true).color, "terminal output should be colored");
    expect_true(!symcli::RenderMode::Detect(true, true).color, "--no-color should disable color");
    expect_true(!symcli::RenderMode::Detect(false, false).color, "non-terminal output should not be colored");

    setenv("NO_COLOR", "1", 1);
    expect_true(!symcli::RenderMode::Detect(false, true).color, "NO_COLOR should disable color");
    unsetenv("NO_COLOR");

    const symcli::RenderMode plain;
    const symcli::RenderMode colored{true};
    expect_true(plain.Paint("x", symcli::Color::Red) == "x", "plain mode should not add codes");
    expect_true(colored.Paint("x", symcli::Color::Red) == "\033[31mx\033[0m", "colored mode should wrap text");
}

std::size_t count_edit_temp_files() {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(std::filesystem::temp_directory_path())) {
        if (entry.path().filename().string().rfind("sym-edit-", 0) == 0) {
            ++count;
        }
    }
    return count;
}

void test_edit_round_trip() {
    Harness h;
    const std::size_t temp_files_before = count_edit_temp_files();
    const std::string key = h.key();
    std::string ciphertext;
    h.cipher.Encrypt("first draft\n", key, ciphertext);
    const std::string path = h.dir.file("notes.enc");
    symcli_test::WriteFile(path, ciphertext);

    setenv("EDITOR", "true", 1);
    auto result = h.run({"-t", "-f", path.c_str(), "-k", key.c_str()});
    expect_true(result.exit_code == 0, "unchanged edit should succeed");
    expect_true(result.out == "no changes in " + path + "\n", "unchanged edit should say so");
    expect_true(symcli_test::ReadFile(path) == ciphertext, "unchanged file should not be rewritten");
    expect_true(!std::filesystem::exists(path + ".bak"), "no backup without --backup");

    const std::string script = h.dir.file("append.sh");
    symcli_test::WriteFile(script, "#!/bin/sh\nprintf 'second line\\n' >> \"$1\"\n");
    setenv("EDITOR", ("sh " + script).c_str(), 1);
    result = h.run({"-t", "-f", path.c_str(), "-k", key.c_str(), "-b"});
    expect_true(result.exit_code == 0, "changed edit should succeed");
    expect_true(result.out == "file " + path + " was saved\n", "changed edit should report the save");
    expect_true(symcli_test::ReadFile(path + ".bak") == ciphertext, "backup should hold the original ciphertext");

    std::string plaintext;
    h.cipher.Decrypt(symcli_test::ReadFile(path), key, plaintext);
    expect_true(plaintext == "first draft\nsecond line\n", "edited content should be re-encrypted");

    setenv("EDITOR", "false", 1);
    result = h.run({"-t", "-f", path.c_str(), "-k", key.c_str()});
    expect_true(result.error && result.error->status == symcli::SymStatus::EditorFailed,
                "failing editor should be reported");

    expect_true(count_edit_temp_files() == temp_files_before, "temporary plaintext should be removed");
}

}  // namespace

int main() {
    test_empty_args_print_usage();
    test_dictionary_wins_over_everything();
    test_version_and_display_precedence();
    test_help_follows_keychain_capability();
    test_parse_error_exit_code();
    test_mode_errors_exit_code();
    test_edit_without_file_stops_before_key_resolution();
    test_missing_keyfile_before_decryption();
    test_no_key_specified();
    test_inline_key_plan();
    test_encrypt_then_decrypt();
    test_file_input_and_output();
    test_ignored_sources_warn_unless_quiet();
    test_generate_password_protected_key();
    test_generate_password_errors();
    test_generate_into_keychain();
    test_trace_and_debug_rendering();
    test_bash_completion_is_idempotent();
    test_render_mode();
    test_edit_round_trip();

    if (failures == 0) {
        std::cout << "All app tests passed.\n";
        return EXIT_SUCCESS;
    }

    std::cerr << failures << " app test(s) failed.\n";
    return EXIT_FAILURE;
}
