#include "symcli/private_key_resolver.hpp"
#include "symcli/sym_cipher.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        ++failures;
    }
}

symcli::KeyPlan resolve(const symcli::Options& options, symcli::CommandKind command, symcli::SymStatus& status) {
    symcli::KeyPlan plan;
    std::string error;
    status = symcli::PrivateKeyResolver::Resolve(options, command, plan, error);
    return plan;
}

symcli::Options all_sources() {
    symcli::Options options;
    options.interactive = true;
    options.private_key = "inline";
    options.keyfile = "key.txt";
    options.keychain = "work";
    return options;
}

void test_precedence_order() {
    symcli::SymStatus status = symcli::SymStatus::Ok;
    symcli::Options options = all_sources();

    auto plan = resolve(options, symcli::CommandKind::Encrypt, status);
    expect_true(status == symcli::SymStatus::Ok, "resolution with all sources should succeed");
    expect_true(plan.source.kind == symcli::KeySourceKind::Interactive, "interactive should beat other sources");
    expect_true(plan.source_flag == "--interactive", "winning flag should be recorded");
    expect_true(plan.ignored_flags.size() == 3, "three lower sources should be ignored");

    options.interactive = false;
    plan = resolve(options, symcli::CommandKind::Encrypt, status);
    expect_true(plan.source.kind == symcli::KeySourceKind::InlineString && plan.source.value == "inline",
                "private-key should beat keyfile and keychain");
    expect_true(plan.ignored_flags.size() == 2 && plan.ignored_flags[0] == "--keyfile" &&
                    plan.ignored_flags[1] == "--keychain",
                "ignored flags should follow precedence order");

    options.private_key.reset();
    plan = resolve(options, symcli::CommandKind::Decrypt, status);
    expect_true(plan.source.kind == symcli::KeySourceKind::KeyFile && plan.source.value == "key.txt",
                "keyfile should beat keychain");

    options.keyfile.reset();
    plan = resolve(options, symcli::CommandKind::Decrypt, status);
    expect_true(plan.source.kind == symcli::KeySourceKind::Keychain && plan.source.value == "work",
                "keychain should be used last");
    expect_true(plan.ignored_flags.empty(), "single source should ignore nothing");
}

void test_resolution_is_deterministic() {
    const symcli::Options options = all_sources();
    symcli::SymStatus status = symcli::SymStatus::Ok;
    const auto first = resolve(options, symcli::CommandKind::Encrypt, status);
    const auto second = resolve(options, symcli::CommandKind::Encrypt, status);
    expect_true(first.source == second.source && first.ignored_flags == second.ignored_flags,
                "the same options should always resolve the same way");
}

void test_no_key_specified() {
    symcli::Options options;
    options.encrypt = true;
    symcli::SymStatus status = symcli::SymStatus::Ok;
    resolve(options, symcli::CommandKind::Encrypt, status);
    expect_true(status == symcli::SymStatus::NoKeySpecified, "missing key should fail");
    expect_true(symcli::KindOf(status) == symcli::ErrorKind::KeyResolutionError,
                "missing key should be a KeyResolutionError");
}

void test_generate_uses_keychain_as_store_label() {
    symcli::Options options;
    options.generate = true;
    options.keychain = "fresh";
    options.password = true;
    options.password_timeout = 10;
    options.no_password_cache = true;
    symcli::SymStatus status = symcli::SymStatus::Ok;
    const auto plan = resolve(options, symcli::CommandKind::Generate, status);
    expect_true(status == symcli::SymStatus::Ok, "generate should resolve");
    expect_true(plan.source.kind == symcli::KeySourceKind::Generated, "generate should produce a generated key");
    expect_true(plan.source_flag == "--generate", "generate should be recorded by its flag name");
    expect_true(plan.store_label == std::optional<std::string>("fresh"), "keychain label should become the store");
    expect_true(plan.ignored_flags.empty(), "keychain should not be counted as an ignored source for generate");
    expect_true(plan.password_protect, "password flag should be carried");
    expect_true(plan.cache_timeout == std::chrono::seconds(10), "timeout should be carried");
    expect_true(!plan.cache_enabled, "cache switch should be carried");
}

void test_acquire_inline_trims() {
    symcli::KeyPlan plan;
    plan.source = {symcli::KeySourceKind::InlineString, "  abc \n"};
    const symcli::SymCipher cipher{};
    symcli_test::ScriptedPrompt prompt;
    std::string key;
    std::string error;
    const auto status = symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, key, error);
    expect_true(status == symcli::SymStatus::Ok && key == "abc", "inline key should be trimmed");
}

void test_acquire_keyfile() {
    symcli_test::TempDir dir;
    const symcli::SymCipher cipher{};
    symcli_test::ScriptedPrompt prompt;
    symcli::KeyPlan plan;
    std::string key;
    std::string error;

    plan.source = {symcli::KeySourceKind::KeyFile, dir.file("missing.key")};
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, key, error) ==
                    symcli::SymStatus::KeyFileNotFound,
                "missing key file should fail");

    plan.source = {symcli::KeySourceKind::KeyFile, dir.path().string()};
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, key, error) ==
                    symcli::SymStatus::KeyFileUnreadable,
                "directory as key file should be unreadable");

    const std::string path = dir.file("good.key");
    symcli_test::WriteFile(path, "filekey\n");
    plan.source = {symcli::KeySourceKind::KeyFile, path};
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, key, error) ==
                    symcli::SymStatus::Ok,
                "readable key file should succeed");
    expect_true(key == "filekey", "key file content should be trimmed");

    const std::string empty = dir.file("empty.key");
    symcli_test::WriteFile(empty, "");
    plan.source = {symcli::KeySourceKind::KeyFile, empty};
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, key, error) ==
                    symcli::SymStatus::InvalidKey,
                "empty key file should be an invalid key");
}

void test_acquire_keychain() {
    const symcli::SymCipher cipher{};
    symcli_test::ScriptedPrompt prompt;
    symcli_test::FakeKeychain keychain;
    keychain.entries["work"] = "stored";
    symcli::KeyPlan plan;
    std::string key;
    std::string error;

    plan.source = {symcli::KeySourceKind::Keychain, "work"};
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, &keychain, prompt}, key, error) ==
                    symcli::SymStatus::Ok && key == "stored",
                "keychain hit should return the stored key");

    plan.source = {symcli::KeySourceKind::Keychain, "other"};
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, &keychain, prompt}, key, error) ==
                    symcli::SymStatus::KeychainMiss,
                "keychain miss should fail");
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, key, error) ==
                    symcli::SymStatus::KeychainUnavailable,
                "no keychain backend should fail");
}

void test_acquire_interactive() {
    const symcli::SymCipher cipher{};
    symcli_test::ScriptedPrompt prompt;
    prompt.answers = {"typed-key"};
    symcli::KeyPlan plan;
    plan.source = {symcli::KeySourceKind::Interactive, ""};
    std::string key;
    std::string error;
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, key, error) ==
                    symcli::SymStatus::Ok && key == "typed-key",
                "interactive key should be read from the prompt");
    expect_true(prompt.labels.size() == 1 && prompt.labels[0] == "Private Key: ", "prompt label should match");

    prompt.answers = {"   "};
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, key, error) ==
                    symcli::SymStatus::InteractiveAborted,
                "blank interactive key should abort");
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, key, error) ==
                    symcli::SymStatus::InteractiveAborted,
                "EOF should abort");
}

void test_acquire_generated() {
    const symcli::SymCipher cipher{};
    symcli_test::ScriptedPrompt prompt;
    symcli::KeyPlan plan;
    plan.source = {symcli::KeySourceKind::Generated, ""};
    std::string first;
    std::string second;
    std::string error;
    expect_true(symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, first, error) ==
                    symcli::SymStatus::Ok,
                "key generation should succeed");
    symcli::PrivateKeyResolver::Acquire(plan, {cipher, nullptr, prompt}, second, error);
    expect_true(!first.empty() && first != second, "generated keys should be fresh");
}

}  // namespace

int main() {
    test_precedence_order();
    test_resolution_is_deterministic();
    test_no_key_specified();
    test_generate_uses_keychain_as_store_label();
    test_acquire_inline_trims();
    test_acquire_keyfile();
    test_acquire_keychain();
    test_acquire_interactive();
    test_acquire_generated();

    if (failures == 0) {
        std::cout << "All private key resolver tests passed.\n";
        return EXIT_SUCCESS;
    }

    std::cerr << failures << " private key resolver test(s) failed.\n";
    return EXIT_FAILURE;
}
