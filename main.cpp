#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "symcli/app.hpp"
#include "symcli/keychain.hpp"
#include "symcli/options.hpp"
#include "symcli/password_cache.hpp"
#include "symcli/secret_prompt.hpp"
#include "symcli/sym_cipher.hpp"

namespace {

int RunCliMain(const int argc, char* argv[]) {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0U);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    const symcli::SymCipher cipher{};
    const std::unique_ptr<symcli::IKeychain> keychain = symcli::CreateSystemKeychain();
    symcli::TerminalPrompt prompt(std::cin, std::cerr, STDIN_FILENO);

    symcli::AppServices services{
        cipher,
        keychain.get(),
        prompt,
        std::cin,
        std::cout,
        std::cerr,
        symcli::Capabilities::Detect(),
        symcli::PasswordCache::DefaultDirectory(),
        isatty(STDOUT_FILENO) == 1,
        isatty(STDERR_FILENO) == 1,
    };
    symcli::SymApp app(std::move(services));
    return app.Run(std::move(args));
}

}  // namespace

int main(const int argc, char* argv[]) {
    return RunCliMain(argc, argv);
}
