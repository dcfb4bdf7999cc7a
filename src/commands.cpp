#include "symcli/commands.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "symcli/crypto_engine.hpp"
#include "symcli/secure_delete.hpp"

namespace symcli {

namespace {

ExecutionResult Failure(const SymStatus status, std::string message, std::string detail = {}) {
    ExecutionResult result;
    result.status = status;
    result.has_payload = false;
    result.message = std::move(message);
    result.detail = std::move(detail);
    return result;
}

SymStatus ReadWholeFile(const std::string& path, std::string& out_data, std::string& out_error) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        out_error = "File " + path + " does not exist";
        return SymStatus::FileIOError;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        out_error = "File " + path + " could not be opened";
        return SymStatus::FileIOError;
    }
    out_data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        CryptoEngine::SecureWipeString(out_data);
        out_error = "File " + path + " could not be read";
        return SymStatus::FileIOError;
    }
    return SymStatus::Ok;
}

SymStatus WriteWholeFile(const std::string& path, const std::string& data, std::string& out_error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        out_error = "File " + path + " could not be opened for writing";
        return SymStatus::FileIOError;
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        out_error = "File " + path + " could not be written";
        return SymStatus::FileIOError;
    }
    return SymStatus::Ok;
}

SymStatus ReadInput(const ExecutionContext& context, std::string& out_data, std::string& out_error) {
    const InputSource& input = context.command.input;
    switch (input.kind) {
        case InputKind::String:
            out_data = input.value;
            return SymStatus::Ok;
        case InputKind::File:
            context.log.Info("reading input from " + input.value);
            return ReadWholeFile(input.value, out_data, out_error);
        case InputKind::Stdin:
            context.log.Info("reading input from standard input");
            out_data.assign(std::istreambuf_iterator<char>(context.in), std::istreambuf_iterator<char>());
            if (context.in.bad()) {
                out_error = "Standard input could not be read";
                return SymStatus::FileIOError;
            }
            return SymStatus::Ok;
    }
    out_error = "Unknown input source";
    return SymStatus::UnknownOp;
}

std::string DescribeCryptoFailure(const SymStatus status) {
    switch (status) {
        case SymStatus::InvalidKey:
            return "The private key is not valid";
        case SymStatus::CorruptCiphertext:
            return "The input is not valid encrypted data";
        case SymStatus::AuthenticationFailed:
            return "Decryption failed: the data was not encrypted with this key or was modified";
        case SymStatus::MissingRngBytes:
            return "The random number generator could not be seeded";
        default:
            return "Cryptographic operation failed";
    }
}

SymStatus MakeTempFile(std::string& out_path, std::string& out_error) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    std::string pattern = (dir / "sym-edit-XXXXXX").string();
    const int fd = mkstemp(pattern.data());
    if (fd < 0) {
        out_error = "Unable to create a temporary file in " + dir.string();
        return SymStatus::FileIOError;
    }
    close(fd);
    out_path = pattern;
    return SymStatus::Ok;
}

// Runs ${EDITOR:-vi} on path through the shell and waits for it.
SymStatus RunEditor(const std::string& path, std::string& out_error) {
    const pid_t pid = fork();
    if (pid < 0) {
        out_error = "Unable to start the editor";
        return SymStatus::EditorFailed;
    }
    if (pid == 0) {
        execl("/bin/sh", "sh", "-c", "exec ${EDITOR:-vi} \"$1\"", "sh", path.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    int wait_status = 0;
    while (waitpid(pid, &wait_status, 0) < 0) {
        if (errno != EINTR) {
            out_error = "Lost track of the editor process";
            return SymStatus::EditorFailed;
        }
    }
    if (!WIFEXITED(wait_status) || WEXITSTATUS(wait_status) != 0) {
        out_error = "The editor exited with an error";
        return SymStatus::EditorFailed;
    }
    return SymStatus::Ok;
}

ExecutionResult RunGenerate(const ExecutionContext& context, const std::string& key) {
    std::string final_key = key;
    if (context.key_plan.password_protect) {
        std::string password;
        std::string confirmation;
        SymStatus status = context.prompt.PromptSecret("New Password: ", password);
        if (status == SymStatus::Ok) {
            status = context.prompt.PromptSecret("Confirm Password: ", confirmation);
        }
        if (status != SymStatus::Ok) {
            CryptoEngine::SecureWipeString(password);
            return Failure(status, "No password was entered");
        }
        if (password != confirmation) {
            CryptoEngine::SecureWipeString(password);
            CryptoEngine::SecureWipeString(confirmation);
            return Failure(SymStatus::PasswordMismatch, "The passwords do not match");
        }
        CryptoEngine::SecureWipeString(confirmation);

        std::string protected_key;
        status = context.crypto.ProtectKey(key, password, protected_key);
        CryptoEngine::SecureWipeString(password);
        if (status == SymStatus::PasswordTooShort) {
            return Failure(status, "The password must be at least 7 characters long");
        }
        if (status != SymStatus::Ok) {
            return Failure(status, "Unable to protect the key with a password", std::string(ToString(status)));
        }
        context.log.Info("key protected with a password");
        final_key = std::move(protected_key);
    }

    if (context.key_plan.store_label.has_value()) {
        const std::string& label = *context.key_plan.store_label;
        if (context.keychain == nullptr) {
            return Failure(SymStatus::KeychainUnavailable, "The OS keychain is not available on this system");
        }
        const SymStatus status = context.keychain->Write(label, final_key);
        if (status != SymStatus::Ok) {
            return Failure(status, "Unable to store the key in the keychain under '" + label + "'");
        }
        context.log.Info("key stored in the keychain as " + label);
    }

    ExecutionResult result;
    result.payload = std::move(final_key);
    return result;
}

ExecutionResult RunEncrypt(const ExecutionContext& context, const std::string& key) {
    std::string error;
    std::string plaintext;
    SymStatus status = ReadInput(context, plaintext, error);
    if (status != SymStatus::Ok) {
        return Failure(status, error);
    }

    ExecutionResult result;
    status = context.crypto.Encrypt(plaintext, key, result.payload);
    CryptoEngine::SecureWipeString(plaintext);
    if (status != SymStatus::Ok) {
        return Failure(status, DescribeCryptoFailure(status), std::string(ToString(status)));
    }
    return result;
}

ExecutionResult RunDecrypt(const ExecutionContext& context, const std::string& key) {
    std::string error;
    std::string ciphertext;
    SymStatus status = ReadInput(context, ciphertext, error);
    if (status != SymStatus::Ok) {
        return Failure(status, error);
    }

    ExecutionResult result;
    status = context.crypto.Decrypt(ciphertext, key, result.payload);
    if (status != SymStatus::Ok) {
        return Failure(status, DescribeCryptoFailure(status), std::string(ToString(status)));
    }
    return result;
}

ExecutionResult RunEdit(const ExecutionContext& context, const std::string& key) {
    const std::string& path = context.command.input.value;
    std::string error;
    std::string original;
    SymStatus status = ReadWholeFile(path, original, error);
    if (status != SymStatus::Ok) {
        return Failure(status, error);
    }

    std::string plaintext;
    status = context.crypto.Decrypt(original, key, plaintext);
    if (status != SymStatus::Ok) {
        return Failure(status, DescribeCryptoFailure(status), std::string(ToString(status)));
    }

    if (context.command.backup) {
        const std::string backup_path = path + ".bak";
        status = WriteWholeFile(backup_path, original, error);
        if (status != SymStatus::Ok) {
            CryptoEngine::SecureWipeString(plaintext);
            return Failure(status, "Unable to create backup " + backup_path, error);
        }
        context.log.Info("backup written to " + backup_path);
    }

    std::string temp_path;
    status = MakeTempFile(temp_path, error);
    if (status != SymStatus::Ok) {
        CryptoEngine::SecureWipeString(plaintext);
        return Failure(status, error);
    }

    status = WriteWholeFile(temp_path, plaintext, error);
    std::string edited;
    if (status == SymStatus::Ok) {
        context.log.Debug("editing " + temp_path);
        status = RunEditor(temp_path, error);
    }
    if (status == SymStatus::Ok) {
        status = ReadWholeFile(temp_path, edited, error);
    }

    const SymStatus delete_status = SecureDelete::DeleteFile(temp_path);
    if (delete_status != SymStatus::Ok) {
        context.log.Warn("unable to securely delete " + temp_path);
    }
    if (status != SymStatus::Ok) {
        CryptoEngine::SecureWipeString(plaintext);
        CryptoEngine::SecureWipeString(edited);
        return Failure(status, error);
    }

    ExecutionResult result;
    result.has_payload = false;
    if (edited == plaintext) {
        CryptoEngine::SecureWipeString(plaintext);
        CryptoEngine::SecureWipeString(edited);
        result.message = "no changes in " + path;
        return result;
    }
    CryptoEngine::SecureWipeString(plaintext);

    std::string ciphertext;
    status = context.crypto.Encrypt(edited, key, ciphertext);
    CryptoEngine::SecureWipeString(edited);
    if (status != SymStatus::Ok) {
        return Failure(status, DescribeCryptoFailure(status), std::string(ToString(status)));
    }
    status = WriteWholeFile(path, ciphertext, error);
    if (status != SymStatus::Ok) {
        return Failure(status, error);
    }
    result.message = "file " + path + " was saved";
    return result;
}

}  // namespace

SymStatus CommandRunner::UnlockKey(
    const ExecutionContext& context,
    const std::string& key,
    std::string& out_key,
    std::string& out_error) {
    if (!context.crypto.IsPasswordProtected(key)) {
        out_key = key;
        return SymStatus::Ok;
    }

    std::string password;
    if (context.password_cache.Lookup(key, password)) {
        const SymStatus status = context.crypto.UnlockKey(key, password, out_key);
        CryptoEngine::SecureWipeString(password);
        if (status == SymStatus::Ok) {
            context.log.Debug("key unlocked with a cached password");
            return SymStatus::Ok;
        }
        if (status != SymStatus::WrongPassword) {
            out_error = "The private key is not valid";
            return status;
        }
        context.log.Info("cached password no longer matches; forgetting it");
        context.password_cache.Forget(key);
    }

    SymStatus status = context.prompt.PromptSecret("Password: ", password);
    if (status != SymStatus::Ok) {
        out_error = "No password was entered";
        return status;
    }
    status = context.crypto.UnlockKey(key, password, out_key);
    if (status != SymStatus::Ok) {
        CryptoEngine::SecureWipeString(password);
        out_error = status == SymStatus::WrongPassword ? "Invalid password" : "The private key is not valid";
        return status;
    }

    if (context.password_cache.enabled()) {
        if (context.password_cache.Store(key, password) != SymStatus::Ok) {
            context.log.Warn("unable to cache the password");
        } else {
            context.log.Debug("password cached");
        }
    }
    CryptoEngine::SecureWipeString(password);
    return SymStatus::Ok;
}

ExecutionResult CommandRunner::Execute(const ExecutionContext& context, const std::string& key) {
    context.log.Info("running " + std::string(ToString(context.command.kind)));
    if (context.command.kind == CommandKind::Generate) {
        return RunGenerate(context, key);
    }

    std::string usable_key;
    std::string error;
    const SymStatus status = UnlockKey(context, key, usable_key, error);
    if (status != SymStatus::Ok) {
        return Failure(status, error);
    }

    ExecutionResult result;
    switch (context.command.kind) {
        case CommandKind::Encrypt:
            result = RunEncrypt(context, usable_key);
            break;
        case CommandKind::Decrypt:
            result = RunDecrypt(context, usable_key);
            break;
        case CommandKind::Edit:
            result = RunEdit(context, usable_key);
            break;
        case CommandKind::Generate:
            break;
    }
    CryptoEngine::SecureWipeString(usable_key);
    return result;
}

}  // namespace symcli
