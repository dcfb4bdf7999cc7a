#include "symcli/secure_delete.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <cryptopp/misc.h>
#include <cryptopp/osrng.h>

namespace symcli {

namespace {

bool FlushToDisk(std::FILE* file) {
    return file != nullptr && fsync(fileno(file)) == 0;
}

bool TruncateToZero(std::FILE* file) {
    return file != nullptr && ftruncate(fileno(file), 0) == 0;
}

std::string RandomHexName(CryptoPP::AutoSeededRandomPool& rng, const std::size_t bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string name;
    name.reserve(bytes * 2);
    for (std::size_t i = 0; i < bytes; ++i) {
        std::uint8_t value = 0;
        rng.GenerateBlock(&value, 1);
        name.push_back(kHex[(value >> 4U) & 0x0FU]);
        name.push_back(kHex[value & 0x0FU]);
    }
    return name;
}

// Zeros, then ones, then random bytes for every further pass.
void FillPass(std::uint8_t* out, const std::size_t length, const std::size_t pass, CryptoPP::AutoSeededRandomPool& rng) {
    switch (pass) {
        case 0:
            std::fill_n(out, length, static_cast<std::uint8_t>(0x00U));
            break;
        case 1:
            std::fill_n(out, length, static_cast<std::uint8_t>(0xFFU));
            break;
        default:
            rng.GenerateBlock(out, length);
            break;
    }
}

}  // namespace

SymStatus SecureDelete::DeleteFile(const std::string& path, const SecureDeleteOptions& options) {
    if (options.passes == 0 || options.buffer_size == 0) {
        return SymStatus::UnknownOp;
    }

    const std::filesystem::path target(path);
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(target, ec);
    if (ec || !std::filesystem::is_regular_file(status)) {
        return SymStatus::FileIOError;
    }

    const std::uintmax_t file_size = std::filesystem::file_size(target, ec);
    if (ec) {
        return SymStatus::FileIOError;
    }

    // Seed before the file is opened.
    std::unique_ptr<CryptoPP::AutoSeededRandomPool> rng;
    try {
        rng = std::make_unique<CryptoPP::AutoSeededRandomPool>();
    } catch (const CryptoPP::Exception&) {
        return SymStatus::MissingRngBytes;
    }

    std::FILE* file = std::fopen(path.c_str(), "r+b");
    if (file == nullptr) {
        return SymStatus::FileIOError;
    }

    std::vector<std::uint8_t> buffer(options.buffer_size, 0U);
    auto fail_and_close = [&](const SymStatus error) -> SymStatus {
        CryptoPP::memset_z(buffer.data(), 0, buffer.size());
        std::fclose(file);
        return error;
    };

    for (std::size_t pass = 0; pass < options.passes; ++pass) {
        if (std::fseek(file, 0, SEEK_SET) != 0) {
            return fail_and_close(SymStatus::FileIOError);
        }

        std::uintmax_t remaining = file_size;
        while (remaining > 0) {
            const std::size_t chunk =
                remaining > buffer.size() ? buffer.size() : static_cast<std::size_t>(remaining);
            FillPass(buffer.data(), chunk, pass, *rng);
            if (std::fwrite(buffer.data(), 1, chunk, file) != chunk) {
                return fail_and_close(SymStatus::FileIOError);
            }
            remaining -= chunk;
        }

        if (std::fflush(file) != 0 || !FlushToDisk(file)) {
            return fail_and_close(SymStatus::FileIOError);
        }
    }

    if (!TruncateToZero(file) || std::fflush(file) != 0 || !FlushToDisk(file)) {
        return fail_and_close(SymStatus::FileIOError);
    }
    CryptoPP::memset_z(buffer.data(), 0, buffer.size());
    if (std::fclose(file) != 0) {
        return SymStatus::FileIOError;
    }

    std::filesystem::path current = target;
    const std::filesystem::path renamed = current.parent_path() / RandomHexName(*rng, 16);
    std::filesystem::rename(current, renamed, ec);
    if (!ec) {
        current = renamed;
    }
    std::filesystem::remove(current, ec);
    return ec ? SymStatus::FileIOError : SymStatus::Ok;
}

}  // namespace symcli
