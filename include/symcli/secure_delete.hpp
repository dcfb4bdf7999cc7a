#pragma once

#include <cstddef>
#include <string>

#include "symcli/sym_status.hpp"

namespace symcli {

struct SecureDeleteOptions {
    std::size_t passes = 3;
    std::size_t buffer_size = 64 * 1024;
};

class SecureDelete {
public:
    // Overwrites, truncates, renames and removes a regular file.
    static SymStatus DeleteFile(const std::string& path, const SecureDeleteOptions& options = {});
};

}  // namespace symcli
