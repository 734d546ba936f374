#pragma once

#include "./path.hpp"

#include <ostream>

namespace fwb {

struct e_remove_file {
    fs::path value;

    friend std::ostream& operator<<(std::ostream& out, const e_remove_file& self) noexcept {
        out << "e_remove_file: [" << self.value.string() << "]";
        return out;
    }
};

struct e_create_directory {
    fs::path value;

    friend std::ostream& operator<<(std::ostream& out, const e_create_directory& self) noexcept {
        out << "e_create_directory: [" << self.value.string() << "]";
        return out;
    }
};

/**
 * @brief Recursively delete the named file/directory.
 *
 * If the file does not exist, no error occurs. Any other failure throws a
 * `user_error<errc::filesystem_error>` carrying the OS error code.
 */
void ensure_absent(path_ref path);

/**
 * @brief Create the named directory and all of its parents, if absent.
 *
 * Failure throws a `user_error<errc::filesystem_error>` carrying the OS error code.
 */
void ensure_directory(path_ref path);

}  // namespace fwb
