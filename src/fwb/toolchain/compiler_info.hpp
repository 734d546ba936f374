#pragma once

#include <fwb/util/fs/path.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fwb {

/**
 * Flags and search paths contributed to a compile by one package (or by the base of the build).
 *
 * All categories are additive except `linker_script`, which is replaced when a merged-in info
 * sets it.
 */
struct compiler_info {
    std::vector<fs::path>    includes;
    std::vector<std::string> cflags;
    std::vector<std::string> lflags;
    std::vector<std::string> aflags;
    std::vector<std::string> ignore_dirs;
    std::vector<std::string> ignore_files;
    std::optional<fs::path>  linker_script;

    void merge(const compiler_info& other);

    friend bool operator==(const compiler_info&, const compiler_info&) = default;
};

}  // namespace fwb
