#pragma once

/**
 * GNU-style dependency tracking: the compiler is run with `-MMD -MF <obj>.d`, which writes a
 * Makefile fragment naming every file read while producing the object. On the next build an object
 * is stale if any of those inputs (or any extra dependency registered with the compiler) has a
 * modification time newer than the object itself.
 */

#include <fwb/util/fs/path.hpp>

#include <string_view>
#include <vector>

namespace fwb {

/**
 * The mode in which we can scan for compilation dependencies.
 */
enum class file_deps_mode {
    /// Disable dependency tracking
    none,
    /// Track dependencies using GNU-style generated-Makefile semantics
    gnu,
};

/**
 * The result of parsing a dependency listing.
 */
struct file_deps_info {
    /// The primary output path
    fs::path output;
    /// The paths to each input
    std::vector<fs::path> inputs;
};

/**
 * Parse a compiler-generated Makefile that contains dependency information.
 * @see `parse_mkfile_deps_str`
 */
file_deps_info parse_mkfile_deps_file(path_ref where);

/**
 * Parse a Makefile-syntax string containing compiler-generated dependency information. An
 * unparseable listing is logged and yields an empty result.
 */
file_deps_info parse_mkfile_deps_str(std::string_view str);

/**
 * Determine which of `inputs` are newer than `output`. A missing input counts as newer. If
 * `output` does not exist, every input is returned.
 */
std::vector<fs::path> newer_inputs(path_ref output, const std::vector<fs::path>& inputs);

}  // namespace fwb
