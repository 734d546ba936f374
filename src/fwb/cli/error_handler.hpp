#pragma once

#include <functional>

namespace fwb {

/**
 * Run `fn` and return its result. Any error escaping it is logged with the context attached to it,
 * and converted to an exit code: 1 for problems in the project or reported by its tools, 42 for
 * anything unexpected (a bug in fwb).
 */
int handle_build_errors(std::function<int()> fn) noexcept;

}  // namespace fwb
