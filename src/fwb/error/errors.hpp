#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace fwb {

enum class errc {
    none = 0,
    configuration_error,
    unsatisfied_api,
    filesystem_error,
    compile_failure,
    archive_failure,
    link_failure,
    test_failure,
    invalid_manifest,
};

std::string_view explanation_of(errc) noexcept;

struct exception_base : std::runtime_error {
    using runtime_error::runtime_error;
};

struct error_base : exception_base {
    using exception_base::exception_base;

    virtual errc     get_errc() const noexcept = 0;
    std::string_view explanation() const noexcept { return explanation_of(get_errc()); }
};

/**
 * Errors caused by the user's project: manifests, targets, failing tests.
 */
struct user_error_base : error_base {
    using error_base::error_base;
};

/**
 * Errors reported by an external tool (compiler, archiver, linker).
 */
struct external_error_base : error_base {
    using error_base::error_base;
};

template <errc ErrorCode>
struct user_error : user_error_base {
    using user_error_base::user_error_base;
    errc get_errc() const noexcept override { return ErrorCode; }
};

template <errc ErrorCode>
struct external_error : external_error_base {
    using external_error_base::external_error_base;
    errc get_errc() const noexcept override { return ErrorCode; }
};

using configuration_error   = user_error<errc::configuration_error>;
using unsatisfied_api_error = user_error<errc::unsatisfied_api>;
using filesystem_error      = user_error<errc::filesystem_error>;
using test_failure_error    = user_error<errc::test_failure>;
using compile_error         = external_error<errc::compile_failure>;
using archive_error         = external_error<errc::archive_failure>;
using link_error            = external_error<errc::link_failure>;

template <errc ErrorCode, typename... Args>
auto make_user_error(fmt::format_string<Args...> fmt_str, Args&&... args) {
    return user_error<ErrorCode>(fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <errc ErrorCode, typename... Args>
[[noreturn]] void throw_user_error(fmt::format_string<Args...> fmt_str, Args&&... args) {
    throw user_error<ErrorCode>(fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <errc ErrorCode, typename... Args>
auto make_external_error(fmt::format_string<Args...> fmt_str, Args&&... args) {
    return external_error<ErrorCode>(fmt::format(fmt_str, std::forward<Args>(args)...));
}

}  // namespace fwb
