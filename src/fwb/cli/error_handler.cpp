#include "./error_handler.hpp"

#include <fwb/build/errors.hpp>
#include <fwb/error/errors.hpp>
#include <fwb/pkg/errors.hpp>
#include <fwb/toolchain/errors.hpp>
#include <fwb/util/log.hpp>
#include <fwb/util/parse_enum.hpp>
#include <fwb/util/yaml/errors.hpp>

#include <boost/leaf/handle_errors.hpp>

#include <sstream>
#include <system_error>
#include <tuple>

using namespace fwb;

using boost::leaf::verbose_diagnostic_info;

namespace {

std::string diag_string(const verbose_diagnostic_info& diag) {
    std::ostringstream out;
    out << diag;
    return out.str();
}

void log_explanation(const error_base& exc, const verbose_diagnostic_info& diag) {
    fwb_log(error, "{}", exc.explanation());
    fwb_log(debug, "Additional diagnostic details:\n{}", diag_string(diag));
}

auto handlers = std::tuple(  //
    [](const unsatisfied_api_error&   exc,
       e_unsatisfied_apis             missing,
       const e_target_name*           tgt,
       const verbose_diagnostic_info& diag) {
        if (tgt) {
            fwb_log(error, "Resolving the packages of target [{}] failed", tgt->value);
        }
        fwb_log(error, "{}", exc.what());
        fwb_log(debug, "{} unsatisfied package/API pair(s)", missing.value.size());
        log_explanation(exc, diag);
        return 1;
    },
    [](const test_failure_error&      exc,
       e_package_name                 pkg,
       e_test_output                  output,
       const verbose_diagnostic_info& diag) {
        fwb_log(error, "Self-test of package [{}] failed", pkg.value);
        fwb_log(error, "Test output:\n{}", output.value);
        log_explanation(exc, diag);
        return 1;
    },
    [](const external_error_base&     exc,
       e_tool_command                 cmd,
       e_tool_output                  output,
       const e_package_name*          pkg,
       const verbose_diagnostic_info& diag) {
        if (pkg) {
            fwb_log(error, "While building package [{}]:", pkg->value);
        }
        fwb_log(error, "{}", exc.what());
        fwb_log(error, "Command: {}", cmd.value);
        if (!output.value.empty()) {
            fwb_log(error, "Output:\n{}", output.value);
        }
        log_explanation(exc, diag);
        return 1;
    },
    [](const user_error<errc::invalid_manifest>& exc,
       e_yaml_parse_error                        err,
       const e_manifest_path*                    path,
       const verbose_diagnostic_info&            diag) {
        if (path) {
            fwb_log(error, "Invalid YAML file [{}]: {}", path->value.string(), err.value);
        } else {
            fwb_log(error, "Invalid YAML: {}", err.value);
        }
        log_explanation(exc, diag);
        return 1;
    },
    [](const std::invalid_argument&,
       e_invalid_enum_str     given,
       e_enum_options         options,
       const e_manifest_key*  key,
       const e_manifest_path* path) {
        fwb_log(error,
                "Invalid value '{}' for setting '{}'",
                given.value,
                key ? key->value : std::string("(unknown)"));
        fwb_log(error, "  (Expected one of: {})", options.value);
        if (path) {
            fwb_log(error, "  (While reading [{}])", path->value.string());
        }
        return 1;
    },
    [](const user_error_base&         exc,
       const e_target_name*           tgt,
       const e_package_name*          pkg,
       const e_dependency_name*       dep,
       const e_manifest_key*          key,
       const e_manifest_path*         path,
       const std::error_code*         ec,
       const verbose_diagnostic_info& diag) {
        fwb_log(error, "{}", exc.what());
        if (tgt) {
            fwb_log(error, "  (While building target [{}])", tgt->value);
        }
        if (pkg) {
            fwb_log(error, "  (While processing package [{}])", pkg->value);
        }
        if (dep) {
            fwb_log(error, "  (Missing package: [{}])", dep->value);
        }
        if (key && path) {
            fwb_log(error, "  (Setting '{}' in [{}])", key->value, path->value.string());
        } else if (path) {
            fwb_log(error, "  (While reading [{}])", path->value.string());
        }
        if (ec) {
            fwb_log(error, "  (Operating system error: {})", ec->message());
        }
        log_explanation(exc, diag);
        return 1;
    },
    [](const std::system_error& exc, const verbose_diagnostic_info& diag) {
        fwb_log(critical,
                "An unhandled std::system_error arose. THIS IS AN FWB BUG! Info: {}",
                diag_string(diag));
        fwb_log(critical, "Exception message from std::system_error: {}", exc.code().message());
        return 42;
    },
    [](const std::logic_error& exc, const verbose_diagnostic_info& diag) {
        fwb_log(critical, "Internal error: {}", exc.what());
        fwb_log(critical, "THIS IS AN FWB BUG! Info: {}", diag_string(diag));
        return 42;
    },
    [](const verbose_diagnostic_info& diag) {
        fwb_log(critical,
                "An unhandled error arose. THIS IS AN FWB BUG! Info: {}",
                diag_string(diag));
        return 42;
    });

}  // namespace

int fwb::handle_build_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
