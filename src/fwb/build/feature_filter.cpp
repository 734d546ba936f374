#include "./feature_filter.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/util/log.hpp>

using namespace fwb;

void feature_filter::append(const std::vector<feature_filter_entry>& entries) {
    for (auto& e : entries) {
        try {
            _entries.push_back(entry{e.pattern, std::regex(e.pattern), e.feature});
        } catch (const std::regex_error& err) {
            throw_user_error<errc::configuration_error>(
                "Invalid package pattern '{}' for feature '{}': {}",
                e.pattern,
                e.feature,
                err.what());
        }
    }
}

bool feature_filter::match_feature(std::string_view package_name,
                                   std::string_view feature) const {
    for (auto& e : _entries) {
        if (e.feature != feature) {
            continue;
        }
        bool found = false;
        try {
            found = std::regex_search(package_name.begin(), package_name.end(), e.pattern);
        } catch (const std::regex_error& err) {
            // libstdc++ may give up on patterns that are too complex to match
            throw_user_error<errc::configuration_error>(
                "Matching package [{}] against pattern '{}' for feature '{}' failed: {}",
                package_name,
                e.pattern_str,
                e.feature,
                err.what());
        }
        if (found) {
            fwb_log(trace,
                    "Feature '{}' of [{}] matched by pattern '{}'",
                    feature,
                    package_name,
                    e.pattern_str);
            return true;
        }
    }
    return false;
}

bool fwb::is_feature_valid(const feature_filter& blacklist,
                           const feature_filter& whitelist,
                           std::string_view      package_name,
                           std::string_view      feature) {
    if (!blacklist.match_feature(package_name, feature)) {
        return true;
    }
    return whitelist.match_feature(package_name, feature);
}
