#pragma once

#include <fwb/pkg/settings.hpp>

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace fwb {

/**
 * An ordered list of (package pattern, feature) rules, as given by `pkg.feature_blacklist` and
 * `pkg.feature_whitelist`.
 */
class feature_filter {
    struct entry {
        std::string pattern_str;
        std::regex  pattern;
        std::string feature;
    };

    std::vector<entry> _entries;

public:
    /**
     * Append rules to the end of the list. A pattern that is not a valid regular expression is a
     * `configuration_error`.
     */
    void append(const std::vector<feature_filter_entry>& entries);

    bool        empty() const noexcept { return _entries.empty(); }
    std::size_t size() const noexcept { return _entries.size(); }

    /**
     * Whether any rule names `feature` with a pattern found in `package_name`. A pattern that
     * cannot be matched is a `configuration_error`.
     */
    bool match_feature(std::string_view package_name, std::string_view feature) const;
};

/**
 * A feature is valid for a package unless it is blacklisted for it and not also whitelisted.
 */
bool is_feature_valid(const feature_filter& blacklist,
                      const feature_filter& whitelist,
                      std::string_view      package_name,
                      std::string_view      feature);

}  // namespace fwb
