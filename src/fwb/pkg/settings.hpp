#pragma once

#include <fwb/util/fs/path.hpp>

#include <yaml-cpp/node/node.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fwb {

/**
 * The set of features enabled in a build. A feature is enabled if it maps to `true`.
 */
using feature_set = std::map<std::string, bool>;

/**
 * A single blacklist/whitelist rule: packages whose full name matches `pattern` are (or are not)
 * permitted to see `feature`.
 */
struct feature_filter_entry {
    std::string pattern;
    std::string feature;

    friend bool operator==(const feature_filter_entry&, const feature_filter_entry&) = default;
};

/**
 * Read-only view of one YAML manifest with flat, dotted keys (e.g. `pkg.cflags`).
 *
 * Any key may be refined for a feature by appending `.<FEATURE>`: `pkg.deps.TEST` contributes only
 * when `TEST` is enabled in the feature set given to the accessor.
 */
class settings {
    YAML::Node _root;
    fs::path   _source;

public:
    settings() = default;
    settings(YAML::Node root, fs::path source)
        : _root(std::move(root))
        , _source(std::move(source)) {}

    static settings from_file(path_ref fpath);
    static settings from_string(std::string_view content, path_ref source);

    path_ref source_path() const noexcept { return _source; }

    bool has(std::string_view key) const;

    /**
     * Get the list value of `key`, followed by the value of `key.<F>` for each enabled feature F
     * in name order. Scalar strings are split on whitespace.
     */
    std::vector<std::string> string_seq(std::string_view   key,
                                        const feature_set& features = {}) const;

    /**
     * Get the scalar value of `key`. An enabled feature's `key.<F>` replaces the base value; the
     * last such feature in name order wins.
     */
    std::optional<std::string> string(std::string_view key, const feature_set& features = {}) const;

    /**
     * Read a mapping of package-name patterns to feature names, preserving document order.
     */
    std::vector<feature_filter_entry> filter_entries(std::string_view key) const;
};

}  // namespace fwb
