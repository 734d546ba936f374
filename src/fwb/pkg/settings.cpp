#include "./settings.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/error/on_error.hpp>
#include <fwb/util/yaml/errors.hpp>
#include <fwb/util/yaml/parse.hpp>

#include <boost/leaf/exception.hpp>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/yaml.h>

#include <sstream>

using namespace fwb;

namespace {

YAML::Node lookup(const YAML::Node& root, std::string_view key) {
    if (!root.IsMap()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    return root[std::string(key)];
}

std::string scalar_of(const YAML::Node& node, std::string_view key, path_ref source) {
    try {
        return node.as<std::string>();
    } catch (const YAML::BadConversion& exc) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_manifest>(
                                       "Expected a string value for '{}' in [{}]",
                                       key,
                                       source.string()),
                                   e_manifest_key{std::string(key)},
                                   e_manifest_path{source});
    }
}

void append_values(std::vector<std::string>& out,
                   const YAML::Node&         node,
                   std::string_view          key,
                   path_ref                  source) {
    if (!node || node.IsNull()) {
        return;
    }
    if (node.IsSequence()) {
        for (const auto& elem : node) {
            out.push_back(scalar_of(elem, key, source));
        }
        return;
    }
    if (node.IsScalar()) {
        std::istringstream words{node.Scalar()};
        std::string        word;
        while (words >> word) {
            out.push_back(word);
        }
        return;
    }
    BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_manifest>(
                                   "Expected a list or string for '{}' in [{}]",
                                   key,
                                   source.string()),
                               e_manifest_key{std::string(key)},
                               e_manifest_path{source});
}

}  // namespace

settings settings::from_file(path_ref fpath) { return settings{parse_yaml_file(fpath), fpath}; }

settings settings::from_string(std::string_view content, path_ref source) {
    FWB_E_SCOPE(e_manifest_path{source});
    return settings{parse_yaml_string(content), source};
}

bool settings::has(std::string_view key) const {
    auto node = lookup(_root, key);
    return node.IsDefined() && !node.IsNull();
}

std::vector<std::string> settings::string_seq(std::string_view key,
                                              const feature_set& features) const {
    std::vector<std::string> ret;
    append_values(ret, lookup(_root, key), key, _source);
    for (auto& [feature, enabled] : features) {
        if (!enabled) {
            continue;
        }
        auto gated_key = std::string(key) + "." + feature;
        append_values(ret, lookup(_root, gated_key), gated_key, _source);
    }
    return ret;
}

std::optional<std::string> settings::string(std::string_view key,
                                            const feature_set& features) const {
    std::optional<std::string> ret;
    auto                       node = lookup(_root, key);
    if (node.IsDefined() && !node.IsNull()) {
        ret = scalar_of(node, key, _source);
    }
    for (auto& [feature, enabled] : features) {
        if (!enabled) {
            continue;
        }
        auto gated_key = std::string(key) + "." + feature;
        auto gated     = lookup(_root, gated_key);
        if (gated.IsDefined() && !gated.IsNull()) {
            ret = scalar_of(gated, gated_key, _source);
        }
    }
    return ret;
}

std::vector<feature_filter_entry> settings::filter_entries(std::string_view key) const {
    std::vector<feature_filter_entry> ret;
    auto                              node = lookup(_root, key);
    if (!node.IsDefined() || node.IsNull()) {
        return ret;
    }
    if (!node.IsMap()) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_manifest>(
                                       "Expected a mapping of package patterns to features for "
                                       "'{}' in [{}]",
                                       key,
                                       _source.string()),
                                   e_manifest_key{std::string(key)},
                                   e_manifest_path{_source});
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        ret.push_back(feature_filter_entry{scalar_of(it->first, key, _source),
                                           scalar_of(it->second, key, _source)});
    }
    return ret;
}
