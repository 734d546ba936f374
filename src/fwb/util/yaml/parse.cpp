#include "./parse.hpp"

#include "./errors.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/error/on_error.hpp>
#include <fwb/util/fs/io.hpp>

#include <boost/leaf/exception.hpp>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/parse.h>

#include <string>

using namespace fwb;

YAML::Node fwb::parse_yaml_file(const std::filesystem::path& fpath) {
    FWB_E_SCOPE(e_manifest_path{fpath});
    auto content = fwb::read_file(fpath);
    return parse_yaml_string(content);
}

YAML::Node fwb::parse_yaml_string(std::string_view sv) {
    try {
        return YAML::Load(std::string(sv));
    } catch (YAML::Exception const& exc) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_manifest>("Invalid YAML: {}",
                                                                           exc.what()),
                                   e_yaml_parse_error{exc.what()});
    }
}
