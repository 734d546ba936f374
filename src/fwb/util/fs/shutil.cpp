#include "./shutil.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/error/on_error.hpp>
#include <fwb/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <system_error>

using namespace fwb;

void fwb::ensure_absent(path_ref path) {
    FWB_E_SCOPE(e_remove_file{path});
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::filesystem_error>(
                                       "Failed to remove [{}]: {}",
                                       path.string(),
                                       ec.message()),
                                   ec);
    }
    fwb_log(trace, "Removed [{}]", path.string());
}

void fwb::ensure_directory(path_ref path) {
    FWB_E_SCOPE(e_create_directory{path});
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::filesystem_error>(
                                       "Failed to create directory [{}]: {}",
                                       path.string(),
                                       ec.message()),
                                   ec);
    }
}
