#ifndef _WIN32
#include "./temp.hpp"

#include <fwb/util/log.hpp>

#include <stdlib.h>

#include <cerrno>
#include <system_error>

using namespace fwb;

temporary_dir temporary_dir::create_in(path_ref parent) {
    auto file = (parent / "fwb-tmp-XXXXXX").string();

    const char* tempdir_path = ::mkdtemp(file.data());
    if (tempdir_path == nullptr) {
        throw std::system_error(std::error_code(errno, std::system_category()),
                                "Failed to create a temporary directory");
    }
    auto path = fs::path(tempdir_path);
    fwb_log(trace, "Created temporary directory [{}]", path.string());
    return temporary_dir(std::make_shared<impl>(std::move(path)));
}

temporary_dir::impl::~impl() {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        fwb_log(warn, "Failed to remove temporary directory [{}]: {}", path.string(), ec.message());
    }
}
#endif
