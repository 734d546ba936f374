#include "./path.hpp"

#include <string>

using namespace fwb;

fs::path fwb::shortest_path_from(path_ref file, path_ref base) noexcept {
    auto relative = file.lexically_normal().lexically_proximate(base);
    auto abs      = file.lexically_normal();
    if (relative.string().size() > abs.string().size()) {
        return abs;
    } else {
        return relative;
    }
}

std::string fwb::name_basename(std::string_view name) noexcept {
    while (!name.empty() && name.back() == '/') {
        name.remove_suffix(1);
    }
    auto slash = name.rfind('/');
    if (slash == name.npos) {
        return std::string(name);
    }
    return std::string(name.substr(slash + 1));
}
