#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fwb {

inline namespace string_utils {

inline bool ends_with(std::string_view s, std::string_view key) {
    auto found = s.rfind(key);
    return found != s.npos && found == s.size() - key.size();
}

inline bool starts_with(std::string_view s, std::string_view key) { return s.find(key) == 0; }

inline std::string replace(std::string_view str, std::string_view key, std::string_view repl) {
    std::string                 ret;
    std::string_view::size_type pos      = 0;
    std::string_view::size_type prev_pos = 0;
    while (pos = str.find(key, pos), pos != key.npos) {
        ret.append(str.begin() + prev_pos, str.begin() + pos);
        ret.append(repl);
        prev_pos = pos += key.size();
    }
    ret.append(str.begin() + prev_pos, str.end());
    return ret;
}

template <typename Range>
std::string joinstr(std::string_view joiner, Range&& rng) {
    std::string ret;
    bool        first = true;
    for (auto&& item : rng) {
        if (!first) {
            ret.append(joiner);
        }
        first = false;
        ret.append(std::string_view(item));
    }
    return ret;
}

}  // namespace string_utils

}  // namespace fwb
