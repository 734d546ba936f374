#pragma once

#include <fwb/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>
#include <magic_enum.hpp>
#include <range/v3/view/transform.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace fwb {

template <typename E>
struct e_invalid_enum {
    std::string value;
};

struct e_invalid_enum_str {
    std::string value;
};

struct e_enum_options {
    std::string value;
};

template <typename E>
constexpr auto parse_enum_str = [](std::string_view sv) {
    auto e = magic_enum::enum_cast<E>(sv);
    if (e.has_value()) {
        return *e;
    }

    BOOST_LEAF_THROW_EXCEPTION(  //
        std::invalid_argument(
            fmt::format("Invalid {} value: \"{}\"", magic_enum::enum_type_name<E>(), sv)),
        e_invalid_enum<E>{std::string(magic_enum::enum_type_name<E>())},
        e_invalid_enum_str{std::string(sv)},
        [&] {
            auto names = magic_enum::enum_names<E>();
            return e_enum_options{fwb::joinstr(", ", names | ranges::views::transform([](auto n) {
                                                         return std::string{"\""} + std::string(n)
                                                             + "\"";
                                                     }))};
        });
};

}  // namespace fwb
