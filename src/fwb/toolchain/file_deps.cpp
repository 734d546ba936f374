#include "./file_deps.hpp"

#include <fwb/util/fs/io.hpp>
#include <fwb/util/log.hpp>
#include <fwb/util/shlex.hpp>
#include <fwb/util/string.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>

using namespace fwb;

file_deps_info fwb::parse_mkfile_deps_file(path_ref where) {
    auto content = fwb::read_file(where);
    return parse_mkfile_deps_str(content);
}

file_deps_info fwb::parse_mkfile_deps_str(std::string_view str) {
    file_deps_info ret;

    // Remove escaped newlines
    auto no_newlines = replace(str, "\\\n", " ");

    auto split = split_shell_string(no_newlines);
    auto iter  = split.begin();
    auto stop  = split.end();
    if (iter == stop) {
        fwb_log(error, "Invalid deps listing. Shell split was empty.");
        return ret;
    }
    auto& head = *iter;
    ++iter;
    if (!ends_with(head, ":")) {
        fwb_log(error, "Invalid deps listing. Leader item [{}] is not colon-terminated.", head);
        return ret;
    }
    ret.output = head.substr(0, head.length() - 1);
    ret.inputs.insert(ret.inputs.end(), iter, stop);
    return ret;
}

std::vector<fs::path> fwb::newer_inputs(path_ref output, const std::vector<fs::path>& inputs) {
    std::error_code ec;
    auto            out_time = fs::last_write_time(output, ec);
    if (ec) {
        return inputs;
    }
    return inputs  //
        | ranges::views::filter([&](path_ref input) {
               std::error_code in_ec;
               auto            in_time = fs::last_write_time(input, in_ec);
               // A vanished input must be regenerated or diagnosed by the compiler
               return in_ec || in_time > out_time;
           })
        | ranges::to_vector;
}
