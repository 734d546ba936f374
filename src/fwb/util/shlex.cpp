#include "./shlex.hpp"

#include <optional>
#include <string>
#include <utility>

using std::string;
using std::vector;

using namespace fwb;

vector<string> fwb::split_shell_string(std::string_view shell) {
    char cur_quote  = 0;
    bool is_escaped = false;

    vector<string> acc;

    auto       iter = shell.begin();
    const auto end  = shell.end();

    std::optional<string> token;
    while (iter != end) {
        const char c = *iter++;
        if (is_escaped) {
            if (c == '\n') {
                // Line continuation
            } else if (cur_quote || c != cur_quote || c == '\\') {
                token = token.value_or("") + c;
            } else {
                token = token.value_or("") + '\\' + c;
            }
            is_escaped = false;
        } else if (c == '\\') {
            is_escaped = true;
        } else if (cur_quote) {
            if (c == cur_quote) {
                cur_quote = 0;
            } else {
                token = token.value_or("") + c;
            }
        } else if (c == '"' || c == '\'') {
            cur_quote = c;
            token     = token.value_or("");
        } else if (c == '\t' || c == ' ' || c == '\n' || c == '\r' || c == '\f') {
            if (token.has_value()) {
                acc.push_back(std::move(*token));
            }
            token.reset();
        } else {
            token = token.value_or("") + c;
        }
    }

    if (token.has_value()) {
        acc.push_back(std::move(*token));
    }

    return acc;
}
