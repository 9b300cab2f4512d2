#pragma once

#include <string_view>
#include <vector>

namespace fonalink::console {

std::string_view trim_ws(std::string_view s);

// Split a command line on ASCII whitespace. A token starting with '"' runs
// to the next '"' (or end of line) and is returned without the quotes, so
// `sms.send 123 "two words"` yields three tokens.
std::vector<std::string_view> split_args(std::string_view s);

} // namespace fonalink::console
