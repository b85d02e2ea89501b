#pragma once

#include <string_view>
#include <vector>

namespace tvlink::console {

// Whitespace is ASCII space, tab, CR, LF, VT and FF.
std::string_view trim_ws(std::string_view s);

// Tokens separated by runs of whitespace; views into `s`.
std::vector<std::string_view> split_ws(std::string_view s);

} // namespace tvlink::console
