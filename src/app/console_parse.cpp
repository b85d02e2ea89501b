#include "tvlink/console/console_parse.h"

namespace tvlink::console {

namespace {
constexpr std::string_view WS = " \t\r\n\v\f";
}

std::string_view trim_ws(std::string_view s)
{
    const std::size_t first = s.find_first_not_of(WS);
    if (first == std::string_view::npos) {
        return {};
    }
    const std::size_t last = s.find_last_not_of(WS);
    return s.substr(first, last - first + 1);
}

std::vector<std::string_view> split_ws(std::string_view s)
{
    std::vector<std::string_view> out;
    std::size_t pos = s.find_first_not_of(WS);
    while (pos != std::string_view::npos) {
        const std::size_t end = s.find_first_of(WS, pos);
        out.push_back(s.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos));
        pos = s.find_first_not_of(WS, end);
    }
    return out;
}

} // namespace tvlink::console
