#include "tvlink/net/form_encoding.h"

namespace tvlink::net {

namespace {

bool is_unreserved(unsigned char c)
{
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

} // namespace

std::string url_escape(std::string_view s)
{
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out.push_back(ch);
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

std::string form_encode(const FormParams& params)
{
    std::string out;
    for (const auto& kv : params) {
        if (!out.empty()) {
            out.push_back('&');
        }
        out.append(url_escape(kv.first));
        out.push_back('=');
        out.append(url_escape(kv.second));
    }
    return out;
}

void form_set(FormParams& params, std::string key, std::string value)
{
    for (auto& kv : params) {
        if (kv.first == key) {
            kv.second = std::move(value);
            return;
        }
    }
    params.emplace_back(std::move(key), std::move(value));
}

} // namespace tvlink::net
