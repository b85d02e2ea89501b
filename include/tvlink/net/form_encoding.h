#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tvlink::net {

// Ordered key/value list; encoded in insertion order.
using FormParams = std::vector<std::pair<std::string, std::string>>;

// application/x-www-form-urlencoded escaping of a single component.
// Unreserved characters (A-Z a-z 0-9 - _ . ~) pass through, space becomes '+',
// everything else is %XX (upper-case hex).
std::string url_escape(std::string_view s);

// "k1=v1&k2=v2" with both sides escaped.
std::string form_encode(const FormParams& params);

// Set or replace the value for `key`, keeping the original position.
void form_set(FormParams& params, std::string key, std::string value);

} // namespace tvlink::net
