#include "tvlink/lounge/lounge_protocol.h"

#include "tvlink/net/form_encoding.h"

#include <cctype>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "cJSON.h"

namespace tvlink::lounge {

namespace {

static constexpr std::string_view SID_MARKER = "[\"c\",\"";
static constexpr std::string_view GSESSION_MARKER = "[\"S\",\"";

std::string endpoint(const ClientIdentity& who, std::string_view path)
{
    std::string url = who.baseUrl;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url.append(path.data(), path.size());
    return url;
}

// Query parameters every /bc/bind request starts with.
net::FormParams bind_base_params(const ClientIdentity& who, const ScreenCredentials& creds)
{
    return net::FormParams{
        {"device",        "REMOTE_CONTROL"},
        {"name",          who.clientName},
        {"id",            creds.screenId},
        {"loungeIdToken", creds.loungeToken},
        {"VER",           "8"},
    };
}

void add_channel_params(net::FormParams& q, const ChannelIds& channel, std::uint32_t aid)
{
    q.emplace_back("SID", channel.sid);
    q.emplace_back("AID", std::to_string(aid));
    if (!channel.gsessionId.empty()) {
        q.emplace_back("gsessionid", channel.gsessionId);
    }
}

net::HttpRequest form_post(std::string url, std::string body)
{
    net::HttpRequest req;
    req.method = net::HttpMethod::Post;
    req.url = std::move(url);
    req.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
    req.body = std::move(body);
    return req;
}

// Value between `marker` and the next '"'. Empty if absent or empty.
std::string quoted_after(std::string_view text, std::string_view marker)
{
    const std::size_t at = text.find(marker);
    if (at == std::string_view::npos) {
        return {};
    }
    const std::size_t start = at + marker.size();
    const std::size_t end = text.find('"', start);
    if (end == std::string_view::npos) {
        return {};
    }
    return std::string(text.substr(start, end - start));
}

std::size_t skip_ws(std::string_view s, std::size_t i)
{
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
        ++i;
    }
    return i;
}

// Parse an unsigned integer at s[i]; it must be followed (after whitespace)
// by ',' or ']' to count as the leading element of a tuple.
bool leading_uint(std::string_view s, std::size_t i, std::uint32_t& out)
{
    i = skip_ws(s, i);
    std::uint64_t v = 0;
    std::size_t digits = 0;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
        v = v * 10 + static_cast<std::uint64_t>(s[i] - '0');
        if (v > std::numeric_limits<std::uint32_t>::max()) {
            return false;
        }
        ++digits;
        ++i;
    }
    if (digits == 0) {
        return false;
    }
    i = skip_ws(s, i);
    if (i >= s.size() || (s[i] != ',' && s[i] != ']')) {
        return false;
    }
    out = static_cast<std::uint32_t>(v);
    return true;
}

struct JsonDeleter {
    void operator()(cJSON* p) const { cJSON_Delete(p); }
};
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

const char* json_string(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        return nullptr;
    }
    return item->valuestring;
}

} // namespace

const char* command_name(LoungeCommand cmd)
{
    switch (cmd) {
    case LoungeCommand::AddVideo: return "addVideo";
    case LoungeCommand::SetVideo: return "setVideo";
    }
    return "addVideo";
}

const char* to_string(LoungeStatus st)
{
    switch (st) {
    case LoungeStatus::Disconnected: return "disconnected";
    case LoungeStatus::Connecting:   return "connecting";
    case LoungeStatus::Connected:    return "connected";
    case LoungeStatus::Error:        return "error";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

net::HttpRequest build_pairing_request(const ClientIdentity& who, std::string_view pairingCode)
{
    net::HttpRequest req;
    req.method = net::HttpMethod::Get;
    req.url = endpoint(who, "/pairing/get_screen") + "?" +
              net::form_encode({{"pairing_code", std::string(pairingCode)}});
    return req;
}

net::HttpRequest build_bind_request(const ClientIdentity& who,
                                    const ScreenCredentials& creds,
                                    std::uint32_t rid)
{
    net::FormParams q = bind_base_params(who, creds);
    q.emplace_back("RID", std::to_string(rid));

    return form_post(endpoint(who, "/bc/bind") + "?" + net::form_encode(q), "count=0");
}

net::HttpRequest build_command_request(const ClientIdentity& who,
                                       const ScreenCredentials& creds,
                                       const ChannelIds& channel,
                                       const ChannelCounters& counters,
                                       LoungeCommand cmd,
                                       std::string_view videoId)
{
    net::FormParams q = bind_base_params(who, creds);
    q.emplace_back("RID", std::to_string(counters.rid));
    add_channel_params(q, channel, counters.aid);

    net::FormParams form{
        {"count",        "1"},
        {"ofs",          std::to_string(counters.ofs)},
        {"req0__sc",     command_name(cmd)},
        {"req0_videoId", std::string(videoId)},
    };
    if (cmd == LoungeCommand::SetVideo) {
        net::form_set(form, "req0_currentTime", "0");
    }

    return form_post(endpoint(who, "/bc/bind") + "?" + net::form_encode(q), net::form_encode(form));
}

net::HttpRequest build_poll_request(const ClientIdentity& who,
                                    const ScreenCredentials& creds,
                                    const ChannelIds& channel,
                                    std::uint32_t aid)
{
    net::FormParams q = bind_base_params(who, creds);
    add_channel_params(q, channel, aid);
    q.emplace_back("CI", "0");
    q.emplace_back("TYPE", "xmlhttp");
    q.emplace_back("RID", "rpc");

    net::HttpRequest req;
    req.method = net::HttpMethod::Get;
    req.url = endpoint(who, "/bc/bind") + "?" + net::form_encode(q);
    return req;
}

// ---------------------------------------------------------------------------
// Parsers
// ---------------------------------------------------------------------------

StatusCode parse_pairing_response(std::string_view body,
                                  ScreenCredentials& out,
                                  std::string& error)
{
    error.clear();

    JsonPtr root(cJSON_ParseWithLength(body.data(), body.size()));
    if (!root) {
        error = "failed to parse pairing response: malformed JSON";
        return StatusCode::ProtocolError;
    }

    const cJSON* screen = cJSON_GetObjectItemCaseSensitive(root.get(), "screen");
    if (!cJSON_IsObject(screen)) {
        error = "invalid pairing response: missing screen object";
        return StatusCode::ProtocolError;
    }

    const char* screenId = json_string(screen, "screenId");
    const char* loungeToken = json_string(screen, "loungeToken");
    if (!screenId || !loungeToken || *screenId == '\0' || *loungeToken == '\0') {
        error = "invalid pairing response: missing screenId or loungeToken";
        return StatusCode::ProtocolError;
    }

    const char* screenName = json_string(screen, "screenName");

    out.screenId = screenId;
    out.loungeToken = loungeToken;
    out.screenName = screenName ? screenName : "";
    return StatusCode::Ok;
}

StatusCode parse_bind_response(std::string_view body, ChannelIds& out)
{
    std::string sid = quoted_after(body, SID_MARKER);
    if (sid.empty()) {
        return StatusCode::ProtocolError;
    }

    out.sid = std::move(sid);
    out.gsessionId = quoted_after(body, GSESSION_MARKER);
    return StatusCode::Ok;
}

bool parse_poll_event_id(std::string_view body, std::uint32_t& maxId)
{
    // The body is a sequence of "<length>\n<json array>" chunks. Each array
    // holds event tuples [<id>, [<name>, ...]]; those tuples sit at depth 2.
    // Bracket depth is tracked across lines and string literals are skipped,
    // so brackets inside event payloads never produce candidates.
    int depth = 0;
    bool inString = false;
    bool escaped = false;
    bool found = false;
    std::uint32_t best = 0;

    for (std::size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];

        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }

        if (c == '"') {
            inString = true;
        } else if (c == '[') {
            ++depth;
            std::uint32_t id = 0;
            if (depth == 2 && leading_uint(body, i + 1, id)) {
                if (!found || id > best) {
                    best = id;
                }
                found = true;
            }
        } else if (c == ']') {
            if (depth > 0) {
                --depth;
            }
        }
    }

    if (found) {
        maxId = best;
    }
    return found;
}

} // namespace tvlink::lounge
