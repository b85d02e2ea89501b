#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "tvlink/core/result.h"
#include "tvlink/lounge/lounge_types.h"
#include "tvlink/net/http_client.h"

namespace tvlink::lounge {

inline constexpr const char* DEFAULT_BASE_URL = "https://www.youtube.com/api/lounge";
inline constexpr const char* DEFAULT_CLIENT_NAME = "tvlink";

// Who we are and where the vendor endpoint lives.
struct ClientIdentity {
    std::string baseUrl{DEFAULT_BASE_URL};
    std::string clientName{DEFAULT_CLIENT_NAME};
};

enum class LoungeCommand : std::uint8_t {
    AddVideo,   // append to the TV queue
    SetVideo,   // play immediately
};

// Wire name sent as req0__sc.
const char* command_name(LoungeCommand cmd);

// Per-channel counters sent with commands and polls.
struct ChannelCounters {
    std::uint32_t rid{0};   // request id of *this* request
    std::uint32_t aid{0};   // last event id seen
    std::uint32_t ofs{0};   // commands already sent on this channel
};

// ---------------------------------------------------------------------------
// Request builders. Pure; timeouts and cancellation are set by the caller.
// ---------------------------------------------------------------------------

// GET {base}/pairing/get_screen?pairing_code=<code>
net::HttpRequest build_pairing_request(const ClientIdentity& who, std::string_view pairingCode);

// POST {base}/bc/bind?device=REMOTE_CONTROL&...&RID=<rid>, body "count=0"
net::HttpRequest build_bind_request(const ClientIdentity& who,
                                    const ScreenCredentials& creds,
                                    std::uint32_t rid);

// POST {base}/bc/bind?...&SID&AID[&gsessionid], body count=1&ofs&req0__sc&req0_videoId[...]
net::HttpRequest build_command_request(const ClientIdentity& who,
                                       const ScreenCredentials& creds,
                                       const ChannelIds& channel,
                                       const ChannelCounters& counters,
                                       LoungeCommand cmd,
                                       std::string_view videoId);

// GET {base}/bc/bind?...&CI=0&TYPE=xmlhttp&RID=rpc&SID&AID[&gsessionid]
net::HttpRequest build_poll_request(const ClientIdentity& who,
                                    const ScreenCredentials& creds,
                                    const ChannelIds& channel,
                                    std::uint32_t aid);

// ---------------------------------------------------------------------------
// Response parsers. Pure; never throw.
// ---------------------------------------------------------------------------

// JSON {"screen":{"screenId","loungeToken","screenName"}}.
// screenId and loungeToken are required; on failure `error` says why.
StatusCode parse_pairing_response(std::string_view body,
                                  ScreenCredentials& out,
                                  std::string& error);

// Finds ["c","<SID>", and ["S","<gsessionid>"] in a bind response.
// ProtocolError when the SID is missing; gsessionid is optional.
StatusCode parse_bind_response(std::string_view body, ChannelIds& out);

// Highest leading integer of any event tuple ([<id>, [...]]) in a chunked
// long-poll response. Returns false when no event id could be found.
bool parse_poll_event_id(std::string_view body, std::uint32_t& maxId);

} // namespace tvlink::lounge
