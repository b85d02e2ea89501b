#pragma once

#include <cstdint>
#include <string>

namespace tvlink::lounge {

// Connection state of one paired screen.
//
//   Connecting -> Connected -> Error
//        |                  \-> Disconnected (explicit Disconnect only)
//        \-> Error
//
// Nothing leaves Error automatically; Reconnect goes back to Connecting.
enum class LoungeStatus : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Error,
};

// "connected", "disconnected", ... as reported to callers.
const char* to_string(LoungeStatus st);

// Durable credentials returned by the pairing endpoint.
struct ScreenCredentials {
    std::string screenId;
    std::string loungeToken;
    std::string screenName;   // display only; may be empty

    bool complete() const { return !screenId.empty() && !loungeToken.empty(); }
};

// Identifiers assigned by the server when a channel is bound.
struct ChannelIds {
    std::string sid;          // mandatory
    std::string gsessionId;   // optional; omitted from requests when empty
};

// Snapshot returned by LoungeManager::status().
struct LoungeStatusInfo {
    LoungeStatus status{LoungeStatus::Disconnected};
    std::string  screenName;
    std::string  errorMessage;   // only set when status == Error
};

} // namespace tvlink::lounge
