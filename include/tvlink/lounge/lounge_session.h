#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "tvlink/core/cancel_token.h"
#include "tvlink/lounge/lounge_types.h"

namespace tvlink::lounge {

// Live state for one paired screen. Owned by LoungeManager and shared with
// the poll worker; every field except sendMutex is guarded by the manager's
// registry mutex.
struct LoungeSession {
    LoungeStatus      status{LoungeStatus::Connecting};
    ScreenCredentials creds;
    ChannelIds        channel;

    std::uint32_t rid{0};   // last request id used; only ever increases for this record
    std::uint32_t aid{0};   // highest event id observed on the current channel
    std::uint32_t ofs{0};   // commands delivered on the current channel

    // Bumped each time a bind starts; only the latest attempt may go live.
    std::uint32_t attempt{0};

    std::string errorMessage;
    std::chrono::steady_clock::time_point lastActivity{std::chrono::steady_clock::now()};

    // Token of the running poll worker; null when none.
    std::shared_ptr<core::CancelToken> cancel;

    // Held for the whole of a command send so two senders never share an ofs.
    // Lock order: sendMutex before the registry mutex.
    std::mutex sendMutex;
};

} // namespace tvlink::lounge
