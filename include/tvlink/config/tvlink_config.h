#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "tvlink/lounge/lounge_protocol.h"

namespace tvlink::config {

struct LoungeConfig {
    std::string baseUrl{lounge::DEFAULT_BASE_URL};
    std::string clientName{lounge::DEFAULT_CLIENT_NAME};   // shown on the TV

    std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};
    std::chrono::milliseconds pollTimeout{std::chrono::minutes(3)};
    std::chrono::milliseconds inactivityTimeout{std::chrono::minutes(30)};

    std::uint32_t             maxPollRetries{3};
    std::chrono::milliseconds retryBaseDelay{std::chrono::seconds(2)};
};

struct CredentialsConfig {
    std::string file{"lounge_credentials.yaml"};   // relative to the data directory
};

struct LogConfig {
    std::string level{"info"};   // error, warn, info, debug, verbose
};

// Unified config for the whole tvlink instance.
struct TvlinkConfig {
    LoungeConfig      lounge;
    CredentialsConfig credentials;
    LogConfig         log;
};

// Abstract storage interface.
class TvlinkConfigStore {
public:
    virtual ~TvlinkConfigStore() = default;

    virtual TvlinkConfig load() = 0;
    virtual void         save(const TvlinkConfig& cfg) = 0;
};

} // namespace tvlink::config
