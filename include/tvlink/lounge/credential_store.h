#pragma once

#include <string>

#include "tvlink/lounge/lounge_types.h"

namespace tvlink::lounge {

// Durable per-key storage of the pairing credentials, so a restarted process
// can Reconnect without a new pairing code. Implementations must be safe to
// call from several threads.
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    // Write all three fields together. Returns false if persisting failed.
    virtual bool save(const std::string& key, const ScreenCredentials& creds) = 0;

    // Forget all three fields. Returns false if persisting failed.
    virtual bool clear(const std::string& key) = 0;

    // Returns true only when screenId and loungeToken are both present.
    virtual bool load(const std::string& key, ScreenCredentials& out) = 0;
};

} // namespace tvlink::lounge
