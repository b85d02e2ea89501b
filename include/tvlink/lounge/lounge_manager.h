#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "tvlink/config/tvlink_config.h"
#include "tvlink/core/cancel_token.h"
#include "tvlink/core/result.h"
#include "tvlink/lounge/credential_store.h"
#include "tvlink/lounge/lounge_events.h"
#include "tvlink/lounge/lounge_protocol.h"
#include "tvlink/lounge/lounge_session.h"
#include "tvlink/net/http_client.h"

namespace tvlink::lounge {

// Backoff before the next poll after `consecutiveErrors` failures in a row:
// base * 2^(consecutiveErrors - 1).
std::chrono::milliseconds poll_retry_delay(std::chrono::milliseconds base,
                                           std::uint32_t consecutiveErrors);

/**
 * Registry of lounge sessions keyed by an opaque caller key.
 *
 * Each connected session owns a background worker that long-polls the
 * server, tracks the event id and detects dead channels. All public methods
 * are safe to call from any thread; none of them holds the registry lock
 * while talking to the network.
 */
class LoungeManager {
public:
    LoungeManager(net::IHttpClient& http,
                  ICredentialStore& store,
                  config::LoungeConfig cfg = {});
    ~LoungeManager();

    LoungeManager(const LoungeManager&) = delete;
    LoungeManager& operator=(const LoungeManager&) = delete;

    // Exchange a TV pairing code for credentials, persist them, bind a
    // channel and start polling. Any existing session for `key` is torn down.
    Result pair(const std::string& key, const std::string& pairingCode);

    // Stop polling, forget the session and its persisted credentials.
    void disconnect(const std::string& key);

    // Bind a fresh channel using in-memory credentials, or persisted ones
    // when there is no usable session (e.g. after a restart).
    Result reconnect(const std::string& key);

    LoungeStatusInfo status(const std::string& key) const;

    // No-ops returning success when the session is missing or not connected.
    Result send_add_video(const std::string& key, const std::string& videoId);
    Result send_play_now(const std::string& key, const std::string& videoId);

    bool is_connected(const std::string& key) const;

    LoungeEventStream& events() { return _events; }

    // Cancel every worker and wait for them to exit. Idempotent; later
    // operations still work but no new workers are started.
    void shutdown();

private:
    using SessionPtr = std::shared_ptr<LoungeSession>;
    using TokenPtr = std::shared_ptr<core::CancelToken>;

    struct Worker {
        TokenPtr cancel;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    Result fetch_screen(const std::string& pairingCode, ScreenCredentials& out);
    Result bind(const SessionPtr& s, std::uint32_t attempt);
    Result go_live(const std::string& key, const SessionPtr& s, std::uint32_t attempt);
    void   fail(const std::string& key, const SessionPtr& s, std::uint32_t attempt,
                const std::string& message);
    Result send_command(const std::string& key, LoungeCommand cmd, const std::string& videoId);

    void start_worker(const std::string& key, const SessionPtr& s, const TokenPtr& cancel);
    void poll_loop(const std::string& key, SessionPtr s, TokenPtr cancel);
    void reap_workers_locked();

    // Registry helpers; caller holds _mutex.
    bool is_current_locked(const std::string& key, const SessionPtr& s,
                           std::uint32_t attempt) const;
    static void stop_worker_locked(LoungeSession& s);
    // Returns the new attempt number; any bind already in flight is superseded.
    static std::uint32_t reset_for_bind_locked(LoungeSession& s);

    void publish(const std::string& key, LoungeStatus st,
                 const std::string& screenName, const std::string& errorMessage);

    net::IHttpClient&    _http;
    ICredentialStore&    _store;
    config::LoungeConfig _cfg;
    ClientIdentity       _who;

    mutable std::mutex _mutex;
    std::unordered_map<std::string, SessionPtr> _sessions;

    // Pairs a registry change with the matching credential store write.
    // Lock order: _storeMutex before _mutex.
    std::mutex _storeMutex;

    std::mutex          _workersMutex;
    std::vector<Worker> _workers;
    bool                _shuttingDown{false};

    LoungeEventStream _events;
};

} // namespace tvlink::lounge
