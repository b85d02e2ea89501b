#include "tvlink/lounge/lounge_manager.h"

#include "tvlink/core/logging.h"

#include <algorithm>
#include <string>
#include <utility>

namespace tvlink::lounge {

static constexpr const char* TAG = "lounge";

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t MAX_BODY_IN_MESSAGE = 200;
constexpr std::uint32_t MAX_BACKOFF_SHIFT = 16;

// Server bodies end up in user-visible messages: one line, bounded length.
std::string brief(const std::string& body)
{
    std::string out = body.substr(0, MAX_BODY_IN_MESSAGE);
    std::replace(out.begin(), out.end(), '\n', ' ');
    std::replace(out.begin(), out.end(), '\r', ' ');
    if (body.size() > MAX_BODY_IN_MESSAGE) {
        out += "...";
    }
    return out;
}

std::string http_failure(const char* what, const net::HttpResponse& resp)
{
    return std::string(what) + " failed with status " +
           std::to_string(resp.httpStatus) + ": " + brief(resp.body);
}

std::string transport_failure(const char* what, StatusCode st, const net::HttpResponse& resp)
{
    std::string msg = std::string(what) + " request failed: ";
    msg += resp.error.empty() ? to_string(st) : resp.error;
    return msg;
}

Result superseded_result()
{
    return Result::error(StatusCode::Cancelled, "session was replaced while connecting");
}

} // namespace

std::chrono::milliseconds poll_retry_delay(std::chrono::milliseconds base,
                                           std::uint32_t consecutiveErrors)
{
    if (consecutiveErrors == 0) {
        return std::chrono::milliseconds(0);
    }
    const std::uint32_t shift = std::min(consecutiveErrors - 1, MAX_BACKOFF_SHIFT);
    return base * (static_cast<std::int64_t>(1) << shift);
}

LoungeManager::LoungeManager(net::IHttpClient& http,
                             ICredentialStore& store,
                             config::LoungeConfig cfg)
    : _http(http)
    , _store(store)
    , _cfg(std::move(cfg))
{
    _who.baseUrl = _cfg.baseUrl;
    _who.clientName = _cfg.clientName;
    if (_cfg.maxPollRetries == 0) {
        _cfg.maxPollRetries = 1;
    }
}

LoungeManager::~LoungeManager()
{
    shutdown();
}

// ---------------------------------------------------------------------------
// Public surface
// ---------------------------------------------------------------------------

Result LoungeManager::pair(const std::string& key, const std::string& pairingCode)
{
    if (pairingCode.empty()) {
        return Result::error(StatusCode::InvalidRequest, "pairing code is required");
    }

    TL_LOGI(TAG, "[%s] pairing started", key.c_str());

    auto s = std::make_shared<LoungeSession>();
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _sessions.find(key);
        if (it != _sessions.end()) {
            stop_worker_locked(*it->second);
            it->second->status = LoungeStatus::Disconnected;
            it->second = s;
        } else {
            _sessions.emplace(key, s);
        }
    }
    publish(key, LoungeStatus::Connecting, "", "");

    ScreenCredentials creds;
    Result r = fetch_screen(pairingCode, creds);
    if (!r.ok()) {
        fail(key, s, 0, r.message);
        return r.wrap("pairing failed");
    }

    std::uint32_t attempt = 0;
    {
        // Held across the save so a concurrent disconnect cannot clear the
        // store before these credentials land in it.
        std::lock_guard<std::mutex> storeLock(_storeMutex);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!is_current_locked(key, s, 0)) {
                TL_LOGI(TAG, "[%s] superseded while connecting", key.c_str());
                return superseded_result();
            }
            s->creds = creds;
            attempt = reset_for_bind_locked(*s);
        }
        TL_LOGI(TAG, "[%s] paired with screen '%s'", key.c_str(), creds.screenName.c_str());

        if (!_store.save(key, creds)) {
            // The session still works; it just won't survive a restart.
            TL_LOGE(TAG, "[%s] failed to persist credentials", key.c_str());
        }
    }

    r = bind(s, attempt);
    if (r.status == StatusCode::Cancelled) {
        return r;
    }
    if (!r.ok()) {
        fail(key, s, attempt, r.message);
        return r.wrap("bind failed");
    }

    return go_live(key, s, attempt);
}

void LoungeManager::disconnect(const std::string& key)
{
    bool had = false;
    {
        std::lock_guard<std::mutex> storeLock(_storeMutex);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _sessions.find(key);
            if (it != _sessions.end()) {
                stop_worker_locked(*it->second);
                it->second->status = LoungeStatus::Disconnected;
                _sessions.erase(it);
                had = true;
            }
        }

        if (!_store.clear(key)) {
            TL_LOGE(TAG, "[%s] failed to clear persisted credentials", key.c_str());
        }
    }

    if (had) {
        TL_LOGI(TAG, "[%s] disconnected", key.c_str());
        publish(key, LoungeStatus::Disconnected, "", "");
    }
}

Result LoungeManager::reconnect(const std::string& key)
{
    SessionPtr s;
    std::uint32_t attempt = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _sessions.find(key);
        if (it != _sessions.end() && it->second->creds.complete()) {
            s = it->second;
            attempt = reset_for_bind_locked(*s);
        }
    }

    if (!s) {
        std::lock_guard<std::mutex> storeLock(_storeMutex);
        ScreenCredentials creds;
        if (!_store.load(key, creds)) {
            return Result::error(StatusCode::NoCredentials,
                                 "reconnect failed: no credentials to reconnect with");
        }
        TL_LOGI(TAG, "[%s] restoring session from saved credentials", key.c_str());

        s = std::make_shared<LoungeSession>();
        s->creds = std::move(creds);

        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _sessions.find(key);
        if (it != _sessions.end()) {
            stop_worker_locked(*it->second);
            it->second = s;
        } else {
            _sessions.emplace(key, s);
        }
        attempt = reset_for_bind_locked(*s);
    }

    std::string screenName;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        screenName = s->creds.screenName;
    }
    TL_LOGI(TAG, "[%s] reconnecting", key.c_str());
    publish(key, LoungeStatus::Connecting, screenName, "");

    Result r = bind(s, attempt);
    if (r.status == StatusCode::Cancelled) {
        return r;
    }
    if (!r.ok()) {
        fail(key, s, attempt, r.message);
        return r.wrap("reconnect failed");
    }

    return go_live(key, s, attempt);
}

LoungeStatusInfo LoungeManager::status(const std::string& key) const
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _sessions.find(key);
        if (it != _sessions.end()) {
            const LoungeSession& s = *it->second;
            LoungeStatusInfo info;
            info.status = s.status;
            info.screenName = s.creds.screenName;
            if (s.status == LoungeStatus::Error) {
                info.errorMessage = s.errorMessage;
            }
            return info;
        }
    }

    // Credentials survived a restart but the channel did not.
    ScreenCredentials creds;
    if (_store.load(key, creds)) {
        LoungeStatusInfo info;
        info.status = LoungeStatus::Error;
        info.screenName = creds.screenName;
        info.errorMessage = "TV connection lost (server restarted)";
        return info;
    }

    return LoungeStatusInfo{};
}

Result LoungeManager::send_add_video(const std::string& key, const std::string& videoId)
{
    return send_command(key, LoungeCommand::AddVideo, videoId);
}

Result LoungeManager::send_play_now(const std::string& key, const std::string& videoId)
{
    return send_command(key, LoungeCommand::SetVideo, videoId);
}

bool LoungeManager::is_connected(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _sessions.find(key);
    return it != _sessions.end() && it->second->status == LoungeStatus::Connected;
}

void LoungeManager::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (auto& kv : _sessions) {
            if (kv.second->cancel) {
                kv.second->cancel->cancel();
            }
        }
    }

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(_workersMutex);
        _shuttingDown = true;
        workers.swap(_workers);
    }

    for (auto& w : workers) {
        w.cancel->cancel();
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }

    if (!workers.empty()) {
        TL_LOGI(TAG, "stopped %u poll worker(s)", static_cast<unsigned>(workers.size()));
    }
}

// ---------------------------------------------------------------------------
// Protocol steps
// ---------------------------------------------------------------------------

Result LoungeManager::fetch_screen(const std::string& pairingCode, ScreenCredentials& out)
{
    net::HttpRequest req = build_pairing_request(_who, pairingCode);
    req.timeout = _cfg.requestTimeout;

    net::HttpResponse resp;
    const StatusCode st = _http.perform(req, resp);
    if (st != StatusCode::Ok) {
        return Result::error(st, transport_failure("pairing", st, resp));
    }
    if (!net::is_success(resp.httpStatus)) {
        return Result::error(StatusCode::HttpError, http_failure("pairing", resp));
    }

    std::string error;
    const StatusCode pst = parse_pairing_response(resp.body, out, error);
    if (pst != StatusCode::Ok) {
        return Result::error(pst, error);
    }
    return Result::success();
}

Result LoungeManager::bind(const SessionPtr& s, std::uint32_t attempt)
{
    ScreenCredentials creds;
    std::uint32_t rid = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (s->attempt != attempt) {
            return superseded_result();
        }
        rid = ++s->rid;
        creds = s->creds;
    }

    net::HttpRequest req = build_bind_request(_who, creds, rid);
    req.timeout = _cfg.requestTimeout;

    net::HttpResponse resp;
    const StatusCode st = _http.perform(req, resp);
    if (st != StatusCode::Ok) {
        return Result::error(st, transport_failure("bind", st, resp));
    }
    if (!net::is_success(resp.httpStatus)) {
        return Result::error(StatusCode::HttpError, http_failure("bind", resp));
    }

    ChannelIds ids;
    if (parse_bind_response(resp.body, ids) != StatusCode::Ok) {
        return Result::error(StatusCode::ProtocolError,
                             "failed to parse SID from bind response");
    }

    TL_LOGD(TAG, "bound channel sid=%s gsessionid=%s",
            ids.sid.c_str(), ids.gsessionId.empty() ? "-" : ids.gsessionId.c_str());

    std::lock_guard<std::mutex> lock(_mutex);
    if (s->attempt != attempt) {
        return superseded_result();
    }
    s->channel = std::move(ids);
    return Result::success();
}

Result LoungeManager::go_live(const std::string& key, const SessionPtr& s, std::uint32_t attempt)
{
    auto token = std::make_shared<core::CancelToken>();
    std::string screenName;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!is_current_locked(key, s, attempt)) {
            TL_LOGI(TAG, "[%s] superseded while connecting", key.c_str());
            return superseded_result();
        }
        stop_worker_locked(*s);
        s->status = LoungeStatus::Connected;
        s->errorMessage.clear();
        s->lastActivity = Clock::now();
        s->cancel = token;
        screenName = s->creds.screenName;
    }

    TL_LOGI(TAG, "[%s] connected", key.c_str());
    publish(key, LoungeStatus::Connected, screenName, "");

    start_worker(key, s, token);
    return Result::success();
}

void LoungeManager::fail(const std::string& key, const SessionPtr& s, std::uint32_t attempt,
                         const std::string& message)
{
    std::string screenName;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!is_current_locked(key, s, attempt)) {
            return;
        }
        s->status = LoungeStatus::Error;
        s->errorMessage = message;
        screenName = s->creds.screenName;
    }

    TL_LOGE(TAG, "[%s] %s", key.c_str(), message.c_str());
    publish(key, LoungeStatus::Error, screenName, message);
}

Result LoungeManager::send_command(const std::string& key,
                                   LoungeCommand cmd,
                                   const std::string& videoId)
{
    SessionPtr s;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _sessions.find(key);
        if (it == _sessions.end() || it->second->status != LoungeStatus::Connected) {
            TL_LOGD(TAG, "[%s] not connected; dropping %s", key.c_str(), command_name(cmd));
            return Result::success();
        }
        s = it->second;
    }

    std::lock_guard<std::mutex> sendLock(s->sendMutex);

    ScreenCredentials creds;
    ChannelIds channel;
    ChannelCounters counters;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (s->status != LoungeStatus::Connected) {
            return Result::success();
        }
        counters.rid = ++s->rid;
        counters.aid = s->aid;
        counters.ofs = s->ofs;
        creds = s->creds;
        channel = s->channel;
    }

    net::HttpRequest req = build_command_request(_who, creds, channel, counters, cmd, videoId);
    req.timeout = _cfg.requestTimeout;

    net::HttpResponse resp;
    const StatusCode st = _http.perform(req, resp);
    if (st != StatusCode::Ok) {
        TL_LOGE(TAG, "[%s] %s transport failure: %s",
                key.c_str(), command_name(cmd), resp.error.c_str());
        return Result::error(st, transport_failure("command", st, resp));
    }
    if (!net::is_success(resp.httpStatus)) {
        TL_LOGE(TAG, "[%s] %s rejected with status %u",
                key.c_str(), command_name(cmd), static_cast<unsigned>(resp.httpStatus));
        return Result::error(StatusCode::HttpError, http_failure("command", resp));
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        ++s->ofs;
        s->lastActivity = Clock::now();
    }

    TL_LOGI(TAG, "[%s] sent %s %s", key.c_str(), command_name(cmd), videoId.c_str());
    return Result::success();
}

// ---------------------------------------------------------------------------
// Poll worker
// ---------------------------------------------------------------------------

void LoungeManager::start_worker(const std::string& key, const SessionPtr& s, const TokenPtr& cancel)
{
    std::lock_guard<std::mutex> lock(_workersMutex);
    if (_shuttingDown) {
        cancel->cancel();
        return;
    }

    reap_workers_locked();

    Worker w;
    w.cancel = cancel;
    w.done = std::make_shared<std::atomic<bool>>(false);
    auto done = w.done;
    w.thread = std::thread([this, key, s, cancel, done]() {
        poll_loop(key, s, cancel);
        done->store(true, std::memory_order_release);
    });
    _workers.push_back(std::move(w));
}

void LoungeManager::reap_workers_locked()
{
    for (auto it = _workers.begin(); it != _workers.end();) {
        if (it->done->load(std::memory_order_acquire)) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = _workers.erase(it);
        } else {
            ++it;
        }
    }
}

void LoungeManager::poll_loop(const std::string& key, SessionPtr s, TokenPtr cancel)
{
    TL_LOGD(TAG, "[%s] poll worker started", key.c_str());

    std::uint32_t consecutiveErrors = 0;

    while (!cancel->cancelled()) {
        ScreenCredentials creds;
        ChannelIds channel;
        std::uint32_t aid = 0;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            if (cancel->cancelled()) {
                break;
            }

            if (Clock::now() - s->lastActivity > _cfg.inactivityTimeout) {
                s->status = LoungeStatus::Error;
                s->errorMessage = "disconnected due to inactivity";
                const std::string screenName = s->creds.screenName;
                const std::string message = s->errorMessage;
                lock.unlock();

                TL_LOGW(TAG, "[%s] %s", key.c_str(), message.c_str());
                publish(key, LoungeStatus::Error, screenName, message);
                return;
            }

            creds = s->creds;
            channel = s->channel;
            aid = s->aid;
        }

        net::HttpRequest req = build_poll_request(_who, creds, channel, aid);
        req.timeout = _cfg.pollTimeout;
        req.cancel = cancel.get();

        net::HttpResponse resp;
        const StatusCode st = _http.perform(req, resp);
        if (cancel->cancelled()) {
            break;
        }

        if (st == StatusCode::Ok && net::is_success(resp.httpStatus)) {
            std::uint32_t eventId = 0;
            const bool haveEvent = parse_poll_event_id(resp.body, eventId);

            std::lock_guard<std::mutex> lock(_mutex);
            if (cancel->cancelled()) {
                break;
            }
            if (haveEvent && eventId > s->aid) {
                s->aid = eventId;
            }
            s->lastActivity = Clock::now();
            consecutiveErrors = 0;
            continue;
        }

        const std::string error = (st != StatusCode::Ok)
            ? transport_failure("poll", st, resp)
            : http_failure("poll", resp);
        ++consecutiveErrors;
        TL_LOGW(TAG, "[%s] %s (%u/%u)", key.c_str(), error.c_str(),
                static_cast<unsigned>(consecutiveErrors),
                static_cast<unsigned>(_cfg.maxPollRetries));

        if (consecutiveErrors >= _cfg.maxPollRetries) {
            std::string screenName;
            std::string message;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                if (cancel->cancelled()) {
                    break;
                }
                s->status = LoungeStatus::Error;
                s->errorMessage = "disconnected after " + std::to_string(consecutiveErrors) +
                                  " consecutive poll errors: " + error;
                screenName = s->creds.screenName;
                message = s->errorMessage;
            }
            TL_LOGE(TAG, "[%s] %s", key.c_str(), message.c_str());
            publish(key, LoungeStatus::Error, screenName, message);
            return;
        }

        if (cancel->wait_for(poll_retry_delay(_cfg.retryBaseDelay, consecutiveErrors))) {
            break;
        }
    }

    TL_LOGD(TAG, "[%s] poll worker stopped", key.c_str());
}

// ---------------------------------------------------------------------------
// Registry helpers
// ---------------------------------------------------------------------------

bool LoungeManager::is_current_locked(const std::string& key, const SessionPtr& s,
                                      std::uint32_t attempt) const
{
    auto it = _sessions.find(key);
    return it != _sessions.end() && it->second == s && s->attempt == attempt;
}

void LoungeManager::stop_worker_locked(LoungeSession& s)
{
    if (s.cancel) {
        s.cancel->cancel();
        s.cancel.reset();
    }
}

std::uint32_t LoungeManager::reset_for_bind_locked(LoungeSession& s)
{
    stop_worker_locked(s);
    s.status = LoungeStatus::Connecting;
    s.errorMessage.clear();
    s.channel = ChannelIds{};
    s.aid = 0;
    s.ofs = 0;
    s.lastActivity = Clock::now();
    return ++s.attempt;
}

void LoungeManager::publish(const std::string& key, LoungeStatus st,
                            const std::string& screenName, const std::string& errorMessage)
{
    LoungeStatusEvent ev;
    ev.key = key;
    ev.status = st;
    ev.screenName = screenName;
    ev.errorMessage = errorMessage;
    _events.publish(ev);
}

} // namespace tvlink::lounge
