#include "tvlink/platform/posix/http_client_curl.h"

#if TL_WITH_CURL == 1

#include "tvlink/core/cancel_token.h"
#include "tvlink/core/logging.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

// curl headers are only included in curl-specific files
#include <curl/curl.h>

namespace tvlink::platform::posix {

static constexpr const char* TAG = "http";

static void ensure_curl_global_init()
{
    static const bool inited = []{
        curl_global_init(CURL_GLOBAL_DEFAULT);
        return true;
    }();
    (void)inited;
}

namespace {

// Owns the per-request curl resources.
struct CurlRequest {
    CURL* curl = nullptr;
    curl_slist* slist = nullptr;
    std::string* body = nullptr;
    const core::CancelToken* cancel = nullptr;
    char errbuf[CURL_ERROR_SIZE]{};

    CurlRequest() : curl(curl_easy_init()) {}

    ~CurlRequest()
    {
        if (curl) {
            curl_easy_cleanup(curl);
        }
        if (slist) {
            curl_slist_free_all(slist);
        }
    }

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;
};

StatusCode map_curl_code(CURLcode res)
{
    switch (res) {
    case CURLE_OK:                  return StatusCode::Ok;
    case CURLE_OPERATION_TIMEDOUT:  return StatusCode::Timeout;
    case CURLE_ABORTED_BY_CALLBACK: return StatusCode::Cancelled;
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
        return StatusCode::InvalidRequest;
    default:
        return StatusCode::IOError;
    }
}

} // namespace

HttpClientCurl::HttpClientCurl()
{
    ensure_curl_global_init();
}

std::size_t HttpClientCurl::write_body_cb(
    char *ptr,
    std::size_t size,
    std::size_t nmemb,
    void *userdata)
{
    auto *req = static_cast<CurlRequest *>(userdata);
    if (!req || !req->body)
        return 0;

    // Guard overflow: n = size * nmemb
    if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size))
    {
        return 0; // abort transfer
    }

    const std::size_t n = size * nmemb;
    if (n == 0 || !ptr)
        return 0;

    req->body->append(ptr, n);
    return n;
}

int HttpClientCurl::xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    auto *req = static_cast<CurlRequest *>(userdata);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    return (req && req->cancel && req->cancel->cancelled()) ? 1 : 0;
}

StatusCode HttpClientCurl::perform(const net::HttpRequest& req, net::HttpResponse& out)
{
    out = net::HttpResponse{};

    if (req.url.empty()) {
        out.error = "empty url";
        return StatusCode::InvalidRequest;
    }
    if (req.cancel && req.cancel->cancelled()) {
        out.error = "cancelled before start";
        return StatusCode::Cancelled;
    }

    CurlRequest cr;
    if (!cr.curl) {
        out.error = "curl_easy_init failed";
        return StatusCode::IOError;
    }
    cr.body = &out.body;
    cr.cancel = req.cancel;

    for (const auto& kv : req.headers) {
        std::string line;
        line.reserve(kv.first.size() + 2 + kv.second.size());
        line.append(kv.first);
        line.append(": ");
        line.append(kv.second);
        cr.slist = curl_slist_append(cr.slist, line.c_str());
    }
    if (cr.slist) {
        curl_easy_setopt(cr.curl, CURLOPT_HTTPHEADER, cr.slist);
    }

    curl_easy_setopt(cr.curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(cr.curl, CURLOPT_ERRORBUFFER, cr.errbuf);
    curl_easy_setopt(cr.curl, CURLOPT_WRITEFUNCTION, &HttpClientCurl::write_body_cb);
    curl_easy_setopt(cr.curl, CURLOPT_WRITEDATA, &cr);

    // Worker threads: no signal-based DNS timeouts.
    curl_easy_setopt(cr.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(cr.curl, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count()));

    // Progress callback fires about once a second even when idle, which is
    // what lets a cancelled long-poll give up without waiting for the server.
    curl_easy_setopt(cr.curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(cr.curl, CURLOPT_XFERINFOFUNCTION, &HttpClientCurl::xferinfo_cb);
    curl_easy_setopt(cr.curl, CURLOPT_XFERINFODATA, &cr);

    curl_easy_setopt(cr.curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(cr.curl, CURLOPT_SSL_VERIFYHOST, 2L);

    if (req.method == net::HttpMethod::Post) {
        curl_easy_setopt(cr.curl, CURLOPT_POST, 1L);
        curl_easy_setopt(cr.curl, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(cr.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    } else {
        curl_easy_setopt(cr.curl, CURLOPT_HTTPGET, 1L);
    }

    const CURLcode res = curl_easy_perform(cr.curl);

    long httpCode = 0;
    curl_easy_getinfo(cr.curl, CURLINFO_RESPONSE_CODE, &httpCode);
    out.httpStatus = static_cast<std::uint16_t>(httpCode < 0 ? 0 : httpCode);

    if (res != CURLE_OK) {
        out.error = cr.errbuf[0] != '\0' ? std::string(cr.errbuf) : std::string(curl_easy_strerror(res));
        const StatusCode st = map_curl_code(res);
        if (st != StatusCode::Cancelled) {
            TL_LOGD(TAG, "transfer failed (%s): %s", to_string(st), out.error.c_str());
        }
        return st;
    }

    TL_LOGV(TAG, "%s -> %u (%u bytes)",
            req.method == net::HttpMethod::Post ? "POST" : "GET",
            static_cast<unsigned>(out.httpStatus),
            static_cast<unsigned>(out.body.size()));
    return StatusCode::Ok;
}

} // namespace tvlink::platform::posix

#endif // TL_WITH_CURL
