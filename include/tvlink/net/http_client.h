#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "tvlink/core/result.h"

namespace tvlink::core {
class CancelToken;
}

namespace tvlink::net {

enum class HttpMethod : std::uint8_t {
    Get = 1,
    Post = 2,
};

struct HttpRequest {
    HttpMethod  method{HttpMethod::Get};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;

    // Sent verbatim for POST; ignored for GET.
    std::string body;

    // Whole-transfer timeout, including the time the server holds a long-poll.
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};

    // Optional; when cancelled the transfer is aborted with StatusCode::Cancelled.
    const core::CancelToken* cancel{nullptr};
};

struct HttpResponse {
    std::uint16_t httpStatus{0};
    std::string   body;

    // Transport error text when perform() did not return Ok.
    std::string   error;
};

inline bool is_success(std::uint16_t httpStatus)
{
    return httpStatus >= 200 && httpStatus < 300;
}

// Synchronous HTTP transport. Implementations must be safe to call
// concurrently from several threads (one request per call, no shared state).
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Returns Ok when a response was received, whatever its HTTP status.
    // IOError / Timeout / Cancelled describe transport failures.
    virtual StatusCode perform(const HttpRequest& req, HttpResponse& out) = 0;
};

} // namespace tvlink::net
