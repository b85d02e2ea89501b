#pragma once

#include "tvlink/net/http_client.h"

#if TL_WITH_CURL == 1

#include <cstddef>
#include <curl/curl.h>

namespace tvlink::platform::posix {

// libcurl-backed IHttpClient. Every perform() uses its own easy handle,
// so one instance can be shared by the registry and all poll workers.
class HttpClientCurl final : public net::IHttpClient {
public:
    HttpClientCurl();

    StatusCode perform(const net::HttpRequest& req, net::HttpResponse& out) override;

private:
    static std::size_t write_body_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);
    static int xferinfo_cb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);
};

} // namespace tvlink::platform::posix

#endif // TL_WITH_CURL
