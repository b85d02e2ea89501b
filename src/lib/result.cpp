#include "tvlink/core/result.h"

namespace tvlink {

const char* to_string(StatusCode code)
{
    switch (code) {
    case StatusCode::Ok:             return "ok";
    case StatusCode::InvalidRequest: return "invalid_request";
    case StatusCode::IOError:        return "io_error";
    case StatusCode::Timeout:        return "timeout";
    case StatusCode::Cancelled:      return "cancelled";
    case StatusCode::HttpError:      return "http_error";
    case StatusCode::ProtocolError:  return "protocol_error";
    case StatusCode::NoCredentials:  return "no_credentials";
    }
    return "unknown";
}

} // namespace tvlink
