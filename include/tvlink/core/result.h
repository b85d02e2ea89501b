#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace tvlink {

// Outcome of a transport, parser or registry operation.
enum class StatusCode : std::uint8_t
{
    Ok = 0,          // Success
    InvalidRequest,  // Caller supplied something unusable (empty code, bad URL)
    IOError,         // Transport-level failure (DNS, connect, reset, ...)
    Timeout,         // Request exceeded its timeout
    Cancelled,       // Aborted by a cancellation token or superseded
    HttpError,       // Server answered with a non-2xx status
    ProtocolError,   // Response did not contain what the protocol requires
    NoCredentials,   // Nothing persisted to reconnect with
};

const char* to_string(StatusCode code);

// StatusCode plus a human-readable message, returned by the registry surface.
struct Result {
    StatusCode status{StatusCode::Ok};

    // Empty on success. Otherwise a single line, suitable for showing to users.
    std::string message;

    bool ok() const { return status == StatusCode::Ok; }

    static Result success() {
        return Result{};
    }

    static Result error(StatusCode st, std::string msg) {
        Result r;
        r.status = st;
        r.message = std::move(msg);
        return r;
    }

    // Prefix the message with context, keeping the code: "bind failed: <msg>".
    Result wrap(const std::string& context) const {
        if (ok()) return *this;
        return error(status, context + ": " + message);
    }
};

} // namespace tvlink
