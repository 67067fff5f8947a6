#ifndef WXSTREAM_STREAM_STREAM_ERROR_HPP
#define WXSTREAM_STREAM_STREAM_ERROR_HPP

#include "wxstream/transport/http_client.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace wxstream {

// ─────────────────────────────────────────────────────────────────────────────
// StreamError
// ─────────────────────────────────────────────────────────────────────────────
// Transport-level failures of a stream. Payload problems (malformed frames,
// undecodable JSON) are never errors: they are logged and dropped.

struct StreamError {
    enum class Code {
        InvalidUrl,
        ConnectionFailed,
        Timeout,             // connect timeout or stalled body
        SslError,
        HttpError,           // non-2xx response
        StreamEnded,         // server closed a subscription body
        BufferOverflow,      // unterminated block exceeded the buffer limit
        Cancelled,
        Closed,              // operation on a closed stream
        ReconnectExhausted
    };

    Code code;
    std::string message;
    std::optional<int> http_status;

    /// Set when the stream will not reconnect after this error.
    bool fatal{false};

    static StreamError invalid_url(const std::string& url) {
        return {Code::InvalidUrl, "invalid stream URL: " + url, std::nullopt, true};
    }
    static StreamError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg, std::nullopt};
    }
    static StreamError timeout(const std::string& msg) {
        return {Code::Timeout, msg, std::nullopt};
    }
    static StreamError ssl_error(const std::string& msg) {
        return {Code::SslError, msg, std::nullopt};
    }
    static StreamError http_error(int status, const std::string& msg) {
        return {Code::HttpError, msg, status};
    }
    static StreamError stream_ended() {
        return {Code::StreamEnded, "server closed the stream", std::nullopt};
    }
    static StreamError buffer_overflow(const std::string& msg) {
        return {Code::BufferOverflow, msg, std::nullopt};
    }
    static StreamError cancelled() {
        return {Code::Cancelled, "stream cancelled", std::nullopt};
    }
    static StreamError closed() {
        return {Code::Closed, "stream is closed", std::nullopt, true};
    }
    static StreamError reconnect_exhausted(std::size_t attempts, const std::string& last_error) {
        return {Code::ReconnectExhausted,
                "giving up after " + std::to_string(attempts) + " reconnect attempts: " + last_error,
                std::nullopt, true};
    }

    static StreamError from_client_error(const HttpClientError& err) {
        switch (err.code) {
            case HttpClientError::Code::Timeout:
                return timeout(err.message);
            case HttpClientError::Code::SslError:
                return ssl_error(err.message);
            case HttpClientError::Code::Cancelled:
            case HttpClientError::Code::Aborted:
                return cancelled();
            case HttpClientError::Code::ConnectionFailed:
            case HttpClientError::Code::Unknown:
                break;
        }
        return connection_failed(err.message);
    }

    [[nodiscard]] StreamError as_fatal() const {
        StreamError copy = *this;
        copy.fatal = true;
        return copy;
    }
};

[[nodiscard]] constexpr std::string_view to_string(StreamError::Code code) noexcept {
    switch (code) {
        case StreamError::Code::InvalidUrl:         return "invalid_url";
        case StreamError::Code::ConnectionFailed:   return "connection_failed";
        case StreamError::Code::Timeout:            return "timeout";
        case StreamError::Code::SslError:           return "ssl_error";
        case StreamError::Code::HttpError:          return "http_error";
        case StreamError::Code::StreamEnded:        return "stream_ended";
        case StreamError::Code::BufferOverflow:     return "buffer_overflow";
        case StreamError::Code::Cancelled:          return "cancelled";
        case StreamError::Code::Closed:             return "closed";
        case StreamError::Code::ReconnectExhausted: return "reconnect_exhausted";
    }
    return "unknown";
}

template <typename T>
using StreamResult = tl::expected<T, StreamError>;

}  // namespace wxstream

#endif  // WXSTREAM_STREAM_STREAM_ERROR_HPP
