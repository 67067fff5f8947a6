#pragma once

#include "wxstream/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace wxstream {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,          // connect timeout or stalled body
        SslError,
        Cancelled,        // IHttpClient::cancel()
        Aborted,          // a StreamHandlers callback returned false
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "request cancelled"};
    }
    static HttpClientError aborted() {
        return {Code::Aborted, "stream aborted by handler"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// Streaming callbacks
// ─────────────────────────────────────────────────────────────────────────────
// Both run on the thread that called IHttpClient::stream(). Returning false
// aborts the transfer; stream() then fails with Code::Aborted.

struct StreamHandlers {
    /// Once, when the final response's headers are complete.
    std::function<bool(int status_code, const HeaderMap& headers)> on_response;

    /// For every body read, in order. Chunk boundaries are arbitrary.
    std::function<bool(std::string_view chunk)> on_chunk;
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// One client per connection attempt: EventSource asks its HttpClientFactory
// for a fresh instance every time it (re)connects, so a client never has to
// be reusable after cancel().

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /// "scheme://host:port"; request paths are appended to it.
    virtual void set_base_url(const std::string& url) = 0;

    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    /// Abort when no bytes arrive for this long. Zero disables the watchdog.
    virtual void set_stall_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    /// PEM bundle used instead of the system trust store; empty for default.
    virtual void set_ca_cert_path(const std::string& path) = 0;

    /// Performs the request and delivers the body incrementally. Blocks until
    /// the body ends, the transfer fails or is aborted. Returns the final HTTP
    /// status on a clean end of body.
    [[nodiscard]] virtual HttpClientResult<int> stream(
        const HttpRequest& request,
        const StreamHandlers& handlers
    ) = 0;

    /// Thread-safe. Makes an in-flight stream() return Code::Cancelled and
    /// any later stream() fail immediately.
    virtual void cancel() = 0;
};

using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;

/// Default implementation (cpr / libcurl).
[[nodiscard]] std::unique_ptr<IHttpClient> make_http_client();

/// Factory producing make_http_client() instances.
[[nodiscard]] HttpClientFactory make_http_client_factory();

}  // namespace wxstream
