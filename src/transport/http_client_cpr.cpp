#include "wxstream/transport/http_client.hpp"

#include "wxstream/log/logger.hpp"

#include <cpr/cpr.h>

#include <atomic>
#include <charconv>
#include <cstdint>

namespace wxstream {

namespace {

using Clock = std::chrono::steady_clock;

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    while (s.empty() == false && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (s.empty() == false && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

// Status line "HTTP/1.1 200 OK" or "HTTP/2 200"
[[nodiscard]] int parse_status_line(std::string_view line) noexcept {
    const auto space = line.find(' ');
    if (space == std::string_view::npos) {
        return 0;
    }
    const auto digits = line.substr(space + 1, 3);
    int status = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), status);
    return ec == std::errc{} ? status : 0;
}

// Interim (1xx) and followed-redirect (3xx) responses are not the stream
[[nodiscard]] bool is_final_status(int status) noexcept {
    return status >= 200 && (status < 300 || status >= 400);
}

// Per-transfer bookkeeping; only touched on the thread running the transfer
struct TransferState {
    int status{0};
    HeaderMap headers;
    bool response_delivered{false};
    bool aborted_by_handler{false};
    bool stalled{false};
    Clock::time_point last_activity{Clock::now()};
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// A cpr::Session with header/write/progress callbacks. libcurl invokes the
// progress callback about once a second even when no data flows, which is
// where cancellation and the stall watchdog are checked.

class CprHttpClient final : public IHttpClient {
public:
    void set_base_url(const std::string& url) override {
        base_url_ = url;
    }

    void set_default_headers(const HeaderMap& headers) override {
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_stall_timeout(std::chrono::milliseconds timeout) override {
        stall_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    void set_ca_cert_path(const std::string& path) override {
        ca_cert_path_ = path;
    }

    HttpClientResult<int> stream(const HttpRequest& request, const StreamHandlers& handlers) override {
        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        TransferState state;

        const auto deliver_response = [&]() -> bool {
            state.response_delivered = true;
            if (handlers.on_response && handlers.on_response(state.status, state.headers) == false) {
                state.aborted_by_handler = true;
                return false;
            }
            return true;
        };

        cpr::Session session;
        session.SetUrl(cpr::Url{base_url_ + request.path});
        session.SetHeader(build_headers(request.headers));
        session.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout_});
        session.SetVerifySsl(cpr::VerifySsl{verify_ssl_});
        if (ca_cert_path_.empty() == false) {
            session.SetSslOptions(cpr::Ssl(cpr::ssl::CaInfo{std::string(ca_cert_path_)}));
        }
        if (request.body.has_value()) {
            session.SetBody(cpr::Body{*request.body});
        }

        session.SetHeaderCallback(cpr::HeaderCallback{
            [&](std::string_view raw, std::intptr_t) -> bool {
                if (cancelled_.load()) {
                    return false;
                }
                const auto line = trim(raw);
                if (line.starts_with("HTTP/")) {
                    // A new response begins (redirects, 100-continue)
                    state.status = parse_status_line(line);
                    state.headers.clear();
                    return true;
                }
                if (line.empty()) {
                    if (is_final_status(state.status) && state.response_delivered == false) {
                        state.last_activity = Clock::now();
                        return deliver_response();
                    }
                    return true;
                }
                const auto colon = line.find(':');
                if (colon != std::string_view::npos) {
                    state.headers[std::string(trim(line.substr(0, colon)))] =
                        std::string(trim(line.substr(colon + 1)));
                }
                return true;
            }});

        session.SetWriteCallback(cpr::WriteCallback{
            [&](std::string_view data, std::intptr_t) -> bool {
                if (cancelled_.load()) {
                    return false;
                }
                state.last_activity = Clock::now();
                if (state.response_delivered == false && deliver_response() == false) {
                    return false;
                }
                if (handlers.on_chunk && handlers.on_chunk(data) == false) {
                    state.aborted_by_handler = true;
                    return false;
                }
                return true;
            }});

        session.SetProgressCallback(cpr::ProgressCallback{
            [&](auto /*dl_total*/, auto /*dl_now*/, auto /*ul_total*/, auto /*ul_now*/, std::intptr_t) -> bool {
                if (cancelled_.load()) {
                    return false;
                }
                const bool watchdog_enabled = stall_timeout_.count() > 0;
                if (watchdog_enabled && Clock::now() - state.last_activity > stall_timeout_) {
                    state.stalled = true;
                    return false;
                }
                return true;
            }});

        get_logger().debug_fmt("{} {}{}", to_string(request.method), base_url_, request.path);

        const cpr::Response response =
            (request.method == HttpMethod::Post) ? session.Post() : session.Get();

        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }
        if (state.aborted_by_handler) {
            return tl::unexpected(HttpClientError::aborted());
        }
        if (state.stalled) {
            return tl::unexpected(HttpClientError::timeout(
                std::format("no data received for {} ms", stall_timeout_.count())));
        }
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        // Empty bodies never reach the write callback
        if (state.response_delivered == false) {
            if (state.status == 0) {
                state.status = static_cast<int>(response.status_code);
            }
            if (deliver_response() == false) {
                return tl::unexpected(HttpClientError::aborted());
            }
        }
        return state.status;
    }

    void cancel() override {
        cancelled_.store(true);
    }

private:
    cpr::Header build_headers(const HeaderMap& extra) const {
        cpr::Header out;
        for (const auto& [name, value] : default_headers_) {
            out[name] = value;
        }
        for (const auto& [name, value] : extra) {
            out[name] = value;
        }
        return out;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool mentions_tls =
            msg.find("SSL") != std::string::npos ||
            msg.find("TLS") != std::string::npos ||
            msg.find("certificate") != std::string::npos;
        if (mentions_tls || error.code == cpr::ErrorCode::SSL_CONNECT_ERROR) {
            return HttpClientError::ssl_error(msg);
        }
        if (error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            return HttpClientError::timeout(msg);
        }
        // Resets, refused connections and truncated bodies all mean "connection lost"
        return HttpClientError::connection_failed(msg);
    }

    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds stall_timeout_{0};
    bool verify_ssl_{true};
    std::string ca_cert_path_;

    std::atomic<bool> cancelled_{false};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

HttpClientFactory make_http_client_factory() {
    return [] { return make_http_client(); };
}

}  // namespace wxstream
