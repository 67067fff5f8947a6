#ifndef WXSTREAM_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define WXSTREAM_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "wxstream/transport/http_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wxstream::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockStreamServer - scripted responses for IHttpClient test doubles
// ─────────────────────────────────────────────────────────────────────────────
// Every client handed out by factory() takes the next script from the shared
// queue when stream() is called. Allows tests to:
// - Script status, headers and body chunks per connection attempt
// - Simulate connect failures and errors after a partial body
// - Keep a body open until the client is cancelled
// - Inspect every request and the client configuration

struct StreamScript {
    int status{200};
    HeaderMap headers{{"Content-Type", "text/event-stream"}};
    std::vector<std::string> chunks;

    // Returned before any response is delivered (refused, DNS, TLS)
    std::optional<HttpClientError> connect_error;

    // Returned after the chunks instead of a clean end of body
    std::optional<HttpClientError> error_after_body;

    // After the chunks, block until cancel() is called
    bool hold_open{false};
};

struct RecordedRequest {
    std::string base_url;
    HttpMethod method{HttpMethod::Get};
    std::string path;
    HeaderMap headers;               // request headers merged over defaults
    std::optional<std::string> body;
    std::chrono::milliseconds stall_timeout{0};
    bool verify_ssl{true};
};

class MockStreamServer : public std::enable_shared_from_this<MockStreamServer> {
public:
    [[nodiscard]] static std::shared_ptr<MockStreamServer> create() {
        return std::shared_ptr<MockStreamServer>(new MockStreamServer());
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup
    // ─────────────────────────────────────────────────────────────────────────

    void enqueue(StreamScript script) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_.push_back(std::move(script));
    }

    void enqueue_stream(std::vector<std::string> chunks) {
        StreamScript script;
        script.chunks = std::move(chunks);
        enqueue(std::move(script));
    }

    void enqueue_connection_error(const std::string& message = "Connection refused") {
        StreamScript script;
        script.connect_error = HttpClientError::connection_failed(message);
        enqueue(std::move(script));
    }

    void enqueue_status(int status, std::vector<std::string> body = {}) {
        StreamScript script;
        script.status = status;
        script.headers = {{"Content-Type", "text/plain"}};
        script.chunks = std::move(body);
        enqueue(std::move(script));
    }

    /// Script used once the queue is empty; defaults to a refused connection.
    void set_fallback(StreamScript script) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_ = std::move(script);
    }

    [[nodiscard]] HttpClientFactory factory();

    // ─────────────────────────────────────────────────────────────────────────
    // Test Verification
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] std::size_t clients_created() const noexcept {
        return clients_created_.load();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Used by MockStreamClient
    // ─────────────────────────────────────────────────────────────────────────

    StreamScript next_script(RecordedRequest request) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(std::move(request));
        if (scripts_.empty()) {
            return fallback_;
        }
        StreamScript script = std::move(scripts_.front());
        scripts_.pop_front();
        return script;
    }

    void client_created() noexcept {
        clients_created_.fetch_add(1);
    }

private:
    MockStreamServer() {
        fallback_.connect_error = HttpClientError::connection_failed("Connection refused");
    }

    mutable std::mutex mutex_;
    std::deque<StreamScript> scripts_;
    StreamScript fallback_;
    std::vector<RecordedRequest> requests_;
    std::atomic<std::size_t> clients_created_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// MockStreamClient - Test double for IHttpClient
// ─────────────────────────────────────────────────────────────────────────────

class MockStreamClient final : public IHttpClient {
public:
    explicit MockStreamClient(std::shared_ptr<MockStreamServer> server)
        : server_(std::move(server))
    {
        server_->client_created();
    }

    void set_base_url(const std::string& url) override {
        base_url_ = url;
    }

    void set_default_headers(const HeaderMap& headers) override {
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds /*timeout*/) override {}

    void set_stall_timeout(std::chrono::milliseconds timeout) override {
        stall_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    void set_ca_cert_path(const std::string& /*path*/) override {}

    HttpClientResult<int> stream(const HttpRequest& request, const StreamHandlers& handlers) override {
        RecordedRequest recorded;
        recorded.base_url = base_url_;
        recorded.method = request.method;
        recorded.path = request.path;
        recorded.headers = default_headers_;
        for (const auto& [name, value] : request.headers) {
            recorded.headers[name] = value;
        }
        recorded.body = request.body;
        recorded.stall_timeout = stall_timeout_;
        recorded.verify_ssl = verify_ssl_;

        const StreamScript script = server_->next_script(std::move(recorded));

        if (is_cancelled()) {
            return tl::unexpected(HttpClientError::cancelled());
        }
        if (script.connect_error.has_value()) {
            return tl::unexpected(*script.connect_error);
        }
        if (handlers.on_response && handlers.on_response(script.status, script.headers) == false) {
            return tl::unexpected(HttpClientError::aborted());
        }
        for (const auto& chunk : script.chunks) {
            if (is_cancelled()) {
                return tl::unexpected(HttpClientError::cancelled());
            }
            if (handlers.on_chunk && handlers.on_chunk(chunk) == false) {
                return tl::unexpected(HttpClientError::aborted());
            }
        }
        if (script.hold_open) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return cancelled_; });
            return tl::unexpected(HttpClientError::cancelled());
        }
        if (script.error_after_body.has_value()) {
            return tl::unexpected(*script.error_after_body);
        }
        return script.status;
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

private:
    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    std::shared_ptr<MockStreamServer> server_;
    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds stall_timeout_{0};
    bool verify_ssl_{true};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
};

inline HttpClientFactory MockStreamServer::factory() {
    return [server = shared_from_this()]() -> std::unique_ptr<IHttpClient> {
        return std::make_unique<MockStreamClient>(server);
    };
}

}  // namespace wxstream::testing

#endif  // WXSTREAM_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
