#pragma once

#include "wxstream/stream/callback_gate.hpp"
#include "wxstream/stream/connection_state.hpp"
#include "wxstream/stream/frame_reader.hpp"
#include "wxstream/stream/reconnect_policy.hpp"
#include "wxstream/stream/stream_error.hpp"
#include "wxstream/transport/http_client.hpp"
#include "wxstream/transport/stream_transport_config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace wxstream {

// ─────────────────────────────────────────────────────────────────────────────
// Options and listener
// ─────────────────────────────────────────────────────────────────────────────

struct EventSourceOptions {
    /// Reconnect after unexpected closes; when false the first failure is fatal.
    bool reconnect{true};

    ReconnectPolicy reconnect_policy;

    /// Overrides the delays derived from reconnect_policy (attempt limits
    /// still come from the policy).
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    /// Use a server `retry:` hint as the base interval.
    bool honor_retry_hint{false};

    /// Send Last-Event-ID when reconnecting after frames with an id.
    bool send_last_event_id{true};

    StreamTransportConfig transport;

    EventSourceOptions& with_reconnect(bool enabled);
    EventSourceOptions& with_reconnect_policy(ReconnectPolicy policy);
    EventSourceOptions& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy);
    EventSourceOptions& with_retry_hint(bool honor);
    EventSourceOptions& with_transport(StreamTransportConfig config);
};

/// Callbacks run on the EventSource's reader thread, one at a time. None
/// runs after disconnect() has returned.
struct EventSourceListener {
    std::function<void()> on_open;
    std::function<void(const StreamFrame& frame)> on_message;

    /// error.fatal is set when the stream is about to close for good.
    std::function<void(const StreamError& error)> on_error;

    /// Once, when the stream reaches Closed (disconnect() or a fatal error).
    std::function<void()> on_close;

    std::function<void(StreamConnectionState old_state, StreamConnectionState new_state)> on_state_change;

    /// A reconnect is scheduled after `delay`.
    std::function<void(std::size_t attempt, std::chrono::milliseconds delay)> on_reconnecting;
};

// ─────────────────────────────────────────────────────────────────────────────
// EventSource
// ─────────────────────────────────────────────────────────────────────────────
// A long-lived GET subscription to a text/event-stream endpoint with
// automatic reconnection.
//
//   auto source = wxstream::open("https://wx.example.com/alerts/stream", {
//       .on_message = [](const StreamFrame& f) { ... },
//       .on_error   = [](const StreamError& e) { ... },
//   });
//   ...
//   source->disconnect();
//
// One reader thread per instance drives a retry loop. Every attempt builds a
// new IHttpClient from the factory; nothing from a failed attempt is reused.

class EventSource {
public:
    /// Throws std::invalid_argument when url is not an http(s) URL.
    EventSource(
        std::string url,
        EventSourceListener listener,
        EventSourceOptions options = {},
        HttpClientFactory client_factory = make_http_client_factory()
    );

    ~EventSource();

    EventSource(const EventSource&) = delete;
    EventSource& operator=(const EventSource&) = delete;

    /// Starts the reader thread. Calling it again while connecting or
    /// connected does nothing; after disconnect() it fails with Code::Closed.
    StreamResult<void> connect();

    /// Stops for good: cancels a pending backoff wait, aborts the in-flight
    /// read and fires on_close (never on_error). Safe from any thread,
    /// including from inside a listener callback. Does not wait for the reader
    /// thread; the destructor joins it.
    void disconnect();

    /// Same as disconnect().
    void cancel() { disconnect(); }

    [[nodiscard]] StreamConnectionState state() const { return state_.state(); }
    [[nodiscard]] std::size_t attempt() const { return state_.attempt(); }
    [[nodiscard]] std::optional<std::string> last_event_id() const { return state_.last_event_id(); }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }

    /// Transport handles created so far (one per connection attempt).
    [[nodiscard]] std::size_t connection_count() const noexcept { return connection_count_.load(); }

private:
    void run();
    StreamError run_once();
    HttpRequest build_request() const;
    void deliver(const StreamFrame& frame);
    std::chrono::milliseconds backoff_delay(std::size_t attempt);
    bool wait_for_backoff(std::chrono::milliseconds delay);
    void fail(const StreamError& error);
    void close_and_silence();

    [[nodiscard]] bool stop_requested() const;

    std::string url_;
    UrlComponents endpoint_;
    EventSourceListener listener_;
    EventSourceOptions options_;
    HttpClientFactory client_factory_;
    std::shared_ptr<IBackoffPolicy> backoff_;

    ConnectionStateMachine state_;
    CallbackGate gate_;

    std::thread worker_;

    mutable std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    bool stop_requested_{false};

    std::mutex client_mutex_;
    IHttpClient* active_client_{nullptr};

    std::atomic<std::size_t> connection_count_{0};
    std::atomic<std::uint32_t> retry_hint_ms_{0};
};

/// Creates an EventSource and connects it.
[[nodiscard]] std::unique_ptr<EventSource> open(
    std::string url,
    EventSourceListener listener,
    EventSourceOptions options = {}
);

}  // namespace wxstream
