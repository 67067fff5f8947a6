#include "wxstream/stream/event_source.hpp"

#include "wxstream/log/logger.hpp"

#include <stdexcept>

namespace wxstream {

// ─────────────────────────────────────────────────────────────────────────────
// EventSourceOptions
// ─────────────────────────────────────────────────────────────────────────────

EventSourceOptions& EventSourceOptions::with_reconnect(bool enabled) {
    reconnect = enabled;
    return *this;
}

EventSourceOptions& EventSourceOptions::with_reconnect_policy(ReconnectPolicy policy) {
    reconnect_policy = policy;
    return *this;
}

EventSourceOptions& EventSourceOptions::with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
    backoff_policy = std::move(policy);
    return *this;
}

EventSourceOptions& EventSourceOptions::with_retry_hint(bool honor) {
    honor_retry_hint = honor;
    return *this;
}

EventSourceOptions& EventSourceOptions::with_transport(StreamTransportConfig config) {
    transport = std::move(config);
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

EventSource::EventSource(
    std::string url,
    EventSourceListener listener,
    EventSourceOptions options,
    HttpClientFactory client_factory
)
    : url_(std::move(url))
    , listener_(std::move(listener))
    , options_(std::move(options))
    , client_factory_(std::move(client_factory))
    , state_(options_.reconnect_policy.max_attempts)
{
    auto parsed = parse_url(url_);
    if (parsed.has_value() == false) {
        throw std::invalid_argument("EventSource: invalid url: " + url_);
    }
    endpoint_ = std::move(*parsed);

    if (client_factory_ == nullptr) {
        throw std::invalid_argument("EventSource: client factory cannot be empty");
    }

    if (options_.backoff_policy != nullptr) {
        backoff_ = options_.backoff_policy;
    } else {
        backoff_ = ExponentialBackoff::from(options_.reconnect_policy);
    }

    state_.on_state_change([this](StreamConnectionState old_state, StreamConnectionState new_state) {
        get_logger().debug_fmt("stream {}: {} -> {}", url_, to_string(old_state), to_string(new_state));
        gate_.invoke("on_state_change", [&] {
            if (listener_.on_state_change) {
                listener_.on_state_change(old_state, new_state);
            }
        });
    });
}

EventSource::~EventSource() {
    disconnect();
    if (worker_.joinable()) {
        // Destroyed from inside one of its own callbacks
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

StreamResult<void> EventSource::connect() {
    if (state_.begin_connect() == false) {
        if (state_.state() == StreamConnectionState::Closed) {
            return tl::unexpected(StreamError::closed());
        }
        get_logger().warn_fmt("stream {}: connect() while already {}", url_, to_string(state_.state()));
        return {};
    }

    get_logger().info_fmt("stream {}: connecting", url_);
    worker_ = std::thread([this]() {
        run();
    });
    return {};
}

void EventSource::disconnect() {
    close_and_silence();

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (stop_requested_) {
            return;
        }
        stop_requested_ = true;
    }
    wait_cv_.notify_all();

    std::lock_guard<std::mutex> lock(client_mutex_);
    if (active_client_ != nullptr) {
        active_client_->cancel();
    }
}

void EventSource::close_and_silence() {
    const bool closed_now = gate_.close([this] {
        state_.close();
        if (listener_.on_close) {
            listener_.on_close();
        }
    });
    if (closed_now) {
        get_logger().info_fmt("stream {}: closed", url_);
    }
}

bool EventSource::stop_requested() const {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    return stop_requested_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Reader thread
// ─────────────────────────────────────────────────────────────────────────────

void EventSource::run() {
    for (;;) {
        if (stop_requested()) {
            return;
        }

        const StreamError failure = run_once();
        if (stop_requested()) {
            return;
        }

        if (options_.reconnect == false) {
            fail(failure.as_fatal());
            return;
        }

        const ReconnectDecision decision = state_.connection_lost(failure.message);
        if (decision == ReconnectDecision::Ignored) {
            return;
        }
        if (decision == ReconnectDecision::Exhausted) {
            fail(StreamError::reconnect_exhausted(state_.max_attempts(), failure.message));
            return;
        }

        const std::size_t attempt = state_.attempt();
        const auto delay = backoff_delay(attempt);
        get_logger().warn_fmt("stream {}: {} ({}), reconnect {}/{} in {} ms",
            url_, failure.message, to_string(failure.code),
            attempt, state_.max_attempts(), delay.count());

        gate_.invoke("on_error", [&] {
            if (listener_.on_error) {
                listener_.on_error(failure);
            }
        });
        gate_.invoke("on_reconnecting", [&] {
            if (listener_.on_reconnecting) {
                listener_.on_reconnecting(attempt, delay);
            }
        });

        if (wait_for_backoff(delay) == false) {
            return;
        }
        if (state_.begin_reconnect() == false) {
            return;
        }
    }
}

StreamError EventSource::run_once() {
    std::unique_ptr<IHttpClient> client = client_factory_();
    if (client == nullptr) {
        return StreamError::connection_failed("client factory returned no client");
    }
    connection_count_.fetch_add(1);
    client->set_base_url(endpoint_.origin());
    options_.transport.apply_to(*client);

    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (stop_requested()) {
            return StreamError::cancelled();
        }
        active_client_ = client.get();
    }

    FrameReader reader(options_.transport.buffer);
    std::optional<StreamError> failure;

    StreamHandlers handlers;
    handlers.on_response = [&](int status, const HeaderMap& headers) -> bool {
        const bool success = status >= 200 && status < 300;
        if (success == false) {
            failure = StreamError::http_error(status, std::format("HTTP {}", status));
            return false;
        }
        if (has_media_type(headers, "text/event-stream") == false) {
            get_logger().debug_fmt("stream {}: Content-Type is not text/event-stream", url_);
        }
        if (state_.connection_opened() == false) {
            return false;
        }
        backoff_->reset();
        get_logger().info_fmt("stream {}: open (HTTP {})", url_, status);
        gate_.invoke("on_open", [&] {
            if (listener_.on_open) {
                listener_.on_open();
            }
        });
        return true;
    };
    handlers.on_chunk = [&](std::string_view chunk) -> bool {
        if (stop_requested()) {
            return false;
        }
        try {
            for (const auto& frame : reader.feed(chunk)) {
                deliver(frame);
            }
        } catch (const BufferOverflowError& e) {
            failure = StreamError::buffer_overflow(e.what());
            return false;
        }
        return true;
    };

    const auto result = client->stream(build_request(), handlers);

    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        active_client_ = nullptr;
    }

    if (failure.has_value()) {
        return *failure;
    }
    if (result.has_value() == false) {
        return StreamError::from_client_error(result.error());
    }

    for (const auto& frame : reader.finish()) {
        deliver(frame);
    }
    get_logger().debug_fmt("stream {}: body ended after {} frames", url_, reader.frames_read());
    return StreamError::stream_ended();
}

HttpRequest EventSource::build_request() const {
    HttpRequest request;
    request.method = HttpMethod::Get;
    request.path = endpoint_.path_with_query();
    request.with_header("Accept", "text/event-stream")
           .with_header("Cache-Control", "no-cache");

    if (options_.send_last_event_id) {
        if (auto last_id = state_.last_event_id()) {
            request.with_header("Last-Event-ID", *last_id);
        }
    }
    return request;
}

void EventSource::deliver(const StreamFrame& frame) {
    if (frame.id.has_value()) {
        state_.record_event_id(*frame.id);
    }
    if (frame.retry.has_value()) {
        retry_hint_ms_.store(*frame.retry);
    }
    get_logger().trace_fmt("stream {}: frame event={} ({} bytes)", url_, frame.event_type(), frame.data.size());
    gate_.invoke("on_message", [&] {
        if (listener_.on_message) {
            listener_.on_message(frame);
        }
    });
}

std::chrono::milliseconds EventSource::backoff_delay(std::size_t attempt) {
    const std::uint32_t hint = retry_hint_ms_.load();
    const bool use_hint = options_.honor_retry_hint && hint > 0 && options_.backoff_policy == nullptr;
    if (use_hint) {
        ReconnectPolicy hinted = options_.reconnect_policy;
        hinted.base_interval = std::chrono::milliseconds{hint};
        return hinted.delay_for(attempt);
    }
    return backoff_->next_delay(attempt);
}

bool EventSource::wait_for_backoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    const bool stopped = wait_cv_.wait_for(lock, delay, [this] {
        return stop_requested_;
    });
    return stopped == false;
}

void EventSource::fail(const StreamError& error) {
    get_logger().error_fmt("stream {}: {}", url_, error.message);
    gate_.invoke("on_error", [&] {
        if (listener_.on_error) {
            listener_.on_error(error);
        }
    });
    close_and_silence();
}

// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<EventSource> open(std::string url, EventSourceListener listener, EventSourceOptions options) {
    auto source = std::make_unique<EventSource>(std::move(url), std::move(listener), std::move(options));
    const auto started = source->connect();
    if (started.has_value() == false) {
        throw std::runtime_error(started.error().message);
    }
    return source;
}

}  // namespace wxstream
