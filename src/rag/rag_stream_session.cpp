#include "wxstream/rag/rag_stream_session.hpp"

#include "wxstream/log/logger.hpp"

#include <stdexcept>

namespace wxstream {

namespace {

// Enough of an error body for a useful message
constexpr std::size_t kMaxErrorBody = 4096;

[[nodiscard]] bool is_success(int status) noexcept {
    return status >= 200 && status < 300;
}

}  // namespace

Json RagStreamRequest::to_json() const {
    Json body = {{"query", query}};
    if (location_id.has_value()) {
        body["locationId"] = *location_id;
    }
    if (context.has_value()) {
        body["context"] = *context;
    }
    return body;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

RagStreamSession::RagStreamSession(
    std::string url,
    RagStreamRequest request,
    RagEventSink sink,
    StreamTransportConfig config,
    HttpClientFactory client_factory
)
    : url_(std::move(url))
    , request_(std::move(request))
    , sink_(std::move(sink))
    , config_(std::move(config))
    , client_factory_(std::move(client_factory))
{
    auto parsed = parse_url(url_);
    if (parsed.has_value() == false) {
        throw std::invalid_argument("RagStreamSession: invalid url: " + url_);
    }
    endpoint_ = std::move(*parsed);

    if (client_factory_ == nullptr) {
        throw std::invalid_argument("RagStreamSession: client factory cannot be empty");
    }
}

RagStreamSession::RagStreamSession(
    std::string url,
    RagStreamRequest request,
    RagStreamListener listener,
    StreamTransportConfig config,
    HttpClientFactory client_factory
)
    : RagStreamSession(
          std::move(url),
          std::move(request),
          RagEventSink([listener = std::move(listener)](const RagStreamEvent& event) {
              dispatch(event, listener);
          }),
          std::move(config),
          std::move(client_factory))
{}

RagStreamSession::~RagStreamSession() {
    cancel();
    if (worker_.joinable()) {
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

StreamResult<void> RagStreamSession::run() {
    if (started_.exchange(true)) {
        return tl::unexpected(StreamError::closed());
    }
    return execute();
}

void RagStreamSession::start() {
    if (started_.exchange(true)) {
        WXSTREAM_LOG_WARN("RagStreamSession::start() called twice");
        return;
    }
    worker_ = std::thread([this]() {
        background_result_ = execute();
    });
}

StreamResult<void> RagStreamSession::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
    if (background_result_.has_value() == false) {
        return tl::unexpected(StreamError::closed());
    }
    return *background_result_;
}

void RagStreamSession::cancel() {
    cancelled_.store(true);
    gate_.close();

    std::lock_guard<std::mutex> lock(client_mutex_);
    if (active_client_ != nullptr) {
        active_client_->cancel();
    }
}

RagTranscript RagStreamSession::transcript() const {
    std::lock_guard<std::mutex> lock(transcript_mutex_);
    return transcript_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Streaming
// ─────────────────────────────────────────────────────────────────────────────

StreamResult<void> RagStreamSession::execute() {
    {
        std::lock_guard<std::mutex> lock(transcript_mutex_);
        transcript_.begin();
    }
    const auto finish_transcript = [this] {
        std::lock_guard<std::mutex> lock(transcript_mutex_);
        transcript_.finish();
    };

    auto client = client_factory_();
    if (client == nullptr) {
        const auto error = StreamError::connection_failed("client factory returned no client");
        emit(RagError{error.message, "", nullptr, RagError::Source::Transport});
        finish_transcript();
        return tl::unexpected(error);
    }
    client->set_base_url(endpoint_.origin());
    config_.apply_to(*client);

    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (cancelled_.load()) {
            finish_transcript();
            return {};
        }
        active_client_ = client.get();
    }

    FrameReader reader(config_.buffer);
    std::optional<StreamError> failure;
    int status = 0;
    std::string error_body;

    StreamHandlers handlers;
    handlers.on_response = [&](int response_status, const HeaderMap& /*headers*/) -> bool {
        status = response_status;
        return cancelled_.load() == false;
    };
    handlers.on_chunk = [&](std::string_view chunk) -> bool {
        if (cancelled_.load()) {
            return false;
        }
        if (is_success(status) == false) {
            error_body.append(chunk.substr(0, kMaxErrorBody - error_body.size()));
            return error_body.size() < kMaxErrorBody;
        }
        try {
            for (const auto& frame : reader.feed(chunk)) {
                handle(frame);
            }
        } catch (const BufferOverflowError& e) {
            failure = StreamError::buffer_overflow(e.what());
            return false;
        }
        return true;
    };

    get_logger().info_fmt("answer stream {}: requesting", url_);
    const auto result = client->stream(build_request(), handlers);

    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        active_client_ = nullptr;
    }

    if (cancelled_.load()) {
        get_logger().info_fmt("answer stream {}: cancelled", url_);
        finish_transcript();
        return {};
    }

    if (status != 0 && is_success(status) == false) {
        failure = StreamError::http_error(status, std::format("HTTP {}: {}", status, error_body));
    } else if (failure.has_value() == false && result.has_value() == false) {
        failure = StreamError::from_client_error(result.error());
    }

    if (failure.has_value()) {
        get_logger().error_fmt("answer stream {}: {}", url_, failure->message);
        emit(RagError{failure->message, "", nullptr, RagError::Source::Transport});
        finish_transcript();
        return tl::unexpected(failure->as_fatal());
    }

    for (const auto& frame : reader.finish()) {
        handle(frame);
    }
    get_logger().info_fmt("answer stream {}: finished ({} frames)", url_, reader.frames_read());
    finish_transcript();
    return {};
}

HttpRequest RagStreamSession::build_request() const {
    HttpRequest request;
    request.method = HttpMethod::Post;
    request.path = endpoint_.path_with_query();
    request.with_header("Content-Type", "application/json")
           .with_header("Accept", "text/event-stream")
           .with_header("Cache-Control", "no-cache")
           .with_body(request_.to_json().dump());
    return request;
}

void RagStreamSession::handle(const StreamFrame& frame) {
    auto event = interpret(frame);
    if (event.has_value() == false) {
        return;
    }
    emit(*event);
}

// The transcript is updated under the gate so it stops changing once cancel() returns
void RagStreamSession::emit(const RagStreamEvent& event) {
    gate_.invoke("answer stream", [&] {
        {
            std::lock_guard<std::mutex> lock(transcript_mutex_);
            transcript_.apply(event);
        }
        if (sink_) {
            sink_(event);
        }
    });
}

}  // namespace wxstream
