#pragma once

#include "wxstream/rag/rag_event.hpp"
#include "wxstream/rag/rag_transcript.hpp"
#include "wxstream/stream/callback_gate.hpp"
#include "wxstream/stream/frame_reader.hpp"
#include "wxstream/stream/stream_error.hpp"
#include "wxstream/transport/http_client.hpp"
#include "wxstream/transport/stream_transport_config.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace wxstream {

/// Body of a question POSTed to the answer-stream endpoint.
struct RagStreamRequest {
    std::string query;
    std::optional<std::string> location_id;
    std::optional<std::string> context;

    /// {"query": ..., "locationId": ..., "context": ...}; absent fields omitted.
    [[nodiscard]] Json to_json() const;
};

using RagEventSink = std::function<void(const RagStreamEvent& event)>;

// ─────────────────────────────────────────────────────────────────────────────
// RagStreamSession
// ─────────────────────────────────────────────────────────────────────────────
// One POST, one answer. The response body is read incrementally, each frame
// interpreted and passed on as soon as it is complete. There is no automatic
// reconnect: a failed request is reported once (a RagError with
// Source::Transport, i.e. on_error(message, "")) and a new session is needed.
//
//   RagStreamSession session(url, {.query = "Will it rain tomorrow?"}, RagStreamListener{
//       .on_token = [](const std::string& text, const std::string&) { std::cout << text; },
//   });
//   auto result = session.run();

class RagStreamSession {
public:
    /// Throws std::invalid_argument when url is not an http(s) URL.
    RagStreamSession(
        std::string url,
        RagStreamRequest request,
        RagEventSink sink,
        StreamTransportConfig config = {},
        HttpClientFactory client_factory = make_http_client_factory()
    );

    /// Listener callbacks are dispatched through dispatch().
    RagStreamSession(
        std::string url,
        RagStreamRequest request,
        RagStreamListener listener,
        StreamTransportConfig config = {},
        HttpClientFactory client_factory = make_http_client_factory()
    );

    ~RagStreamSession();

    RagStreamSession(const RagStreamSession&) = delete;
    RagStreamSession& operator=(const RagStreamSession&) = delete;

    /// Streams on the calling thread until the body ends, the request fails or
    /// cancel() is called. A cancelled session returns success; check
    /// was_cancelled(). A session runs at most once.
    StreamResult<void> run();

    /// run() on a background thread.
    void start();

    /// Joins the background thread started by start() and returns its result.
    StreamResult<void> wait();

    /// Aborts the request. No sink call starts after cancel() returns.
    void cancel();

    [[nodiscard]] bool was_cancelled() const noexcept { return cancelled_.load(); }

    /// Snapshot of the events received so far.
    [[nodiscard]] RagTranscript transcript() const;

private:
    StreamResult<void> execute();
    HttpRequest build_request() const;
    void handle(const StreamFrame& frame);
    void emit(const RagStreamEvent& event);

    std::string url_;
    UrlComponents endpoint_;
    RagStreamRequest request_;
    RagEventSink sink_;
    StreamTransportConfig config_;
    HttpClientFactory client_factory_;

    CallbackGate gate_;
    std::atomic<bool> started_{false};
    std::atomic<bool> cancelled_{false};

    std::mutex client_mutex_;
    IHttpClient* active_client_{nullptr};

    mutable std::mutex transcript_mutex_;
    RagTranscript transcript_;

    std::thread worker_;
    std::optional<StreamResult<void>> background_result_;
};

}  // namespace wxstream
