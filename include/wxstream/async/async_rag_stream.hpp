#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// AsyncRagStream - answer streams for asio coroutines
// ─────────────────────────────────────────────────────────────────────────────
//
// Runs a RagStreamSession on a producer thread and hands its events to a
// coroutine through an asio channel. The producer blocks while the channel is
// full, so a slow consumer slows the read instead of growing a queue.
//
//   wxstream::AsyncRagStream stream(io.get_executor(), url, {.query = "Frost tonight?"});
//   stream.start();
//   asio::co_spawn(stream.get_executor(), [&]() -> asio::awaitable<void> {
//       for (;;) {
//           auto next = co_await stream.async_next();
//           if (!next || !next->has_value()) break;
//           ...
//       }
//   }, asio::detached);
//
// async_next() must be awaited from a coroutine running on get_executor().
//
// ─────────────────────────────────────────────────────────────────────────────

#include "wxstream/rag/rag_event.hpp"
#include "wxstream/rag/rag_stream_session.hpp"
#include "wxstream/stream/stream_error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace wxstream {

class AsyncRagStream {
public:
    /// Throws std::invalid_argument when url is not an http(s) URL.
    AsyncRagStream(
        asio::any_io_executor executor,
        std::string url,
        RagStreamRequest request,
        StreamTransportConfig config = {},
        HttpClientFactory client_factory = make_http_client_factory(),
        std::size_t channel_capacity = 16
    );

    ~AsyncRagStream();

    AsyncRagStream(const AsyncRagStream&) = delete;
    AsyncRagStream& operator=(const AsyncRagStream&) = delete;

    [[nodiscard]] asio::strand<asio::any_io_executor> get_executor() const { return strand_; }

    /// Starts the request on the producer thread. Only the first call counts.
    void start();

    /// Next protocol event; nullopt once the stream has ended or was
    /// cancelled; the transport error if the request failed. Transport
    /// failures are reported only here, never as a RagError event.
    [[nodiscard]] asio::awaitable<StreamResult<std::optional<RagStreamEvent>>> async_next();

    /// Stops the request; pending and later async_next() calls return nullopt.
    void cancel();

private:
    // nullopt marks the end of the stream
    using EventChannel = asio::experimental::channel<
        void(asio::error_code, std::optional<RagStreamEvent>)
    >;

    void push(std::optional<RagStreamEvent> item);
    StreamResult<std::optional<RagStreamEvent>> final_result();

    asio::strand<asio::any_io_executor> strand_;
    std::shared_ptr<EventChannel> channel_;
    std::unique_ptr<RagStreamSession> session_;

    std::thread producer_;
    std::atomic<bool> started_{false};
    std::atomic<bool> cancelled_{false};
    bool finished_{false};  // consumer side, strand only

    std::mutex result_mutex_;
    std::optional<StreamResult<void>> result_;
};

}  // namespace wxstream
