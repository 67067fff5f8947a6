#include "wxstream/async/async_rag_stream.hpp"

#include "wxstream/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>

#include <chrono>
#include <future>

namespace wxstream {

namespace {

// How often a blocked producer re-checks for cancellation
constexpr std::chrono::milliseconds kSendPoll{50};

}  // namespace

AsyncRagStream::AsyncRagStream(
    asio::any_io_executor executor,
    std::string url,
    RagStreamRequest request,
    StreamTransportConfig config,
    HttpClientFactory client_factory,
    std::size_t channel_capacity
)
    : strand_(asio::make_strand(executor))
    , channel_(std::make_shared<EventChannel>(strand_, channel_capacity))
{
    session_ = std::make_unique<RagStreamSession>(
        std::move(url),
        std::move(request),
        RagEventSink([this](const RagStreamEvent& event) {
            const auto* error = std::get_if<RagError>(&event);
            if (error != nullptr && error->source == RagError::Source::Transport) {
                return;
            }
            push(event);
        }),
        std::move(config),
        std::move(client_factory));
}

AsyncRagStream::~AsyncRagStream() {
    cancel();
    if (producer_.joinable()) {
        producer_.join();
    }
}

void AsyncRagStream::start() {
    if (started_.exchange(true)) {
        return;
    }
    producer_ = std::thread([this]() {
        auto result = session_->run();
        {
            std::lock_guard<std::mutex> lock(result_mutex_);
            result_ = std::move(result);
        }
        push(std::nullopt);
    });
}

void AsyncRagStream::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    session_->cancel();
    asio::post(strand_, [channel = channel_]() {
        channel->close();
    });
}

// Runs on the producer thread; blocks until the consumer has room
void AsyncRagStream::push(std::optional<RagStreamEvent> item) {
    if (cancelled_.load()) {
        return;
    }

    auto sent = asio::co_spawn(
        strand_,
        [channel = channel_, item = std::move(item)]() mutable -> asio::awaitable<void> {
            co_await channel->async_send(asio::error_code{}, std::move(item), asio::use_awaitable);
        },
        asio::use_future);

    while (sent.wait_for(kSendPoll) != std::future_status::ready) {
        if (cancelled_.load()) {
            return;
        }
    }
    try {
        sent.get();
    } catch (const std::system_error& e) {
        get_logger().debug_fmt("answer stream channel closed: {}", e.what());
    }
}

StreamResult<std::optional<RagStreamEvent>> AsyncRagStream::final_result() {
    std::lock_guard<std::mutex> lock(result_mutex_);
    if (result_.has_value() && result_->has_value() == false) {
        return tl::unexpected(result_->error());
    }
    return std::optional<RagStreamEvent>{};
}

asio::awaitable<StreamResult<std::optional<RagStreamEvent>>> AsyncRagStream::async_next() {
    if (finished_) {
        co_return final_result();
    }

    try {
        auto item = co_await channel_->async_receive(asio::use_awaitable);
        if (item.has_value()) {
            co_return std::optional<RagStreamEvent>(std::move(*item));
        }
        finished_ = true;
        co_return final_result();
    } catch (const std::system_error& e) {
        // Closed by cancel()
        get_logger().debug_fmt("answer stream receive ended: {}", e.what());
        finished_ = true;
        co_return std::optional<RagStreamEvent>{};
    }
}

}  // namespace wxstream
