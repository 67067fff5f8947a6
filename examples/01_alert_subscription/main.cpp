// Example 01: Alert Subscription
//
// Subscribes to a weather alert stream and prints frames as they arrive.
// The connection is re-established automatically with exponential backoff.

#include <wxstream/log/spdlog_logger.hpp>
#include <wxstream/stream/event_source.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace wxstream;

int main() {
    std::cout << "=== Alert Subscription Example ===\n\n";

    const char* url_env = std::getenv("WX_ALERTS_URL");
    if (!url_env) {
        std::cerr << "Please set WX_ALERTS_URL environment variable\n";
        std::cerr << "Example: export WX_ALERTS_URL=\"http://localhost:8080/api/alerts/stream\"\n";
        return 1;
    }

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 1. Reconnect schedule: 1s, 2s, 4s, then give up
    EventSourceOptions options;
    options.with_reconnect_policy(ReconnectPolicy{}
                                      .with_base_interval(std::chrono::seconds(1))
                                      .with_max_attempts(3))
           .with_transport(StreamTransportConfig{}.with_stall_timeout(std::chrono::seconds(45)));

    // 2. Listener
    std::atomic<int> received{0};
    std::atomic<bool> closed{false};

    EventSourceListener listener;
    listener.on_open = [] { std::cout << "[open]\n"; };
    listener.on_message = [&](const StreamFrame& frame) {
        ++received;
        std::cout << "[" << frame.event_type() << "] " << frame.data << "\n";
    };
    listener.on_error = [](const StreamError& error) {
        std::cout << (error.fatal ? "[fatal] " : "[error] ") << error.message << "\n";
    };
    listener.on_reconnecting = [](std::size_t attempt, std::chrono::milliseconds delay) {
        std::cout << "[retry " << attempt << " in " << delay.count() << " ms]\n";
    };
    listener.on_close = [&] { closed = true; };

    // 3. Connect and listen for a minute
    auto source = open(url_env, std::move(listener), std::move(options));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::minutes(1);
    while (closed == false && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // 4. Stop; no callback runs after this returns
    source->disconnect();

    std::cout << "\nReceived " << received << " frames over "
              << source->connection_count() << " connection(s)\n";
    if (auto id = source->last_event_id()) {
        std::cout << "Last event id: " << *id << "\n";
    }
    return 0;
}
