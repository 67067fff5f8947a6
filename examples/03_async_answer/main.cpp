// Example 03: Asynchronous Answer Stream
//
// Consumes an answer stream from a C++20 coroutine via AsyncRagStream.

#include <wxstream/async/async_rag_stream.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>

using namespace wxstream;

asio::awaitable<void> print_answer(AsyncRagStream& stream) {
    for (;;) {
        auto next = co_await stream.async_next();
        if (!next) {
            std::cerr << "\nERROR: " << next.error().message << "\n";
            co_return;
        }
        if (!next->has_value()) {
            std::cout << "\n[end of stream]\n";
            co_return;
        }

        const auto& event = **next;
        if (const auto* token = std::get_if<RagToken>(&event)) {
            std::cout << token->content << std::flush;
        } else if (const auto* done = std::get_if<RagDone>(&event)) {
            std::cout << "\n[done " << done->request_id << "]";
        } else if (const auto* error = std::get_if<RagError>(&event)) {
            std::cout << "\n[error] " << error->message;
        }
    }
}

int main() {
    std::cout << "=== Asynchronous Answer Stream Example ===\n\n";

    const char* url_env = std::getenv("WX_CHAT_URL");
    if (!url_env) {
        std::cerr << "Please set WX_CHAT_URL environment variable\n";
        return 1;
    }

    asio::io_context io;

    AsyncRagStream stream(io.get_executor(), url_env, RagStreamRequest{.query = "How windy is it on the coast?"});
    stream.start();

    asio::co_spawn(stream.get_executor(), print_answer(stream), asio::detached);
    io.run();
    return 0;
}
