// Example 02: Ask a Forecast Question
//
// POSTs a question to a retrieval-augmented answer endpoint and prints the
// answer while it streams in.

#include <wxstream/rag/rag_stream_session.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace wxstream;

int main() {
    std::cout << "=== Forecast Question Example ===\n\n";

    const char* url_env = std::getenv("WX_CHAT_URL");
    if (!url_env) {
        std::cerr << "Please set WX_CHAT_URL environment variable\n";
        std::cerr << "Example: export WX_CHAT_URL=\"http://localhost:8080/api/chat/stream\"\n";
        return 1;
    }
    const char* location_env = std::getenv("WX_LOCATION");

    // 1. Request
    RagStreamRequest request;
    request.query = "Should I expect rain this weekend?";
    if (location_env) {
        request.location_id = location_env;
    }
    std::cout << "Q: " << request.query << "\n\nA: ";

    // 2. Listener
    RagStreamListener listener;
    listener.on_token = [](const std::string& content, const std::string&) {
        std::cout << content << std::flush;
    };
    listener.on_done = [](const std::string& request_id) {
        std::cout << "\n\n[done " << request_id << "]\n";
    };
    listener.on_error = [](const std::string& message, const std::string&) {
        std::cerr << "\n[error] " << message << "\n";
    };

    // 3. Stream (blocking)
    RagStreamSession session(url_env, std::move(request), std::move(listener));
    auto result = session.run();
    if (!result) {
        return 1;
    }

    // 4. Inspect the transcript
    const auto transcript = session.transcript();
    std::cout << "Tokens: " << transcript.token_count() << "\n";
    std::cout << "Characters: " << transcript.content().size() << "\n";
    return transcript.state().error ? 1 : 0;
}
