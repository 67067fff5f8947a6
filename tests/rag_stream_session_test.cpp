#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "wxstream/rag/rag_stream_session.hpp"

#include "mocks/mock_http_client.hpp"
#include "mocks/recording_backoff.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

using namespace wxstream;
using namespace wxstream::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

constexpr const char* kUrl = "https://wx.test/api/chat/stream";

struct RecordingListener {
    std::mutex mutex;
    std::vector<std::string> calls;

    RagStreamListener listener() {
        RagStreamListener l;
        l.on_start = [this] { record("start"); };
        l.on_token = [this](const std::string& content, const std::string&) { record("token:" + content); };
        l.on_done = [this](const std::string& id) { record("done:" + id); };
        l.on_error = [this](const std::string& message, const std::string& id) {
            record("error:" + message + "|" + id);
        };
        return l;
    }

    void record(std::string call) {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back(std::move(call));
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }
};

RagStreamRequest weekend_question() {
    RagStreamRequest request;
    request.query = "Rain this weekend?";
    request.location_id = "KSEA";
    return request;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// RagStreamRequest
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("RagStreamRequest serialises with camelCase keys", "[rag][session][request]") {
    RagStreamRequest request{"Is it icy?", "KBOS", "driving to work"};

    const Json body = request.to_json();

    REQUIRE(body["query"] == "Is it icy?");
    REQUIRE(body["locationId"] == "KBOS");
    REQUIRE(body["context"] == "driving to work");
}

TEST_CASE("RagStreamRequest omits absent fields", "[rag][session][request]") {
    RagStreamRequest request;
    request.query = "Fog?";

    const Json body = request.to_json();

    REQUIRE(body.size() == 1);
    REQUIRE(body.contains("locationId") == false);
    REQUIRE(body.contains("context") == false);
}

// ─────────────────────────────────────────────────────────────────────────────
// Streaming
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("RagStreamSession posts the question and streams the answer", "[rag][session]") {
    auto server = MockStreamServer::create();
    server->enqueue_stream({
        "id: 1\ndata: {\"type\":\"start\",\"requestId\":\"q-1\"}\n\n",
        ": keep-alive\n\n",
        "data: {\"type\":\"token\",\"content\":\"Light \",\"requestId\":\"q-1\"}\n\ndata: {\"type\":\"tok",
        "en\",\"content\":\"showers.\",\"requestId\":\"q-1\"}\n\n",
        "data: {\"type\":\"done\",\"requestId\":\"q-1\",\"metadata\":{\"total_tokens\":2}}\n\n",
    });

    RecordingListener log;
    RagStreamSession session(kUrl, weekend_question(), log.listener(), {}, server->factory());

    auto result = session.run();

    REQUIRE(result.has_value());
    REQUIRE(log.snapshot() == std::vector<std::string>{
        "start", "token:Light ", "token:showers.", "done:q-1"});

    auto requests = server->requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].base_url == "https://wx.test:443");
    REQUIRE(requests[0].method == HttpMethod::Post);
    REQUIRE(requests[0].path == "/api/chat/stream");
    REQUIRE(requests[0].headers["Content-Type"] == "application/json");
    REQUIRE(requests[0].headers["Accept"] == "text/event-stream");
    REQUIRE(requests[0].headers["Cache-Control"] == "no-cache");
    REQUIRE(Json::parse(requests[0].body.value()) == Json{{"query", "Rain this weekend?"}, {"locationId", "KSEA"}});

    const auto transcript = session.transcript();
    REQUIRE(transcript.content() == "Light showers.");
    REQUIRE(transcript.state().is_complete);
    REQUIRE(transcript.state().is_streaming == false);
    REQUIRE(transcript.state().request_id.value() == "q-1");
}

TEST_CASE("RagStreamSession mixes JSON and plain text payloads", "[rag][session]") {
    auto server = MockStreamServer::create();
    server->enqueue_stream({
        "data: Plain text token\n\n",
        "data: {not json\n\n",
        "data: line one\ndata: line two\n\n",
    });

    RecordingListener log;
    RagStreamSession session(kUrl, weekend_question(), log.listener(), {}, server->factory());

    REQUIRE(session.run());
    REQUIRE(log.snapshot() == std::vector<std::string>{
        "token:Plain text token", "token:{not json", "token:line one\nline two"});
}

TEST_CASE("RagStreamSession flushes a final frame without a trailing blank line", "[rag][session]") {
    auto server = MockStreamServer::create();
    server->enqueue_stream({
        "data: {\"type\":\"token\",\"content\":\"Clear\"}\n\n",
        "data: {\"type\":\"done\",\"requestId\":\"end\"}",
    });

    RecordingListener log;
    RagStreamSession session(kUrl, weekend_question(), log.listener(), {}, server->factory());

    REQUIRE(session.run());
    REQUIRE(log.snapshot() == std::vector<std::string>{"token:Clear", "done:end"});
}

TEST_CASE("RagStreamSession passes typed events to a sink", "[rag][session]") {
    auto server = MockStreamServer::create();
    server->enqueue_stream({"data: {\"type\":\"error\",\"error\":\"no data for station\",\"requestId\":\"e\"}\n\n"});

    std::vector<RagStreamEvent> events;
    RagStreamSession session(
        kUrl, weekend_question(),
        RagEventSink([&](const RagStreamEvent& event) { events.push_back(event); }),
        {}, server->factory());

    // A protocol error ends the request but the transport succeeded
    REQUIRE(session.run());
    REQUIRE(events.size() == 1);
    const auto& error = std::get<RagError>(events[0]);
    REQUIRE(error.message == "no data for station");
    REQUIRE(error.source == RagError::Source::Protocol);
    REQUIRE(session.transcript().state().error.value() == "no data for station");
}

// ─────────────────────────────────────────────────────────────────────────────
// Failures
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("RagStreamSession reports non-2xx responses with the body", "[rag][session][error]") {
    auto server = MockStreamServer::create();
    server->enqueue_status(500, {"upstream ", "model unavailable"});

    RecordingListener log;
    RagStreamSession session(kUrl, weekend_question(), log.listener(), {}, server->factory());

    auto result = session.run();

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == StreamError::Code::HttpError);
    REQUIRE(result.error().http_status.value() == 500);
    REQUIRE(result.error().message == "HTTP 500: upstream model unavailable");
    REQUIRE(result.error().fatal);
    REQUIRE(log.snapshot() == std::vector<std::string>{"error:HTTP 500: upstream model unavailable|"});
    REQUIRE(server->clients_created() == 1);
}

TEST_CASE("RagStreamSession reports transport failures once", "[rag][session][error]") {
    auto server = MockStreamServer::create();
    server->enqueue_connection_error("Could not resolve host: wx.test");

    RecordingListener log;
    RagStreamSession session(kUrl, weekend_question(), log.listener(), {}, server->factory());

    auto result = session.run();

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == StreamError::Code::ConnectionFailed);
    auto calls = log.snapshot();
    REQUIRE(calls.size() == 1);
    REQUIRE_THAT(calls[0], StartsWith("error:Could not resolve host"));
    REQUIRE(server->clients_created() == 1);
}

TEST_CASE("RagStreamSession reports a connection lost mid-answer", "[rag][session][error]") {
    auto server = MockStreamServer::create();
    StreamScript script;
    script.chunks = {"data: {\"type\":\"token\",\"content\":\"Partly\"}\n\n"};
    script.error_after_body = HttpClientError::connection_failed("Connection reset by peer");
    server->enqueue(script);

    RecordingListener log;
    RagStreamSession session(kUrl, weekend_question(), log.listener(), {}, server->factory());

    auto result = session.run();

    REQUIRE(result.has_value() == false);
    REQUIRE(log.snapshot() == std::vector<std::string>{"token:Partly", "error:Connection reset by peer|"});
    REQUIRE(session.transcript().content() == "Partly");
}

TEST_CASE("RagStreamSession runs only once", "[rag][session]") {
    auto server = MockStreamServer::create();
    server->enqueue_stream({"data: hi\n\n"});

    RagStreamSession session(kUrl, weekend_question(), RagStreamListener{}, {}, server->factory());

    REQUIRE(session.run());
    auto again = session.run();
    REQUIRE(again.has_value() == false);
    REQUIRE(again.error().code == StreamError::Code::Closed);
}

TEST_CASE("RagStreamSession rejects invalid URLs", "[rag][session]") {
    REQUIRE_THROWS_AS(
        RagStreamSession("wx.test/no-scheme", weekend_question(), RagStreamListener{}),
        std::invalid_argument);
}

// ─────────────────────────────────────────────────────────────────────────────
// Background run and cancellation
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("RagStreamSession start and wait", "[rag][session][async]") {
    auto server = MockStreamServer::create();
    server->enqueue_stream({"data: {\"type\":\"token\",\"content\":\"Dry\"}\n\ndata: {\"type\":\"done\"}\n\n"});

    RecordingListener log;
    RagStreamSession session(kUrl, weekend_question(), log.listener(), {}, server->factory());

    session.start();
    auto result = session.wait();

    REQUIRE(result.has_value());
    REQUIRE(log.snapshot().size() == 2);
}

TEST_CASE("RagStreamSession cancel is silent", "[rag][session][cancel]") {
    auto server = MockStreamServer::create();
    StreamScript script;
    script.chunks = {"data: {\"type\":\"token\",\"content\":\"Cloudy\"}\n\n"};
    script.hold_open = true;
    server->enqueue(script);

    RecordingListener log;
    RagStreamSession session(kUrl, weekend_question(), log.listener(), {}, server->factory());
    session.start();

    REQUIRE(wait_until([&] { return log.snapshot().size() == 1; }));
    session.cancel();
    const auto calls_at_cancel = log.snapshot();

    auto result = session.wait();

    REQUIRE(result.has_value());
    REQUIRE(session.was_cancelled());
    REQUIRE(log.snapshot() == calls_at_cancel);
    REQUIRE(calls_at_cancel == std::vector<std::string>{"token:Cloudy"});
    REQUIRE(session.transcript().state().is_streaming == false);
    REQUIRE(session.transcript().state().error.has_value() == false);
}

TEST_CASE("RagStreamSession transcript stops changing once cancelled", "[rag][session][cancel]") {
    auto server = MockStreamServer::create();
    server->enqueue_stream({
        "data: Dry\n\n"
        "data:  until\n\n"
        "data:  Sunday\n\n"
        "data: {\"type\":\"done\",\"requestId\":\"q-9\"}\n\n"
    });

    RagStreamSession* self = nullptr;
    std::vector<RagStreamEvent> delivered;
    RagStreamSession session(
        kUrl,
        weekend_question(),
        RagEventSink([&](const RagStreamEvent& event) {
            delivered.push_back(event);
            self->cancel();
        }),
        {},
        server->factory());
    self = &session;

    REQUIRE(session.run());
    REQUIRE(session.was_cancelled());
    REQUIRE(delivered.size() == 1);

    const auto transcript = session.transcript();
    REQUIRE(transcript.events().size() == 1);
    REQUIRE(transcript.content() == "Dry");
    REQUIRE(transcript.state().is_complete == false);
}

TEST_CASE("RagStreamSession cancelled before it runs never connects", "[rag][session][cancel]") {
    auto server = MockStreamServer::create();
    server->enqueue_stream({"data: never\n\n"});

    RecordingListener log;
    RagStreamSession session(kUrl, weekend_question(), log.listener(), {}, server->factory());
    session.cancel();

    REQUIRE(session.run());
    REQUIRE(log.snapshot().empty());
    REQUIRE(server->request_count() == 0);
}

TEST_CASE("RagStreamSession listener exceptions do not break the stream", "[rag][session]") {
    auto server = MockStreamServer::create();
    server->enqueue_stream({"data: one\n\ndata: two\n\n"});

    std::vector<std::string> seen;
    RagStreamListener listener;
    listener.on_token = [&](const std::string& content, const std::string&) {
        seen.push_back(content);
        if (content == "one") {
            throw std::runtime_error("render failed");
        }
    };

    RagStreamSession session(kUrl, weekend_question(), listener, {}, server->factory());

    REQUIRE(session.run());
    REQUIRE(seen == std::vector<std::string>{"one", "two"});
}
