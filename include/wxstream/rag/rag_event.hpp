#pragma once

#include "wxstream/stream/stream_frame.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace wxstream {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Typed events of a retrieval-augmented answer stream
// ─────────────────────────────────────────────────────────────────────────────
// A request produces RagStart?, RagToken*, then RagDone or RagError. Done and
// Error end the logical request; they do not close the transport.

struct RagStart {
    std::string request_id;
    Json metadata;  // null when absent
};

struct RagToken {
    std::string content;
    std::string request_id;
    Json metadata;
};

struct RagDone {
    std::string request_id;
    Json metadata;  // e.g. prompt_version, total_tokens, sources_count
};

struct RagError {
    enum class Source {
        Protocol,   // the server sent {"type":"error"}
        Transport   // the request itself failed (RagStreamSession only)
    };

    std::string message;
    std::string request_id;
    Json metadata;
    Source source{Source::Protocol};
};

using RagStreamEvent = std::variant<RagStart, RagToken, RagDone, RagError>;

enum class RagEventType { Start, Token, Done, Error };

[[nodiscard]] constexpr std::string_view to_string(RagEventType type) noexcept {
    switch (type) {
        case RagEventType::Start: return "start";
        case RagEventType::Token: return "token";
        case RagEventType::Done:  return "done";
        case RagEventType::Error: return "error";
    }
    return "unknown";
}

[[nodiscard]] RagEventType type_of(const RagStreamEvent& event) noexcept;

[[nodiscard]] const std::string& request_id_of(const RagStreamEvent& event) noexcept;

/// True for RagDone and RagError.
[[nodiscard]] bool is_terminal(const RagStreamEvent& event) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Interpretation
// ─────────────────────────────────────────────────────────────────────────────

/// Maps a frame to a typed event.
///
/// Data that starts with '{' (after whitespace) is decoded as JSON and
/// dispatched on its "type" member. Anything else, including JSON that fails
/// to decode, becomes a RagToken carrying the raw data. The request id comes
/// from "requestId", else the frame id, else generate_request_id().
///
/// Returns nullopt only for a "token" payload that has no content at all.
[[nodiscard]] std::optional<RagStreamEvent> interpret(const StreamFrame& frame);

/// "<epoch millis>-<9 base-36 characters>"
[[nodiscard]] std::string generate_request_id();

// ─────────────────────────────────────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────────────────────────────────────

struct RagStreamListener {
    std::function<void()> on_start;
    std::function<void(const std::string& content, const std::string& request_id)> on_token;
    std::function<void(const std::string& request_id)> on_done;
    std::function<void(const std::string& message, const std::string& request_id)> on_error;
};

/// Invokes exactly the one listener member matching the event (if set).
void dispatch(const RagStreamEvent& event, const RagStreamListener& listener);

}  // namespace wxstream
