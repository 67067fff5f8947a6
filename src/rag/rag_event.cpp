#include "wxstream/rag/rag_event.hpp"

#include "wxstream/json/fast_json.hpp"
#include "wxstream/log/logger.hpp"

#include <chrono>
#include <random>

namespace wxstream {

namespace {

[[nodiscard]] std::string_view trim_left(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    return first == std::string_view::npos ? std::string_view{} : s.substr(first);
}

[[nodiscard]] std::optional<std::string> string_member(const Json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_string() == false) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] Json object_member(const Json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_object() == false) {
        return nullptr;
    }
    return *it;
}

[[nodiscard]] std::string resolve_request_id(const Json* payload, const StreamFrame& frame) {
    if (payload != nullptr) {
        if (auto id = string_member(*payload, "requestId")) {
            return *id;
        }
    }
    if (frame.id.has_value() && frame.id->empty() == false) {
        return *frame.id;
    }
    return generate_request_id();
}

// Server payloads put event metadata either in "metadata" or, for done/error,
// directly in an object-valued "data"
[[nodiscard]] Json metadata_of(const Json& obj, bool data_fallback) {
    Json metadata = object_member(obj, "metadata");
    if (metadata.is_null() && data_fallback) {
        metadata = object_member(obj, "data");
    }
    return metadata;
}

[[nodiscard]] std::string error_message_of(const Json& obj) {
    if (auto message = string_member(obj, "error")) {
        return *message;
    }
    if (auto message = string_member(obj, "data")) {
        return *message;
    }
    const Json details = object_member(obj, "data");
    if (details.is_object()) {
        if (auto message = string_member(details, "message")) {
            return *message;
        }
    }
    if (auto message = string_member(obj, "message")) {
        return *message;
    }
    return "Unknown stream error";
}

[[nodiscard]] RagToken plain_token(const StreamFrame& frame) {
    return RagToken{frame.data, resolve_request_id(nullptr, frame), nullptr};
}

[[nodiscard]] std::optional<RagStreamEvent> interpret_object(const Json& obj, const StreamFrame& frame) {
    const auto declared_type = string_member(obj, "type");
    const std::string type = declared_type.value_or("token");

    if (type == "start") {
        return RagStart{resolve_request_id(&obj, frame), metadata_of(obj, false)};
    }
    if (type == "done") {
        return RagDone{resolve_request_id(&obj, frame), metadata_of(obj, true)};
    }
    if (type == "error") {
        return RagError{error_message_of(obj), resolve_request_id(&obj, frame), metadata_of(obj, true),
                        RagError::Source::Protocol};
    }

    auto content = string_member(obj, "content");
    if (content.has_value() == false) {
        content = string_member(obj, "data");
    }
    if (content.has_value() == false) {
        if (declared_type == "token") {
            WXSTREAM_LOG_DEBUG("dropping token payload without content");
            return std::nullopt;
        }
        // Unknown or untyped payload: hand the text through untouched
        get_logger().debug_fmt("unrecognised payload type '{}', treating as token", type);
        content = frame.data;
    }
    if (content->empty()) {
        WXSTREAM_LOG_DEBUG("dropping token with empty content");
        return std::nullopt;
    }
    return RagToken{std::move(*content), resolve_request_id(&obj, frame), metadata_of(obj, false)};
}

}  // namespace

std::optional<RagStreamEvent> interpret(const StreamFrame& frame) {
    if (frame.data.empty()) {
        WXSTREAM_LOG_DEBUG("dropping token with empty content");
        return std::nullopt;
    }
    const std::string_view text = trim_left(frame.data);
    if (text.starts_with('{') == false) {
        return plain_token(frame);
    }

    auto parsed = fast_parse_object(text);
    if (parsed.has_value() == false) {
        get_logger().debug_fmt("payload is not valid JSON ({}), treating as text", parsed.error().message);
        return plain_token(frame);
    }
    return interpret_object(*parsed, frame);
}

std::string generate_request_id() {
    constexpr std::string_view kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);

    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::string id = std::to_string(now_ms);
    id.push_back('-');
    for (int i = 0; i < 9; ++i) {
        id.push_back(kAlphabet[pick(rng)]);
    }
    return id;
}

// ─────────────────────────────────────────────────────────────────────────────
// Event helpers
// ─────────────────────────────────────────────────────────────────────────────

RagEventType type_of(const RagStreamEvent& event) noexcept {
    switch (event.index()) {
        case 0: return RagEventType::Start;
        case 1: return RagEventType::Token;
        case 2: return RagEventType::Done;
        default: return RagEventType::Error;
    }
}

const std::string& request_id_of(const RagStreamEvent& event) noexcept {
    return std::visit([](const auto& e) -> const std::string& { return e.request_id; }, event);
}

bool is_terminal(const RagStreamEvent& event) noexcept {
    const RagEventType type = type_of(event);
    return type == RagEventType::Done || type == RagEventType::Error;
}

void dispatch(const RagStreamEvent& event, const RagStreamListener& listener) {
    if (std::holds_alternative<RagStart>(event)) {
        if (listener.on_start) {
            listener.on_start();
        }
    } else if (const auto* token = std::get_if<RagToken>(&event)) {
        if (listener.on_token) {
            listener.on_token(token->content, token->request_id);
        }
    } else if (const auto* done = std::get_if<RagDone>(&event)) {
        if (listener.on_done) {
            listener.on_done(done->request_id);
        }
    } else if (const auto* error = std::get_if<RagError>(&event)) {
        if (listener.on_error) {
            listener.on_error(error->message, error->request_id);
        }
    }
}

}  // namespace wxstream
