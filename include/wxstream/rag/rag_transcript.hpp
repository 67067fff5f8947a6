#pragma once

#include "wxstream/rag/rag_event.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wxstream {

/// Derived view of one answer stream.
struct RagStreamState {
    bool is_streaming{false};
    bool is_complete{false};
    std::string content;                      // concatenated token content
    std::optional<std::string> request_id;    // from the latest event
    std::optional<std::string> error;
};

/// In-memory log of the events of one request plus the running answer.
/// Not synchronised; RagStreamSession guards its own instance.
class RagTranscript {
public:
    /// Clears everything and marks the stream as running.
    void begin();

    void apply(const RagStreamEvent& event);

    /// The stream stopped without a terminal event (cancel, end of body).
    void finish();

    [[nodiscard]] const std::vector<RagStreamEvent>& events() const noexcept { return events_; }
    [[nodiscard]] const RagStreamState& state() const noexcept { return state_; }
    [[nodiscard]] const std::string& content() const noexcept { return state_.content; }
    [[nodiscard]] std::size_t token_count() const noexcept { return token_count_; }

private:
    std::vector<RagStreamEvent> events_;
    RagStreamState state_;
    std::size_t token_count_{0};
};

}  // namespace wxstream
