#include "wxstream/rag/rag_transcript.hpp"

namespace wxstream {

void RagTranscript::begin() {
    events_.clear();
    state_ = RagStreamState{};
    state_.is_streaming = true;
    token_count_ = 0;
}

void RagTranscript::apply(const RagStreamEvent& event) {
    events_.push_back(event);
    if (const auto& id = request_id_of(event); id.empty() == false) {
        state_.request_id = id;
    }

    if (const auto* token = std::get_if<RagToken>(&event)) {
        state_.content += token->content;
        ++token_count_;
    } else if (std::holds_alternative<RagDone>(event)) {
        state_.is_streaming = false;
        state_.is_complete = true;
    } else if (const auto* error = std::get_if<RagError>(&event)) {
        state_.is_streaming = false;
        state_.error = error->message;
    }
}

void RagTranscript::finish() {
    state_.is_streaming = false;
}

}  // namespace wxstream
