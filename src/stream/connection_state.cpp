#include "wxstream/stream/connection_state.hpp"

#include <algorithm>

namespace wxstream {

StreamConnectionState ConnectionStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t ConnectionStateMachine::attempt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_;
}

std::string ConnectionStateMachine::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::optional<std::string> ConnectionStateMachine::last_event_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_event_id_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────────────────────────────────────

bool ConnectionStateMachine::transition(
    std::initializer_list<StreamConnectionState> from,
    StreamConnectionState to
) {
    std::vector<StateChangeCallback> callbacks;
    StreamConnectionState old_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(from.begin(), from.end(), state_) == from.end()) {
            return false;
        }
        old_state = state_;
        state_ = to;
        if (to == StreamConnectionState::Connected) {
            attempt_ = 0;
        }
        callbacks = callbacks_;
    }
    fire(old_state, to, callbacks);
    return true;
}

bool ConnectionStateMachine::begin_connect() {
    return transition({StreamConnectionState::Disconnected}, StreamConnectionState::Connecting);
}

bool ConnectionStateMachine::connection_opened() {
    return transition({StreamConnectionState::Connecting}, StreamConnectionState::Connected);
}

ReconnectDecision ConnectionStateMachine::connection_lost(std::string reason) {
    std::vector<StateChangeCallback> callbacks;
    StreamConnectionState old_state;
    StreamConnectionState new_state;
    ReconnectDecision decision;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool active =
            state_ == StreamConnectionState::Connected || state_ == StreamConnectionState::Connecting;
        if (active == false) {
            return ReconnectDecision::Ignored;
        }
        last_error_ = std::move(reason);
        old_state = state_;
        if (attempt_ < max_attempts_) {
            ++attempt_;
            new_state = StreamConnectionState::Reconnecting;
            decision = ReconnectDecision::Retry;
        } else {
            new_state = StreamConnectionState::Closed;
            decision = ReconnectDecision::Exhausted;
        }
        state_ = new_state;
        callbacks = callbacks_;
    }
    fire(old_state, new_state, callbacks);
    return decision;
}

bool ConnectionStateMachine::begin_reconnect() {
    return transition({StreamConnectionState::Reconnecting}, StreamConnectionState::Connecting);
}

bool ConnectionStateMachine::close() {
    return transition(
        {StreamConnectionState::Disconnected, StreamConnectionState::Connecting,
         StreamConnectionState::Connected, StreamConnectionState::Reconnecting},
        StreamConnectionState::Closed);
}

void ConnectionStateMachine::record_event_id(std::string event_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_event_id_ = std::move(event_id);
}

void ConnectionStateMachine::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void ConnectionStateMachine::fire(
    StreamConnectionState old_state,
    StreamConnectionState new_state,
    const std::vector<StateChangeCallback>& callbacks
) {
    for (const auto& callback : callbacks) {
        if (callback) {
            callback(old_state, new_state);
        }
    }
}

}  // namespace wxstream
