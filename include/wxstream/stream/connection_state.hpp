#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wxstream {

/// Lifecycle of one subscription stream.
///
///   Disconnected ──begin_connect()──▶ Connecting ──connection_opened()──▶ Connected
///                                        ▲   │                              │
///                      begin_reconnect() │   │ connection_lost()            │ connection_lost()
///                                        │   ▼                              │
///                                     Reconnecting ◀────────────────────────┘
///
///   connection_lost() with no attempts left, or close() from anywhere ──▶ Closed
///
enum class StreamConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(StreamConnectionState state) noexcept {
    switch (state) {
        case StreamConnectionState::Disconnected: return "Disconnected";
        case StreamConnectionState::Connecting:   return "Connecting";
        case StreamConnectionState::Connected:    return "Connected";
        case StreamConnectionState::Reconnecting: return "Reconnecting";
        case StreamConnectionState::Closed:       return "Closed";
    }
    return "Unknown";
}

enum class ReconnectDecision {
    Retry,       // now Reconnecting; attempt() is the attempt to schedule
    Exhausted,   // max_attempts reached, now Closed
    Ignored      // already Closed (cancelled concurrently)
};

/// Thread-safe state holder for EventSource. State-change callbacks are
/// copied under the lock and invoked after releasing it, so a callback may
/// query the machine.
class ConnectionStateMachine {
public:
    using StateChangeCallback =
        std::function<void(StreamConnectionState old_state, StreamConnectionState new_state)>;

    explicit ConnectionStateMachine(std::size_t max_attempts = 5)
        : max_attempts_(max_attempts)
    {}

    ConnectionStateMachine(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;

    [[nodiscard]] StreamConnectionState state() const;

    /// Reconnect attempts since the last successful open.
    [[nodiscard]] std::size_t attempt() const;
    [[nodiscard]] std::size_t max_attempts() const noexcept { return max_attempts_; }
    [[nodiscard]] std::string last_error() const;
    [[nodiscard]] std::optional<std::string> last_event_id() const;

    /// Disconnected → Connecting. False (and no change) from any other state.
    bool begin_connect();

    /// Connecting → Connected, resetting the attempt counter.
    bool connection_opened();

    /// Connected|Connecting → Reconnecting while attempts remain, else → Closed.
    ReconnectDecision connection_lost(std::string reason);

    /// Reconnecting → Connecting.
    bool begin_reconnect();

    /// Any state → Closed. False if already Closed.
    bool close();

    void record_event_id(std::string event_id);

    void on_state_change(StateChangeCallback callback);

private:
    bool transition(
        std::initializer_list<StreamConnectionState> from,
        StreamConnectionState to
    );
    void fire(
        StreamConnectionState old_state,
        StreamConnectionState new_state,
        const std::vector<StateChangeCallback>& callbacks
    );

    const std::size_t max_attempts_;

    mutable std::mutex mutex_;
    StreamConnectionState state_{StreamConnectionState::Disconnected};
    std::size_t attempt_{0};
    std::string last_error_;
    std::optional<std::string> last_event_id_;
    std::vector<StateChangeCallback> callbacks_;
};

}  // namespace wxstream
