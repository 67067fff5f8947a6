#ifndef WXSTREAM_STREAM_RECONNECT_POLICY_HPP
#define WXSTREAM_STREAM_RECONNECT_POLICY_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <random>

namespace wxstream {

// ─────────────────────────────────────────────────────────────────────────────
// ReconnectPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Fixed for the lifetime of one EventSource. Attempts are 1-based: the first
// reconnect after a failure waits base_interval, the next base * multiplier,
// and so on. Defaults give 5s, 10s, 20s, 40s, 80s, then give up.

struct ReconnectPolicy {
    std::chrono::milliseconds base_interval{5000};
    std::size_t max_attempts{5};
    double multiplier{2.0};
    double jitter_factor{0.0};  // 0.25 = +/-25%

    /// base_interval * multiplier^(attempt - 1), without jitter.
    [[nodiscard]] std::chrono::milliseconds delay_for(std::size_t attempt) const;

    ReconnectPolicy& with_base_interval(std::chrono::milliseconds interval);
    ReconnectPolicy& with_max_attempts(std::size_t attempts);
    ReconnectPolicy& with_multiplier(double value);
    ReconnectPolicy& with_jitter(double factor);
};

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Turns an attempt number into a wait. EventSource builds an
// ExponentialBackoff from its ReconnectPolicy unless one is injected; tests
// inject policies that record the schedule without sleeping.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    /// attempt is 1-based (1 = first reconnect).
    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    /// Called after a connection opened successfully.
    virtual void reset() = 0;
};

class ExponentialBackoff : public IBackoffPolicy {
public:
    explicit ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier = 2.0,
        std::optional<std::chrono::milliseconds> cap = std::nullopt,
        double jitter_factor = 0.0
    );

    [[nodiscard]] static std::unique_ptr<ExponentialBackoff> from(const ReconnectPolicy& policy);

    std::chrono::milliseconds next_delay(std::size_t attempt) override;
    void reset() override {}

private:
    std::chrono::milliseconds base_;
    double multiplier_;
    std::optional<std::chrono::milliseconds> cap_;
    double jitter_factor_;
    std::mt19937 rng_;
};

/// Reconnect immediately.
class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }
    void reset() override {}
};

}  // namespace wxstream

#endif  // WXSTREAM_STREAM_RECONNECT_POLICY_HPP
