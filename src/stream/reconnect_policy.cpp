#include "wxstream/stream/reconnect_policy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace wxstream {

namespace {

[[nodiscard]] double scaled_ms(std::chrono::milliseconds base, double multiplier, std::size_t attempt) {
    const std::size_t exponent = (attempt == 0) ? 0 : attempt - 1;
    return static_cast<double>(base.count()) * std::pow(multiplier, static_cast<double>(exponent));
}

[[nodiscard]] std::chrono::milliseconds to_millis(double ms) {
    // Large attempt counts overflow to inf; clamp before converting
    constexpr double kLimit = static_cast<double>(std::chrono::milliseconds::max().count() / 2);
    return std::chrono::milliseconds{static_cast<std::int64_t>(std::clamp(ms, 0.0, kLimit))};
}

}  // namespace

std::chrono::milliseconds ReconnectPolicy::delay_for(std::size_t attempt) const {
    return to_millis(scaled_ms(base_interval, multiplier, attempt));
}

ReconnectPolicy& ReconnectPolicy::with_base_interval(std::chrono::milliseconds interval) {
    base_interval = interval;
    return *this;
}

ReconnectPolicy& ReconnectPolicy::with_max_attempts(std::size_t attempts) {
    max_attempts = attempts;
    return *this;
}

ReconnectPolicy& ReconnectPolicy::with_multiplier(double value) {
    multiplier = value;
    return *this;
}

ReconnectPolicy& ReconnectPolicy::with_jitter(double factor) {
    jitter_factor = factor;
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────

ExponentialBackoff::ExponentialBackoff(
    std::chrono::milliseconds base,
    double multiplier,
    std::optional<std::chrono::milliseconds> cap,
    double jitter_factor
)
    : base_(base)
    , multiplier_(multiplier)
    , cap_(cap)
    , jitter_factor_(jitter_factor)
    , rng_(std::random_device{}())
{}

std::unique_ptr<ExponentialBackoff> ExponentialBackoff::from(const ReconnectPolicy& policy) {
    return std::make_unique<ExponentialBackoff>(
        policy.base_interval, policy.multiplier, std::nullopt, policy.jitter_factor);
}

std::chrono::milliseconds ExponentialBackoff::next_delay(std::size_t attempt) {
    double ms = scaled_ms(base_, multiplier_, attempt);
    if (cap_.has_value()) {
        ms = std::min(ms, static_cast<double>(cap_->count()));
    }
    if (jitter_factor_ > 0.0) {
        std::uniform_real_distribution<double> spread(1.0 - jitter_factor_, 1.0 + jitter_factor_);
        ms *= spread(rng_);
    }
    return to_millis(ms);
}

}  // namespace wxstream
