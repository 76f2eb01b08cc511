#include "core/Backoff.h"

#include <algorithm>
#include <cmath>

namespace core {

Backoff::Backoff(Policy policy, std::uint32_t seed)
    : policy_(policy), rng_(seed) {
    if (policy_.base.count() < 1) {
        policy_.base = std::chrono::milliseconds{1};
    }
    if (policy_.cap < policy_.base) {
        policy_.cap = policy_.base;
    }
    policy_.jitter = std::isfinite(policy_.jitter) ? std::clamp(policy_.jitter, 0.0, 1.0) : 0.0;
}

std::chrono::milliseconds Backoff::baseDelay(std::uint32_t retry) const {
    auto delay = policy_.base;
    for (std::uint32_t i = 0; i < retry && delay < policy_.cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy_.cap);
}

std::chrono::milliseconds Backoff::nextDelay() {
    const auto delay = baseDelay(retry_);
    ++retry_;

    const auto maxJitter = static_cast<std::int64_t>(static_cast<double>(delay.count()) * policy_.jitter);
    std::chrono::milliseconds jitter{0};
    if (maxJitter > 0) {
        std::uniform_int_distribution<std::int64_t> dist(0, maxJitter);
        jitter = std::chrono::milliseconds(dist(rng_));
    }
    return std::min(delay + jitter, policy_.cap);
}

void Backoff::reset() {
    retry_ = 0;
}

}  // namespace core
