#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace core {

// Exponential reconnect delay: min(base * 2^retry, cap) plus a random jitter of
// up to `jitter * delay`, with the total clamped to cap.
class Backoff {
public:
    struct Policy {
        std::chrono::milliseconds base{500};
        std::chrono::milliseconds cap{30000};
        double jitter{0.5};  // clamped to [0, 1]; a non-finite value disables jitter
    };

    explicit Backoff(Policy policy, std::uint32_t seed = std::random_device{}());

    // Deterministic part of the delay for a given retry index.
    std::chrono::milliseconds baseDelay(std::uint32_t retry) const;
    // Delay for the current retry index, then advances it.
    std::chrono::milliseconds nextDelay();
    void reset();

    std::uint32_t retryCount() const { return retry_; }
    const Policy& policy() const { return policy_; }

private:
    Policy policy_;
    std::mt19937 rng_;
    std::uint32_t retry_{0};
};

}  // namespace core
