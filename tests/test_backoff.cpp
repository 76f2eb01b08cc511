#include <chrono>
#include <iostream>
#include <limits>
#include <vector>

#include "core/Backoff.h"

using core::Backoff;
using std::chrono::milliseconds;

int main() {
    {
        Backoff::Policy policy;
        policy.base = milliseconds(100);
        policy.cap = milliseconds(5000);
        policy.jitter = 0.0;
        Backoff backoff(policy, 7);

        const std::vector<long long> expected{100, 200, 400, 800, 1600, 3200, 5000, 5000};
        for (std::size_t i = 0; i < expected.size(); ++i) {
            const auto delay = backoff.nextDelay();
            if (delay.count() != expected[i]) {
                std::cerr << "Retry " << i << " expected " << expected[i] << "ms but got " << delay.count() << "ms\n";
                return 1;
            }
        }
        if (backoff.retryCount() != expected.size()) {
            std::cerr << "Expected retry count " << expected.size() << " but got " << backoff.retryCount() << "\n";
            return 1;
        }

        backoff.reset();
        if (backoff.retryCount() != 0 || backoff.nextDelay().count() != 100) {
            std::cerr << "Reset should restart the sequence at the base delay\n";
            return 1;
        }
    }

    {
        Backoff::Policy policy;
        policy.base = milliseconds(100);
        policy.cap = milliseconds(5000);
        policy.jitter = 0.5;

        for (std::uint32_t seed = 1; seed <= 50; ++seed) {
            Backoff backoff(policy, seed);
            milliseconds previous{0};
            for (std::uint32_t retry = 0; retry < 12; ++retry) {
                const auto floor = backoff.baseDelay(retry);
                const auto delay = backoff.nextDelay();
                if (delay < floor || delay > policy.cap) {
                    std::cerr << "Jittered delay " << delay.count() << "ms outside [" << floor.count() << ", "
                              << policy.cap.count() << "] (seed " << seed << ")\n";
                    return 1;
                }
                if (delay < previous) {
                    std::cerr << "Delay decreased from " << previous.count() << "ms to " << delay.count()
                              << "ms (seed " << seed << ")\n";
                    return 1;
                }
                previous = delay;
            }
        }
    }

    {
        // cap below base is lifted to base
        Backoff::Policy policy;
        policy.base = milliseconds(300);
        policy.cap = milliseconds(100);
        policy.jitter = 0.0;
        Backoff backoff(policy, 1);
        if (backoff.nextDelay().count() != 300 || backoff.nextDelay().count() != 300) {
            std::cerr << "Expected delays pinned at the base when cap < base\n";
            return 1;
        }
    }

    {
        Backoff::Policy policy;
        policy.base = milliseconds(100);
        policy.cap = milliseconds(5000);
        policy.jitter = std::numeric_limits<double>::quiet_NaN();
        Backoff backoff(policy, 3);
        if (backoff.policy().jitter != 0.0 || backoff.nextDelay().count() != 100 || backoff.nextDelay().count() != 200) {
            std::cerr << "A non-finite jitter must fall back to the plain schedule\n";
            return 1;
        }
    }

    return 0;
}
