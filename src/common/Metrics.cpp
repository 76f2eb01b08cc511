#include "common/Metrics.h"

namespace vst::common::metrics {

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[gaugeKey] = value;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.counters.reserve(counters_.size());
    for (const auto& [key, value] : counters_) {
        snapshot.counters.emplace(key, CounterSnapshot{value});
    }

    snapshot.gauges.reserve(gauges_.size());
    for (const auto& [key, value] : gauges_) {
        snapshot.gauges.emplace(key, GaugeSnapshot{value});
    }

    return snapshot;
}

std::uint64_t Registry::Snapshot::counter(const std::string& key) const {
    const auto it = counters.find(key);
    return it == counters.end() ? 0U : it->second.value;
}

double Registry::Snapshot::gauge(const std::string& key) const {
    const auto it = gauges.find(key);
    return it == gauges.end() ? 0.0 : it->second.value;
}

}  // namespace vst::common::metrics
