#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace vst::common::metrics {

class Registry {
public:
    struct CounterSnapshot {
        std::uint64_t value{0};
    };

    struct GaugeSnapshot {
        double value{0.0};
    };

    struct Snapshot {
        std::unordered_map<std::string, CounterSnapshot> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;

        std::uint64_t counter(const std::string& key) const;
        double gauge(const std::string& key) const;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey,
                          std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    Snapshot snapshot() const;

private:
    Registry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, double> gauges_;
};

// Metric names shared by the core components.
namespace names {
inline constexpr const char* kReconnectAttempts = "reconnect_attempts_total";
inline constexpr const char* kEventsDropped = "events_dropped_total";
inline constexpr const char* kDecodeMalformed = "decode_malformed_total";
inline constexpr const char* kDecodeUnknown = "decode_unknown_total";
inline constexpr const char* kDecodeSchemaMismatch = "decode_schema_mismatch_total";
inline constexpr const char* kCommandsDropped = "commands_dropped_total";
inline constexpr const char* kWsState = "ws_state";
inline constexpr const char* kSnapshotSequence = "snapshot_sequence";
}  // namespace names

}  // namespace vst::common::metrics
