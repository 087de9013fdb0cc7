#pragma once

#include "netmon/device.hpp"
#include "netmon/prober.hpp"

namespace netmon {

constexpr int kDefaultFailureThreshold = 3;

struct Transition {
    DeviceStatus status;
    int consecutive_failures;
};

struct StatusUpdate {
    MonitoringState state;          // State to commit
    DeviceStatus previous_status;

    bool transitioned() const { return previous_status != state.status; }
    bool entered_offline() const {
        return transitioned() && state.status == DeviceStatus::Offline;
    }
};

// Decision table for one completed probe:
//   success                        -> ONLINE, failures reset to 0
//   failure, failures < threshold  -> WARNING
//   failure, failures >= threshold -> OFFLINE
Transition decide_transition(DeviceStatus current, int consecutive_failures,
                             bool probe_succeeded, int failure_threshold);

// Applies a probe outcome observed at `now` without touching the input.
// Uptime accounting runs only when the status actually changes.
StatusUpdate apply_probe_result(const MonitoringState& current, const ProbeResult& result,
                                TimePoint now, int failure_threshold = kDefaultFailureThreshold);

} // namespace netmon
