#include "netmon/status_machine.hpp"
#include "netmon/uptime_accumulator.hpp"
#include <limits>

namespace netmon {

Transition decide_transition(DeviceStatus current, int consecutive_failures,
                             bool probe_succeeded, int failure_threshold) {
    if (probe_succeeded) {
        return {DeviceStatus::Online, 0};
    }

    int threshold = failure_threshold > 0 ? failure_threshold : kDefaultFailureThreshold;
    int failures = consecutive_failures < std::numeric_limits<int>::max()
        ? consecutive_failures + 1
        : consecutive_failures;

    if (failures >= threshold || current == DeviceStatus::Offline) {
        return {DeviceStatus::Offline, failures};
    }
    return {DeviceStatus::Warning, failures};
}

StatusUpdate apply_probe_result(const MonitoringState& current, const ProbeResult& result,
                                TimePoint now, int failure_threshold) {
    StatusUpdate update{current, current.status};

    Transition next = decide_transition(current.status, current.consecutive_failures,
                                        result.success, failure_threshold);

    update.state.consecutive_failures = next.consecutive_failures;
    update.state.last_probe_time = now;
    if (result.success) {
        update.state.last_probe_latency = result.latency;
    } else {
        update.state.last_probe_latency.reset();
    }

    accumulate_transition(update.state, next.status, now);
    return update;
}

} // namespace netmon
