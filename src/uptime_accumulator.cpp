#include "netmon/uptime_accumulator.hpp"

namespace netmon {

void accumulate_transition(MonitoringState& state, DeviceStatus new_status, TimePoint now) {
    if (state.status == new_status) {
        return;
    }

    double elapsed = std::chrono::duration<double>(now - state.last_status_change_time).count();
    if (elapsed > 0.0) {
        if (state.status == DeviceStatus::Online) {
            state.total_uptime_seconds += elapsed;
        } else if (state.status == DeviceStatus::Offline) {
            state.total_downtime_seconds += elapsed;
        }
    }

    state.last_status_change_time = now;
    state.status = new_status;
}

double uptime_percent(double uptime_seconds, double downtime_seconds) {
    double total = uptime_seconds + downtime_seconds;
    if (total <= 0.0) {
        return 100.0;
    }
    return uptime_seconds / total * 100.0;
}

} // namespace netmon
