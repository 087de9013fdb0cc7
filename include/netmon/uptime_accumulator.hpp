#pragma once

#include "netmon/device.hpp"

namespace netmon {

// Closes the period the device spent in its current status and moves it to
// `new_status`. ONLINE time goes to uptime, OFFLINE time to downtime;
// UNKNOWN and WARNING periods are not counted toward either total.
void accumulate_transition(MonitoringState& state, DeviceStatus new_status, TimePoint now);

// Percentage of counted time spent ONLINE, 100 when nothing has been counted yet
double uptime_percent(double uptime_seconds, double downtime_seconds);

} // namespace netmon
