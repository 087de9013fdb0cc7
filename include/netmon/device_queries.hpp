#pragma once

#include "netmon/device.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netmon {

// Read-only projections over device snapshots

struct NetworkHealthSummary {
    int total_devices = 0;
    int monitored_devices = 0;      // monitoring_enabled devices, the base for health
    int online_devices = 0;
    int warning_devices = 0;
    int offline_devices = 0;
    int unknown_devices = 0;
    int disabled_devices = 0;
    double average_latency_ms = 0.0;
    double health_percentage = 100.0;

    // "Healthy", "Good", "Fair" or "Issues"
    std::string health_status() const;
};

struct DeviceFilter {
    std::string search;                     // Case-insensitive match on name, address or location
    std::optional<DeviceType> type;
    std::optional<DeviceStatus> status;
    std::optional<std::string> location;
};

NetworkHealthSummary summarize(const std::vector<Device>& devices);

std::vector<Device> filter_devices(const std::vector<Device>& devices, const DeviceFilter& filter);

// Monitored devices in WARNING or OFFLINE, offline first
std::vector<Device> devices_requiring_attention(const std::vector<Device>& devices);

std::map<DeviceStatus, int> count_by_status(const std::vector<Device>& devices);
std::map<DeviceType, int> count_by_type(const std::vector<Device>& devices);

// Sorted, without empty locations
std::vector<std::string> unique_locations(const std::vector<Device>& devices);

} // namespace netmon
