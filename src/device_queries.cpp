#include "netmon/device_queries.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace netmon {

namespace {

std::string lower(const std::string& text) {
    std::string out = text;
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool contains_text(const std::string& haystack, const std::string& needle) {
    return lower(haystack).find(needle) != std::string::npos;
}

} // namespace

std::string NetworkHealthSummary::health_status() const {
    if (health_percentage >= 95.0) return "Healthy";
    if (health_percentage >= 85.0) return "Good";
    if (health_percentage >= 70.0) return "Fair";
    return "Issues";
}

NetworkHealthSummary summarize(const std::vector<Device>& devices) {
    NetworkHealthSummary summary;
    summary.total_devices = static_cast<int>(devices.size());

    double latency_total_ms = 0.0;
    int latency_samples = 0;

    for (const auto& device : devices) {
        if (!device.config.monitoring_enabled) {
            summary.disabled_devices++;
            continue;
        }
        summary.monitored_devices++;

        switch (device.state.status) {
            case DeviceStatus::Online:  summary.online_devices++;  break;
            case DeviceStatus::Warning: summary.warning_devices++; break;
            case DeviceStatus::Offline: summary.offline_devices++; break;
            default:                    summary.unknown_devices++; break;
        }

        if (device.state.last_probe_latency) {
            latency_total_ms += std::chrono::duration<double, std::milli>(*device.state.last_probe_latency).count();
            latency_samples++;
        }
    }

    if (latency_samples > 0) {
        summary.average_latency_ms = latency_total_ms / latency_samples;
    }
    if (summary.monitored_devices > 0) {
        summary.health_percentage = 100.0 * summary.online_devices / summary.monitored_devices;
    }
    return summary;
}

std::vector<Device> filter_devices(const std::vector<Device>& devices, const DeviceFilter& filter) {
    std::string needle = lower(filter.search);
    std::vector<Device> result;

    for (const auto& device : devices) {
        if (!needle.empty()) {
            bool matches = contains_text(device.config.name, needle) ||
                           contains_text(device.config.address, needle) ||
                           contains_text(device.config.location, needle);
            if (!matches) continue;
        }
        if (filter.type && device.type() != *filter.type) continue;
        if (filter.status && device.state.status != *filter.status) continue;
        if (filter.location && device.config.location != *filter.location) continue;
        result.push_back(device);
    }
    return result;
}

std::vector<Device> devices_requiring_attention(const std::vector<Device>& devices) {
    std::vector<Device> result;
    for (const auto& device : devices) {
        if (!device.config.monitoring_enabled) continue;
        if (device.state.status == DeviceStatus::Warning || device.state.status == DeviceStatus::Offline) {
            result.push_back(device);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const Device& a, const Device& b) {
        bool a_offline = a.state.status == DeviceStatus::Offline;
        bool b_offline = b.state.status == DeviceStatus::Offline;
        return a_offline && !b_offline;
    });
    return result;
}

std::map<DeviceStatus, int> count_by_status(const std::vector<Device>& devices) {
    std::map<DeviceStatus, int> counts;
    for (const auto& device : devices) {
        counts[device.state.status]++;
    }
    return counts;
}

std::map<DeviceType, int> count_by_type(const std::vector<Device>& devices) {
    std::map<DeviceType, int> counts;
    for (const auto& device : devices) {
        counts[device.type()]++;
    }
    return counts;
}

std::vector<std::string> unique_locations(const std::vector<Device>& devices) {
    std::set<std::string> locations;
    for (const auto& device : devices) {
        if (!device.config.location.empty()) {
            locations.insert(device.config.location);
        }
    }
    return std::vector<std::string>(locations.begin(), locations.end());
}

} // namespace netmon
