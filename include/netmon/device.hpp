#pragma once

#include <typiconf/typiconf.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace netmon {

using TimePoint = std::chrono::system_clock::time_point;

enum class DeviceStatus {
    Unknown,
    Online,
    Warning,
    Offline
};

enum class DeviceType {
    Printer,
    AccessPoint,
    Switch,
    Router,
    Server,
    Camera,
    Workstation,
    Other
};

std::string to_string(DeviceStatus status);
std::string to_string(DeviceType type);
std::optional<DeviceStatus> parse_device_status(const std::string& text);
std::optional<DeviceType> parse_device_type(const std::string& text);

// Operator-owned part of a device record
struct DeviceConfig {
    std::string address;                 // Lookup key, never changes after registration
    std::string name;
    std::string type = "other";
    std::string location;
    int port = 0;                        // 0 probes by ICMP echo, otherwise TCP connect
    int poll_interval_seconds = 60;
    int probe_timeout_millis = 5000;
    bool monitoring_enabled = true;
    bool alert_on_offline = true;
    std::string alert_email;
    int failure_threshold = 0;           // 0 uses the global threshold

    bool validate(std::string& error_msg) const;

    TYPICONF_DEFINE_FIELDS(DeviceConfig,
        TYPICONF_FIELD(address),
        TYPICONF_FIELD(name),
        TYPICONF_FIELD(type),
        TYPICONF_FIELD(location),
        TYPICONF_FIELD(port),
        TYPICONF_FIELD(poll_interval_seconds),
        TYPICONF_FIELD(probe_timeout_millis),
        TYPICONF_FIELD(monitoring_enabled),
        TYPICONF_FIELD(alert_on_offline),
        TYPICONF_FIELD(alert_email),
        TYPICONF_FIELD(failure_threshold)
    )
};

// Probe-owned part of a device record
struct MonitoringState {
    DeviceStatus status = DeviceStatus::Unknown;
    int consecutive_failures = 0;
    std::optional<TimePoint> last_probe_time;
    std::optional<std::chrono::microseconds> last_probe_latency;  // Only set after a successful probe
    TimePoint last_status_change_time{};
    double total_uptime_seconds = 0.0;
    double total_downtime_seconds = 0.0;
};

struct Device {
    DeviceConfig config;
    MonitoringState state;

    const std::string& address() const { return config.address; }
    const std::string& display_name() const;
    DeviceType type() const;
    double uptime_percent() const;
};

// Fresh record for a newly registered device
Device make_device(const DeviceConfig& config, TimePoint now);

} // namespace netmon
