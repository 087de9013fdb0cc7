#include "netmon/device.hpp"
#include "netmon/uptime_accumulator.hpp"
#include <cctype>
#include <utility>

namespace netmon {

namespace {

std::string normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == ' ' || c == '-') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

bool has_control_chars(const std::string& text) {
    for (char c : text) {
        if (std::iscntrl(static_cast<unsigned char>(c))) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Online:  return "ONLINE";
        case DeviceStatus::Warning: return "WARNING";
        case DeviceStatus::Offline: return "OFFLINE";
        default:                    return "UNKNOWN";
    }
}

std::string to_string(DeviceType type) {
    switch (type) {
        case DeviceType::Printer:     return "printer";
        case DeviceType::AccessPoint: return "access_point";
        case DeviceType::Switch:      return "switch";
        case DeviceType::Router:      return "router";
        case DeviceType::Server:      return "server";
        case DeviceType::Camera:      return "camera";
        case DeviceType::Workstation: return "workstation";
        default:                      return "other";
    }
}

std::optional<DeviceStatus> parse_device_status(const std::string& text) {
    std::string key = normalize(text);
    if (key == "unknown") return DeviceStatus::Unknown;
    if (key == "online")  return DeviceStatus::Online;
    if (key == "warning") return DeviceStatus::Warning;
    if (key == "offline") return DeviceStatus::Offline;
    return std::nullopt;
}

std::optional<DeviceType> parse_device_type(const std::string& text) {
    std::string key = normalize(text);
    if (key == "printer") return DeviceType::Printer;
    if (key == "access_point" || key == "ap") return DeviceType::AccessPoint;
    if (key == "switch") return DeviceType::Switch;
    if (key == "router") return DeviceType::Router;
    if (key == "server") return DeviceType::Server;
    if (key == "camera") return DeviceType::Camera;
    if (key == "workstation") return DeviceType::Workstation;
    if (key == "other" || key.empty()) return DeviceType::Other;
    return std::nullopt;
}

bool DeviceConfig::validate(std::string& error_msg) const {
    if (address.empty()) {
        error_msg = "Device address is required";
        return false;
    }
    const std::pair<const char*, const std::string*> text_fields[] = {
        {"address", &address}, {"name", &name}, {"type", &type},
        {"location", &location}, {"alert_email", &alert_email},
    };
    for (const auto& [field, value] : text_fields) {
        if (has_control_chars(*value)) {
            error_msg = std::string("Device ") + field + " must not contain control characters";
            return false;
        }
    }
    if (poll_interval_seconds <= 0) {
        error_msg = "Poll interval for " + address + " must be positive";
        return false;
    }
    if (probe_timeout_millis <= 0) {
        error_msg = "Probe timeout for " + address + " must be positive";
        return false;
    }
    if (port < 0 || port > 65535) {
        error_msg = "Port for " + address + " must be between 0 and 65535";
        return false;
    }
    if (failure_threshold < 0) {
        error_msg = "Failure threshold for " + address + " cannot be negative";
        return false;
    }
    if (!parse_device_type(type)) {
        error_msg = "Unknown device type '" + type + "' for " + address;
        return false;
    }
    return true;
}

const std::string& Device::display_name() const {
    return config.name.empty() ? config.address : config.name;
}

DeviceType Device::type() const {
    return parse_device_type(config.type).value_or(DeviceType::Other);
}

double Device::uptime_percent() const {
    return netmon::uptime_percent(state.total_uptime_seconds, state.total_downtime_seconds);
}

Device make_device(const DeviceConfig& config, TimePoint now) {
    Device device;
    device.config = config;
    device.state.last_status_change_time = now;
    return device;
}

} // namespace netmon
