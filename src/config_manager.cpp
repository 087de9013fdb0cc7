#include "netmon/config_manager.hpp"
#include "parse_utils.hpp"
#include <iostream>
#include <fstream>
#include <set>

// Line-oriented YAML reader for the netmon config layout: top-level keys,
// one level of named sections, and the "devices" list of mappings.
namespace netmon {

namespace {

void warn_invalid(const std::string& key, const std::string& value, int line_number) {
    std::cerr << "Config line " << line_number << ": ignoring invalid value '"
              << value << "' for " << key << "\n";
}

void read_int(const std::string& key, const std::string& value, int line_number, int& out) {
    if (!detail::parse_int(value, out)) warn_invalid(key, value, line_number);
}

void read_bool(const std::string& key, const std::string& value, int line_number, bool& out) {
    if (!detail::parse_bool(value, out)) warn_invalid(key, value, line_number);
}

bool apply_device_key(DeviceConfig& device, const std::string& key,
                      const std::string& value, int line_number) {
    if (key == "address") device.address = value;
    else if (key == "name") device.name = value;
    else if (key == "type") device.type = value;
    else if (key == "location") device.location = value;
    else if (key == "port") read_int(key, value, line_number, device.port);
    else if (key == "poll_interval_seconds") read_int(key, value, line_number, device.poll_interval_seconds);
    else if (key == "probe_timeout_millis") read_int(key, value, line_number, device.probe_timeout_millis);
    else if (key == "monitoring_enabled") read_bool(key, value, line_number, device.monitoring_enabled);
    else if (key == "alert_on_offline") read_bool(key, value, line_number, device.alert_on_offline);
    else if (key == "alert_email") device.alert_email = value;
    else if (key == "failure_threshold") read_int(key, value, line_number, device.failure_threshold);
    else return false;
    return true;
}

} // namespace

bool MonitorConfig::validate() const {
    std::string ignored;
    return validate_config(*this, ignored);
}

bool validate_config(const MonitorConfig& config, std::string& error_msg) {
    if (config.failure_threshold < 1) {
        error_msg = "failure_threshold must be at least 1";
        return false;
    }
    if (config.display.refresh_rate <= 0) {
        error_msg = "display.refresh_rate must be positive";
        return false;
    }
    if (config.probe.icmp_fallback_port <= 0 || config.probe.icmp_fallback_port > 65535) {
        error_msg = "probe.icmp_fallback_port must be between 1 and 65535";
        return false;
    }
    if (config.alerts.history_size < 0) {
        error_msg = "alerts.history_size cannot be negative";
        return false;
    }

    std::set<std::string> seen;
    for (const auto& device : config.devices) {
        if (!device.validate(error_msg)) {
            return false;
        }
        if (!seen.insert(device.address).second) {
            error_msg = "Duplicate device address: " + device.address;
            return false;
        }
    }
    return true;
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
    , last_modified_{}
{
}

bool ConfigManager::load() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << config_path_ << "\n";
        return false;
    }

    // Store file modification time
    try {
        last_modified_ = std::filesystem::last_write_time(config_path_);
    } catch (const std::exception& e) {
        std::cerr << "Failed to get file modification time: " << e.what() << "\n";
        return false;
    }

    MonitorConfig parsed;

    std::string raw;
    std::string current_section;
    DeviceConfig current_device;
    bool have_device = false;
    int line_number = 0;

    while (std::getline(file, raw)) {
        ++line_number;
        size_t indent = raw.find_first_not_of(' ');
        std::string line = detail::trim(raw);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers (no indent, nothing after the colon)
        if (indent == 0 && line.back() == ':' && line.find(' ') == std::string::npos) {
            if (have_device) {
                parsed.devices.push_back(current_device);
                have_device = false;
            }
            current_section = line.substr(0, line.length() - 1);
            continue;
        }

        if (indent == 0) {
            if (have_device) {
                parsed.devices.push_back(current_device);
                have_device = false;
            }
            current_section.clear();
        }

        // Start of a devices list item: "- address: ..."
        if (current_section == "devices" && line[0] == '-') {
            if (have_device) {
                parsed.devices.push_back(current_device);
            }
            current_device = DeviceConfig{};
            have_device = true;
            line = detail::trim(line.substr(1));
            if (line.empty()) {
                continue;
            }
        }

        std::string key, value;
        if (!detail::split_key_value(line, key, value)) {
            std::cerr << "Config line " << line_number << ": expected 'key: value'\n";
            continue;
        }

        bool known = true;
        if (current_section.empty()) {
            if (key == "version") parsed.version = value;
            else if (key == "failure_threshold") read_int(key, value, line_number, parsed.failure_threshold);
            else if (key == "debug_logging") read_bool(key, value, line_number, parsed.debug_logging);
            else known = false;
        }
        else if (current_section == "devices") {
            known = have_device && apply_device_key(current_device, key, value, line_number);
        }
        else if (current_section == "store") {
            if (key == "path") parsed.store.path = value;
            else known = false;
        }
        else if (current_section == "probe") {
            if (key == "icmp_fallback_port") read_int(key, value, line_number, parsed.probe.icmp_fallback_port);
            else known = false;
        }
        else if (current_section == "display") {
            if (key == "color_scheme") parsed.display.color_scheme = value;
            else if (key == "refresh_rate") read_int(key, value, line_number, parsed.display.refresh_rate);
            else if (key == "show_disabled") read_bool(key, value, line_number, parsed.display.show_disabled);
            else known = false;
        }
        else if (current_section == "alerts") {
            if (key == "enabled") read_bool(key, value, line_number, parsed.alerts.enabled);
            else if (key == "log_to_file") read_bool(key, value, line_number, parsed.alerts.log_to_file);
            else if (key == "log_path") parsed.alerts.log_path = value;
            else if (key == "history_size") read_int(key, value, line_number, parsed.alerts.history_size);
            else known = false;
        }
        else {
            known = false;
        }

        if (!known) {
            std::cerr << "Config line " << line_number << ": unknown key '" << key << "'";
            if (!current_section.empty()) {
                std::cerr << " in section '" << current_section << "'";
            }
            std::cerr << "\n";
        }
    }

    // Save last device if exists
    if (have_device) {
        parsed.devices.push_back(current_device);
    }

    config_ = std::move(parsed);
    return true;
}

bool ConfigManager::check_and_reload() {
    try {
        auto current_time = std::filesystem::last_write_time(config_path_);
        if (current_time != last_modified_) {
            return load();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error checking file modification: " << e.what() << "\n";
    }
    return false;
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    if (!netmon::validate_config(config_, error_msg)) {
        error_msg = "Configuration validation failed: " + error_msg;
        return false;
    }
    return true;
}

} // namespace netmon
