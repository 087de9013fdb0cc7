#pragma once

#include "netmon/device.hpp"
#include <typiconf/typiconf.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace netmon {

struct StoreConfig {
    std::string path;    // Directory for device records, empty keeps them in memory

    TYPICONF_DEFINE_FIELDS(StoreConfig,
        TYPICONF_FIELD(path)
    )
};

struct ProbeConfig {
    int icmp_fallback_port = 80;

    TYPICONF_DEFINE_FIELDS(ProbeConfig,
        TYPICONF_FIELD(icmp_fallback_port)
    )
};

struct DisplayConfig {
    std::string color_scheme = "default";
    int refresh_rate = 2;
    bool show_disabled = true;

    TYPICONF_DEFINE_FIELDS(DisplayConfig,
        TYPICONF_FIELD(color_scheme),
        TYPICONF_FIELD(refresh_rate),
        TYPICONF_FIELD(show_disabled)
    )
};

struct AlertConfig {
    bool enabled = true;
    bool log_to_file = true;
    std::string log_path = "./netmon-alerts.log";
    int history_size = 20;

    TYPICONF_DEFINE_FIELDS(AlertConfig,
        TYPICONF_FIELD(enabled),
        TYPICONF_FIELD(log_to_file),
        TYPICONF_FIELD(log_path),
        TYPICONF_FIELD(history_size)
    )
};

struct MonitorConfig {
    std::string version = "1.0";
    int failure_threshold = 3;
    bool debug_logging = false;
    StoreConfig store;
    ProbeConfig probe;
    DisplayConfig display;
    AlertConfig alerts;
    std::vector<DeviceConfig> devices;

    bool validate() const;

    TYPICONF_DEFINE_FIELDS(MonitorConfig,
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(failure_threshold),
        TYPICONF_FIELD(debug_logging),
        TYPICONF_FIELD(store),
        TYPICONF_FIELD(probe),
        TYPICONF_FIELD(display),
        TYPICONF_FIELD(alerts),
        TYPICONF_FIELD(devices)
    )
};

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path);

    // Load configuration
    bool load();

    // Reload if file changed (hot-reload)
    bool check_and_reload();

    // Access configuration
    const MonitorConfig& get_config() const { return config_; }

    // Validation
    bool validate_config(std::string& error_msg) const;

private:
    std::string config_path_;
    MonitorConfig config_;
    std::filesystem::file_time_type last_modified_;
};

// Checks every field of an already parsed configuration
bool validate_config(const MonitorConfig& config, std::string& error_msg);

} // namespace netmon
