#pragma once

#include "netmon/config_manager.hpp"
#include "netmon/alert_dispatcher.hpp"
#include "netmon/device_queries.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace netmon {

class Display {
public:
    explicit Display(const DisplayConfig& config, std::ostream& out = std::cout);

    // Clear screen and render full dashboard
    void render(const std::vector<Device>& devices,
                const NetworkHealthSummary& summary,
                const std::vector<Alert>& recent_alerts);

    // Same content without clearing the screen or the footer, for one-shot runs
    void print_report(const std::vector<Device>& devices,
                      const NetworkHealthSummary& summary,
                      const std::vector<Alert>& recent_alerts);

    // Update configuration (for hot-reload)
    void update_config(const DisplayConfig& config);

private:
    void render_header();
    void render_summary(const NetworkHealthSummary& summary);
    void render_devices(const std::vector<Device>& devices);
    void render_alerts(const std::vector<Alert>& alerts);
    void render_footer();

    // Helper rendering functions
    std::string create_uptime_bar(double percentage, int width, DeviceStatus status);

    // Color helpers (ANSI escape codes)
    std::string colorize(const std::string& text, DeviceStatus status);
    std::string color_code(DeviceStatus status);
    std::string reset_color();
    void clear_screen();

    DisplayConfig config_;
    std::ostream& out_;
};

// Helper functions for formatting
std::string format_duration(double seconds);
std::string format_latency(const std::optional<std::chrono::microseconds>& latency);
std::string status_icon(DeviceStatus status);

} // namespace netmon
