#include "netmon/display.hpp"
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cmath>

namespace netmon {

Display::Display(const DisplayConfig& config, std::ostream& out)
    : config_(config)
    , out_(out)
{
}

void Display::update_config(const DisplayConfig& config) {
    config_ = config;
}

std::string Display::color_code(DeviceStatus status) {
    if (config_.color_scheme == "mono") {
        return "";
    }

    switch (status) {
        case DeviceStatus::Online:  return "\033[32m";  // Green
        case DeviceStatus::Warning: return "\033[33m";  // Yellow
        case DeviceStatus::Offline: return "\033[31m";  // Red
        default:                    return "\033[90m";  // Grey
    }
}

std::string Display::reset_color() {
    if (config_.color_scheme == "mono") {
        return "";
    }
    return "\033[0m";
}

std::string Display::colorize(const std::string& text, DeviceStatus status) {
    return color_code(status) + text + reset_color();
}

void Display::clear_screen() {
    out_ << "\033[2J\033[H" << std::flush;
}

std::string format_duration(double seconds) {
    auto total = static_cast<long long>(std::floor(std::max(seconds, 0.0)));
    long long days = total / 86400;
    long long hours = (total % 86400) / 3600;
    long long minutes = (total % 3600) / 60;
    long long secs = total % 60;

    std::ostringstream oss;
    if (days > 0) {
        oss << days << "d " << hours << "h";
    } else if (hours > 0) {
        oss << hours << "h " << minutes << "m";
    } else if (minutes > 0) {
        oss << minutes << "m " << secs << "s";
    } else {
        oss << secs << "s";
    }
    return oss.str();
}

std::string format_latency(const std::optional<std::chrono::microseconds>& latency) {
    if (!latency) {
        return "-";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << std::chrono::duration<double, std::milli>(*latency).count() << " ms";
    return oss.str();
}

std::string status_icon(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Online:  return "\u2713";  // ✓
        case DeviceStatus::Warning: return "\u26A0";  // ⚠
        case DeviceStatus::Offline: return "\u2717";  // ✗
        default:                    return "?";
    }
}

std::string Display::create_uptime_bar(double percentage, int width, DeviceStatus status) {
    int filled = static_cast<int>(std::clamp(percentage, 0.0, 100.0) / 100.0 * width);
    std::string bar;
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? "\u2588" : "\u2591";
    }
    return colorize(bar, status);
}

void Display::render_header() {
    const int box_width = 60;
    const std::string title = "NETMON - Campus Network Devices";
    const int padding = (box_width - static_cast<int>(title.length())) / 2;

    out_ << "\u2554";
    for (int i = 0; i < box_width; ++i) out_ << "\u2550";
    out_ << "\u2557\n";

    out_ << "\u2551";
    for (int i = 0; i < padding; ++i) out_ << " ";
    out_ << title;
    for (int i = 0; i < box_width - padding - static_cast<int>(title.length()); ++i) out_ << " ";
    out_ << "\u2551\n";

    out_ << "\u255A";
    for (int i = 0; i < box_width; ++i) out_ << "\u2550";
    out_ << "\u255D\n\n";
}

void Display::render_summary(const NetworkHealthSummary& summary) {
    DeviceStatus tone = DeviceStatus::Online;
    if (summary.health_percentage < 70.0) {
        tone = DeviceStatus::Offline;
    } else if (summary.health_percentage < 95.0) {
        tone = DeviceStatus::Warning;
    }

    out_ << "[Network Health]  "
         << colorize(std::to_string(static_cast<int>(summary.health_percentage)) + "% " +
                     summary.health_status(), tone)
         << "\n";
    out_ << "  Devices: " << summary.total_devices
         << "  Online: " << summary.online_devices
         << "  Warning: " << summary.warning_devices
         << "  Offline: " << summary.offline_devices
         << "  Unknown: " << summary.unknown_devices
         << "  Disabled: " << summary.disabled_devices << "\n";
    out_ << "  Avg latency: " << std::fixed << std::setprecision(1)
         << summary.average_latency_ms << " ms\n\n";
}

void Display::render_devices(const std::vector<Device>& devices) {
    out_ << "[Devices]\n";

    if (devices.empty()) {
        out_ << "  No devices registered\n\n";
        return;
    }

    for (const auto& device : devices) {
        if (!device.config.monitoring_enabled && !config_.show_disabled) {
            continue;
        }

        DeviceStatus status = device.state.status;
        std::string label = device.display_name() + " (" + device.address() + ")";

        out_ << "  " << colorize(status_icon(status), status) << " "
             << std::setw(34) << std::left << label.substr(0, 34)
             << std::setw(9) << std::left << to_string(status);

        if (!device.config.monitoring_enabled) {
            out_ << colorize("disabled", DeviceStatus::Unknown) << "\n";
            continue;
        }

        out_ << create_uptime_bar(device.uptime_percent(), 10, status) << " "
             << std::setw(6) << std::right << std::fixed << std::setprecision(1)
             << device.uptime_percent() << "%  "
             << std::setw(9) << std::right << format_latency(device.state.last_probe_latency);

        if (device.state.total_downtime_seconds > 0.0) {
            out_ << "  down " << format_duration(device.state.total_downtime_seconds);
        }
        if (device.state.consecutive_failures > 0) {
            out_ << "  fails: " << device.state.consecutive_failures;
        }
        out_ << "\n";
    }
    out_ << "\n";
}

void Display::render_alerts(const std::vector<Alert>& alerts) {
    size_t shown = std::min<size_t>(5, alerts.size());
    out_ << "[Alerts - Last " << shown << "]\n";

    if (alerts.empty()) {
        out_ << "  " << colorize("No offline alerts", DeviceStatus::Online) << "\n";
    } else {
        for (size_t i = 0; i < shown; ++i) {
            const auto& alert = alerts[i];
            out_ << "  " << status_icon(DeviceStatus::Offline) << " "
                 << format_timestamp(alert.timestamp) << " | "
                 << colorize(alert.message, DeviceStatus::Offline);
            if (!alert.delivered) {
                out_ << " (not delivered)";
            }
            out_ << "\n";
        }
    }
    out_ << "\n";
}

void Display::render_footer() {
    out_ << "Press Ctrl+C to quit, Config hot-reload enabled\n";
}

void Display::render(const std::vector<Device>& devices,
                     const NetworkHealthSummary& summary,
                     const std::vector<Alert>& recent_alerts)
{
    clear_screen();

    render_header();
    render_summary(summary);
    render_devices(devices);
    render_alerts(recent_alerts);
    render_footer();
    out_ << std::flush;
}

void Display::print_report(const std::vector<Device>& devices,
                           const NetworkHealthSummary& summary,
                           const std::vector<Alert>& recent_alerts)
{
    render_header();
    render_summary(summary);
    render_devices(devices);
    render_alerts(recent_alerts);
    out_ << std::flush;
}

} // namespace netmon
