#pragma once

#include "netmon/config_manager.hpp"
#include "netmon/device.hpp"
#include "netmon/status_machine.hpp"
#include <chrono>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace netmon {

struct Alert {
    std::string device_id;      // Device address
    std::string device_name;
    std::string destination;    // "alert_email" of the device, may be empty
    std::string message;        // "Library Printer (10.0.0.5) is OFFLINE after 3 failed probes"
    bool delivered = false;
    TimePoint timestamp;
};

// Notification channel. Returns false when the message could not be delivered.
class AlertSink {
public:
    virtual ~AlertSink() = default;
    virtual bool send(const std::string& device_id, const std::string& message) = 0;
};

// Appends timestamped alerts to a log file
class LogFileAlertSink : public AlertSink {
public:
    explicit LogFileAlertSink(const std::string& log_path);
    ~LogFileAlertSink() override;

    bool send(const std::string& device_id, const std::string& message) override;

private:
    std::mutex mutex_;
    std::string log_path_;
    std::ofstream log_file_;
};

class ConsoleAlertSink : public AlertSink {
public:
    bool send(const std::string& device_id, const std::string& message) override;
};

// Factory function
std::unique_ptr<AlertSink> create_alert_sink(const AlertConfig& config);

class AlertDispatcher {
public:
    AlertDispatcher(const AlertConfig& config, std::unique_ptr<AlertSink> sink);

    // True for a transition into OFFLINE on a device that wants alerts
    static bool should_alert(const Device& device, const StatusUpdate& update);

    // Makes at most one delivery attempt for this transition. Delivery
    // problems are logged and never thrown back to the caller.
    std::optional<Alert> on_transition(const Device& device, const StatusUpdate& update);

    // Most recent first
    std::vector<Alert> recent_alerts() const;

    // Update configuration
    void update_config(const AlertConfig& config);

private:
    std::string format_message(const Device& device, const StatusUpdate& update) const;

    mutable std::mutex mutex_;
    AlertConfig alert_config_;
    std::unique_ptr<AlertSink> sink_;
    std::deque<Alert> history_;
};

std::string format_timestamp(const TimePoint& tp);

} // namespace netmon
