#include "netmon/alert_dispatcher.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace netmon {

std::string format_timestamp(const TimePoint& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

LogFileAlertSink::LogFileAlertSink(const std::string& log_path)
    : log_path_(log_path)
{
    log_file_.open(log_path_, std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "Warning: Failed to open alert log file: " << log_path_ << "\n";
    }
}

LogFileAlertSink::~LogFileAlertSink() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

bool LogFileAlertSink::send(const std::string& device_id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!log_file_.is_open()) {
        return false;
    }

    log_file_ << "[" << format_timestamp(std::chrono::system_clock::now()) << "] "
              << "OFFLINE - " << device_id << ": " << message << "\n";
    log_file_.flush();
    return static_cast<bool>(log_file_);
}

bool ConsoleAlertSink::send(const std::string& device_id, const std::string& message) {
    std::ostringstream line;
    line << "[ALERT] " << device_id << ": " << message << "\n";
    std::cout << line.str() << std::flush;
    return true;
}

std::unique_ptr<AlertSink> create_alert_sink(const AlertConfig& config) {
    if (config.log_to_file && !config.log_path.empty()) {
        return std::make_unique<LogFileAlertSink>(config.log_path);
    }
    return std::make_unique<ConsoleAlertSink>();
}

AlertDispatcher::AlertDispatcher(const AlertConfig& config, std::unique_ptr<AlertSink> sink)
    : alert_config_(config)
    , sink_(std::move(sink))
{
}

void AlertDispatcher::update_config(const AlertConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    alert_config_ = config;
    while (history_.size() > static_cast<size_t>(std::max(alert_config_.history_size, 0))) {
        history_.pop_back();
    }
}

bool AlertDispatcher::should_alert(const Device& device, const StatusUpdate& update) {
    return update.entered_offline() && device.config.alert_on_offline;
}

std::string AlertDispatcher::format_message(const Device& device, const StatusUpdate& update) const {
    std::ostringstream oss;
    oss << device.display_name() << " (" << device.address() << ")";
    if (!device.config.location.empty()) {
        oss << " at " << device.config.location;
    }
    oss << " is OFFLINE after " << update.state.consecutive_failures << " failed probes"
        << " (was " << to_string(update.previous_status) << ")";
    if (!device.config.alert_email.empty()) {
        oss << ", notify " << device.config.alert_email;
    }
    return oss.str();
}

std::optional<Alert> AlertDispatcher::on_transition(const Device& device, const StatusUpdate& update) {
    if (!should_alert(device, update)) {
        return std::nullopt;
    }

    Alert alert;
    alert.device_id = device.address();
    alert.device_name = device.display_name();
    alert.destination = device.config.alert_email;
    alert.timestamp = update.state.last_status_change_time;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!alert_config_.enabled) {
            return std::nullopt;
        }
        alert.message = format_message(device, update);
    }

    // Single attempt, the transition stands whatever happens here
    try {
        alert.delivered = sink_ && sink_->send(alert.device_id, alert.message);
        if (!alert.delivered) {
            std::cerr << "Alert delivery failed for " << alert.device_id << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Alert delivery failed for " << alert.device_id << ": " << e.what() << "\n";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_front(alert);
    while (history_.size() > static_cast<size_t>(std::max(alert_config_.history_size, 0))) {
        history_.pop_back();
    }
    return alert;
}

std::vector<Alert> AlertDispatcher::recent_alerts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Alert>(history_.begin(), history_.end());
}

} // namespace netmon
