#pragma once

#include "netmon/config_manager.hpp"
#include "netmon/alert_dispatcher.hpp"
#include "netmon/device_queries.hpp"
#include "netmon/device_registry.hpp"
#include "netmon/device_store.hpp"
#include "netmon/display.hpp"
#include "netmon/poll_scheduler.hpp"
#include "netmon/prober.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace netmon {

using Clock = std::function<TimePoint()>;

// Upper bound on probes running at once in probe_all() and recheck_offline()
constexpr size_t kMaxParallelProbes = 16;

// Collaborators the monitor runs on. Anything left empty is built from the config.
struct MonitorComponents {
    std::unique_ptr<Prober> prober;
    std::unique_ptr<DeviceStore> store;
    std::unique_ptr<AlertSink> alert_sink;
    Clock clock;
};

enum class ManualProbeResult {
    Completed,
    AlreadyInFlight,
    UnknownDevice
};

struct ProbeSweep {
    int completed = 0;
    int skipped = 0;        // Already in flight
    int reachable = 0;
    int unreachable = 0;
};

class NetworkMonitor {
public:
    explicit NetworkMonitor(const std::string& config_path = "");
    ~NetworkMonitor();

    NetworkMonitor(const NetworkMonitor&) = delete;
    NetworkMonitor& operator=(const NetworkMonitor&) = delete;

    // Initialize all components from the config file
    bool initialize();

    // Initialize from an already loaded config
    bool initialize(const MonitorConfig& config, MonitorComponents components);

    // Start polling every monitored device
    void start();

    // Start polling and refresh the dashboard until stop()
    void run();

    // Stop monitoring
    void stop();

    // Only asks run() to return, safe to call from a signal handler
    void request_stop() { running_ = false; }

    bool is_started() const { return started_; }

    // Registration and configuration
    bool register_device(const DeviceConfig& config, std::string& error_msg);
    bool update_device(const DeviceConfig& config, std::string& error_msg);
    bool set_monitoring_enabled(const std::string& address, bool enabled, std::string& error_msg);
    bool remove_device(const std::string& address, std::string& error_msg);
    bool is_address_registered(const std::string& address) const;

    // Status queries, each device a consistent snapshot
    std::optional<Device> get_device(const std::string& address) const;
    std::vector<Device> list_devices() const;
    std::vector<Device> find_devices(const DeviceFilter& filter) const;
    std::vector<Device> devices_requiring_attention() const;
    std::map<DeviceStatus, int> status_counts() const;
    std::map<DeviceType, int> type_counts() const;
    std::vector<std::string> locations() const;
    NetworkHealthSummary health_summary() const;
    std::vector<Alert> recent_alerts() const;

    // Operator-initiated probes outside the schedule
    ManualProbeResult probe_now(const std::string& address);
    ProbeSweep probe_all();
    // Probes every OFFLINE device, returns the ones that came back ONLINE
    std::vector<Device> recheck_offline();

    int failure_threshold() const { return failure_threshold_.load(); }

    // Print a one-shot report to the display
    void print_report();

private:
    void run_probe_cycle(const std::string& address);
    std::optional<std::chrono::milliseconds> poll_interval(const std::string& address) const;
    ProbeSweep probe_many(const std::vector<std::string>& addresses);
    void apply_config(const MonitorConfig& config);
    void sync_schedule(const Device& device);

    std::string config_path_;
    std::unique_ptr<ConfigManager> config_manager_;

    std::unique_ptr<Prober> prober_;
    std::unique_ptr<DeviceStore> store_;
    std::unique_ptr<DeviceRegistry> registry_;
    std::unique_ptr<AlertDispatcher> alert_dispatcher_;
    std::unique_ptr<Display> display_;
    Clock clock_;

    std::atomic<int> failure_threshold_{kDefaultFailureThreshold};
    std::atomic<bool> running_{false};
    std::atomic<bool> started_{false};
    int refresh_rate_ = 2;

    // Destroyed first, its workers call back into the members above
    std::unique_ptr<PollScheduler> scheduler_;
};

} // namespace netmon
