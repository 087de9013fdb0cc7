#include "netmon/network_monitor.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace netmon {

NetworkMonitor::NetworkMonitor(const std::string& config_path)
    : config_path_(config_path)
{
}

NetworkMonitor::~NetworkMonitor() {
    stop();
}

bool NetworkMonitor::initialize() {
    config_manager_ = std::make_unique<ConfigManager>(config_path_);

    // Load configuration
    if (!config_manager_->load()) {
        std::cerr << "Failed to load configuration from " << config_path_ << "\n";
        return false;
    }

    // Validate configuration
    std::string validation_error;
    if (!config_manager_->validate_config(validation_error)) {
        std::cerr << validation_error << "\n";
        return false;
    }

    return initialize(config_manager_->get_config(), MonitorComponents{});
}

bool NetworkMonitor::initialize(const MonitorConfig& config, MonitorComponents components) {
    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        std::cerr << "Configuration validation failed: " << validation_error << "\n";
        return false;
    }

    DebugLogger::set_enabled(config.debug_logging);

    // Initialize components
    try {
        prober_ = components.prober
            ? std::move(components.prober)
            : create_prober(ProberOptions{config.probe.icmp_fallback_port});
        store_ = components.store
            ? std::move(components.store)
            : create_device_store(config.store.path);
        clock_ = components.clock
            ? std::move(components.clock)
            : Clock([] { return std::chrono::system_clock::now(); });

        registry_ = std::make_unique<DeviceRegistry>(*store_);
        registry_->load();
    } catch (const StoreError& e) {
        std::cerr << "Failed to open device store: " << e.what() << "\n";
        return false;
    }

    auto sink = components.alert_sink
        ? std::move(components.alert_sink)
        : create_alert_sink(config.alerts);
    alert_dispatcher_ = std::make_unique<AlertDispatcher>(config.alerts, std::move(sink));
    display_ = std::make_unique<Display>(config.display);

    scheduler_ = std::make_unique<PollScheduler>(
        [this](const std::string& address) { run_probe_cycle(address); },
        [this](const std::string& address) { return poll_interval(address); });

    // Devices restored from the store can be probed by hand right away
    for (const auto& device : registry_->list()) {
        scheduler_->track(device.address());
    }

    apply_config(config);
    DebugLogger::log("Initialized with ", registry_->size(), " devices");
    return true;
}

void NetworkMonitor::apply_config(const MonitorConfig& config) {
    DebugLogger::set_enabled(config.debug_logging);
    failure_threshold_ = config.failure_threshold;
    refresh_rate_ = config.display.refresh_rate;
    alert_dispatcher_->update_config(config.alerts);
    display_->update_config(config.display);

    // Devices listed in the file are registered, or their settings refreshed
    for (const auto& device_config : config.devices) {
        std::string error;
        bool ok = is_address_registered(device_config.address)
            ? update_device(device_config, error)
            : register_device(device_config, error);
        if (!ok) {
            std::cerr << "Cannot apply configured device " << device_config.address
                      << ": " << error << "\n";
        }
    }
}

void NetworkMonitor::start() {
    if (!scheduler_) {
        std::cerr << "Network monitor not initialized. Call initialize() first.\n";
        return;
    }

    started_ = true;
    for (const auto& device : registry_->list()) {
        sync_schedule(device);
    }
}

void NetworkMonitor::run() {
    if (!scheduler_ || !display_) {
        std::cerr << "Network monitor not initialized. Call initialize() first.\n";
        return;
    }

    running_ = true;
    start();

    std::cout << "netmon started. Monitoring " << registry_->size() << " devices";
    if (!config_path_.empty()) {
        std::cout << " with config: " << config_path_;
    }
    std::cout << "\nPress Ctrl+C to exit.\n\n";

    while (running_) {
        auto loop_start = std::chrono::steady_clock::now();

        // Hot-reload configuration if changed
        if (config_manager_ && config_manager_->check_and_reload()) {
            std::string error;
            if (config_manager_->validate_config(error)) {
                apply_config(config_manager_->get_config());
            } else {
                std::cerr << "Ignoring reloaded configuration: " << error << "\n";
            }
        }

        std::vector<Device> devices = registry_->list();
        display_->render(devices, summarize(devices), alert_dispatcher_->recent_alerts());

        // Sleep until next refresh, waking early on stop()
        auto next = loop_start + std::chrono::seconds(refresh_rate_);
        while (running_ && std::chrono::steady_clock::now() < next) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    stop();
}

void NetworkMonitor::stop() {
    running_ = false;
    started_ = false;
    if (scheduler_) {
        scheduler_->stop_all();
    }
}

std::optional<std::chrono::milliseconds> NetworkMonitor::poll_interval(const std::string& address) const {
    auto device = registry_->get(address);
    if (!device || !device->config.monitoring_enabled) {
        return std::nullopt;
    }
    return std::chrono::seconds(device->config.poll_interval_seconds);
}

void NetworkMonitor::sync_schedule(const Device& device) {
    scheduler_->track(device.address());
    if (!started_) {
        return;
    }
    if (device.config.monitoring_enabled) {
        scheduler_->schedule(device.address());
    } else {
        scheduler_->unschedule(device.address());
    }
}

void NetworkMonitor::run_probe_cycle(const std::string& address) {
    // Full record at the start of the cycle
    auto device = registry_->get(address);
    if (!device) {
        return;
    }

    ProbeResult result;
    try {
        result = prober_->probe(device->config.address, device->config.port,
                                std::chrono::milliseconds(device->config.probe_timeout_millis));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid probe settings for " << address << ": " << e.what() << "\n";
        return;
    }

    std::optional<CommittedProbe> committed;
    try {
        committed = registry_->apply_probe(address, result, clock_(), failure_threshold_.load());
    } catch (const StoreError& e) {
        std::cerr << "Persistence error for " << address << ", probe cycle abandoned: "
                  << e.what() << "\n";
        return;
    }
    if (!committed) {
        return;
    }

    const StatusUpdate& update = committed->update;
    if (!update.transitioned()) {
        DebugLogger::log(address, ": ", result.success ? "reachable" : result.error,
                         ", still ", to_string(update.state.status),
                         ", failures ", update.state.consecutive_failures);
        return;
    }

    DebugLogger::log(address, ": ", to_string(update.previous_status), " -> ",
                     to_string(update.state.status));
    alert_dispatcher_->on_transition(committed->device, update);
}

bool NetworkMonitor::register_device(const DeviceConfig& config, std::string& error_msg) {
    try {
        if (!registry_->add(config, clock_(), error_msg)) {
            return false;
        }
    } catch (const StoreError& e) {
        error_msg = std::string("Cannot store device: ") + e.what();
        return false;
    }

    if (auto device = registry_->get(config.address)) {
        sync_schedule(*device);
    }
    return true;
}

bool NetworkMonitor::update_device(const DeviceConfig& config, std::string& error_msg) {
    try {
        if (!registry_->update_config(config, error_msg)) {
            return false;
        }
    } catch (const StoreError& e) {
        error_msg = std::string("Cannot store device: ") + e.what();
        return false;
    }

    if (auto device = registry_->get(config.address)) {
        sync_schedule(*device);
    }
    return true;
}

bool NetworkMonitor::set_monitoring_enabled(const std::string& address, bool enabled, std::string& error_msg) {
    auto device = registry_->get(address);
    if (!device) {
        error_msg = "No device registered with address " + address;
        return false;
    }
    DeviceConfig config = device->config;
    config.monitoring_enabled = enabled;
    return update_device(config, error_msg);
}

bool NetworkMonitor::remove_device(const std::string& address, std::string& error_msg) {
    // Stop polling before the record disappears
    scheduler_->forget(address);
    try {
        if (!registry_->remove(address)) {
            error_msg = "No device registered with address " + address;
            return false;
        }
    } catch (const StoreError& e) {
        error_msg = std::string("Cannot remove device: ") + e.what();
        if (auto device = registry_->get(address)) {
            sync_schedule(*device);
        }
        return false;
    }
    return true;
}

bool NetworkMonitor::is_address_registered(const std::string& address) const {
    return registry_->contains(address);
}

std::optional<Device> NetworkMonitor::get_device(const std::string& address) const {
    return registry_->get(address);
}

std::vector<Device> NetworkMonitor::list_devices() const {
    return registry_->list();
}

std::vector<Device> NetworkMonitor::find_devices(const DeviceFilter& filter) const {
    return filter_devices(registry_->list(), filter);
}

std::vector<Device> NetworkMonitor::devices_requiring_attention() const {
    return netmon::devices_requiring_attention(registry_->list());
}

std::map<DeviceStatus, int> NetworkMonitor::status_counts() const {
    return count_by_status(registry_->list());
}

std::map<DeviceType, int> NetworkMonitor::type_counts() const {
    return count_by_type(registry_->list());
}

std::vector<std::string> NetworkMonitor::locations() const {
    return unique_locations(registry_->list());
}

NetworkHealthSummary NetworkMonitor::health_summary() const {
    return summarize(registry_->list());
}

std::vector<Alert> NetworkMonitor::recent_alerts() const {
    return alert_dispatcher_->recent_alerts();
}

ManualProbeResult NetworkMonitor::probe_now(const std::string& address) {
    if (!registry_->contains(address)) {
        return ManualProbeResult::UnknownDevice;
    }
    switch (scheduler_->trigger(address)) {
        case PollScheduler::TriggerResult::Ran:      return ManualProbeResult::Completed;
        case PollScheduler::TriggerResult::InFlight: return ManualProbeResult::AlreadyInFlight;
        default:                                     return ManualProbeResult::UnknownDevice;
    }
}

ProbeSweep NetworkMonitor::probe_many(const std::vector<std::string>& addresses) {
    ProbeSweep sweep;

    // Batches of at most kMaxParallelProbes, one thread per probe in a batch
    for (size_t first = 0; first < addresses.size(); first += kMaxParallelProbes) {
        size_t last = std::min(addresses.size(), first + kMaxParallelProbes);

        std::vector<std::pair<std::string, std::future<ManualProbeResult>>> pending;
        pending.reserve(last - first);
        for (size_t i = first; i < last; ++i) {
            const std::string& address = addresses[i];
            pending.emplace_back(address, std::async(std::launch::async,
                                                     [this, address] { return probe_now(address); }));
        }

        for (auto& [address, future] : pending) {
            ManualProbeResult outcome = future.get();
            if (outcome == ManualProbeResult::AlreadyInFlight) {
                sweep.skipped++;
                continue;
            }
            if (outcome != ManualProbeResult::Completed) {
                continue;
            }
            sweep.completed++;
            auto device = registry_->get(address);
            if (device && device->state.last_probe_latency) {
                sweep.reachable++;
            } else {
                sweep.unreachable++;
            }
        }
    }
    return sweep;
}

ProbeSweep NetworkMonitor::probe_all() {
    std::vector<std::string> addresses;
    for (const auto& device : registry_->list()) {
        if (device.config.monitoring_enabled) {
            addresses.push_back(device.address());
        }
    }
    return probe_many(addresses);
}

std::vector<Device> NetworkMonitor::recheck_offline() {
    std::vector<std::string> addresses;
    for (const auto& device : registry_->list()) {
        if (device.state.status == DeviceStatus::Offline) {
            addresses.push_back(device.address());
        }
    }
    probe_many(addresses);

    std::vector<Device> recovered;
    for (const auto& address : addresses) {
        auto device = registry_->get(address);
        if (device && device->state.status == DeviceStatus::Online) {
            recovered.push_back(*device);
        }
    }
    return recovered;
}

void NetworkMonitor::print_report() {
    std::vector<Device> devices = registry_->list();
    display_->print_report(devices, summarize(devices), alert_dispatcher_->recent_alerts());
}

} // namespace netmon
