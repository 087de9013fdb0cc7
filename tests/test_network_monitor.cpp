#include <catch2/catch_test_macros.hpp>
#include "netmon/network_monitor.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <thread>

using namespace std::chrono_literals;
using netmon::DeviceStatus;
using netmon::ManualProbeResult;
using netmon::testing::epoch_plus;

namespace {

netmon::DeviceConfig device_config(const std::string& address, const std::string& name,
                                   const std::string& type = "printer") {
    netmon::DeviceConfig config;
    config.address = address;
    config.name = name;
    config.type = type;
    config.location = "Library";
    config.probe_timeout_millis = 200;
    return config;
}

// Monitor wired to scripted collaborators
struct MonitorFixture {
    netmon::testing::ScriptedProber* prober = nullptr;
    netmon::testing::FlakyStore* store = nullptr;
    netmon::testing::AlertRecorder alerts;
    netmon::testing::ManualClock clock{epoch_plus(0)};
    netmon::NetworkMonitor monitor;

    explicit MonitorFixture(netmon::MonitorConfig config = {}) {
        config.alerts.log_to_file = false;

        auto scripted = std::make_unique<netmon::testing::ScriptedProber>();
        auto flaky = std::make_unique<netmon::testing::FlakyStore>();
        prober = scripted.get();
        store = flaky.get();

        netmon::MonitorComponents components;
        components.prober = std::move(scripted);
        components.store = std::move(flaky);
        components.alert_sink = alerts.make_sink();
        components.clock = clock.as_clock();
        initialized = monitor.initialize(config, std::move(components));
    }

    DeviceStatus status_of(const std::string& address) const {
        return monitor.get_device(address)->state.status;
    }

    bool initialized = false;
};

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

} // namespace

TEST_CASE("NetworkMonitor takes a failing device OFFLINE and alerts once", "[monitor]") {
    MonitorFixture f;
    REQUIRE(f.initialized);

    std::string error;
    REQUIRE(f.monitor.register_device(device_config("10.0.0.5", "Library Printer"), error));
    REQUIRE(f.status_of("10.0.0.5") == DeviceStatus::Unknown);

    f.prober->push_many("10.0.0.5", {false, false, false, false});
    std::vector<DeviceStatus> seen;
    for (int i = 0; i < 3; ++i) {
        f.clock.advance(60s);
        REQUIRE(f.monitor.probe_now("10.0.0.5") == ManualProbeResult::Completed);
        seen.push_back(f.status_of("10.0.0.5"));
    }
    REQUIRE(seen == std::vector<DeviceStatus>{DeviceStatus::Warning, DeviceStatus::Warning,
                                              DeviceStatus::Offline});
    REQUIRE(f.alerts.count() == 1);

    f.clock.advance(60s);
    f.monitor.probe_now("10.0.0.5");
    REQUIRE(f.alerts.count() == 1);
    REQUIRE(f.monitor.get_device("10.0.0.5")->state.consecutive_failures == 4);

    auto recent = f.monitor.recent_alerts();
    REQUIRE(recent.size() == 1);
    REQUIRE(recent[0].device_id == "10.0.0.5");
    REQUIRE(recent[0].timestamp == epoch_plus(180));

    // Recovery counts the outage as downtime
    f.clock.advance(60s);
    f.monitor.probe_now("10.0.0.5");
    auto device = f.monitor.get_device("10.0.0.5");
    REQUIRE(device->state.status == DeviceStatus::Online);
    REQUIRE(device->state.total_downtime_seconds == 120.0);
    REQUIRE(device->state.last_status_change_time == epoch_plus(300));
}

TEST_CASE("NetworkMonitor uses the configured failure threshold", "[monitor]") {
    netmon::MonitorConfig config;
    config.failure_threshold = 2;
    config.devices.push_back(device_config("10.0.0.5", "Library Printer"));
    MonitorFixture f(config);
    REQUIRE(f.initialized);
    REQUIRE(f.monitor.failure_threshold() == 2);
    REQUIRE(f.monitor.is_address_registered("10.0.0.5"));

    f.prober->push_many("10.0.0.5", {false, false});
    f.monitor.probe_now("10.0.0.5");
    f.monitor.probe_now("10.0.0.5");
    REQUIRE(f.status_of("10.0.0.5") == DeviceStatus::Offline);
}

TEST_CASE("NetworkMonitor rejects bad configuration", "[monitor]") {
    netmon::MonitorConfig config;
    config.failure_threshold = 0;
    MonitorFixture f(config);
    REQUIRE_FALSE(f.initialized);
}

TEST_CASE("NetworkMonitor registration", "[monitor]") {
    MonitorFixture f;
    REQUIRE(f.initialized);
    std::string error;

    REQUIRE(f.monitor.register_device(device_config("10.0.0.5", "Library Printer"), error));

    SECTION("Duplicate address") {
        REQUIRE_FALSE(f.monitor.register_device(device_config("10.0.0.5", "Copy"), error));
        REQUIRE(f.monitor.list_devices().size() == 1);
    }

    SECTION("Invalid interval") {
        auto config = device_config("10.0.0.6", "Lab Switch", "switch");
        config.poll_interval_seconds = -5;
        REQUIRE_FALSE(f.monitor.register_device(config, error));
        REQUIRE_FALSE(f.monitor.is_address_registered("10.0.0.6"));
    }

    SECTION("Store failure") {
        f.store->fail_saves = true;
        REQUIRE_FALSE(f.monitor.register_device(device_config("10.0.0.6", "Lab Switch"), error));
        REQUIRE(error.find("disk full") != std::string::npos);
    }

    SECTION("Remove") {
        REQUIRE(f.monitor.remove_device("10.0.0.5", error));
        REQUIRE_FALSE(f.monitor.is_address_registered("10.0.0.5"));
        REQUIRE(f.monitor.probe_now("10.0.0.5") == ManualProbeResult::UnknownDevice);
        REQUIRE(f.prober->calls_for("10.0.0.5") == 0);
        REQUIRE_FALSE(f.monitor.remove_device("10.0.0.5", error));
    }
}

TEST_CASE("A failed write abandons the probe cycle", "[monitor]") {
    MonitorFixture f;
    REQUIRE(f.initialized);
    std::string error;
    REQUIRE(f.monitor.register_device(device_config("10.0.0.5", "Library Printer"), error));

    f.prober->push_many("10.0.0.5", {false, false});
    f.store->fail_saves = true;
    REQUIRE(f.monitor.probe_now("10.0.0.5") == ManualProbeResult::Completed);

    auto device = f.monitor.get_device("10.0.0.5");
    REQUIRE(device->state.status == DeviceStatus::Unknown);
    REQUIRE(device->state.consecutive_failures == 0);

    f.store->fail_saves = false;
    f.monitor.probe_now("10.0.0.5");
    device = f.monitor.get_device("10.0.0.5");
    REQUIRE(device->state.status == DeviceStatus::Warning);
    REQUIRE(device->state.consecutive_failures == 1);
}

TEST_CASE("Disabled devices are never probed until enabled", "[monitor]") {
    MonitorFixture f;
    REQUIRE(f.initialized);
    std::string error;

    auto config = device_config("10.0.0.5", "Library Printer");
    config.poll_interval_seconds = 1;
    config.monitoring_enabled = false;
    REQUIRE(f.monitor.register_device(config, error));

    f.monitor.start();
    REQUIRE(f.monitor.is_started());
    std::this_thread::sleep_for(1500ms);
    REQUIRE(f.prober->calls_for("10.0.0.5") == 0);

    auto enabled_at = std::chrono::steady_clock::now();
    REQUIRE(f.monitor.set_monitoring_enabled("10.0.0.5", true, error));
    REQUIRE(wait_until([&] { return f.prober->calls_for("10.0.0.5") >= 1; }, 3000ms));
    REQUIRE(std::chrono::steady_clock::now() - enabled_at >= 900ms);

    // Disabling again stops the polling
    REQUIRE(f.monitor.set_monitoring_enabled("10.0.0.5", false, error));
    int calls = f.prober->calls_for("10.0.0.5");
    std::this_thread::sleep_for(1300ms);
    REQUIRE(f.prober->calls_for("10.0.0.5") == calls);

    f.monitor.stop();
    REQUIRE_FALSE(f.monitor.is_started());
}

TEST_CASE("Every monitored device is polled on its own schedule", "[monitor]") {
    MonitorFixture f;
    REQUIRE(f.initialized);
    std::string error;

    auto a = device_config("10.0.0.5", "Library Printer");
    auto b = device_config("10.0.0.6", "Library AP", "access_point");
    a.poll_interval_seconds = 1;
    b.poll_interval_seconds = 1;
    REQUIRE(f.monitor.register_device(a, error));
    REQUIRE(f.monitor.register_device(b, error));

    f.monitor.start();
    REQUIRE(wait_until([&] {
        return f.prober->calls_for("10.0.0.5") >= 2 && f.prober->calls_for("10.0.0.6") >= 2;
    }, 5000ms));
    f.monitor.stop();

    REQUIRE(f.status_of("10.0.0.5") == DeviceStatus::Online);
    REQUIRE(f.status_of("10.0.0.6") == DeviceStatus::Online);
}

TEST_CASE("Manual probes skip devices already in flight", "[monitor]") {
    MonitorFixture f;
    REQUIRE(f.initialized);
    std::string error;
    REQUIRE(f.monitor.register_device(device_config("10.0.0.5", "Library Printer"), error));

    f.prober->set_delay(300ms);
    ManualProbeResult first = ManualProbeResult::UnknownDevice;
    std::thread background([&] { first = f.monitor.probe_now("10.0.0.5"); });
    REQUIRE(wait_until([&] { return f.prober->calls() >= 1; }, 2000ms));

    REQUIRE(f.monitor.probe_now("10.0.0.5") == ManualProbeResult::AlreadyInFlight);
    background.join();
    REQUIRE(first == ManualProbeResult::Completed);
    REQUIRE(f.prober->calls() == 1);
}

TEST_CASE("probe_all and recheck_offline", "[monitor]") {
    netmon::MonitorConfig config;
    config.failure_threshold = 1;
    MonitorFixture f(config);
    REQUIRE(f.initialized);
    std::string error;

    REQUIRE(f.monitor.register_device(device_config("10.0.0.5", "Library Printer"), error));
    REQUIRE(f.monitor.register_device(device_config("10.0.0.6", "Library AP", "access_point"), error));
    REQUIRE(f.monitor.register_device(device_config("10.0.1.1", "Science Switch", "switch"), error));
    auto disabled = device_config("10.0.2.2", "Old Router", "router");
    disabled.monitoring_enabled = false;
    REQUIRE(f.monitor.register_device(disabled, error));

    f.prober->push("10.0.0.6", false);
    f.prober->push("10.0.1.1", false);
    netmon::ProbeSweep sweep = f.monitor.probe_all();
    REQUIRE(sweep.completed == 3);
    REQUIRE(sweep.reachable == 1);
    REQUIRE(sweep.unreachable == 2);
    REQUIRE(f.prober->calls_for("10.0.2.2") == 0);

    auto summary = f.monitor.health_summary();
    REQUIRE(summary.monitored_devices == 3);
    REQUIRE(summary.offline_devices == 2);
    REQUIRE(summary.disabled_devices == 1);
    REQUIRE(f.monitor.devices_requiring_attention().size() == 2);
    REQUIRE(f.monitor.status_counts()[DeviceStatus::Offline] == 2);
    REQUIRE(f.monitor.type_counts()[netmon::DeviceType::Router] == 1);
    REQUIRE(f.monitor.locations() == std::vector<std::string>{"Library"});

    netmon::DeviceFilter filter;
    filter.status = DeviceStatus::Offline;
    REQUIRE(f.monitor.find_devices(filter).size() == 2);

    // One comes back, the other stays down
    f.prober->push("10.0.1.1", false);
    f.clock.advance(60s);
    auto recovered = f.monitor.recheck_offline();
    REQUIRE(recovered.size() == 1);
    REQUIRE(recovered[0].address() == "10.0.0.6");
    REQUIRE(f.status_of("10.0.1.1") == DeviceStatus::Offline);
    REQUIRE(f.alerts.count() == 2);
}

TEST_CASE("Restart keeps polling devices next to an unreadable record", "[monitor]") {
    auto dir = std::filesystem::temp_directory_path() / "netmon_monitor_restart";
    std::filesystem::remove_all(dir);

    netmon::MonitorConfig config;
    config.store.path = dir.string();
    config.alerts.log_to_file = false;

    auto components = [] {
        netmon::MonitorComponents c;
        c.prober = std::make_unique<netmon::testing::ScriptedProber>();
        netmon::testing::AlertRecorder recorder;
        c.alert_sink = recorder.make_sink();
        return c;
    };

    {
        netmon::NetworkMonitor first;
        REQUIRE(first.initialize(config, components()));
        std::string error;
        REQUIRE(first.register_device(device_config("10.0.0.1", "Core Switch", "switch"), error));
        REQUIRE_FALSE(first.register_device(device_config("10.0.0.2", "Lab\nPrinter"), error));
        REQUIRE_FALSE(first.is_address_registered("10.0.0.2"));
    }

    // A record damaged outside netmon
    {
        std::ofstream out(dir / "10.0.0.3.device");
        out << "address: \"10.0.0.3\"\n";
        out << "name: \"Lab\n";
        out << "Printer\"\n";
    }

    netmon::NetworkMonitor second;
    REQUIRE(second.initialize(config, components()));
    REQUIRE(second.is_address_registered("10.0.0.1"));
    REQUIRE_FALSE(second.is_address_registered("10.0.0.3"));
    REQUIRE(second.probe_now("10.0.0.1") == ManualProbeResult::Completed);
    REQUIRE(second.get_device("10.0.0.1")->state.status == DeviceStatus::Online);

    second.stop();
    std::filesystem::remove_all(dir);
}

TEST_CASE("Sweeps cap the number of probes running at once", "[monitor]") {
    MonitorFixture f;
    REQUIRE(f.initialized);
    std::string error;

    const int device_count = static_cast<int>(netmon::kMaxParallelProbes) * 2 + 5;
    for (int i = 0; i < device_count; ++i) {
        REQUIRE(f.monitor.register_device(device_config("10.1.0." + std::to_string(i), "AP"), error));
    }

    f.prober->set_delay(30ms);
    netmon::ProbeSweep sweep = f.monitor.probe_all();

    REQUIRE(sweep.completed == device_count);
    REQUIRE(sweep.reachable == device_count);
    REQUIRE(f.prober->calls() == device_count);
    REQUIRE(f.prober->max_active() <= static_cast<int>(netmon::kMaxParallelProbes));
    REQUIRE(f.prober->max_active() > 1);
}
