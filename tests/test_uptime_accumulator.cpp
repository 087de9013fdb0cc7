#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "netmon/status_machine.hpp"
#include "netmon/uptime_accumulator.hpp"
#include "test_helpers.hpp"

using Catch::Matchers::WithinAbs;
using netmon::DeviceStatus;
using netmon::MonitoringState;
using netmon::ProbeResult;
using netmon::testing::epoch_plus;

TEST_CASE("Downtime is counted from entering OFFLINE to recovery", "[uptime]") {
    MonitoringState state;
    state.last_status_change_time = epoch_plus(0);
    state.status = DeviceStatus::Offline;
    state.consecutive_failures = 3;

    auto update = netmon::apply_probe_result(
        state, ProbeResult::reachable(std::chrono::microseconds(900)), epoch_plus(120));

    REQUIRE(update.state.status == DeviceStatus::Online);
    REQUIRE(update.state.consecutive_failures == 0);
    REQUIRE_THAT(update.state.total_downtime_seconds, WithinAbs(120.0, 1e-9));
    REQUIRE(update.state.total_uptime_seconds == 0.0);
    REQUIRE(update.state.last_status_change_time == epoch_plus(120));
}

TEST_CASE("WARNING time is not counted as uptime", "[uptime]") {
    MonitoringState state;
    state.last_status_change_time = epoch_plus(0);

    // UNKNOWN -> ONLINE at t=0, WARNING at t=300, ONLINE again at t=310
    state = netmon::apply_probe_result(state, ProbeResult::reachable(std::chrono::microseconds(500)), epoch_plus(0)).state;
    state = netmon::apply_probe_result(state, ProbeResult::unreachable("timed out"), epoch_plus(300)).state;
    REQUIRE(state.status == DeviceStatus::Warning);
    REQUIRE_THAT(state.total_uptime_seconds, WithinAbs(300.0, 1e-9));

    state = netmon::apply_probe_result(state, ProbeResult::reachable(std::chrono::microseconds(500)), epoch_plus(310)).state;
    REQUIRE(state.status == DeviceStatus::Online);
    REQUIRE_THAT(state.total_uptime_seconds, WithinAbs(300.0, 1e-9));
    REQUIRE(state.total_downtime_seconds == 0.0);
}

TEST_CASE("accumulate_transition", "[uptime]") {
    MonitoringState state;
    state.last_status_change_time = epoch_plus(10);

    SECTION("Same status is a no-op") {
        netmon::accumulate_transition(state, DeviceStatus::Unknown, epoch_plus(50));
        REQUIRE(state.last_status_change_time == epoch_plus(10));
        REQUIRE(state.total_uptime_seconds == 0.0);
    }

    SECTION("UNKNOWN time goes to neither total") {
        netmon::accumulate_transition(state, DeviceStatus::Online, epoch_plus(50));
        REQUIRE(state.status == DeviceStatus::Online);
        REQUIRE(state.total_uptime_seconds == 0.0);
        REQUIRE(state.total_downtime_seconds == 0.0);
        REQUIRE(state.last_status_change_time == epoch_plus(50));
    }

    SECTION("Clock going backwards adds nothing") {
        state.status = DeviceStatus::Online;
        netmon::accumulate_transition(state, DeviceStatus::Offline, epoch_plus(5));
        REQUIRE(state.total_uptime_seconds == 0.0);
        REQUIRE(state.status == DeviceStatus::Offline);
    }
}

TEST_CASE("Counted time matches the time spent ONLINE and OFFLINE", "[uptime]") {
    // (time, status entered) for a device walking through every status
    const std::pair<int, DeviceStatus> timeline[] = {
        {0, DeviceStatus::Online},
        {40, DeviceStatus::Warning},
        {55, DeviceStatus::Offline},
        {175, DeviceStatus::Online},
        {200, DeviceStatus::Offline},
        {230, DeviceStatus::Warning},
        {260, DeviceStatus::Online},
        {300, DeviceStatus::Offline},
    };

    MonitoringState state;
    state.last_status_change_time = epoch_plus(0);
    double expected_up = 0.0;
    double expected_down = 0.0;
    int entered_at = 0;
    DeviceStatus current = DeviceStatus::Unknown;

    for (const auto& [t, status] : timeline) {
        if (current == DeviceStatus::Online) expected_up += t - entered_at;
        if (current == DeviceStatus::Offline) expected_down += t - entered_at;
        netmon::accumulate_transition(state, status, epoch_plus(t));
        current = status;
        entered_at = t;

        REQUIRE_THAT(state.total_uptime_seconds, WithinAbs(expected_up, 1e-9));
        REQUIRE_THAT(state.total_downtime_seconds, WithinAbs(expected_down, 1e-9));
    }

    REQUIRE_THAT(state.total_uptime_seconds, WithinAbs(40.0 + 25.0 + 40.0, 1e-9));
    REQUIRE_THAT(state.total_downtime_seconds, WithinAbs(120.0 + 30.0, 1e-9));
}

TEST_CASE("uptime_percent", "[uptime]") {
    REQUIRE(netmon::uptime_percent(0.0, 0.0) == 100.0);
    REQUIRE_THAT(netmon::uptime_percent(300.0, 100.0), WithinAbs(75.0, 1e-9));
    REQUIRE(netmon::uptime_percent(0.0, 60.0) == 0.0);

    netmon::Device device;
    device.state.total_uptime_seconds = 90.0;
    device.state.total_downtime_seconds = 10.0;
    REQUIRE_THAT(device.uptime_percent(), WithinAbs(90.0, 1e-9));
}
