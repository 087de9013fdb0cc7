#include <catch2/catch_test_macros.hpp>
#include "netmon/display.hpp"
#include "test_helpers.hpp"
#include <sstream>

TEST_CASE("Formatting helpers", "[display]") {
    REQUIRE(netmon::format_duration(42) == "42s");
    REQUIRE(netmon::format_duration(125) == "2m 5s");
    REQUIRE(netmon::format_duration(7260) == "2h 1m");
    REQUIRE(netmon::format_duration(90000) == "1d 1h");
    REQUIRE(netmon::format_duration(-3) == "0s");

    REQUIRE(netmon::format_latency(std::nullopt) == "-");
    REQUIRE(netmon::format_latency(std::chrono::microseconds(12340)) == "12.3 ms");
}

TEST_CASE("Display report lists devices and alerts", "[display]") {
    netmon::DisplayConfig config;
    config.color_scheme = "mono";
    std::ostringstream out;
    netmon::Display display(config, out);

    netmon::DeviceConfig printer;
    printer.address = "10.0.0.5";
    printer.name = "Library Printer";
    netmon::Device online = netmon::make_device(printer, netmon::testing::epoch_plus(0));
    online.state.status = netmon::DeviceStatus::Online;
    online.state.last_probe_latency = std::chrono::microseconds(1500);

    netmon::DeviceConfig camera;
    camera.address = "10.0.3.45";
    camera.name = "Parking Camera";
    camera.monitoring_enabled = false;
    netmon::Device disabled = netmon::make_device(camera, netmon::testing::epoch_plus(0));

    netmon::Alert alert;
    alert.device_id = "10.0.0.9";
    alert.message = "Lab Switch (10.0.0.9) is OFFLINE after 3 failed probes (was WARNING)";
    alert.timestamp = netmon::testing::epoch_plus(60);

    std::vector<netmon::Device> devices{online, disabled};

    SECTION("Everything shown") {
        display.print_report(devices, netmon::summarize(devices), {alert});
        std::string text = out.str();
        REQUIRE(text.find("Library Printer (10.0.0.5)") != std::string::npos);
        REQUIRE(text.find("1.5 ms") != std::string::npos);
        REQUIRE(text.find("Parking Camera") != std::string::npos);
        REQUIRE(text.find("is OFFLINE after 3 failed probes") != std::string::npos);
        REQUIRE(text.find("(not delivered)") != std::string::npos);
        // Mono scheme writes no escape codes
        REQUIRE(text.find('\033') == std::string::npos);
    }

    SECTION("Disabled devices hidden") {
        config.show_disabled = false;
        display.update_config(config);
        display.print_report(devices, netmon::summarize(devices), {});
        std::string text = out.str();
        REQUIRE(text.find("Parking Camera") == std::string::npos);
        REQUIRE(text.find("No offline alerts") != std::string::npos);
    }
}
