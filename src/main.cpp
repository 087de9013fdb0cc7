#include "netmon/network_monitor.hpp"
#include <iostream>
#include <csignal>
#include <memory>

// Global pointer for signal handler
netmon::NetworkMonitor* g_monitor = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_monitor) {
            g_monitor->request_stop();
        }
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--once] [config_file]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  config_file    Path to YAML configuration file (default: config/default_config.yaml)\n";
    std::cout << "  --once         Probe every monitored device once, print a report and exit\n";
    std::cout << "  -h, --help     Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "\n";
    std::cout << "  " << program_name << " --once config/default_config.yaml\n";
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    // Parse command-line arguments
    std::string config_path = "config/default_config.yaml";
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--once") {
            once = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            config_path = arg;
        }
    }

    auto monitor = std::make_unique<netmon::NetworkMonitor>(config_path);

    if (!monitor->initialize()) {
        std::cerr << "Failed to initialize network monitor\n";
        return 1;
    }

    if (once) {
        netmon::ProbeSweep sweep = monitor->probe_all();
        monitor->print_report();
        std::cout << "Probed " << sweep.completed << " devices: " << sweep.reachable
                  << " reachable, " << sweep.unreachable << " unreachable\n";
        return sweep.unreachable == 0 ? 0 : 2;
    }

    // Setup signal handlers
    g_monitor = monitor.get();
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Run monitoring loop
    monitor->run();

    g_monitor = nullptr;
    std::cout << "netmon stopped.\n";
    return 0;
}
