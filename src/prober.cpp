#include "netmon/prober.hpp"

namespace netmon {

std::atomic<bool> DebugLogger::enabled_{false};

ProbeResult ProbeResult::reachable(std::chrono::microseconds latency) {
    ProbeResult result;
    result.success = true;
    result.latency = latency;
    return result;
}

ProbeResult ProbeResult::unreachable(const std::string& error) {
    ProbeResult result;
    result.success = false;
    result.error = error;
    return result;
}

// Platform-specific implementations are in platform/ subdirectory

#if defined(__linux__)
    std::unique_ptr<Prober> create_prober(const ProberOptions& options) {
        extern std::unique_ptr<Prober> create_linux_prober(const ProberOptions& options);
        return create_linux_prober(options);
    }
#else
    #error "Unsupported platform"
#endif

} // namespace netmon
