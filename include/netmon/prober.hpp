#pragma once

#include "netmon/debug_logger.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace netmon {

struct ProbeResult {
    bool success = false;
    std::chrono::microseconds latency{0};   // Round trip, meaningful only on success
    std::string error;                      // Why the probe failed

    static ProbeResult reachable(std::chrono::microseconds latency);
    static ProbeResult unreachable(const std::string& error);
};

struct ProberOptions {
    int icmp_fallback_port = 80;            // TCP port tried when ICMP sockets are not permitted
};

class Prober {
public:
    virtual ~Prober() = default;

    // Returns within `timeout`. Network conditions come back as an unreachable
    // result; an empty address or non-positive timeout throws std::invalid_argument.
    // port == 0 probes with ICMP echo, otherwise with a TCP connect.
    virtual ProbeResult probe(const std::string& address, int port,
                              std::chrono::milliseconds timeout) = 0;
};

// Factory function
std::unique_ptr<Prober> create_prober(const ProberOptions& options);

} // namespace netmon
