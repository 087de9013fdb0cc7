#pragma once

#include <atomic>
#include <sys/socket.h>

namespace netmon::detail {

// Which address families still allow unprivileged ICMP echo sockets.
// A refusal for IPv6 says nothing about IPv4 and the other way round.
class IcmpFamilies {
public:
    bool available(int family) const {
        const std::atomic<bool>* flag = flag_for(family);
        return flag != nullptr && flag->load();
    }

    void mark_unavailable(int family) {
        if (std::atomic<bool>* flag = flag_for(family)) {
            *flag = false;
        }
    }

private:
    const std::atomic<bool>* flag_for(int family) const {
        if (family == AF_INET) return &ipv4_;
        if (family == AF_INET6) return &ipv6_;
        return nullptr;
    }

    std::atomic<bool>* flag_for(int family) {
        if (family == AF_INET) return &ipv4_;
        if (family == AF_INET6) return &ipv6_;
        return nullptr;
    }

    std::atomic<bool> ipv4_{true};
    std::atomic<bool> ipv6_{true};
};

} // namespace netmon::detail
