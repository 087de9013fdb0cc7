#include "netmon/prober.hpp"
#include "platform/icmp_families.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>
#include <netdb.h>
#include <netinet/icmp6.h>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace netmon {

namespace {

using SteadyClock = std::chrono::steady_clock;

class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const { ::freeaddrinfo(info); }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

int remaining_millis(SteadyClock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

std::chrono::microseconds elapsed_since(SteadyClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start);
}

std::string errno_text(int err) {
    return std::strerror(err);
}

} // namespace

class LinuxProber : public Prober {
public:
    explicit LinuxProber(const ProberOptions& options)
        : options_(options)
    {
    }

    ProbeResult probe(const std::string& address, int port,
                      std::chrono::milliseconds timeout) override {
        if (address.empty()) {
            throw std::invalid_argument("probe address must not be empty");
        }
        if (timeout.count() <= 0) {
            throw std::invalid_argument("probe timeout must be positive");
        }

        auto start = SteadyClock::now();
        auto deadline = start + timeout;

        std::string error;
        AddrInfoPtr targets = resolve(address, port > 0 ? SOCK_STREAM : SOCK_DGRAM, error);
        if (!targets) {
            return ProbeResult::unreachable(error);
        }
        if (remaining_millis(deadline) == 0) {
            return ProbeResult::unreachable("name resolution exceeded timeout");
        }

        if (port > 0) {
            return tcp_probe(targets.get(), port, start, deadline, false);
        }

        const addrinfo* target = first_inet(targets.get());
        if (target == nullptr) {
            return ProbeResult::unreachable("no usable address");
        }
        if (icmp_families_.available(target->ai_family)) {
            bool permitted = true;
            ProbeResult result = icmp_probe(target, start, deadline, permitted);
            if (permitted) {
                return result;
            }
            icmp_families_.mark_unavailable(target->ai_family);
            DebugLogger::log("ICMP sockets not permitted for ",
                             target->ai_family == AF_INET6 ? "IPv6" : "IPv4",
                             ", falling back to TCP port ", options_.icmp_fallback_port);
        }

        // A refused connection still proves the host is up
        return tcp_probe(targets.get(), options_.icmp_fallback_port, start, deadline, true);
    }

private:
    AddrInfoPtr resolve(const std::string& address, int socktype, std::string& error) {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = socktype;
        hints.ai_flags = AI_NUMERICHOST;

        addrinfo* raw = nullptr;
        int rc = ::getaddrinfo(address.c_str(), nullptr, &hints, &raw);
        if (rc == EAI_NONAME) {
            // Not a literal address, do a real lookup
            hints.ai_flags = AI_ADDRCONFIG;
            rc = ::getaddrinfo(address.c_str(), nullptr, &hints, &raw);
        }
        if (rc != 0) {
            error = std::string("cannot resolve ") + address + ": " + ::gai_strerror(rc);
            return nullptr;
        }
        return AddrInfoPtr(raw);
    }

    ProbeResult tcp_probe(const addrinfo* targets, int port,
                          SteadyClock::time_point start,
                          SteadyClock::time_point deadline,
                          bool refused_means_alive) {
        std::string last_error = "no usable address";

        for (const addrinfo* ai = targets; ai != nullptr; ai = ai->ai_next) {
            if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6) {
                continue;
            }
            if (remaining_millis(deadline) == 0) {
                return ProbeResult::unreachable("timed out");
            }

            sockaddr_storage target{};
            std::memcpy(&target, ai->ai_addr, ai->ai_addrlen);
            if (ai->ai_family == AF_INET) {
                reinterpret_cast<sockaddr_in*>(&target)->sin_port = htons(static_cast<uint16_t>(port));
            } else {
                reinterpret_cast<sockaddr_in6*>(&target)->sin6_port = htons(static_cast<uint16_t>(port));
            }

            SocketHandle sock(::socket(ai->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
            if (!sock.valid()) {
                last_error = "socket: " + errno_text(errno);
                continue;
            }

            int err = 0;
            if (::connect(sock.get(), reinterpret_cast<sockaddr*>(&target), ai->ai_addrlen) != 0) {
                if (errno != EINPROGRESS) {
                    err = errno;
                } else {
                    pollfd pfd{sock.get(), POLLOUT, 0};
                    int ready = ::poll(&pfd, 1, remaining_millis(deadline));
                    if (ready == 0) {
                        return ProbeResult::unreachable("timed out");
                    }
                    if (ready < 0) {
                        last_error = "poll: " + errno_text(errno);
                        continue;
                    }
                    socklen_t len = sizeof(err);
                    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
                        err = errno;
                    }
                }
            }

            if (err == 0 || (err == ECONNREFUSED && refused_means_alive)) {
                return ProbeResult::reachable(elapsed_since(start));
            }
            last_error = "connect port " + std::to_string(port) + ": " + errno_text(err);
        }

        return ProbeResult::unreachable(last_error);
    }

    static const addrinfo* first_inet(const addrinfo* targets) {
        for (const addrinfo* ai = targets; ai != nullptr; ai = ai->ai_next) {
            if (ai->ai_family == AF_INET || ai->ai_family == AF_INET6) {
                return ai;
            }
        }
        return nullptr;
    }

    // `permitted` is cleared when the kernel refuses unprivileged ICMP sockets
    ProbeResult icmp_probe(const addrinfo* ai,
                           SteadyClock::time_point start,
                           SteadyClock::time_point deadline,
                           bool& permitted) {
        bool v6 = ai->ai_family == AF_INET6;
        SocketHandle sock(::socket(ai->ai_family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC,
                                   v6 ? IPPROTO_ICMPV6 : IPPROTO_ICMP));
        if (!sock.valid()) {
            int err = errno;
            if (err == EACCES || err == EPERM || err == EPROTONOSUPPORT || err == EAFNOSUPPORT) {
                permitted = false;
            }
            return ProbeResult::unreachable("icmp socket: " + errno_text(err));
        }

        uint16_t sequence = next_sequence_.fetch_add(1);
        std::vector<unsigned char> packet(16, 0);
        if (v6) {
            icmp6_hdr header{};
            header.icmp6_type = ICMP6_ECHO_REQUEST;
            header.icmp6_seq = htons(sequence);
            std::memcpy(packet.data(), &header, sizeof(header));
        } else {
            icmphdr header{};
            header.type = ICMP_ECHO;
            header.un.echo.sequence = htons(sequence);
            std::memcpy(packet.data(), &header, sizeof(header));
        }

        // The kernel fills in the identifier and checksum on ping sockets
        if (::sendto(sock.get(), packet.data(), packet.size(), 0, ai->ai_addr, ai->ai_addrlen) < 0) {
            return ProbeResult::unreachable("send echo: " + errno_text(errno));
        }

        unsigned char reply[1500];
        while (true) {
            pollfd pfd{sock.get(), POLLIN, 0};
            int ready = ::poll(&pfd, 1, remaining_millis(deadline));
            if (ready == 0) {
                return ProbeResult::unreachable("timed out");
            }
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return ProbeResult::unreachable("poll: " + errno_text(errno));
            }

            ssize_t n = ::recv(sock.get(), reply, sizeof(reply), 0);
            if (n < 0) {
                if (errno == EAGAIN || errno == EINTR) {
                    continue;
                }
                return ProbeResult::unreachable("receive echo: " + errno_text(errno));
            }

            if (v6 && static_cast<size_t>(n) >= sizeof(icmp6_hdr)) {
                icmp6_hdr header{};
                std::memcpy(&header, reply, sizeof(header));
                if (header.icmp6_type == ICMP6_ECHO_REPLY && ntohs(header.icmp6_seq) == sequence) {
                    return ProbeResult::reachable(elapsed_since(start));
                }
            } else if (!v6 && static_cast<size_t>(n) >= sizeof(icmphdr)) {
                icmphdr header{};
                std::memcpy(&header, reply, sizeof(header));
                if (header.type == ICMP_ECHOREPLY && ntohs(header.un.echo.sequence) == sequence) {
                    return ProbeResult::reachable(elapsed_since(start));
                }
            }
            // Stale reply from an earlier probe, keep waiting
        }
    }

    ProberOptions options_;
    detail::IcmpFamilies icmp_families_;
    std::atomic<uint16_t> next_sequence_{1};
};

std::unique_ptr<Prober> create_linux_prober(const ProberOptions& options) {
    return std::make_unique<LinuxProber>(options);
}

} // namespace netmon
