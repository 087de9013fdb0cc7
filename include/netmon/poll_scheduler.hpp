#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace netmon {

// Runs one worker thread per scheduled device. A worker waits one interval,
// runs a probe cycle, and starts waiting again only after the cycle has
// completed, so drift comes from probe latency and never from overlap.
// The same per-device guard covers manual triggers: a trigger that finds a
// cycle already in flight is skipped, not queued.
class PollScheduler {
public:
    using CycleFn = std::function<void(const std::string& address)>;
    // Current interval of a device, nullopt once it should no longer be polled
    using IntervalFn = std::function<std::optional<std::chrono::milliseconds>(const std::string& address)>;

    PollScheduler(CycleFn run_cycle, IntervalFn interval_of);
    ~PollScheduler();

    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    enum class TriggerResult {
        Ran,
        InFlight,       // A cycle for this device was already running
        Unknown         // Device not tracked, or forgotten
    };

    // Makes the device known so it can be triggered, without polling it
    void track(const std::string& address);

    // Tracks the device and starts a worker if it has none. First cycle after one interval.
    void schedule(const std::string& address);

    // Stops the device's worker. Waits for a cycle in progress to finish.
    void unschedule(const std::string& address);

    void stop_all();

    // Stops the worker and drops all per-device state of a removed device
    void forget(const std::string& address);

    // Runs a cycle now on the caller's thread. Never creates state for an
    // untracked device.
    TriggerResult trigger(const std::string& address);

    bool is_tracked(const std::string& address) const;
    bool is_scheduled(const std::string& address) const;
    bool is_in_flight(const std::string& address) const;
    std::vector<std::string> scheduled() const;

    // Ticks dropped because a cycle was still running
    uint64_t skipped_ticks() const { return skipped_ticks_.load(); }

private:
    struct Slot {
        std::atomic<bool> in_flight{false};
        std::mutex mutex;
        std::condition_variable wake;
        bool stop = false;
        std::atomic<bool> running{false};
        std::thread worker;
    };

    std::shared_ptr<Slot> slot_for(const std::string& address);
    std::shared_ptr<Slot> find_slot(const std::string& address) const;
    bool run_guarded(Slot& slot, const std::string& address);
    void worker_loop(std::shared_ptr<Slot> slot, std::string address);
    static void stop_worker(Slot& slot);

    CycleFn run_cycle_;
    IntervalFn interval_of_;

    std::mutex control_mutex_;          // Serializes membership and worker changes
    mutable std::mutex slots_mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;
    std::atomic<uint64_t> skipped_ticks_{0};
};

} // namespace netmon
