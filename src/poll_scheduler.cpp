#include "netmon/poll_scheduler.hpp"
#include "netmon/debug_logger.hpp"
#include <iostream>

namespace netmon {

namespace {

class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_ = false; }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

PollScheduler::PollScheduler(CycleFn run_cycle, IntervalFn interval_of)
    : run_cycle_(std::move(run_cycle))
    , interval_of_(std::move(interval_of))
{
}

PollScheduler::~PollScheduler() {
    stop_all();
}

std::shared_ptr<PollScheduler::Slot> PollScheduler::slot_for(const std::string& address) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& slot = slots_[address];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

std::shared_ptr<PollScheduler::Slot> PollScheduler::find_slot(const std::string& address) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(address);
    return it == slots_.end() ? nullptr : it->second;
}

void PollScheduler::track(const std::string& address) {
    std::lock_guard<std::mutex> control(control_mutex_);
    slot_for(address);
}

void PollScheduler::schedule(const std::string& address) {
    std::lock_guard<std::mutex> control(control_mutex_);
    auto slot = slot_for(address);

    if (slot->running) {
        return;
    }
    if (slot->worker.joinable()) {
        // Worker ended on its own, reap it before starting another
        slot->worker.join();
    }

    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->stop = false;
    }
    slot->running = true;
    slot->worker = std::thread(&PollScheduler::worker_loop, this, slot, address);
    DebugLogger::log("Scheduled ", address);
}

void PollScheduler::unschedule(const std::string& address) {
    std::lock_guard<std::mutex> control(control_mutex_);
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto it = slots_.find(address);
        if (it == slots_.end()) {
            return;
        }
        slot = it->second;
    }
    stop_worker(*slot);
    DebugLogger::log("Unscheduled ", address);
}

void PollScheduler::forget(const std::string& address) {
    std::lock_guard<std::mutex> control(control_mutex_);
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto it = slots_.find(address);
        if (it == slots_.end()) {
            return;
        }
        slot = it->second;
        slots_.erase(it);
    }
    stop_worker(*slot);
}

void PollScheduler::stop_all() {
    std::lock_guard<std::mutex> control(control_mutex_);
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (auto& [address, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    // Signal every worker first so they wind down in parallel
    for (auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->stop = true;
        slot->wake.notify_all();
    }
    for (auto& slot : slots) {
        stop_worker(*slot);
    }
}

void PollScheduler::stop_worker(Slot& slot) {
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        slot.stop = true;
    }
    slot.wake.notify_all();
    if (slot.worker.joinable()) {
        slot.worker.join();
    }
    slot.running = false;
}

PollScheduler::TriggerResult PollScheduler::trigger(const std::string& address) {
    auto slot = find_slot(address);
    if (!slot) {
        return TriggerResult::Unknown;
    }
    return run_guarded(*slot, address) ? TriggerResult::Ran : TriggerResult::InFlight;
}

bool PollScheduler::run_guarded(Slot& slot, const std::string& address) {
    bool expected = false;
    if (!slot.in_flight.compare_exchange_strong(expected, true)) {
        return false;
    }

    InFlightGuard guard(slot.in_flight);
    try {
        run_cycle_(address);
    } catch (const std::exception& e) {
        // One device's failure must not take its worker down
        std::cerr << "Probe cycle for " << address << " failed: " << e.what() << "\n";
    }
    return true;
}

void PollScheduler::worker_loop(std::shared_ptr<Slot> slot, std::string address) {
    while (true) {
        std::optional<std::chrono::milliseconds> interval;
        try {
            interval = interval_of_(address);
        } catch (const std::exception& e) {
            std::cerr << "Cannot read poll interval for " << address << ": " << e.what() << "\n";
        }
        if (!interval) {
            break;
        }

        {
            std::unique_lock<std::mutex> lock(slot->mutex);
            if (slot->wake.wait_for(lock, *interval, [&slot] { return slot->stop; })) {
                break;
            }
        }

        if (!run_guarded(*slot, address)) {
            skipped_ticks_.fetch_add(1);
            DebugLogger::log("Skipped tick for ", address, ", previous probe still in flight");
        }
    }
    slot->running = false;
}

bool PollScheduler::is_tracked(const std::string& address) const {
    return find_slot(address) != nullptr;
}

bool PollScheduler::is_scheduled(const std::string& address) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(address);
    return it != slots_.end() && it->second->running;
}

bool PollScheduler::is_in_flight(const std::string& address) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(address);
    return it != slots_.end() && it->second->in_flight;
}

std::vector<std::string> PollScheduler::scheduled() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    std::vector<std::string> result;
    for (const auto& [address, slot] : slots_) {
        if (slot->running) {
            result.push_back(address);
        }
    }
    return result;
}

} // namespace netmon
