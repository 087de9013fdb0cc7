#include "netmon/device_registry.hpp"

namespace netmon {

DeviceRegistry::DeviceRegistry(DeviceStore& store)
    : store_(store)
{
}

void DeviceRegistry::load() {
    std::vector<Device> devices = store_.load_all();

    std::map<std::string, std::shared_ptr<Entry>> loaded;
    for (auto& device : devices) {
        auto entry = std::make_shared<Entry>();
        entry->device = std::move(device);
        loaded[entry->device.address()] = entry;
    }

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    entries_ = std::move(loaded);
}

bool DeviceRegistry::add(const DeviceConfig& config, TimePoint now, std::string& error_msg) {
    if (!config.validate(error_msg)) {
        return false;
    }

    // The new entry is published locked, readers of this address wait for
    // the store write while every other device stays available
    auto entry = std::make_shared<Entry>();
    entry->device = make_device(config, now);
    std::unique_lock<std::mutex> entry_lock(entry->mutex);
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        if (entries_.count(config.address) > 0) {
            error_msg = "A device with address " + config.address + " is already registered";
            return false;
        }
        entries_[config.address] = entry;
    }

    try {
        store_.save(entry->device);
    } catch (const StoreError&) {
        entry->removed = true;
        erase_entry(config.address, entry);
        throw;
    }
    return true;
}

bool DeviceRegistry::update_config(const DeviceConfig& config, std::string& error_msg) {
    if (!config.validate(error_msg)) {
        return false;
    }

    auto entry = find(config.address);
    if (!entry) {
        error_msg = "No device registered with address " + config.address;
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        error_msg = "No device registered with address " + config.address;
        return false;
    }
    Device next = entry->device;
    next.config = config;
    store_.save(next);
    entry->device = std::move(next);
    return true;
}

bool DeviceRegistry::remove(const std::string& address) {
    auto entry = find(address);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        return false;
    }
    store_.remove(address);
    entry->removed = true;
    erase_entry(address, entry);
    return true;
}

void DeviceRegistry::erase_entry(const std::string& address, const std::shared_ptr<Entry>& entry) {
    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    auto it = entries_.find(address);
    if (it != entries_.end() && it->second == entry) {
        entries_.erase(it);
    }
}

bool DeviceRegistry::contains(const std::string& address) const {
    auto entry = find(address);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return !entry->removed;
}

std::optional<Device> DeviceRegistry::get(const std::string& address) const {
    auto entry = find(address);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        return std::nullopt;
    }
    return entry->device;
}

std::vector<Device> DeviceRegistry::list() const {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        snapshot.reserve(entries_.size());
        for (const auto& [address, entry] : entries_) {
            snapshot.push_back(entry);
        }
    }

    std::vector<Device> devices;
    devices.reserve(snapshot.size());
    for (const auto& entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!entry->removed) {
            devices.push_back(entry->device);
        }
    }
    return devices;
}

std::vector<std::string> DeviceRegistry::addresses() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [address, entry] : entries_) {
        result.push_back(address);
    }
    return result;
}

size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return entries_.size();
}

std::optional<CommittedProbe> DeviceRegistry::apply_probe(const std::string& address,
                                                          const ProbeResult& result,
                                                          TimePoint now,
                                                          int default_failure_threshold) {
    auto entry = find(address);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        return std::nullopt;
    }

    int threshold = entry->device.config.failure_threshold > 0
        ? entry->device.config.failure_threshold
        : default_failure_threshold;

    StatusUpdate update = apply_probe_result(entry->device.state, result, now, threshold);

    Device next = entry->device;
    next.state = update.state;
    store_.save(next);
    entry->device = next;

    return CommittedProbe{std::move(next), update};
}

std::shared_ptr<DeviceRegistry::Entry> DeviceRegistry::find(const std::string& address) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = entries_.find(address);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace netmon
