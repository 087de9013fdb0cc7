#pragma once

#include "netmon/device.hpp"
#include "netmon/device_store.hpp"
#include "netmon/status_machine.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace netmon {

// Result of a probe outcome that has been persisted and published
struct CommittedProbe {
    Device device;          // Record as committed
    StatusUpdate update;
};

// Authority for device records. The address map is guarded by one shared
// mutex held only for lookups and membership changes, never across store
// I/O. Every record has its own mutex, so work on different devices never
// contends. Every change is written to the store before it becomes visible
// to readers. Lock order is record mutex, then map mutex.
class DeviceRegistry {
public:
    explicit DeviceRegistry(DeviceStore& store);

    // Replaces the in-memory records with the store's contents.
    // Throws StoreError.
    void load();

    // Registration and operator edits. Return false with a reason on
    // validation failure, duplicate or unknown address. Throw StoreError.
    bool add(const DeviceConfig& config, TimePoint now, std::string& error_msg);
    bool update_config(const DeviceConfig& config, std::string& error_msg);
    bool remove(const std::string& address);

    bool contains(const std::string& address) const;
    std::optional<Device> get(const std::string& address) const;
    std::vector<Device> list() const;
    std::vector<std::string> addresses() const;
    size_t size() const;

    // Runs the status machine on the record and commits the result.
    // Returns nullopt when the device is no longer registered. Throws
    // StoreError, in which case the record is left as it was.
    std::optional<CommittedProbe> apply_probe(const std::string& address,
                                              const ProbeResult& result,
                                              TimePoint now,
                                              int default_failure_threshold);

private:
    struct Entry {
        mutable std::mutex mutex;
        Device device;
        bool removed = false;
    };

    std::shared_ptr<Entry> find(const std::string& address) const;
    // Drops the map slot if it still holds this entry
    void erase_entry(const std::string& address, const std::shared_ptr<Entry>& entry);

    DeviceStore& store_;
    mutable std::shared_mutex map_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace netmon
