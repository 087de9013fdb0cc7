#pragma once

#include "netmon/device.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace netmon {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable home of device records, one record per address.
// Implementations throw StoreError when a record cannot be read or written,
// and must allow concurrent calls for different addresses.
class DeviceStore {
public:
    virtual ~DeviceStore() = default;

    virtual std::vector<Device> load_all() = 0;
    virtual void save(const Device& device) = 0;
    virtual void remove(const std::string& address) = 0;
};

class MemoryDeviceStore : public DeviceStore {
public:
    std::vector<Device> load_all() override;
    void save(const Device& device) override;
    void remove(const std::string& address) override;

private:
    std::mutex mutex_;
    std::map<std::string, Device> records_;
};

// One "<address>.device" file per record under a directory, written as
// "key: value" lines and replaced atomically on save.
class FileDeviceStore : public DeviceStore {
public:
    explicit FileDeviceStore(const std::filesystem::path& directory);

    std::vector<Device> load_all() override;
    void save(const Device& device) override;
    void remove(const std::string& address) override;

    std::filesystem::path record_path(const std::string& address) const;

private:
    Device read_record(const std::filesystem::path& path) const;

    std::filesystem::path directory_;
};

// Factory function: an empty path keeps records in memory only
std::unique_ptr<DeviceStore> create_device_store(const std::string& path);

} // namespace netmon
