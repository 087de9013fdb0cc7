#include "netmon/device_store.hpp"
#include "parse_utils.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <system_error>

namespace netmon {

namespace {

const char* kRecordExtension = ".device";

int64_t to_epoch_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_millis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

// Text fields are written between quotes with backslash escapes, so a
// record stays one field per line whatever the operator typed
std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n':  out += "\\n"; break;
            case '\r':  out += "\\r"; break;
            case '\t':  out += "\\t"; break;
            default:    out.push_back(c); break;
        }
    }
    return out;
}

bool unescape(const std::string& text, std::string& out) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\') {
            result.push_back(text[i]);
            continue;
        }
        if (++i == text.size()) {
            return false;
        }
        switch (text[i]) {
            case '\\': result.push_back('\\'); break;
            case 'n':  result.push_back('\n'); break;
            case 'r':  result.push_back('\r'); break;
            case 't':  result.push_back('\t'); break;
            default:   return false;
        }
    }
    out = std::move(result);
    return true;
}

std::string encode(const Device& device) {
    const DeviceConfig& c = device.config;
    const MonitoringState& s = device.state;

    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    out << "address: \"" << escape(c.address) << "\"\n";
    out << "name: \"" << escape(c.name) << "\"\n";
    out << "type: \"" << escape(c.type) << "\"\n";
    out << "location: \"" << escape(c.location) << "\"\n";
    out << "port: " << c.port << "\n";
    out << "poll_interval_seconds: " << c.poll_interval_seconds << "\n";
    out << "probe_timeout_millis: " << c.probe_timeout_millis << "\n";
    out << "monitoring_enabled: " << (c.monitoring_enabled ? "true" : "false") << "\n";
    out << "alert_on_offline: " << (c.alert_on_offline ? "true" : "false") << "\n";
    out << "alert_email: \"" << escape(c.alert_email) << "\"\n";
    out << "failure_threshold: " << c.failure_threshold << "\n";

    out << "status: " << to_string(s.status) << "\n";
    out << "consecutive_failures: " << s.consecutive_failures << "\n";
    if (s.last_probe_time) {
        out << "last_probe_time: " << to_epoch_millis(*s.last_probe_time) << "\n";
    }
    if (s.last_probe_latency) {
        out << "last_probe_latency_us: " << s.last_probe_latency->count() << "\n";
    }
    out << "last_status_change_time: " << to_epoch_millis(s.last_status_change_time) << "\n";
    out << "total_uptime_seconds: " << s.total_uptime_seconds << "\n";
    out << "total_downtime_seconds: " << s.total_downtime_seconds << "\n";
    return out.str();
}

} // namespace

std::vector<Device> MemoryDeviceStore::load_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Device> devices;
    devices.reserve(records_.size());
    for (const auto& [address, device] : records_) {
        devices.push_back(device);
    }
    return devices;
}

void MemoryDeviceStore::save(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[device.address()] = device;
}

void MemoryDeviceStore::remove(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(address);
}

FileDeviceStore::FileDeviceStore(const std::filesystem::path& directory)
    : directory_(directory)
{
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw StoreError("Cannot create store directory " + directory_.string() + ": " + ec.message());
    }
}

std::filesystem::path FileDeviceStore::record_path(const std::string& address) const {
    std::string file_name;
    for (char c : address) {
        bool safe = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-';
        file_name.push_back(safe ? c : '_');
    }
    return directory_ / (file_name + kRecordExtension);
}

std::vector<Device> FileDeviceStore::load_all() {
    std::vector<Device> devices;
    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        throw StoreError("Cannot list store directory " + directory_.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != kRecordExtension) {
            continue;
        }
        // One unreadable record must not keep the other devices from loading
        try {
            devices.push_back(read_record(entry.path()));
        } catch (const StoreError& e) {
            std::cerr << "Skipping unreadable device record: " << e.what() << "\n";
        }
    }
    return devices;
}

void FileDeviceStore::save(const Device& device) {
    std::filesystem::path path = record_path(device.address());
    std::filesystem::path tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            throw StoreError("Cannot open " + tmp_path.string() + " for writing");
        }
        out << encode(device);
        out.flush();
        if (!out) {
            throw StoreError("Failed to write " + tmp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        throw StoreError("Cannot replace " + path.string() + ": " + ec.message());
    }
}

void FileDeviceStore::remove(const std::string& address) {
    std::error_code ec;
    std::filesystem::remove(record_path(address), ec);
    if (ec) {
        throw StoreError("Cannot remove record for " + address + ": " + ec.message());
    }
}

Device FileDeviceStore::read_record(const std::filesystem::path& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw StoreError("Cannot open " + path.string());
    }

    Device device;
    DeviceConfig& c = device.config;
    MonitoringState& s = device.state;

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = detail::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::string key, value;
        if (!detail::split_key_value(line, key, value)) {
            throw StoreError(path.string() + ":" + std::to_string(line_number) + ": malformed line");
        }

        bool ok = true;
        int64_t millis = 0;
        if (key == "address") ok = unescape(value, c.address);
        else if (key == "name") ok = unescape(value, c.name);
        else if (key == "type") ok = unescape(value, c.type);
        else if (key == "location") ok = unescape(value, c.location);
        else if (key == "port") ok = detail::parse_int(value, c.port);
        else if (key == "poll_interval_seconds") ok = detail::parse_int(value, c.poll_interval_seconds);
        else if (key == "probe_timeout_millis") ok = detail::parse_int(value, c.probe_timeout_millis);
        else if (key == "monitoring_enabled") ok = detail::parse_bool(value, c.monitoring_enabled);
        else if (key == "alert_on_offline") ok = detail::parse_bool(value, c.alert_on_offline);
        else if (key == "alert_email") ok = unescape(value, c.alert_email);
        else if (key == "failure_threshold") ok = detail::parse_int(value, c.failure_threshold);
        else if (key == "status") {
            auto status = parse_device_status(value);
            ok = status.has_value();
            if (ok) s.status = *status;
        }
        else if (key == "consecutive_failures") ok = detail::parse_int(value, s.consecutive_failures);
        else if (key == "last_probe_time") {
            ok = detail::parse_int64(value, millis);
            if (ok) s.last_probe_time = from_epoch_millis(millis);
        }
        else if (key == "last_probe_latency_us") {
            int64_t micros = 0;
            ok = detail::parse_int64(value, micros);
            if (ok) s.last_probe_latency = std::chrono::microseconds(micros);
        }
        else if (key == "last_status_change_time") {
            ok = detail::parse_int64(value, millis);
            if (ok) s.last_status_change_time = from_epoch_millis(millis);
        }
        else if (key == "total_uptime_seconds") ok = detail::parse_double(value, s.total_uptime_seconds);
        else if (key == "total_downtime_seconds") ok = detail::parse_double(value, s.total_downtime_seconds);

        if (!ok) {
            throw StoreError(path.string() + ":" + std::to_string(line_number) +
                             ": invalid value for " + key);
        }
    }

    if (c.address.empty()) {
        throw StoreError(path.string() + ": record has no address");
    }
    return device;
}

std::unique_ptr<DeviceStore> create_device_store(const std::string& path) {
    if (path.empty()) {
        return std::make_unique<MemoryDeviceStore>();
    }
    return std::make_unique<FileDeviceStore>(path);
}

} // namespace netmon
