#pragma once

// Helpers shared by the config file parser and the file device store

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace netmon::detail {

inline std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

inline std::string unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.length() - 2);
    }
    return value;
}

// Splits "key: value" at the first colon. Returns false when there is no colon.
inline bool split_key_value(const std::string& line, std::string& key, std::string& value) {
    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    key = trim(line.substr(0, colon_pos));
    value = unquote(trim(line.substr(colon_pos + 1)));
    return true;
}

inline bool parse_int(const std::string& value, int& out) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size()) return false;
        out = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

inline bool parse_int64(const std::string& value, int64_t& out) {
    try {
        size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != value.size()) return false;
        out = static_cast<int64_t>(parsed);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

inline bool parse_double(const std::string& value, double& out) {
    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != value.size()) return false;
        out = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

inline bool parse_bool(const std::string& value, bool& out) {
    std::string lower = value;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true" || lower == "yes" || lower == "1") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0") {
        out = false;
        return true;
    }
    return false;
}

} // namespace netmon::detail
