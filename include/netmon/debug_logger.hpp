#pragma once

#include <atomic>
#include <iostream>
#include <sstream>

namespace netmon {

class DebugLogger {
public:
    static void set_enabled(bool enabled) { enabled_ = enabled; }
    static bool is_enabled() { return enabled_; }

    // Formats the whole line first so concurrent device workers do not interleave
    template<typename... Args>
    static void log(Args&&... args) {
        if (enabled_) {
            std::ostringstream line;
            line << "[DEBUG] ";
            ((line << args), ...);
            line << '\n';
            std::cerr << line.str() << std::flush;
        }
    }

private:
    static std::atomic<bool> enabled_;
};

} // namespace netmon
