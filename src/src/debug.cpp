#include <cf/debug.h>
#include <atomic>
#include <cstdlib>
#include <iostream>

namespace cf {
namespace debug {

namespace {
    bool read_environment() {
        const char* setting = std::getenv("CF_PARSE_DEBUG");
        if (setting == nullptr) return false;
        std::string s(setting);
        return not s.empty() and s != "0";
    }

    std::atomic<bool>& flag() {
        static std::atomic<bool> on{read_environment()};
        return on;
    }
}

bool enabled() { return flag().load(std::memory_order_relaxed); }

void set_enabled(bool on) { flag().store(on, std::memory_order_relaxed); }

void log(const std::string& message) {
    if (not enabled()) return;
    std::cerr << "conform: " << message << "\n";
}

}  // namespace debug
}  // namespace cf
