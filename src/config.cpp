#include "config.hpp"
#include "debug_log.hpp"
#include <atomic>
#include <cstdlib>
#include <mutex>

namespace pyhamt {

namespace {

struct Settings {
    std::atomic<bool> validate;
    std::mutex mutex;
    std::string debugLogPath;

    Settings() {
#ifdef NDEBUG
        bool enabled = false;
#else
        bool enabled = true;
#endif
        if (const char* value = std::getenv(VALIDATE_ENV)) {
            std::string flag(value);
            enabled = !(flag.empty() || flag == "0" || flag == "false" || flag == "off");
        }
        validate.store(enabled);

        if (const char* path = std::getenv(DEBUG_LOG_ENV)) {
            debugLogPath = path;
        }
    }
};

Settings& settings() {
    static Settings instance;
    return instance;
}

}  // namespace

bool Config::validate() {
    return settings().validate.load(std::memory_order_relaxed);
}

void Config::setValidate(bool enabled) {
    settings().validate.store(enabled, std::memory_order_relaxed);
}

std::string Config::debugLogPath() {
    Settings& s = settings();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.debugLogPath;
}

void Config::setDebugLogPath(const std::string& path) {
    {
        Settings& s = settings();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.debugLogPath = path;
    }
    if (path.empty()) {
        debug::close();
    } else {
        debug::open(path);
    }
}

}  // namespace pyhamt
