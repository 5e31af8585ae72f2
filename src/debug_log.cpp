#include "debug_log.hpp"
#include "config.hpp"
#include <atomic>
#include <fstream>
#include <mutex>

namespace pyhamt {
namespace debug {

namespace {

std::ofstream debug_log;
std::mutex debug_mutex;
std::once_flag debug_initialized;
std::atomic<bool> debug_open{false};

void openLocked(const std::string& path) {
    if (debug_log.is_open()) {
        debug_log.close();
    }
    debug_log.open(path, std::ios::out | std::ios::trunc);
    debug_open.store(debug_log.is_open(), std::memory_order_release);
    if (debug_log.is_open()) {
        debug_log << "=== pyhamt Debug Log ===" << std::endl;
    }
}

void initFromConfig() {
    std::call_once(debug_initialized, [] {
        std::string path = Config::debugLogPath();
        if (!path.empty()) {
            std::lock_guard<std::mutex> lock(debug_mutex);
            openLocked(path);
        }
    });
}

}  // namespace

bool enabled() {
    initFromConfig();
    return debug_open.load(std::memory_order_acquire);
}

void open(const std::string& path) {
    initFromConfig();
    std::lock_guard<std::mutex> lock(debug_mutex);
    openLocked(path);
}

void close() {
    initFromConfig();
    std::lock_guard<std::mutex> lock(debug_mutex);
    debug_open.store(false, std::memory_order_release);
    if (debug_log.is_open()) {
        debug_log.close();
    }
}

void write(const std::string& line) {
    std::lock_guard<std::mutex> lock(debug_mutex);
    if (debug_log.is_open()) {
        debug_log << line << std::endl;
    }
}

}  // namespace debug
}  // namespace pyhamt
