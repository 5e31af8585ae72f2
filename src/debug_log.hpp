#pragma once

#include <sstream>
#include <string>

namespace pyhamt {
namespace debug {

// True once a log file is open; opens the configured path on first use
bool enabled();

// (Re)open the log at `path`, truncating it
void open(const std::string& path);
void close();

void write(const std::string& line);

template <typename... Args>
void log(const Args&... args) {
    if (!enabled()) return;
    std::ostringstream oss;
    (oss << ... << args);
    write(oss.str());
}

}  // namespace debug
}  // namespace pyhamt
