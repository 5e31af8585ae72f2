#pragma once

#include <string>

namespace pyhamt {

// Environment variables read once at startup
constexpr const char* VALIDATE_ENV = "PYHAMT_VALIDATE";
constexpr const char* DEBUG_LOG_ENV = "PYHAMT_DEBUG_LOG";

/**
 * Config - process-wide runtime settings.
 *
 * - validate: run the full invariant check on every algebra result.
 *   Defaults to on in builds without NDEBUG; PYHAMT_VALIDATE=0/1 overrides.
 * - debugLogPath: file receiving the debug trace; empty disables it.
 *   Taken from PYHAMT_DEBUG_LOG.
 *
 * Both can be changed at runtime; changing the log path reopens the log.
 */
class Config {
public:
    static bool validate();
    static void setValidate(bool enabled);

    static std::string debugLogPath();
    static void setDebugLogPath(const std::string& path);
};

}  // namespace pyhamt
