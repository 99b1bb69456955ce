#pragma once

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>

namespace das_integrity {
namespace debug {

/**
 * Debug and Log Control
 *
 * Environment variables:
 * - DAS_INTEGRITY_DEBUG: Enable/disable debug output (every attempt, canopy fills,
 *   raw responses). Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * Info and error lines are always printed. Category tasks run concurrently, so every
 * line is assembled first and written under one mutex.
 */

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static const bool enabled = []() {
        const char* env = std::getenv("DAS_INTEGRITY_DEBUG");
        return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
    }();
    return enabled;
}

inline std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}

inline void write_line(std::ostream& os, const std::string& line) {
    std::lock_guard<std::mutex> lock(output_mutex());
    os << line << std::endl;
}

} // namespace debug
} // namespace das_integrity

// Info lines: "[component] message"
#define DAS_LOG_INFO(component, expr) \
    do { \
        std::ostringstream das_log_oss_; \
        das_log_oss_ << "[" << component << "] " << expr; \
        das_integrity::debug::write_line(std::cout, das_log_oss_.str()); \
    } while(0)

// Error lines go to stderr
#define DAS_LOG_ERROR(component, expr) \
    do { \
        std::ostringstream das_log_oss_; \
        das_log_oss_ << "[" << component << "] " << expr; \
        das_integrity::debug::write_line(std::cerr, das_log_oss_.str()); \
    } while(0)

// Debug printing (detailed state dumps)
#define DAS_DEBUG_COUT(component, expr) \
    do { \
        if (das_integrity::debug::is_debug_enabled()) { \
            DAS_LOG_INFO(component, expr); \
        } \
    } while(0)
