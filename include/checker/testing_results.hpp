#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace das_integrity {

struct TestingResult {
    uint64_t total_tests = 0;
    uint64_t failed_tests = 0;
};

/**
 * Per-method counters shared by all category tasks.
 * Entries are created on first use; the lock is held for the increment only.
 */
class TestingResults {
public:
    void inc_total_tests(const std::string& method);
    void inc_failed_tests(const std::string& method);

    std::map<std::string, TestingResult> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, TestingResult> results_;
};

} // namespace das_integrity
