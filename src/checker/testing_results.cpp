#include "checker/testing_results.hpp"

namespace das_integrity {

void TestingResults::inc_total_tests(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_[method].total_tests++;
}

void TestingResults::inc_failed_tests(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_[method].failed_tests++;
}

std::map<std::string, TestingResult> TestingResults::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

} // namespace das_integrity
