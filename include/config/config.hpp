#pragma once

#include <cstdint>
#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace das_integrity {

constexpr uint64_t DEFAULT_TEST_RETRIES = 20;
constexpr uint64_t DEFAULT_REQUESTS_INTERVAL_MILLIS = 1500;
constexpr uint64_t DEFAULT_NUM_OF_VIRTUAL_USERS = 1;
constexpr uint64_t DEFAULT_TEST_DURATION_SECS = 60;

/**
 * IntegrityVerificationConfig - settings of one run, read from a JSON file
 */
struct IntegrityVerificationConfig {
    std::string reference_host;
    std::string testing_host;
    std::string rpc_endpoint;
    std::string testing_file_path;
    uint64_t test_retries = DEFAULT_TEST_RETRIES;
    bool log_differences = false;
    std::vector<std::string> difference_filter_regexes;
    uint64_t requests_interval_millis = DEFAULT_REQUESTS_INTERVAL_MILLIS;

    // Load-test mode only
    uint64_t num_of_virtual_users = DEFAULT_NUM_OF_VIRTUAL_USERS;
    uint64_t test_duration_time = DEFAULT_TEST_DURATION_SECS;
};

/**
 * Build a config from parsed JSON, applying defaults and validating.
 * @throws ConfigError on missing or mistyped fields, or failed validation
 */
IntegrityVerificationConfig parse_config(const nlohmann::json& j);

/**
 * Read and validate the config file at `path`.
 * @throws ConfigError if the file cannot be read or is not valid JSON
 */
IntegrityVerificationConfig load_config(const std::string& path);

/**
 * @throws ConfigError when test_retries or num_of_virtual_users is zero
 */
void validate_config(const IntegrityVerificationConfig& config);

/**
 * Compile the difference filters (ECMAScript grammar).
 * @throws ConfigError naming the first pattern that fails to compile
 */
std::vector<std::regex> compile_filter_regexes(const std::vector<std::string>& patterns);

} // namespace das_integrity
