#include "config/config.hpp"
#include "common/errors.hpp"

#include <fstream>

namespace das_integrity {

namespace {

template <typename T>
T required_field(const nlohmann::json& j, const char* name) {
    if (!j.contains(name)) {
        throw ConfigError(std::string("missing field ") + name);
    }
    try {
        return j.at(name).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid field ") + name + ": " + e.what());
    }
}

template <typename T>
T optional_field(const nlohmann::json& j, const char* name, T fallback) {
    if (!j.contains(name) || j.at(name).is_null()) {
        return fallback;
    }
    return required_field<T>(j, name);
}

} // namespace

IntegrityVerificationConfig parse_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    IntegrityVerificationConfig config;
    config.reference_host = required_field<std::string>(j, "reference_host");
    config.testing_host = required_field<std::string>(j, "testing_host");
    config.rpc_endpoint = required_field<std::string>(j, "rpc_endpoint");
    config.testing_file_path = required_field<std::string>(j, "testing_file_path");
    config.test_retries = optional_field<uint64_t>(j, "test_retries", DEFAULT_TEST_RETRIES);
    config.log_differences = optional_field<bool>(j, "log_differences", false);
    config.difference_filter_regexes =
        optional_field<std::vector<std::string>>(j, "difference_filter_regexes", {});
    config.requests_interval_millis =
        optional_field<uint64_t>(j, "requests_interval_millis", DEFAULT_REQUESTS_INTERVAL_MILLIS);
    config.num_of_virtual_users =
        optional_field<uint64_t>(j, "num_of_virtual_users", DEFAULT_NUM_OF_VIRTUAL_USERS);
    config.test_duration_time =
        optional_field<uint64_t>(j, "test_duration_time", DEFAULT_TEST_DURATION_SECS);

    validate_config(config);
    return config;
}

IntegrityVerificationConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse config file " + path + ": " + e.what());
    }
    return parse_config(j);
}

void validate_config(const IntegrityVerificationConfig& config) {
    if (config.test_retries < 1) {
        throw ConfigError("test_retries");
    }
    if (config.num_of_virtual_users < 1) {
        throw ConfigError("num_of_virtual_users");
    }
    compile_filter_regexes(config.difference_filter_regexes);
}

std::vector<std::regex> compile_filter_regexes(const std::vector<std::string>& patterns) {
    std::vector<std::regex> regexes;
    regexes.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        try {
            regexes.emplace_back(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw ConfigError("InvalidRegex " + pattern + ": " + e.what());
        }
    }
    return regexes;
}

} // namespace das_integrity
