/**
 * DAS-API Integrity Verification - Main Entry Point
 *
 * Compares a testing DAS-API deployment against a reference deployment and
 * proves served asset proofs against on-chain tree state.
 *
 * Usage:
 *   ./das_integrity_verification --config-path config.json --test-type integrity
 *   ./das_integrity_verification -c config.json -t performance
 *
 * Environment Variables:
 *   DAS_INTEGRITY_DEBUG - Enable debug output
 */

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "checker/diff_checker.hpp"
#include "common/cancellation.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "config/config.hpp"
#include "keys/file_keys_fetcher.hpp"
#include "performance/load_test.hpp"
#include "rpc/api_client.hpp"
#include "rpc/chain_state_reader.hpp"
#include "runner/graceful_stop.hpp"
#include "runner/test_runner.hpp"

using namespace das_integrity;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  -c, --config-path FILE    Path to the JSON config file" << std::endl;
    std::cerr << "  -t, --test-type TYPE      integrity or performance" << std::endl;
    std::cerr << "  -h, --help                Show this help message" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Environment Variables:" << std::endl;
    std::cerr << "  DAS_INTEGRITY_DEBUG       Enable debug output" << std::endl;
}

int run_integrity(const IntegrityVerificationConfig& config, CancellationToken& cancellation) {
    auto keys_fetcher = std::make_unique<FileKeysFetcher>(config.testing_file_path);
    auto api = std::make_shared<HttpApiClient>();
    auto chain = std::make_shared<SolanaChainReader>(api, config.rpc_endpoint);

    DiffChecker checker(config, std::move(keys_fetcher), api, chain, cancellation);
    run_integrity_tests(checker, cancellation);
    return 0;
}

int run_performance(const IntegrityVerificationConfig& config, CancellationToken& cancellation) {
    auto keys_fetcher = std::make_shared<FileKeysFetcher>(config.testing_file_path);
    // Fail fast instead of letting every worker report the same error
    keys_fetcher->get_random_command();

    LoadTestOptions options;
    options.num_workers = static_cast<uint32_t>(config.num_of_virtual_users);
    options.duration = std::chrono::seconds(config.test_duration_time);
    options.endpoint = config.testing_host;

    run_performance_tests(options, std::make_shared<HttpApiClient>(),
                          [keys_fetcher]() { return keys_fetcher->get_random_command(); },
                          cancellation);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string test_type;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config-path" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a FILE argument" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--test-type" || arg == "-t") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a TYPE argument" << std::endl;
                return 1;
            }
            test_type = argv[++i];
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (test_type != "integrity" && test_type != "performance") {
        std::cerr << "Error: --test-type must be integrity or performance" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    DAS_LOG_INFO("main", "DAS-API tests start");

    IntegrityVerificationConfig config;
    try {
        config = load_config(config_path);
    } catch (const ConfigError& e) {
        DAS_LOG_ERROR("main", e.what());
        return 1;
    }

    CancellationToken cancellation;
    install_signal_handlers(cancellation);

    try {
        if (test_type == "integrity") {
            return run_integrity(config, cancellation);
        }
        return run_performance(config, cancellation);
    } catch (const VerificationError& e) {
        DAS_LOG_ERROR("main", e.what());
        return 1;
    }
}
