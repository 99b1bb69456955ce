#pragma once

#include "checker/proof_verifier.hpp"
#include "checker/testing_results.hpp"
#include "common/cancellation.hpp"
#include "config/config.hpp"
#include "keys/keys_fetcher.hpp"
#include "rpc/api_client.hpp"
#include "rpc/chain_state_reader.hpp"
#include "rpc/request_body.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace das_integrity {

/**
 * DiffChecker - differential comparison of a testing host against a reference host
 *
 * Every check_* call handles one method category: it fetches the category's keys,
 * builds one request per key and runs them one after another. Each request is sent
 * to both hosts at once and the responses are compared; a mismatch is retried up to
 * test_retries times with a pause in between, and only a mismatch that survives all
 * retries counts as a failure. getAssetProof responses are additionally proven
 * against the on-chain tree.
 *
 * Different categories may run on different threads against one DiffChecker; the
 * result counters are the only state they share.
 */
class DiffChecker {
public:
    /**
     * @throws ConfigError if a filter regex does not compile
     */
    DiffChecker(const IntegrityVerificationConfig& config,
                std::unique_ptr<KeysFetcher> keys_fetcher,
                std::shared_ptr<const ApiClient> api,
                std::shared_ptr<const ChainStateReader> chain,
                const CancellationToken& cancellation);

    // Each throws KeysFetchError if the category's keys cannot be fetched
    void check_get_asset();
    void check_get_asset_proof();
    void check_get_asset_by_owner();
    void check_get_asset_by_authority();
    void check_get_asset_by_creator();
    void check_get_asset_by_group();
    void check_get_token_accounts_by_owner();
    void check_get_token_accounts_by_mint();
    void check_get_token_accounts_by_owner_and_mint();
    void check_get_signatures_for_asset();

    /**
     * Strict diff of the two responses with the configured filters applied.
     * @return nullopt if nothing is left after filtering
     */
    std::optional<std::string> compare_responses(const nlohmann::json& reference_response,
                                                 const nlohmann::json& testing_response) const;

    // Log one summary line per tested method
    void show_results() const;

    std::map<std::string, TestingResult> results() const { return test_results_.snapshot(); }

private:
    struct DiffWithResponses {
        std::optional<std::string> diff;
        // Absent when either host call failed
        std::optional<nlohmann::json> testing_response;
    };

    DiffWithResponses check_request(const RequestBody& request) const;
    void check_requests(const std::vector<RequestBody>& requests);
    bool check_proof_valid(const RequestBody& request, const nlohmann::json& testing_response) const;

    std::string reference_host_;
    std::string testing_host_;
    uint64_t test_retries_;
    bool log_differences_;
    std::chrono::milliseconds requests_interval_;
    std::vector<std::regex> regexes_;

    std::unique_ptr<KeysFetcher> keys_fetcher_;
    std::shared_ptr<const ApiClient> api_;
    ProofVerifier proof_verifier_;
    const CancellationToken& cancellation_;
    TestingResults test_results_;
};

} // namespace das_integrity
