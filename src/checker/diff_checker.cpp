#include "checker/diff_checker.hpp"
#include "checker/json_diff.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "params/params_generation.hpp"
#include "rpc/methods.hpp"

#include <future>
#include <utility>

namespace das_integrity {

DiffChecker::DiffChecker(const IntegrityVerificationConfig& config,
                         std::unique_ptr<KeysFetcher> keys_fetcher,
                         std::shared_ptr<const ApiClient> api,
                         std::shared_ptr<const ChainStateReader> chain,
                         const CancellationToken& cancellation)
    : reference_host_(config.reference_host),
      testing_host_(config.testing_host),
      test_retries_(config.test_retries),
      log_differences_(config.log_differences),
      requests_interval_(config.requests_interval_millis),
      regexes_(compile_filter_regexes(config.difference_filter_regexes)),
      keys_fetcher_(std::move(keys_fetcher)),
      api_(api),
      proof_verifier_(api, std::move(chain), config.reference_host),
      cancellation_(cancellation) {}

// ============================================================================
// Comparison
// ============================================================================

std::optional<std::string> DiffChecker::compare_responses(const nlohmann::json& reference_response,
                                                          const nlohmann::json& testing_response) const {
    auto diff = compare_json_strict(reference_response, testing_response);
    if (!diff) {
        return std::nullopt;
    }
    return filter_diff(std::move(*diff), regexes_);
}

DiffChecker::DiffWithResponses DiffChecker::check_request(const RequestBody& request) const {
    const std::string body = request.to_string();

    nlohmann::json reference_response;
    nlohmann::json testing_response;
    std::optional<std::string> reference_error;
    std::optional<std::string> testing_error;

    // The testing call runs on its own thread so both hosts see the request at once
    auto testing_call = std::async(std::launch::async, [&]() {
        try {
            testing_response = api_->make_request(testing_host_, body);
        } catch (const ApiError& e) {
            testing_error = e.what();
        }
    });

    try {
        reference_response = api_->make_request(reference_host_, body);
    } catch (const ApiError& e) {
        reference_error = e.what();
    }
    testing_call.get();

    // A failed call is not a difference between the hosts
    if (reference_error) {
        DAS_LOG_ERROR("diff_checker", "Reference host network error: " << *reference_error);
        return {};
    }
    if (testing_error) {
        DAS_LOG_ERROR("diff_checker", "Testing host network error: " << *testing_error);
        return {};
    }

    DiffWithResponses result;
    result.diff = compare_responses(reference_response, testing_response);
    result.testing_response = std::move(testing_response);
    return result;
}

bool DiffChecker::check_proof_valid(const RequestBody& request, const nlohmann::json& testing_response) const {
    const nlohmann::json& params = request.params();
    const std::string asset_id =
        params.contains("id") && params.at("id").is_string() ? params.at("id").get<std::string>() : "";

    try {
        if (!proof_verifier_.validate(asset_id, testing_response)) {
            DAS_LOG_ERROR("diff_checker", "Invalid proof for " << asset_id << " asset");
            return false;
        }
        return true;
    } catch (const VerificationError& e) {
        DAS_LOG_ERROR("diff_checker", "Check proof valid: " << e.what());
        return false;
    }
}

void DiffChecker::check_requests(const std::vector<RequestBody>& requests) {
    for (const auto& request : requests) {
        if (cancellation_.is_cancelled()) {
            DAS_DEBUG_COUT("diff_checker", request.method() << ": cancelled, skipping remaining requests");
            return;
        }

        test_results_.inc_total_tests(request.method());

        DiffWithResponses diff_with_responses;
        for (uint64_t attempt = 0; attempt < test_retries_; ++attempt) {
            diff_with_responses = check_request(request);
            if (!diff_with_responses.diff) {
                break;
            }
            DAS_DEBUG_COUT("diff_checker", request.method() << ": attempt " << (attempt + 1) << " of "
                                           << test_retries_ << " differs");
            // Rate-limit guard
            if (!cancellation_.sleep_for(requests_interval_)) {
                break;
            }
        }

        bool test_failed = false;
        if (diff_with_responses.diff) {
            test_failed = true;
            if (log_differences_) {
                DAS_LOG_ERROR("diff_checker", request.method() << ": mismatch responses: req: "
                                              << request.to_pretty_string() << ", diff: "
                                              << *diff_with_responses.diff);
            }
        }

        if (request.method() == GET_ASSET_PROOF_METHOD && diff_with_responses.testing_response) {
            if (!check_proof_valid(request, *diff_with_responses.testing_response)) {
                test_failed = true;
            }
        }

        if (test_failed) {
            test_results_.inc_failed_tests(request.method());
        }

        cancellation_.sleep_for(requests_interval_);
    }
}

// ============================================================================
// Categories
// ============================================================================

void DiffChecker::check_get_asset() {
    std::vector<RequestBody> requests;
    for (const auto& key : keys_fetcher_->get_verification_required_assets_keys()) {
        requests.emplace_back(GET_ASSET_METHOD, generate_get_asset_params(key));
    }
    check_requests(requests);
}

void DiffChecker::check_get_asset_proof() {
    std::vector<RequestBody> requests;
    for (const auto& key : keys_fetcher_->get_verification_required_assets_proof_keys()) {
        requests.emplace_back(GET_ASSET_PROOF_METHOD, generate_get_asset_proof_params(key));
    }
    check_requests(requests);
}

void DiffChecker::check_get_asset_by_owner() {
    std::vector<RequestBody> requests;
    for (const auto& key : keys_fetcher_->get_verification_required_owners_keys()) {
        requests.emplace_back(GET_ASSET_BY_OWNER_METHOD, generate_get_assets_by_owner_params(key));
    }
    check_requests(requests);
}

void DiffChecker::check_get_asset_by_authority() {
    std::vector<RequestBody> requests;
    for (const auto& key : keys_fetcher_->get_verification_required_authorities_keys()) {
        requests.emplace_back(GET_ASSET_BY_AUTHORITY_METHOD, generate_get_assets_by_authority_params(key));
    }
    check_requests(requests);
}

void DiffChecker::check_get_asset_by_creator() {
    std::vector<RequestBody> requests;
    for (const auto& key : keys_fetcher_->get_verification_required_creators_keys()) {
        requests.emplace_back(GET_ASSET_BY_CREATOR_METHOD, generate_get_assets_by_creator_params(key));
    }
    check_requests(requests);
}

void DiffChecker::check_get_asset_by_group() {
    std::vector<RequestBody> requests;
    for (const auto& key : keys_fetcher_->get_verification_required_groups_keys()) {
        requests.emplace_back(GET_ASSET_BY_GROUP_METHOD, generate_get_assets_by_group_params(key));
    }
    check_requests(requests);
}

void DiffChecker::check_get_token_accounts_by_owner() {
    std::vector<RequestBody> requests;
    for (const auto& owner : keys_fetcher_->get_verification_required_tokens_by_owner()) {
        requests.emplace_back(GET_TOKEN_ACCOUNTS_BY_OWNER, generate_get_token_accounts(owner, std::nullopt));
    }
    check_requests(requests);
}

void DiffChecker::check_get_token_accounts_by_mint() {
    std::vector<RequestBody> requests;
    for (const auto& mint : keys_fetcher_->get_verification_required_tokens_by_mint()) {
        requests.emplace_back(GET_TOKEN_ACCOUNTS_BY_MINT, generate_get_token_accounts(std::nullopt, mint));
    }
    check_requests(requests);
}

void DiffChecker::check_get_token_accounts_by_owner_and_mint() {
    std::vector<RequestBody> requests;
    for (const auto& [owner, mint] : keys_fetcher_->get_verification_required_tokens_by_owner_and_mint()) {
        requests.emplace_back(GET_TOKEN_ACCOUNTS_BY_OWNER_AND_MINT, generate_get_token_accounts(owner, mint));
    }
    check_requests(requests);
}

void DiffChecker::check_get_signatures_for_asset() {
    std::vector<RequestBody> requests;
    for (const auto& asset : keys_fetcher_->get_verification_required_signatures_for_asset()) {
        requests.emplace_back(GET_SIGNATURES_FOR_ASSET, generate_get_signatures_for_asset(asset));
    }
    check_requests(requests);
}

// ============================================================================
// Report
// ============================================================================

void DiffChecker::show_results() const {
    for (const auto& [method, result] : test_results_.snapshot()) {
        DAS_LOG_INFO("diff_checker", "RESULTS OF " << method << " METHOD TEST: TESTED PUBKEYS TOTAL: "
                                     << result.total_tests << ", FAILED TESTS: " << result.failed_tests);
    }
}

} // namespace das_integrity
