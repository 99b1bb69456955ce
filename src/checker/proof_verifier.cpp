#include "checker/proof_verifier.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "merkle/canopy.hpp"
#include "merkle/concurrent_merkle_tree.hpp"
#include "params/params_generation.hpp"
#include "rpc/methods.hpp"

#include <exception>
#include <future>
#include <limits>
#include <stdexcept>
#include <utility>

namespace das_integrity {

namespace {

const nlohmann::json& result_of(const nlohmann::json& response, const char* field) {
    if (!response.is_object() || !response.contains("result") || !response.at("result").is_object()) {
        throw ProofExtractionError(field);
    }
    return response.at("result");
}

std::string string_field(const nlohmann::json& result, const char* field) {
    auto it = result.find(field);
    if (it == result.end() || !it->is_string()) {
        throw ProofExtractionError(field);
    }
    return it->get<std::string>();
}

} // namespace

AssetProof AssetProof::from_response(const nlohmann::json& response) {
    const nlohmann::json& result = result_of(response, "tree_id");

    AssetProof out;
    out.tree_id = string_field(result, "tree_id");

    try {
        out.leaf = Node::from_base58(string_field(result, "leaf"));
    } catch (const std::invalid_argument&) {
        throw ProofExtractionError("leaf");
    }

    auto proof = result.find("proof");
    if (proof == result.end() || !proof->is_array()) {
        throw ProofExtractionError("proof");
    }
    for (const auto& entry : *proof) {
        if (!entry.is_string()) {
            continue;
        }
        try {
            out.proof.push_back(Node::from_base58(entry.get<std::string>()));
        } catch (const std::invalid_argument&) {
            DAS_DEBUG_COUT("proof", "Dropping malformed proof node " << entry.get<std::string>());
        }
    }
    return out;
}

ProofVerifier::ProofVerifier(std::shared_ptr<const ApiClient> api,
                             std::shared_ptr<const ChainStateReader> chain,
                             std::string reference_host)
    : api_(std::move(api)), chain_(std::move(chain)), reference_host_(std::move(reference_host)) {}

uint32_t ProofVerifier::fetch_leaf_index(const std::string& asset_id) const {
    RequestBody request(GET_ASSET_METHOD, generate_get_asset_params(asset_id));
    nlohmann::json asset = api_->make_request(reference_host_, request.to_string());

    const nlohmann::json& result = result_of(asset, "leaf_id");
    auto compression = result.find("compression");
    if (compression == result.end() || !compression->is_object()) {
        throw ProofExtractionError("leaf_id");
    }
    auto leaf_id = compression->find("leaf_id");
    if (leaf_id == compression->end() || !leaf_id->is_number_integer()) {
        throw ProofExtractionError("leaf_id");
    }
    int64_t value = leaf_id->get<int64_t>();
    if (value < 0 || value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw ProofStructureError("Leaf index " + std::to_string(value) + " out of range");
    }
    return static_cast<uint32_t>(value);
}

std::vector<uint8_t> ProofVerifier::fetch_tree_account(const std::string& tree_id) const {
    auto data = chain_->get_account_data(tree_id, CommitmentLevel::Processed);
    if (!data) {
        throw ProofStructureError("NullAssetAccount " + tree_id);
    }
    return std::move(*data);
}

bool ProofVerifier::validate(const std::string& asset_id, const nlohmann::json& response) const {
    AssetProof asset_proof = AssetProof::from_response(response);

    // Reference getAsset and the chain read run side by side; errors surface after both finish
    auto account_read = std::async(std::launch::async, [this, &asset_proof]() {
        return fetch_tree_account(asset_proof.tree_id);
    });

    uint32_t leaf_index = 0;
    std::exception_ptr asset_error;
    try {
        leaf_index = fetch_leaf_index(asset_id);
    } catch (const VerificationError&) {
        asset_error = std::current_exception();
    }

    account_read.wait();
    if (asset_error) {
        std::rethrow_exception(asset_error);
    }
    std::vector<uint8_t> account_data = account_read.get();

    TreeAccount account = TreeAccount::parse(account_data);
    const uint32_t max_depth = account.header().max_depth;

    std::vector<Node> proof = std::move(asset_proof.proof);
    fill_in_proof_from_canopy(account.canopy_bytes(), max_depth, leaf_index, proof);

    DAS_DEBUG_COUT("proof", asset_id << ": tree " << asset_proof.tree_id
                   << ", leaf index " << leaf_index << ", depth " << max_depth
                   << ", proof length " << proof.size());

    return account.tree().prove_leaf(asset_proof.leaf, std::move(proof), leaf_index);
}

} // namespace das_integrity
