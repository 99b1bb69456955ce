#pragma once

#include "rpc/api_client.hpp"
#include "rpc/chain_state_reader.hpp"
#include "types/node.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace das_integrity {

/**
 * Fields of a getAssetProof response needed for verification
 */
struct AssetProof {
    std::string tree_id;
    Node leaf;
    // Valid base58 nodes only, leaf to root; may stop below the canopy
    std::vector<Node> proof;

    /**
     * @throws ProofExtractionError naming the first missing or malformed field
     */
    static AssetProof from_response(const nlohmann::json& response);
};

/**
 * ProofVerifier - checks getAssetProof responses against on-chain tree state
 *
 * For each asset the leaf index is taken from the reference host's getAsset
 * response and the tree account is read at processed commitment; both reads run
 * concurrently. The served proof is completed from the canopy and proven against
 * the current root, fast-forwarded through the change log when stale.
 */
class ProofVerifier {
public:
    ProofVerifier(std::shared_ptr<const ApiClient> api,
                  std::shared_ptr<const ChainStateReader> chain,
                  std::string reference_host);

    /**
     * @param asset_id Asset the proof was requested for
     * @param response Testing host's getAssetProof response
     * @return true if the proof is valid for the current tree
     * @throws VerificationError (extraction, structure, API or RPC) when the
     *         proof cannot be checked
     */
    bool validate(const std::string& asset_id, const nlohmann::json& response) const;

private:
    uint32_t fetch_leaf_index(const std::string& asset_id) const;
    std::vector<uint8_t> fetch_tree_account(const std::string& tree_id) const;

    std::shared_ptr<const ApiClient> api_;
    std::shared_ptr<const ChainStateReader> chain_;
    std::string reference_host_;
};

} // namespace das_integrity
