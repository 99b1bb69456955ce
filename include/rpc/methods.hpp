#pragma once

#include <array>

namespace das_integrity {

// DAS-API methods under test. Also the category names of the key file.
constexpr const char* GET_ASSET_METHOD = "getAsset";
constexpr const char* GET_ASSET_PROOF_METHOD = "getAssetProof";
constexpr const char* GET_ASSET_BY_OWNER_METHOD = "getAssetsByOwner";
constexpr const char* GET_ASSET_BY_AUTHORITY_METHOD = "getAssetsByAuthority";
constexpr const char* GET_ASSET_BY_GROUP_METHOD = "getAssetsByGroup";
constexpr const char* GET_ASSET_BY_CREATOR_METHOD = "getAssetsByCreator";
constexpr const char* GET_TOKEN_ACCOUNTS_BY_OWNER = "getTokenAccountsByOwner";
constexpr const char* GET_TOKEN_ACCOUNTS_BY_MINT = "getTokenAccountsByMint";
constexpr const char* GET_TOKEN_ACCOUNTS_BY_OWNER_AND_MINT = "getTokenAccountsByOwnerAndMint";
constexpr const char* GET_SIGNATURES_FOR_ASSET = "getSignaturesForAsset";

constexpr std::array<const char*, 10> ALL_METHODS = {
    GET_ASSET_METHOD,
    GET_ASSET_PROOF_METHOD,
    GET_ASSET_BY_OWNER_METHOD,
    GET_ASSET_BY_AUTHORITY_METHOD,
    GET_ASSET_BY_GROUP_METHOD,
    GET_ASSET_BY_CREATOR_METHOD,
    GET_TOKEN_ACCOUNTS_BY_OWNER,
    GET_TOKEN_ACCOUNTS_BY_MINT,
    GET_TOKEN_ACCOUNTS_BY_OWNER_AND_MINT,
    GET_SIGNATURES_FOR_ASSET,
};

} // namespace das_integrity
