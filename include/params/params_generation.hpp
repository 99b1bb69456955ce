#pragma once

#include "rpc/request_body.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace das_integrity {

enum class AssetSortBy {
    Created,
    Updated,
    RecentAction,
    None,
};

enum class AssetSortDirection {
    Asc,
    Desc,
};

struct AssetSorting {
    AssetSortBy sort_by = AssetSortBy::Created;
    std::optional<AssetSortDirection> sort_direction = AssetSortDirection::Desc;

    nlohmann::json to_json() const;
};

/**
 * Paging shared by the list methods. Unset fields are sent as null.
 */
struct Pagination {
    std::optional<AssetSorting> sort_by;
    std::optional<uint32_t> limit;
    std::optional<uint32_t> page;
    std::optional<std::string> before;
    std::optional<std::string> after;

    void write_to(nlohmann::json& params) const;
};

// Collection grouping key used for getAssetsByGroup
constexpr const char* DEFAULT_GROUP_KEY = "collection";

nlohmann::json generate_get_asset_params(const std::string& id);
nlohmann::json generate_get_asset_proof_params(const std::string& id);
nlohmann::json generate_get_assets_by_owner_params(const std::string& owner_address,
                                                   const Pagination& pagination = {});
nlohmann::json generate_get_assets_by_authority_params(const std::string& authority_address,
                                                       const Pagination& pagination = {});
nlohmann::json generate_get_assets_by_creator_params(const std::string& creator_address,
                                                     std::optional<bool> only_verified = std::nullopt,
                                                     const Pagination& pagination = {});
nlohmann::json generate_get_assets_by_group_params(const std::string& group_value,
                                                   const Pagination& pagination = {});
nlohmann::json generate_get_token_accounts(const std::optional<std::string>& owner,
                                           const std::optional<std::string>& mint);
nlohmann::json generate_get_signatures_for_asset(const std::string& id);

/**
 * Build the request for a raw key-file key of any category.
 * Owner+mint keys are "(owner;mint)" tokens.
 *
 * @throws std::invalid_argument for an unknown method
 * @throws KeysFetchError for a malformed owner+mint token
 */
RequestBody build_request(const std::string& method, const std::string& raw_key);

} // namespace das_integrity
