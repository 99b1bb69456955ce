#include "params/params_generation.hpp"
#include "keys/file_keys_fetcher.hpp"
#include "rpc/methods.hpp"

#include <stdexcept>

namespace das_integrity {

namespace {

const char* to_string(AssetSortBy sort_by) {
    switch (sort_by) {
        case AssetSortBy::Created: return "created";
        case AssetSortBy::Updated: return "updated";
        case AssetSortBy::RecentAction: return "recent_action";
        case AssetSortBy::None: return "none";
    }
    return "none";
}

const char* to_string(AssetSortDirection direction) {
    return direction == AssetSortDirection::Asc ? "asc" : "desc";
}

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json AssetSorting::to_json() const {
    nlohmann::json j;
    j["sortBy"] = to_string(sort_by);
    j["sortDirection"] = sort_direction ? nlohmann::json(to_string(*sort_direction)) : nlohmann::json(nullptr);
    return j;
}

void Pagination::write_to(nlohmann::json& params) const {
    params["sortBy"] = sort_by ? sort_by->to_json() : nlohmann::json(nullptr);
    params["limit"] = optional_json(limit);
    params["page"] = optional_json(page);
    params["before"] = optional_json(before);
    params["after"] = optional_json(after);
}

nlohmann::json generate_get_asset_params(const std::string& id) {
    return {{"id", id}};
}

nlohmann::json generate_get_asset_proof_params(const std::string& id) {
    return {{"id", id}};
}

nlohmann::json generate_get_assets_by_owner_params(const std::string& owner_address,
                                                   const Pagination& pagination) {
    nlohmann::json params;
    params["ownerAddress"] = owner_address;
    pagination.write_to(params);
    return params;
}

nlohmann::json generate_get_assets_by_authority_params(const std::string& authority_address,
                                                       const Pagination& pagination) {
    nlohmann::json params;
    params["authorityAddress"] = authority_address;
    pagination.write_to(params);
    return params;
}

nlohmann::json generate_get_assets_by_creator_params(const std::string& creator_address,
                                                     std::optional<bool> only_verified,
                                                     const Pagination& pagination) {
    nlohmann::json params;
    params["creatorAddress"] = creator_address;
    params["onlyVerified"] = optional_json(only_verified);
    pagination.write_to(params);
    return params;
}

nlohmann::json generate_get_assets_by_group_params(const std::string& group_value,
                                                   const Pagination& pagination) {
    nlohmann::json params;
    params["groupKey"] = DEFAULT_GROUP_KEY;
    params["groupValue"] = group_value;
    pagination.write_to(params);
    return params;
}

nlohmann::json generate_get_token_accounts(const std::optional<std::string>& owner,
                                           const std::optional<std::string>& mint) {
    nlohmann::json params;
    params["ownerAddress"] = optional_json(owner);
    params["mintAddress"] = optional_json(mint);
    params["limit"] = nullptr;
    params["page"] = nullptr;
    params["before"] = nullptr;
    params["after"] = nullptr;
    return params;
}

nlohmann::json generate_get_signatures_for_asset(const std::string& id) {
    nlohmann::json params;
    params["id"] = id;
    params["limit"] = nullptr;
    params["page"] = nullptr;
    params["before"] = nullptr;
    params["after"] = nullptr;
    return params;
}

RequestBody build_request(const std::string& method, const std::string& raw_key) {
    if (method == GET_ASSET_METHOD) {
        return RequestBody(method, generate_get_asset_params(raw_key));
    } else if (method == GET_ASSET_PROOF_METHOD) {
        return RequestBody(method, generate_get_asset_proof_params(raw_key));
    } else if (method == GET_ASSET_BY_OWNER_METHOD) {
        return RequestBody(method, generate_get_assets_by_owner_params(raw_key));
    } else if (method == GET_ASSET_BY_AUTHORITY_METHOD) {
        return RequestBody(method, generate_get_assets_by_authority_params(raw_key));
    } else if (method == GET_ASSET_BY_CREATOR_METHOD) {
        return RequestBody(method, generate_get_assets_by_creator_params(raw_key));
    } else if (method == GET_ASSET_BY_GROUP_METHOD) {
        return RequestBody(method, generate_get_assets_by_group_params(raw_key));
    } else if (method == GET_TOKEN_ACCOUNTS_BY_OWNER) {
        return RequestBody(method, generate_get_token_accounts(raw_key, std::nullopt));
    } else if (method == GET_TOKEN_ACCOUNTS_BY_MINT) {
        return RequestBody(method, generate_get_token_accounts(std::nullopt, raw_key));
    } else if (method == GET_TOKEN_ACCOUNTS_BY_OWNER_AND_MINT) {
        KeyPair pair = parse_key_pair(raw_key);
        return RequestBody(method, generate_get_token_accounts(pair.first, pair.second));
    } else if (method == GET_SIGNATURES_FOR_ASSET) {
        return RequestBody(method, generate_get_signatures_for_asset(raw_key));
    }
    throw std::invalid_argument("Unknown method: " + method);
}

} // namespace das_integrity
