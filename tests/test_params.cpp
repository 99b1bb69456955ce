#include <gtest/gtest.h>
#include "params/params_generation.hpp"
#include "common/errors.hpp"
#include "rpc/methods.hpp"

#include <stdexcept>

using namespace das_integrity;
using nlohmann::json;

// Test the JSON-RPC envelope
TEST(RequestBodyTest, Envelope) {
    RequestBody body(GET_ASSET_METHOD, generate_get_asset_params("asset1"));
    json j = json::parse(body.to_string());
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 0);
    EXPECT_EQ(j["method"], "getAsset");
    EXPECT_EQ(j["params"], json({{"id", "asset1"}}));
    EXPECT_EQ(j.size(), 4u);

    EXPECT_EQ(RequestBody("getAsset", json::object(), 7).to_json()["id"], 7);
    EXPECT_EQ(json::parse(body.to_pretty_string()), j);
}

// Test list params carry every paging field, null when unset
TEST(ParamsTest, ListParamsNulls) {
    json owner = generate_get_assets_by_owner_params("owner1");
    EXPECT_EQ(owner["ownerAddress"], "owner1");
    for (const char* field : {"sortBy", "limit", "page", "before", "after"}) {
        ASSERT_TRUE(owner.contains(field)) << field;
        EXPECT_TRUE(owner[field].is_null()) << field;
    }

    json creator = generate_get_assets_by_creator_params("creator1");
    EXPECT_EQ(creator["creatorAddress"], "creator1");
    ASSERT_TRUE(creator.contains("onlyVerified"));
    EXPECT_TRUE(creator["onlyVerified"].is_null());

    json group = generate_get_assets_by_group_params("collection1");
    EXPECT_EQ(group["groupKey"], "collection");
    EXPECT_EQ(group["groupValue"], "collection1");

    json authority = generate_get_assets_by_authority_params("authority1");
    EXPECT_EQ(authority["authorityAddress"], "authority1");
}

// Test explicit paging and sorting
TEST(ParamsTest, Pagination) {
    Pagination pagination;
    pagination.sort_by = AssetSorting{AssetSortBy::RecentAction, AssetSortDirection::Asc};
    pagination.limit = 10;
    pagination.page = 2;

    json params = generate_get_assets_by_creator_params("creator1", true, pagination);
    EXPECT_EQ(params["onlyVerified"], true);
    EXPECT_EQ(params["sortBy"], json({{"sortBy", "recent_action"}, {"sortDirection", "asc"}}));
    EXPECT_EQ(params["limit"], 10);
    EXPECT_EQ(params["page"], 2);
    EXPECT_TRUE(params["before"].is_null());

    AssetSorting sorting;
    sorting.sort_direction = std::nullopt;
    EXPECT_EQ(sorting.to_json(), json({{"sortBy", "created"}, {"sortDirection", nullptr}}));
}

// Test token account and signature params
TEST(ParamsTest, TokenAccountsAndSignatures) {
    json both = generate_get_token_accounts(std::string("owner1"), std::string("mint1"));
    EXPECT_EQ(both["ownerAddress"], "owner1");
    EXPECT_EQ(both["mintAddress"], "mint1");
    for (const char* field : {"limit", "page", "before", "after"}) {
        EXPECT_TRUE(both[field].is_null()) << field;
    }
    EXPECT_FALSE(both.contains("cursor"));

    json signatures = generate_get_signatures_for_asset("asset1");
    EXPECT_EQ(signatures["id"], "asset1");
    EXPECT_TRUE(signatures["limit"].is_null());
}

// Test requests for raw keys of every category
TEST(BuildRequestTest, AllMethods) {
    for (const char* method : ALL_METHODS) {
        std::string key = std::string(method) == GET_TOKEN_ACCOUNTS_BY_OWNER_AND_MINT ? "(o;m)" : "key";
        RequestBody body = build_request(method, key);
        EXPECT_EQ(body.method(), method);
        EXPECT_TRUE(body.params().is_object()) << method;
    }

    EXPECT_EQ(build_request(GET_TOKEN_ACCOUNTS_BY_MINT, "mint1").params()["mintAddress"], "mint1");
    EXPECT_TRUE(build_request(GET_TOKEN_ACCOUNTS_BY_MINT, "mint1").params()["ownerAddress"].is_null());

    json pair = build_request(GET_TOKEN_ACCOUNTS_BY_OWNER_AND_MINT, "(o;m)").params();
    EXPECT_EQ(pair["ownerAddress"], "o");
    EXPECT_EQ(pair["mintAddress"], "m");
}

// Test invalid inputs
TEST(BuildRequestTest, Invalid) {
    EXPECT_THROW(build_request("getAssetBatch", "key"), std::invalid_argument);
    EXPECT_THROW(build_request(GET_TOKEN_ACCOUNTS_BY_OWNER_AND_MINT, "o;m"), KeysFetchError);
}
