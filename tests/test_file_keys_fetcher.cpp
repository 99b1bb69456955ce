#include <gtest/gtest.h>
#include "keys/file_keys_fetcher.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <set>
#include <sstream>

using namespace das_integrity;

namespace {

const char* kKeyFile =
    "stray,line\n"
    "getAsset:\n"
    "a1,a2,\n"
    "\n"
    "a3\r\n"
    "getAssetsByOwner:\r\n"
    ",,o1,,o2\n"
    "getTokenAccountsByOwnerAndMint:\n"
    "(owner1;mint1),(owner2;mint2)\n"
    "getSignaturesForAsset:\n";

} // namespace

class FileKeysFetcherTest : public ::testing::Test {
protected:
    FileKeysFetcherTest() : input_(kKeyFile), fetcher_(input_) {}

    std::istringstream input_;
    FileKeysFetcher fetcher_;
};

// Test keys accumulate across lines of one category
TEST_F(FileKeysFetcherTest, CategoryKeys) {
    EXPECT_EQ(fetcher_.get_verification_required_assets_keys(), (std::vector<std::string>{"a1", "a2", "a3"}));
    EXPECT_EQ(fetcher_.get_verification_required_owners_keys(), (std::vector<std::string>{"o1", "o2"}));
}

// Test lines before the first header and empty categories
TEST_F(FileKeysFetcherTest, StrayAndEmpty) {
    EXPECT_EQ(fetcher_.keys_map().count("stray"), 0u);
    EXPECT_EQ(fetcher_.keys_map().size(), 3u);
    EXPECT_TRUE(fetcher_.get_verification_required_signatures_for_asset().empty());
    EXPECT_TRUE(fetcher_.get_verification_required_groups_keys().empty());
}

// Test owner+mint pairs
TEST_F(FileKeysFetcherTest, OwnerMintPairs) {
    auto pairs = fetcher_.get_verification_required_tokens_by_owner_and_mint();
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[0], KeyPair("owner1", "mint1"));
    EXPECT_EQ(pairs[1], KeyPair("owner2", "mint2"));
}

// Test random commands only come from non-empty categories
TEST_F(FileKeysFetcherTest, RandomCommand) {
    const std::set<std::string> methods = {"getAsset", "getAssetsByOwner", "getTokenAccountsByOwnerAndMint"};
    for (int i = 0; i < 50; ++i) {
        auto [method, key] = fetcher_.get_random_command();
        ASSERT_EQ(methods.count(method), 1u) << method;
        auto keys = fetcher_.read_keys(method);
        EXPECT_NE(std::find(keys.begin(), keys.end(), key), keys.end());
    }
}

// Test a key file without keys cannot supply random commands
TEST(FileKeysFetcherEmptyTest, NoKeys) {
    std::istringstream input("getAsset:\n\n");
    FileKeysFetcher fetcher(input);
    EXPECT_THROW(fetcher.get_random_command(), KeysFetchError);
}

// Test a missing file
TEST(FileKeysFetcherEmptyTest, MissingFile) {
    EXPECT_THROW(FileKeysFetcher("/nonexistent/keys.txt"), KeysFetchError);
}

// Test malformed pairs
TEST(ParseKeyPairTest, Malformed) {
    EXPECT_EQ(parse_key_pair("(a;b)"), KeyPair("a", "b"));
    for (const char* token : {"a;b", "(a;b", "(ab)", "(;b)", "(a;)", "(a;b;c)", "()"}) {
        EXPECT_THROW(parse_key_pair(token), KeysFetchError) << token;
    }
}

// Test a malformed pair fails the whole category
TEST(ParseKeyPairTest, MalformedPairInFile) {
    std::istringstream input("getTokenAccountsByOwnerAndMint:\n(a;b),oops\n");
    FileKeysFetcher fetcher(input);
    EXPECT_THROW(fetcher.get_verification_required_tokens_by_owner_and_mint(), KeysFetchError);
}
