#pragma once

#include "keys/keys_fetcher.hpp"

#include <istream>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace das_integrity {

/**
 * FileKeysFetcher - keys read from a plain-text key file
 *
 * Format:
 *
 *   getAsset:
 *   key1,key2,
 *   key3
 *   getTokenAccountsByOwnerAndMint:
 *   (owner1;mint1),(owner2;mint2)
 *
 * A line ending in ':' starts a category named by the rest of the line. Following
 * non-empty lines are comma-separated keys of that category; empty tokens are
 * ignored. Lines before the first category header are ignored.
 */
class FileKeysFetcher : public KeysFetcher {
public:
    /**
     * @throws KeysFetchError if the file cannot be opened or read
     */
    explicit FileKeysFetcher(const std::string& file_path);
    explicit FileKeysFetcher(std::istream& input);

    std::vector<std::string> get_verification_required_owners_keys() const override;
    std::vector<std::string> get_verification_required_creators_keys() const override;
    std::vector<std::string> get_verification_required_authorities_keys() const override;
    std::vector<std::string> get_verification_required_groups_keys() const override;
    std::vector<std::string> get_verification_required_assets_keys() const override;
    std::vector<std::string> get_verification_required_assets_proof_keys() const override;
    std::vector<std::string> get_verification_required_tokens_by_owner() const override;
    std::vector<std::string> get_verification_required_tokens_by_mint() const override;
    std::vector<KeyPair> get_verification_required_tokens_by_owner_and_mint() const override;
    std::vector<std::string> get_verification_required_signatures_for_asset() const override;

    // Raw keys of a category, empty if the file has none
    std::vector<std::string> read_keys(const std::string& method_name) const;

    const std::map<std::string, std::vector<std::string>>& keys_map() const { return keys_map_; }

    /**
     * Uniformly random (category, raw key) for load generation. Thread-safe.
     * @throws KeysFetchError if the file holds no keys
     */
    std::pair<std::string, std::string> get_random_command();

private:
    void load(std::istream& input);

    std::map<std::string, std::vector<std::string>> keys_map_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_{std::random_device{}()};
};

/**
 * Parse a "(owner;mint)" token.
 * @throws KeysFetchError on any other shape
 */
KeyPair parse_key_pair(const std::string& token);

} // namespace das_integrity
