#pragma once

#include <string>
#include <utility>
#include <vector>

namespace das_integrity {

using KeyPair = std::pair<std::string, std::string>;

/**
 * Source of the identifiers to test, one accessor per method category.
 *
 * Every accessor throws KeysFetchError when its keys cannot be supplied;
 * only the calling category is affected.
 */
class KeysFetcher {
public:
    virtual ~KeysFetcher() = default;

    virtual std::vector<std::string> get_verification_required_owners_keys() const = 0;
    virtual std::vector<std::string> get_verification_required_creators_keys() const = 0;
    virtual std::vector<std::string> get_verification_required_authorities_keys() const = 0;
    virtual std::vector<std::string> get_verification_required_groups_keys() const = 0;
    virtual std::vector<std::string> get_verification_required_assets_keys() const = 0;
    virtual std::vector<std::string> get_verification_required_assets_proof_keys() const = 0;
    virtual std::vector<std::string> get_verification_required_tokens_by_owner() const = 0;
    virtual std::vector<std::string> get_verification_required_tokens_by_mint() const = 0;
    // (owner, mint)
    virtual std::vector<KeyPair> get_verification_required_tokens_by_owner_and_mint() const = 0;
    virtual std::vector<std::string> get_verification_required_signatures_for_asset() const = 0;
};

} // namespace das_integrity
