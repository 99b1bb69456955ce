#include "keys/file_keys_fetcher.hpp"
#include "rpc/methods.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace das_integrity {

FileKeysFetcher::FileKeysFetcher(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw KeysFetchError("Failed to open key file " + file_path + ": " + std::strerror(errno));
    }
    load(file);
}

FileKeysFetcher::FileKeysFetcher(std::istream& input) {
    load(input);
}

void FileKeysFetcher::load(std::istream& input) {
    std::string line;
    std::string current_key;
    bool has_key = false;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!line.empty() && line.back() == ':') {
            current_key = line.substr(0, line.size() - 1);
            has_key = true;
            continue;
        }
        if (!has_key || line.empty()) {
            continue;
        }

        std::istringstream tokens(line);
        std::string token;
        while (std::getline(tokens, token, ',')) {
            if (token.empty()) {
                continue;
            }
            keys_map_[current_key].push_back(token);
        }
    }

    if (input.bad()) {
        throw KeysFetchError("Failed to read key file");
    }

    for (const auto& [method, keys] : keys_map_) {
        DAS_DEBUG_COUT("keys", method << ": " << keys.size() << " keys");
    }
}

std::vector<std::string> FileKeysFetcher::read_keys(const std::string& method_name) const {
    auto it = keys_map_.find(method_name);
    if (it == keys_map_.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::string> FileKeysFetcher::get_verification_required_owners_keys() const {
    return read_keys(GET_ASSET_BY_OWNER_METHOD);
}

std::vector<std::string> FileKeysFetcher::get_verification_required_creators_keys() const {
    return read_keys(GET_ASSET_BY_CREATOR_METHOD);
}

std::vector<std::string> FileKeysFetcher::get_verification_required_authorities_keys() const {
    return read_keys(GET_ASSET_BY_AUTHORITY_METHOD);
}

std::vector<std::string> FileKeysFetcher::get_verification_required_groups_keys() const {
    return read_keys(GET_ASSET_BY_GROUP_METHOD);
}

std::vector<std::string> FileKeysFetcher::get_verification_required_assets_keys() const {
    return read_keys(GET_ASSET_METHOD);
}

std::vector<std::string> FileKeysFetcher::get_verification_required_assets_proof_keys() const {
    return read_keys(GET_ASSET_PROOF_METHOD);
}

std::vector<std::string> FileKeysFetcher::get_verification_required_tokens_by_owner() const {
    return read_keys(GET_TOKEN_ACCOUNTS_BY_OWNER);
}

std::vector<std::string> FileKeysFetcher::get_verification_required_tokens_by_mint() const {
    return read_keys(GET_TOKEN_ACCOUNTS_BY_MINT);
}

std::vector<KeyPair> FileKeysFetcher::get_verification_required_tokens_by_owner_and_mint() const {
    std::vector<KeyPair> pairs;
    for (const auto& token : read_keys(GET_TOKEN_ACCOUNTS_BY_OWNER_AND_MINT)) {
        pairs.push_back(parse_key_pair(token));
    }
    return pairs;
}

std::vector<std::string> FileKeysFetcher::get_verification_required_signatures_for_asset() const {
    return read_keys(GET_SIGNATURES_FOR_ASSET);
}

std::pair<std::string, std::string> FileKeysFetcher::get_random_command() {
    std::vector<const std::string*> commands;
    for (const auto& [method, keys] : keys_map_) {
        if (!keys.empty()) {
            commands.push_back(&method);
        }
    }
    if (commands.empty()) {
        throw KeysFetchError("Key file holds no keys");
    }

    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<size_t> command_dist(0, commands.size() - 1);
    const std::string& command = *commands[command_dist(rng_)];
    const auto& args = keys_map_.at(command);
    std::uniform_int_distribution<size_t> arg_dist(0, args.size() - 1);
    return {command, args[arg_dist(rng_)]};
}

KeyPair parse_key_pair(const std::string& token) {
    if (token.size() < 5 || token.front() != '(' || token.back() != ')') {
        throw KeysFetchError("Malformed key pair: " + token);
    }
    std::string inner = token.substr(1, token.size() - 2);
    size_t sep = inner.find(';');
    if (sep == std::string::npos || sep == 0 || sep + 1 == inner.size() ||
        inner.find(';', sep + 1) != std::string::npos) {
        throw KeysFetchError("Malformed key pair: " + token);
    }
    return {inner.substr(0, sep), inner.substr(sep + 1)};
}

} // namespace das_integrity
