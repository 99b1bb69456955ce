#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace das_integrity {

class ApiClient;

/**
 * Commitment level of a chain read. Processed is the freshest state,
 * finalized the most settled one.
 */
enum class CommitmentLevel {
    Processed,
    Confirmed,
    Finalized,
};

std::string commitment_to_string(CommitmentLevel level);

/**
 * Reader of raw account state.
 */
class ChainStateReader {
public:
    virtual ~ChainStateReader() = default;

    /**
     * @param account Base58 account key
     * @return Raw account bytes, std::nullopt if the account does not exist
     * @throws ApiError on transport failures, ChainRpcError on an RPC error reply
     */
    virtual std::optional<std::vector<uint8_t>> get_account_data(const std::string& account,
                                                                  CommitmentLevel commitment) const = 0;
};

/**
 * SolanaChainReader - getAccountInfo over JSON-RPC, base64 encoded
 */
class SolanaChainReader : public ChainStateReader {
public:
    SolanaChainReader(std::shared_ptr<const ApiClient> api, std::string rpc_endpoint);

    std::optional<std::vector<uint8_t>> get_account_data(const std::string& account,
                                                          CommitmentLevel commitment) const override;

private:
    std::shared_ptr<const ApiClient> api_;
    std::string rpc_endpoint_;
};

} // namespace das_integrity
