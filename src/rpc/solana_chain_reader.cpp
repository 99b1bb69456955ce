#include "rpc/chain_state_reader.hpp"
#include "rpc/api_client.hpp"
#include "rpc/request_body.hpp"
#include "codec/base64.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"

#include <stdexcept>
#include <utility>

namespace das_integrity {

namespace {

constexpr const char* GET_ACCOUNT_INFO_METHOD = "getAccountInfo";
constexpr const char* ACCOUNT_ENCODING = "base64";

} // namespace

std::string commitment_to_string(CommitmentLevel level) {
    switch (level) {
        case CommitmentLevel::Processed: return "processed";
        case CommitmentLevel::Confirmed: return "confirmed";
        case CommitmentLevel::Finalized: return "finalized";
    }
    return "finalized";
}

SolanaChainReader::SolanaChainReader(std::shared_ptr<const ApiClient> api, std::string rpc_endpoint)
    : api_(std::move(api)), rpc_endpoint_(std::move(rpc_endpoint)) {}

std::optional<std::vector<uint8_t>> SolanaChainReader::get_account_data(const std::string& account,
                                                                         CommitmentLevel commitment) const {
    nlohmann::json config;
    config["encoding"] = ACCOUNT_ENCODING;
    config["commitment"] = commitment_to_string(commitment);

    RequestBody body(GET_ACCOUNT_INFO_METHOD, nlohmann::json::array({account, config}), 1);
    nlohmann::json reply = api_->make_request(rpc_endpoint_, body.to_string());

    if (reply.contains("error")) {
        throw ChainRpcError(reply["error"].dump());
    }

    const nlohmann::json* value = nullptr;
    if (reply.contains("result") && reply["result"].is_object() && reply["result"].contains("value")) {
        value = &reply["result"]["value"];
    }
    if (value == nullptr) {
        throw ChainRpcError("getAccountInfo reply has no result.value: " + reply.dump());
    }
    if (value->is_null()) {
        return std::nullopt;
    }

    // "data": ["<base64>", "base64"]
    if (!value->is_object() || !value->contains("data")) {
        throw ChainRpcError("getAccountInfo reply has no data for " + account);
    }
    const auto& data = value->at("data");
    if (!data.is_array() || data.empty() || !data[0].is_string()) {
        throw ChainRpcError("getAccountInfo reply has no base64 data for " + account);
    }

    try {
        std::vector<uint8_t> bytes = codec::base64_decode(data[0].get<std::string>());
        DAS_DEBUG_COUT("chain", "Account " << account << ": " << bytes.size() << " bytes at "
                                << commitment_to_string(commitment));
        return bytes;
    } catch (const std::invalid_argument& e) {
        throw ChainRpcError("Account " + account + " data is not base64: " + e.what());
    }
}

} // namespace das_integrity
