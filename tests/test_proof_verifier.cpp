#include <gtest/gtest.h>
#include "checker/proof_verifier.hpp"
#include "common/errors.hpp"
#include "fakes.hpp"
#include "merkle_fixture.hpp"

#include <atomic>
#include <chrono>
#include <memory>

using namespace das_integrity;
using namespace das_integrity::testing_support;
using nlohmann::json;

class ProofVerifierTest : public ::testing::Test {
protected:
    static constexpr const char* kReference = "http://reference.test";

    void SetUp() override {
        for (uint8_t i = 0; i < 5; ++i) {
            builder_.append(leaf_node(i));
        }
        tree_id_ = leaf_node(150).to_base58();
        chain_->set_account(tree_id_, builder_.account_bytes());
        serve_leaf_id(2);
    }

    void serve_leaf_id(json leaf_id) {
        api_->on(kReference, [leaf_id](const json& request) {
            EXPECT_EQ(request["method"], "getAsset");
            return json{{"jsonrpc", "2.0"}, {"id", 0},
                        {"result", {{"id", request["params"]["id"]}, {"compression", {{"leaf_id", leaf_id}}}}}};
        });
    }

    json proof_response(uint32_t index, const Node& leaf) const {
        json proof = json::array();
        for (const auto& node : builder_.served_proof(index)) {
            proof.push_back(node.to_base58());
        }
        return json{{"jsonrpc", "2.0"}, {"id", 0},
                    {"result", {{"tree_id", tree_id_}, {"leaf", leaf.to_base58()}, {"proof", proof},
                                {"root", builder_.model().root().to_base58()}, {"node_index", 10}}}};
    }

    ProofVerifier verifier() const { return ProofVerifier(api_, chain_, kReference); }

    TreeAccountBuilder builder_{3, 8, 1};
    std::string tree_id_;
    std::shared_ptr<FakeApiClient> api_ = std::make_shared<FakeApiClient>();
    std::shared_ptr<FakeChainReader> chain_ = std::make_shared<FakeChainReader>();
};

// Test a served proof completed from the canopy is valid
TEST_F(ProofVerifierTest, ValidProof) {
    EXPECT_TRUE(verifier().validate("asset", proof_response(2, leaf_node(2))));
    EXPECT_EQ(api_->call_count(kReference), 1u);
    ASSERT_TRUE(chain_->last_commitment().has_value());
    EXPECT_EQ(*chain_->last_commitment(), CommitmentLevel::Processed);
}

// Test the reference getAsset and the chain read are in flight at the same time
TEST_F(ProofVerifierTest, ReadsOverlap) {
    auto rendezvous = std::make_shared<Rendezvous>(2);
    auto overlapped = std::make_shared<std::atomic<int>>(0);
    api_->on(kReference, [rendezvous, overlapped](const json& request) {
        if (rendezvous->arrive_and_wait(std::chrono::seconds(5))) {
            ++*overlapped;
        }
        return json{{"result", {{"id", request["params"]["id"]}, {"compression", {{"leaf_id", 2}}}}}};
    });
    chain_->on_read([rendezvous, overlapped]() {
        if (rendezvous->arrive_and_wait(std::chrono::seconds(5))) {
            ++*overlapped;
        }
    });

    EXPECT_TRUE(verifier().validate("asset", proof_response(2, leaf_node(2))));
    EXPECT_EQ(overlapped->load(), 2);
}

// Test a wrong leaf is reported invalid, not as an error
TEST_F(ProofVerifierTest, WrongLeaf) {
    EXPECT_FALSE(verifier().validate("asset", proof_response(2, leaf_node(3))));
}

// Test a leaf index disagreeing with the proof is invalid
TEST_F(ProofVerifierTest, WrongLeafIndex) {
    serve_leaf_id(3);
    EXPECT_FALSE(verifier().validate("asset", proof_response(2, leaf_node(2))));
}

// Test malformed proof entries are dropped
TEST_F(ProofVerifierTest, MalformedProofEntryDropped) {
    json response = proof_response(2, leaf_node(2));
    response["result"]["proof"].push_back("not-base58-0OIl");
    response["result"]["proof"].push_back(12);
    EXPECT_TRUE(verifier().validate("asset", response));

    auto extracted = AssetProof::from_response(response);
    EXPECT_EQ(extracted.proof.size(), 2u);
}

// Test missing response fields name the field
TEST_F(ProofVerifierTest, MissingFields) {
    for (const char* field : {"tree_id", "leaf", "proof"}) {
        json response = proof_response(2, leaf_node(2));
        response["result"].erase(field);
        try {
            verifier().validate("asset", response);
            FAIL() << "expected ProofExtractionError for " << field;
        } catch (const ProofExtractionError& e) {
            EXPECT_EQ(e.field(), field);
        }
    }

    EXPECT_THROW(verifier().validate("asset", json{{"error", "boom"}}), ProofExtractionError);
}

// Test the reference host's getAsset must carry compression.leaf_id
TEST_F(ProofVerifierTest, MissingLeafId) {
    api_->on(kReference, [](const json&) { return json{{"result", {{"compression", json::object()}}}}; });
    try {
        verifier().validate("asset", proof_response(2, leaf_node(2)));
        FAIL() << "expected ProofExtractionError";
    } catch (const ProofExtractionError& e) {
        EXPECT_EQ(e.field(), "leaf_id");
    }
}

// Test a missing tree account is a structural error
TEST_F(ProofVerifierTest, NullAccount) {
    json response = proof_response(2, leaf_node(2));
    response["result"]["tree_id"] = leaf_node(151).to_base58();
    EXPECT_THROW(verifier().validate("asset", response), ProofStructureError);
}

// Test chain RPC errors propagate
TEST_F(ProofVerifierTest, ChainRpcFailure) {
    chain_->fail_with("node is behind");
    EXPECT_THROW(verifier().validate("asset", proof_response(2, leaf_node(2))), ChainRpcError);
}

// Test reference host failures propagate
TEST_F(ProofVerifierTest, ReferenceUnreachable) {
    auto api = std::make_shared<FakeApiClient>();
    ProofVerifier verifier(api, chain_, kReference);
    EXPECT_THROW(verifier.validate("asset", proof_response(2, leaf_node(2))), ApiTransportError);
}

// Test a corrupted account is a structural error
TEST_F(ProofVerifierTest, CorruptAccount) {
    auto bytes = builder_.account_bytes();
    bytes[0] = 0;
    chain_->set_account(tree_id_, bytes);
    EXPECT_THROW(verifier().validate("asset", proof_response(2, leaf_node(2))), ProofStructureError);
}

// Test leaf indices beyond the tree
TEST_F(ProofVerifierTest, LeafIndexOutOfRange) {
    serve_leaf_id(8);
    EXPECT_THROW(verifier().validate("asset", proof_response(2, leaf_node(2))), ProofStructureError);

    serve_leaf_id(-1);
    EXPECT_THROW(verifier().validate("asset", proof_response(2, leaf_node(2))), ProofStructureError);
}
