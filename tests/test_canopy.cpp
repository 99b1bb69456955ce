#include <gtest/gtest.h>
#include "merkle/canopy.hpp"
#include "hash/keccak.hpp"
#include "common/errors.hpp"
#include "merkle_fixture.hpp"

using namespace das_integrity;
using das_integrity::testing_support::TreeAccountBuilder;
using das_integrity::testing_support::leaf_node;

// Test canopy depth from its byte length
TEST(CanopyTest, CachedPathLength) {
    EXPECT_EQ(get_cached_path_length(0, 3), 0u);
    EXPECT_EQ(get_cached_path_length(2 * Node::LEN, 3), 1u);
    EXPECT_EQ(get_cached_path_length(6 * Node::LEN, 3), 2u);
    EXPECT_EQ(get_cached_path_length(14 * Node::LEN, 3), 3u);
    EXPECT_EQ(get_cached_path_length(((1u << 11) - 2) * Node::LEN, 14), 10u);
}

// Test invalid canopy sizes
TEST(CanopyTest, CachedPathLengthInvalid) {
    // Not whole nodes
    EXPECT_THROW(get_cached_path_length(33, 3), ProofStructureError);
    // Not a complete subtree
    EXPECT_THROW(get_cached_path_length(3 * Node::LEN, 3), ProofStructureError);
    // Larger than the tree
    EXPECT_THROW(get_cached_path_length(30 * Node::LEN, 3), ProofStructureError);
}

// Test the completed proof always has max_depth nodes and matches the full proof
TEST(CanopyTest, FillsToMaxDepth) {
    TreeAccountBuilder builder(3, 8, 2);
    for (uint8_t i = 0; i < 7; ++i) {
        builder.append(leaf_node(i));
    }
    const auto canopy = builder.canopy_bytes();
    ASSERT_EQ(canopy.size(), 6 * Node::LEN);

    for (uint32_t index = 0; index < 8; ++index) {
        auto proof = builder.served_proof(index);
        ASSERT_EQ(proof.size(), 1u);
        fill_in_proof_from_canopy(canopy, 3, index, proof);
        EXPECT_EQ(proof.size(), 3u);
        EXPECT_EQ(proof, builder.model().proof(index)) << "index " << index;
    }
}

// Test zero canopy slots stand for empty subtrees
TEST(CanopyTest, ZeroSlotsBecomeEmptyNodes) {
    TreeAccountBuilder builder(3, 8, 2);
    builder.append(leaf_node(0));
    builder.append(leaf_node(1));

    const auto canopy = builder.canopy_bytes();
    // Right half of the tree is untouched
    Node right_half = Node::from_bytes(canopy.data() + 1 * Node::LEN);
    ASSERT_TRUE(right_half.is_zero());

    auto proof = builder.served_proof(0);
    fill_in_proof_from_canopy(canopy, 3, 0, proof);
    ASSERT_EQ(proof.size(), 3u);
    EXPECT_EQ(proof[2], Keccak::empty_node(2));
    EXPECT_EQ(proof, builder.model().proof(0));
}

// Test a proof that already reaches max_depth is left alone
TEST(CanopyTest, OverlapKeepsServedNodes) {
    TreeAccountBuilder builder(3, 8, 2);
    for (uint8_t i = 0; i < 4; ++i) {
        builder.append(leaf_node(i));
    }
    auto proof = builder.model().proof(2);
    const auto expected = proof;
    fill_in_proof_from_canopy(builder.canopy_bytes(), 3, 2, proof);
    EXPECT_EQ(proof, expected);

    // One node short: only the top level comes from the canopy
    proof.pop_back();
    fill_in_proof_from_canopy(builder.canopy_bytes(), 3, 2, proof);
    EXPECT_EQ(proof, expected);
}

// Test an empty canopy adds nothing
TEST(CanopyTest, EmptyCanopy) {
    TreeAccountBuilder builder(3, 8, 0);
    builder.append(leaf_node(0));
    auto proof = builder.served_proof(0);
    ASSERT_EQ(proof.size(), 3u);
    fill_in_proof_from_canopy(builder.canopy_bytes(), 3, 0, proof);
    EXPECT_EQ(proof.size(), 3u);
}

// Test leaf index outside the tree
TEST(CanopyTest, IndexOutOfRange) {
    TreeAccountBuilder builder(3, 8, 1);
    std::vector<Node> proof;
    EXPECT_THROW(fill_in_proof_from_canopy(builder.canopy_bytes(), 3, 8, proof), ProofStructureError);
}
