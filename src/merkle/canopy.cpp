#include "merkle/canopy.hpp"
#include "hash/keccak.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"

#include <algorithm>

namespace das_integrity {

namespace {

uint32_t floor_log2(uint64_t v) {
    uint32_t n = 0;
    while (v >>= 1) {
        ++n;
    }
    return n;
}

} // namespace

uint32_t get_cached_path_length(size_t canopy_byte_len, uint32_t max_depth) {
    if (canopy_byte_len % Node::LEN != 0) {
        throw ProofStructureError("CanopyLengthMismatch: canopy byte length " + std::to_string(canopy_byte_len) +
                                  " is not a multiple of " + std::to_string(Node::LEN));
    }

    // The canopy is a full binary tree without its root: 2^n - 2 nodes
    const uint64_t closest_power_of_2 = canopy_byte_len / Node::LEN + 2;
    if ((closest_power_of_2 & (closest_power_of_2 - 1)) != 0) {
        throw ProofStructureError("CanopyLengthMismatch: canopy of " + std::to_string(canopy_byte_len / Node::LEN) +
                                  " nodes is not a complete subtree");
    }
    if (closest_power_of_2 > (uint64_t(1) << (max_depth + 1))) {
        throw ProofStructureError("CanopyLengthMismatch: canopy of " + std::to_string(canopy_byte_len / Node::LEN) +
                                  " nodes exceeds a tree of depth " + std::to_string(max_depth));
    }
    return floor_log2(closest_power_of_2) - 1;
}

void fill_in_proof_from_canopy(const std::vector<uint8_t>& canopy_bytes, uint32_t max_depth,
                               uint32_t index, std::vector<Node>& proof) {
    const uint32_t path_len = get_cached_path_length(canopy_bytes.size(), max_depth);
    if (static_cast<uint64_t>(index) >= (uint64_t(1) << max_depth)) {
        throw ProofStructureError("Leaf index " + std::to_string(index) +
                                  " out of range for depth " + std::to_string(max_depth));
    }

    // Node index (1 = root) where the leaf's path meets the bottom of the canopy
    uint64_t node_idx = ((uint64_t(1) << max_depth) + index) >> (max_depth - path_len);

    std::vector<Node> inferred_nodes;
    inferred_nodes.reserve(path_len);
    while (node_idx > 1) {
        // node_idx - 2 is the canopy slot of this node; its sibling is the neighbour
        const uint64_t shifted_index = node_idx - 2;
        const uint64_t cached_idx = (shifted_index % 2 == 0) ? shifted_index + 1 : shifted_index - 1;

        Node cached = Node::from_bytes(canopy_bytes.data() + cached_idx * Node::LEN);
        if (cached.is_zero()) {
            const uint32_t level = max_depth - floor_log2(node_idx);
            inferred_nodes.push_back(Keccak::empty_node(level));
        } else {
            inferred_nodes.push_back(cached);
        }
        node_idx >>= 1;
    }

    const size_t total = proof.size() + inferred_nodes.size();
    const size_t overlap = total > max_depth ? total - max_depth : 0;
    DAS_DEBUG_COUT("proof", "Canopy depth " << path_len << " adds " << (inferred_nodes.size() - std::min(overlap, inferred_nodes.size()))
                            << " nodes to a proof of " << proof.size());

    for (size_t i = overlap; i < inferred_nodes.size(); ++i) {
        proof.push_back(inferred_nodes[i]);
    }
}

} // namespace das_integrity
