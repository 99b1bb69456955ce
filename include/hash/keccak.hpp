#pragma once

#include "types/node.hpp"
#include <cstdint>
#include <vector>

namespace das_integrity {

/**
 * Keccak - node hashing of the on-chain concurrent Merkle tree
 *
 * Original Keccak-256 (pre-NIST padding), as computed by the chain's
 * keccak hashv syscall. Backed by ethash's keccak implementation.
 */
class Keccak {
public:
    // Deepest tree the chain program accepts
    static constexpr uint32_t MAX_SUPPORTED_DEPTH = 30;

    static Node hash(const uint8_t* data, size_t len);
    static Node hash(const std::vector<uint8_t>& data) { return hash(data.data(), data.size()); }

    // keccak256(left || right)
    static Node hash_pair(const Node& left, const Node& right);

    /**
     * Root of an all-empty subtree of the given height.
     * Level 0 is the zero node; level n hashes two level n-1 empty nodes.
     *
     * @throws std::out_of_range if level > MAX_SUPPORTED_DEPTH
     */
    static Node empty_node(uint32_t level);
};

} // namespace das_integrity
