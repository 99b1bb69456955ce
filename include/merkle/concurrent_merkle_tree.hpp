#pragma once

#include "types/node.hpp"
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace das_integrity {

/**
 * On-chain concurrent Merkle tree account
 *
 * Account layout (all integers little-endian):
 *
 *   [56 bytes: header]
 *     [1 byte:  account type, 1 = concurrent Merkle tree]
 *     [1 byte:  header version, 0 = V1]
 *     [4 bytes: max_buffer_size]
 *     [4 bytes: max_depth]
 *     [32 bytes: authority]
 *     [8 bytes: creation_slot]
 *     [6 bytes: padding]
 *   [active tree: merkle_tree_get_size(header) bytes]
 *     [8 bytes: sequence_number] [8 bytes: active_index] [8 bytes: buffer_size]
 *     max_buffer_size x change log:
 *       [32 bytes: root] [max_depth x 32 bytes: path] [4 bytes: index] [4 bytes: padding]
 *     rightmost proof:
 *       [max_depth x 32 bytes: proof] [32 bytes: leaf] [4 bytes: index] [4 bytes: padding]
 *   [canopy: remaining bytes, 32-byte nodes]
 */

constexpr size_t CONCURRENT_MERKLE_TREE_HEADER_SIZE_V1 = 56;

enum class CompressionAccountType : uint8_t {
    Uninitialized = 0,
    ConcurrentMerkleTree = 1,
};

struct ConcurrentMerkleTreeHeader {
    CompressionAccountType account_type = CompressionAccountType::Uninitialized;
    uint8_t version = 0;
    uint32_t max_buffer_size = 0;
    uint32_t max_depth = 0;
    Node authority;
    uint64_t creation_slot = 0;

    /**
     * Parse the fixed-size header at the start of a tree account.
     * @throws ProofStructureError on a short buffer, wrong account type or unknown version
     */
    static ConcurrentMerkleTreeHeader parse(const uint8_t* data, size_t len);
};

// (max_depth, max_buffer_size) pairs the chain program can allocate
bool is_supported_tree_shape(uint32_t max_depth, uint32_t max_buffer_size);

/**
 * Byte size of the active-tree region for the header's shape.
 * @throws ProofStructureError if the shape is not supported
 */
size_t merkle_tree_get_size(const ConcurrentMerkleTreeHeader& header);

/**
 * One entry of the change log ring: the root after an update, the new nodes
 * along the updated leaf's path (path[0] is the leaf itself) and its index.
 */
struct ChangeLog {
    Node root;
    std::vector<Node> path;
    uint32_t index = 0;

    /**
     * Bring a proof for leaf_index up to date with this change.
     * A change to another leaf replaces the proof node at the level where both
     * paths diverge; a change to this leaf replaces the leaf.
     */
    void update_proof_or_leaf(uint32_t leaf_index, std::vector<Node>& proof, Node& leaf) const;
};

struct RightmostPath {
    std::vector<Node> proof;
    Node leaf;
    uint32_t index = 0;
};

/**
 * ConcurrentMerkleTree - parsed view of the active-tree region
 */
class ConcurrentMerkleTree {
public:
    /**
     * Parse the active-tree region.
     *
     * @param header Header parsed from the same account
     * @param data Start of the active-tree region
     * @param len Must equal merkle_tree_get_size(header)
     * @throws ProofStructureError on size mismatch or inconsistent ring indices
     */
    static ConcurrentMerkleTree load_bytes(const ConcurrentMerkleTreeHeader& header,
                                           const uint8_t* data, size_t len);

    uint32_t max_depth() const { return max_depth_; }
    uint32_t max_buffer_size() const { return max_buffer_size_; }
    uint64_t sequence_number() const { return sequence_number_; }
    uint64_t active_index() const { return active_index_; }
    uint64_t buffer_size() const { return buffer_size_; }
    const std::vector<ChangeLog>& change_logs() const { return change_logs_; }
    const RightmostPath& rightmost_proof() const { return rightmost_proof_; }

    // Current root: the root of the change log at active_index
    const Node& get_root() const;

    // Hash the leaf up the proof path; bit i of index selects the side at level i
    static Node recompute(const Node& leaf, const std::vector<Node>& proof, uint32_t index);

    // Search the change log ring newest to oldest for a root
    std::optional<uint64_t> find_root_in_changelog(const Node& root) const;

    /**
     * Replay every change log newer than changelog_index onto the proof.
     * @return false if one of them modified the leaf itself
     */
    bool fast_forward_proof(Node& leaf, std::vector<Node>& proof, uint32_t leaf_index,
                            uint64_t changelog_index) const;

    /**
     * Check that leaf is in the current tree at leaf_index.
     *
     * The proof may have been taken against any root still held in the change log;
     * it is fast-forwarded to the current root before the final comparison.
     *
     * @param proof Full proof, exactly max_depth nodes
     * @throws ProofStructureError on a wrong proof length or leaf_index >= 2^max_depth
     */
    bool prove_leaf(const Node& leaf, std::vector<Node> proof, uint32_t leaf_index) const;

private:
    ConcurrentMerkleTree() = default;

    uint32_t max_depth_ = 0;
    uint32_t max_buffer_size_ = 0;
    uint64_t sequence_number_ = 0;
    uint64_t active_index_ = 0;
    uint64_t buffer_size_ = 0;
    std::vector<ChangeLog> change_logs_;
    RightmostPath rightmost_proof_;
};

/**
 * TreeAccount - account bytes split into header, active tree and canopy
 */
class TreeAccount {
public:
    /**
     * @throws ProofStructureError if the regions do not fit the data
     */
    static TreeAccount parse(const std::vector<uint8_t>& account_data);

    const ConcurrentMerkleTreeHeader& header() const { return header_; }
    const ConcurrentMerkleTree& tree() const { return tree_; }
    const std::vector<uint8_t>& canopy_bytes() const { return canopy_bytes_; }

private:
    TreeAccount(ConcurrentMerkleTreeHeader header, ConcurrentMerkleTree tree,
                std::vector<uint8_t> canopy_bytes)
        : header_(header), tree_(std::move(tree)), canopy_bytes_(std::move(canopy_bytes)) {}

    ConcurrentMerkleTreeHeader header_;
    ConcurrentMerkleTree tree_;
    std::vector<uint8_t> canopy_bytes_;
};

} // namespace das_integrity
