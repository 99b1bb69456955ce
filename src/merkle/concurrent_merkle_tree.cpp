#include "merkle/concurrent_merkle_tree.hpp"
#include "merkle/canopy.hpp"
#include "hash/keccak.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace das_integrity {

namespace {

constexpr size_t kHeaderV1Tag = 0;

// Sizes of the fixed parts of the active-tree region
constexpr size_t kTreeScalarsSize = 3 * sizeof(uint64_t);
constexpr size_t kIndexAndPaddingSize = 2 * sizeof(uint32_t);

constexpr std::array<std::pair<uint32_t, uint32_t>, 34> kSupportedShapes = {{
    {3, 8}, {5, 8}, {6, 16}, {7, 16}, {8, 16}, {9, 16},
    {10, 32}, {11, 32}, {12, 32}, {13, 32},
    {14, 64}, {14, 256}, {14, 1024}, {14, 2048},
    {15, 64}, {16, 64}, {17, 64}, {18, 64}, {19, 64},
    {20, 64}, {20, 256}, {20, 1024}, {20, 2048},
    {24, 64}, {24, 256}, {24, 512}, {24, 1024}, {24, 2048},
    {26, 512}, {26, 1024}, {26, 2048},
    {30, 512}, {30, 1024}, {30, 2048},
}};

// Little-endian cursor over account bytes
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    uint8_t read_u8() {
        require(1);
        return data_[pos_++];
    }

    uint32_t read_u32_le() {
        require(4);
        uint32_t v = 0;
        for (size_t i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += 4;
        return v;
    }

    uint64_t read_u64_le() {
        require(8);
        uint64_t v = 0;
        for (size_t i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += 8;
        return v;
    }

    Node read_node() {
        require(Node::LEN);
        Node node = Node::from_bytes(data_ + pos_);
        pos_ += Node::LEN;
        return node;
    }

    std::vector<Node> read_nodes(size_t count) {
        std::vector<Node> nodes;
        nodes.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            nodes.push_back(read_node());
        }
        return nodes;
    }

    void skip(size_t n) {
        require(n);
        pos_ += n;
    }

    size_t position() const { return pos_; }

private:
    void require(size_t n) const {
        if (len_ - pos_ < n) {
            throw ProofStructureError("Account data too short: need " + std::to_string(n) +
                                      " bytes at offset " + std::to_string(pos_) +
                                      ", have " + std::to_string(len_ - pos_));
        }
    }

    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

uint32_t leading_zeros(uint32_t v) {
    uint32_t n = 0;
    for (uint32_t bit = 1u << 31; bit != 0 && (v & bit) == 0; bit >>= 1) {
        ++n;
    }
    return n;
}

} // namespace

// ============================================================================
// Header
// ============================================================================

ConcurrentMerkleTreeHeader ConcurrentMerkleTreeHeader::parse(const uint8_t* data, size_t len) {
    if (len < CONCURRENT_MERKLE_TREE_HEADER_SIZE_V1) {
        throw ProofStructureError("Account data too short for tree header: " + std::to_string(len) + " bytes");
    }

    ByteReader reader(data, CONCURRENT_MERKLE_TREE_HEADER_SIZE_V1);
    ConcurrentMerkleTreeHeader header;

    uint8_t account_type = reader.read_u8();
    if (account_type != static_cast<uint8_t>(CompressionAccountType::ConcurrentMerkleTree)) {
        throw ProofStructureError("Account is not a concurrent Merkle tree, type " + std::to_string(account_type));
    }
    header.account_type = CompressionAccountType::ConcurrentMerkleTree;

    header.version = reader.read_u8();
    if (header.version != kHeaderV1Tag) {
        throw ProofStructureError("Unsupported tree header version " + std::to_string(header.version));
    }

    header.max_buffer_size = reader.read_u32_le();
    header.max_depth = reader.read_u32_le();
    header.authority = reader.read_node();
    header.creation_slot = reader.read_u64_le();
    reader.skip(6);

    return header;
}

bool is_supported_tree_shape(uint32_t max_depth, uint32_t max_buffer_size) {
    return std::find(kSupportedShapes.begin(), kSupportedShapes.end(),
                     std::make_pair(max_depth, max_buffer_size)) != kSupportedShapes.end();
}

size_t merkle_tree_get_size(const ConcurrentMerkleTreeHeader& header) {
    if (!is_supported_tree_shape(header.max_depth, header.max_buffer_size)) {
        throw ProofStructureError("CannotCreateMerkleTree: depth [" + std::to_string(header.max_depth) +
                                  "], size [" + std::to_string(header.max_buffer_size) + "]");
    }
    const size_t depth = header.max_depth;
    const size_t change_log_size = Node::LEN + depth * Node::LEN + kIndexAndPaddingSize;
    const size_t rightmost_path_size = depth * Node::LEN + Node::LEN + kIndexAndPaddingSize;
    return kTreeScalarsSize + header.max_buffer_size * change_log_size + rightmost_path_size;
}

// ============================================================================
// Change log
// ============================================================================

void ChangeLog::update_proof_or_leaf(uint32_t leaf_index, std::vector<Node>& proof, Node& leaf) const {
    if (leaf_index == index) {
        leaf = path[0];
        return;
    }
    const uint32_t depth = static_cast<uint32_t>(proof.size());
    const uint32_t padding = 32 - depth;
    const uint32_t common_path_len = leading_zeros((leaf_index ^ index) << padding);
    const uint32_t critbit_index = (depth - 1) - common_path_len;
    proof[critbit_index] = path[critbit_index];
}

// ============================================================================
// Active tree
// ============================================================================

ConcurrentMerkleTree ConcurrentMerkleTree::load_bytes(const ConcurrentMerkleTreeHeader& header,
                                                      const uint8_t* data, size_t len) {
    const size_t expected = merkle_tree_get_size(header);
    if (len != expected) {
        throw ProofStructureError("Tree region size mismatch: expected " + std::to_string(expected) +
                                  ", got " + std::to_string(len));
    }

    ConcurrentMerkleTree tree;
    tree.max_depth_ = header.max_depth;
    tree.max_buffer_size_ = header.max_buffer_size;

    ByteReader reader(data, len);
    tree.sequence_number_ = reader.read_u64_le();
    tree.active_index_ = reader.read_u64_le();
    tree.buffer_size_ = reader.read_u64_le();

    if (tree.active_index_ >= tree.max_buffer_size_) {
        throw ProofStructureError("Active index " + std::to_string(tree.active_index_) +
                                  " out of range for buffer of " + std::to_string(tree.max_buffer_size_));
    }
    if (tree.buffer_size_ > tree.max_buffer_size_) {
        throw ProofStructureError("Buffer size " + std::to_string(tree.buffer_size_) +
                                  " exceeds max buffer size " + std::to_string(tree.max_buffer_size_));
    }

    const uint64_t num_leaves = uint64_t(1) << tree.max_depth_;
    tree.change_logs_.reserve(tree.max_buffer_size_);
    for (uint32_t i = 0; i < tree.max_buffer_size_; ++i) {
        ChangeLog change_log;
        change_log.root = reader.read_node();
        change_log.path = reader.read_nodes(tree.max_depth_);
        change_log.index = reader.read_u32_le();
        reader.skip(4);
        if (change_log.index >= num_leaves) {
            throw ProofStructureError("Change log " + std::to_string(i) + " has leaf index " +
                                      std::to_string(change_log.index) + " outside the tree");
        }
        tree.change_logs_.push_back(std::move(change_log));
    }

    tree.rightmost_proof_.proof = reader.read_nodes(tree.max_depth_);
    tree.rightmost_proof_.leaf = reader.read_node();
    tree.rightmost_proof_.index = reader.read_u32_le();
    reader.skip(4);

    return tree;
}

const Node& ConcurrentMerkleTree::get_root() const {
    return change_logs_[active_index_].root;
}

Node ConcurrentMerkleTree::recompute(const Node& leaf, const std::vector<Node>& proof, uint32_t index) {
    Node current = leaf;
    for (size_t level = 0; level < proof.size(); ++level) {
        if (((index >> level) & 1) == 0) {
            current = Keccak::hash_pair(current, proof[level]);
        } else {
            current = Keccak::hash_pair(proof[level], current);
        }
    }
    return current;
}

std::optional<uint64_t> ConcurrentMerkleTree::find_root_in_changelog(const Node& root) const {
    const uint64_t mask = max_buffer_size_ - 1;
    for (uint64_t i = 0; i < buffer_size_; ++i) {
        uint64_t j = (active_index_ - i) & mask;
        if (change_logs_[j].root == root) {
            return j;
        }
    }
    return std::nullopt;
}

bool ConcurrentMerkleTree::fast_forward_proof(Node& leaf, std::vector<Node>& proof, uint32_t leaf_index,
                                              uint64_t changelog_index) const {
    const uint64_t mask = max_buffer_size_ - 1;
    const Node original_leaf = leaf;

    while (changelog_index != active_index_) {
        changelog_index = (changelog_index + 1) & mask;
        change_logs_[changelog_index].update_proof_or_leaf(leaf_index, proof, leaf);
    }
    return leaf == original_leaf;
}

bool ConcurrentMerkleTree::prove_leaf(const Node& leaf, std::vector<Node> proof, uint32_t leaf_index) const {
    if (proof.size() != max_depth_) {
        throw ProofStructureError("Proof length " + std::to_string(proof.size()) +
                                  " does not match tree depth " + std::to_string(max_depth_));
    }
    if (static_cast<uint64_t>(leaf_index) >= (uint64_t(1) << max_depth_)) {
        throw ProofStructureError("Leaf index " + std::to_string(leaf_index) +
                                  " out of range for depth " + std::to_string(max_depth_));
    }
    if (buffer_size_ == 0) {
        throw ProofStructureError("Merkle tree is not initialized");
    }
    if (leaf_index > rightmost_proof_.index) {
        DAS_DEBUG_COUT("proof", "Leaf index " << leaf_index << " is beyond the rightmost index "
                                << rightmost_proof_.index);
        return false;
    }

    const Node observed_root = recompute(leaf, proof, leaf_index);
    auto changelog_index = find_root_in_changelog(observed_root);
    if (!changelog_index) {
        DAS_DEBUG_COUT("proof", "Root " << observed_root << " not found in change log");
        return false;
    }

    Node updated_leaf = leaf;
    if (!fast_forward_proof(updated_leaf, proof, leaf_index, *changelog_index)) {
        DAS_DEBUG_COUT("proof", "Leaf " << leaf_index << " was modified after root " << observed_root);
        return false;
    }

    return recompute(updated_leaf, proof, leaf_index) == get_root();
}

// ============================================================================
// Account
// ============================================================================

TreeAccount TreeAccount::parse(const std::vector<uint8_t>& account_data) {
    ConcurrentMerkleTreeHeader header =
        ConcurrentMerkleTreeHeader::parse(account_data.data(), account_data.size());

    const size_t tree_size = merkle_tree_get_size(header);
    const size_t rest = account_data.size() - CONCURRENT_MERKLE_TREE_HEADER_SIZE_V1;
    if (rest < tree_size) {
        throw ProofStructureError("Account data too short for tree of depth " + std::to_string(header.max_depth) +
                                  " and buffer " + std::to_string(header.max_buffer_size) +
                                  ": have " + std::to_string(rest) + ", need " + std::to_string(tree_size));
    }

    const uint8_t* tree_begin = account_data.data() + CONCURRENT_MERKLE_TREE_HEADER_SIZE_V1;
    ConcurrentMerkleTree tree = ConcurrentMerkleTree::load_bytes(header, tree_begin, tree_size);

    std::vector<uint8_t> canopy_bytes(tree_begin + tree_size, account_data.data() + account_data.size());
    // Rejects canopies that are not a whole subtree
    get_cached_path_length(canopy_bytes.size(), header.max_depth);

    return TreeAccount(header, std::move(tree), std::move(canopy_bytes));
}

} // namespace das_integrity
