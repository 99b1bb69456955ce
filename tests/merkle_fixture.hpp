#pragma once

#include "hash/keccak.hpp"
#include "merkle/concurrent_merkle_tree.hpp"
#include "types/node.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace das_integrity {
namespace testing_support {

inline Node leaf_node(uint8_t seed) {
    std::array<uint8_t, Node::LEN> bytes{};
    for (size_t i = 0; i < Node::LEN; ++i) {
        bytes[i] = static_cast<uint8_t>(seed * 31 + i + 1);
    }
    return Node(bytes);
}

/**
 * Plain full binary tree used as ground truth
 */
class TreeModel {
public:
    explicit TreeModel(uint32_t depth) : depth_(depth), leaves_(size_t(1) << depth, Node::zero()) {}

    uint32_t depth() const { return depth_; }

    void set_leaf(uint32_t index, const Node& leaf) { leaves_[index] = leaf; }
    const Node& leaf(uint32_t index) const { return leaves_[index]; }

    // level 0 is the leaves
    Node node_at(uint32_t level, uint64_t position) const {
        if (level == 0) {
            return leaves_[position];
        }
        return Keccak::hash_pair(node_at(level - 1, 2 * position), node_at(level - 1, 2 * position + 1));
    }

    Node root() const { return node_at(depth_, 0); }

    std::vector<Node> proof(uint32_t index) const {
        std::vector<Node> out;
        for (uint32_t level = 0; level < depth_; ++level) {
            out.push_back(node_at(level, (uint64_t(index) >> level) ^ 1));
        }
        return out;
    }

    // Nodes on the path from the leaf up, path[0] is the leaf
    std::vector<Node> path(uint32_t index) const {
        std::vector<Node> out;
        for (uint32_t level = 0; level < depth_; ++level) {
            out.push_back(node_at(level, uint64_t(index) >> level));
        }
        return out;
    }

private:
    uint32_t depth_;
    std::vector<Node> leaves_;
};

/**
 * Tree account as the chain program lays it out, driven through appends and
 * replacements so the change log ring is realistic.
 */
class TreeAccountBuilder {
public:
    TreeAccountBuilder(uint32_t depth, uint32_t buffer_size, uint32_t canopy_depth)
        : model_(depth), max_buffer_size_(buffer_size), canopy_depth_(canopy_depth),
          change_logs_(buffer_size) {
        for (auto& log : change_logs_) {
            log.path.assign(depth, Node::zero());
        }
        change_logs_[0].root = Keccak::empty_node(depth);
        for (uint32_t level = 0; level < depth; ++level) {
            change_logs_[0].path[level] = Keccak::empty_node(level);
        }
        rightmost_.proof = model_.proof(0);
        buffer_size_ = 1;
    }

    const TreeModel& model() const { return model_; }
    uint32_t appended() const { return rightmost_.index; }

    void append(const Node& leaf) {
        const uint32_t index = rightmost_.index;
        apply(index, leaf);
        rightmost_.proof = model_.proof(index);
        rightmost_.leaf = leaf;
        rightmost_.index = index + 1;
    }

    void replace(uint32_t index, const Node& leaf) {
        apply(index, leaf);
        if (index + 1 == rightmost_.index) {
            rightmost_.leaf = leaf;
        }
        rightmost_.proof = model_.proof(rightmost_.index == 0 ? 0 : rightmost_.index - 1);
    }

    // Proof as an indexer serves it: the levels covered by the canopy are left out
    std::vector<Node> served_proof(uint32_t index) const {
        std::vector<Node> proof = model_.proof(index);
        proof.resize(model_.depth() - canopy_depth_);
        return proof;
    }

    std::vector<uint8_t> canopy_bytes() const {
        std::vector<uint8_t> out;
        const uint64_t count = (uint64_t(1) << (canopy_depth_ + 1)) - 2;
        for (uint64_t slot = 0; slot < count; ++slot) {
            const uint64_t heap_index = slot + 2;
            uint32_t height = 0;
            while ((heap_index >> (height + 1)) != 0) {
                ++height;
            }
            const uint32_t level = model_.depth() - height;
            const uint64_t position = heap_index - (uint64_t(1) << height);
            Node node = model_.node_at(level, position);
            // Untouched subtrees stay zero on chain
            if (node == Keccak::empty_node(level)) {
                node = Node::zero();
            }
            append_node(out, node);
        }
        return out;
    }

    std::vector<uint8_t> header_bytes(uint8_t account_type = 1, uint8_t version = 0) const {
        std::vector<uint8_t> out;
        out.push_back(account_type);
        out.push_back(version);
        append_u32(out, max_buffer_size_);
        append_u32(out, model_.depth());
        append_node(out, leaf_node(200));
        append_u64(out, 123456);
        out.insert(out.end(), 6, 0);
        return out;
    }

    std::vector<uint8_t> tree_bytes() const {
        std::vector<uint8_t> out;
        append_u64(out, sequence_number_);
        append_u64(out, active_index_);
        append_u64(out, buffer_size_);
        for (const auto& log : change_logs_) {
            append_node(out, log.root);
            for (const auto& node : log.path) {
                append_node(out, node);
            }
            append_u32(out, log.index);
            append_u32(out, 0);
        }
        for (const auto& node : rightmost_.proof) {
            append_node(out, node);
        }
        append_node(out, rightmost_.leaf);
        append_u32(out, rightmost_.index);
        append_u32(out, 0);
        return out;
    }

    std::vector<uint8_t> account_bytes() const {
        std::vector<uint8_t> out = header_bytes();
        std::vector<uint8_t> tree = tree_bytes();
        std::vector<uint8_t> canopy = canopy_bytes();
        out.insert(out.end(), tree.begin(), tree.end());
        out.insert(out.end(), canopy.begin(), canopy.end());
        return out;
    }

    static void append_u32(std::vector<uint8_t>& out, uint32_t v) {
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    static void append_u64(std::vector<uint8_t>& out, uint64_t v) {
        for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    static void append_node(std::vector<uint8_t>& out, const Node& node) {
        out.insert(out.end(), node.bytes().begin(), node.bytes().end());
    }

private:
    void apply(uint32_t index, const Node& leaf) {
        model_.set_leaf(index, leaf);
        active_index_ = (active_index_ + 1) % max_buffer_size_;
        buffer_size_ = std::min<uint64_t>(buffer_size_ + 1, max_buffer_size_);
        sequence_number_++;

        ChangeLog& log = change_logs_[active_index_];
        log.root = model_.root();
        log.path = model_.path(index);
        log.index = index;
    }

    TreeModel model_;
    uint32_t max_buffer_size_;
    uint32_t canopy_depth_;
    uint64_t sequence_number_ = 0;
    uint64_t active_index_ = 0;
    uint64_t buffer_size_ = 0;
    std::vector<ChangeLog> change_logs_;
    RightmostPath rightmost_;
};

} // namespace testing_support
} // namespace das_integrity
