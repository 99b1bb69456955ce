#include "hash/keccak.hpp"
#include <array>
#include <cstring>
#include <stdexcept>

#include <ethash/keccak.hpp>

namespace das_integrity {

Node Keccak::hash(const uint8_t* data, size_t len) {
    const ethash::hash256 h = ethash::keccak256(data, len);
    return Node::from_bytes(h.bytes);
}

Node Keccak::hash_pair(const Node& left, const Node& right) {
    std::array<uint8_t, 2 * Node::LEN> buf;
    std::memcpy(buf.data(), left.data(), Node::LEN);
    std::memcpy(buf.data() + Node::LEN, right.data(), Node::LEN);
    return hash(buf.data(), buf.size());
}

Node Keccak::empty_node(uint32_t level) {
    // Computed once, read-only afterwards
    static const std::array<Node, MAX_SUPPORTED_DEPTH + 1> cache = [] {
        std::array<Node, MAX_SUPPORTED_DEPTH + 1> nodes;
        nodes[0] = Node::zero();
        for (size_t i = 1; i < nodes.size(); ++i) {
            nodes[i] = hash_pair(nodes[i - 1], nodes[i - 1]);
        }
        return nodes;
    }();

    if (level > MAX_SUPPORTED_DEPTH) {
        throw std::out_of_range("Empty node level out of range: " + std::to_string(level));
    }
    return cache[level];
}

} // namespace das_integrity
