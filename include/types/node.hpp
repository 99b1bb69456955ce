#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace das_integrity {

/**
 * Node - 32-byte tree node (Keccak-256 output)
 *
 * Leaves, proof siblings, change log paths and roots of an on-chain
 * concurrent Merkle tree are all Nodes. Account identifiers share the
 * same 32-byte shape and the same base58 text form.
 */
class Node {
public:
    static constexpr size_t LEN = 32;

    // Constructors
    Node() : bytes_{} {}

    explicit Node(const std::array<uint8_t, LEN>& bytes) : bytes_(bytes) {}

    // Factory methods
    static Node zero() { return Node(); }
    static Node from_bytes(const uint8_t* data);

    // Accessors
    const std::array<uint8_t, LEN>& bytes() const { return bytes_; }
    const uint8_t* data() const { return bytes_.data(); }
    uint8_t operator[](size_t i) const { return bytes_[i]; }
    uint8_t& operator[](size_t i) { return bytes_[i]; }

    bool is_zero() const;

    // Comparison
    bool operator==(const Node& rhs) const { return bytes_ == rhs.bytes_; }
    bool operator!=(const Node& rhs) const { return !(*this == rhs); }

    // Text representations
    std::string to_hex() const;
    static Node from_hex(const std::string& hex);
    std::string to_base58() const;

    /**
     * Parse a base58 identifier.
     * @throws std::invalid_argument if the text is not base58 or does not decode to 32 bytes
     */
    static Node from_base58(const std::string& text);

    friend std::ostream& operator<<(std::ostream& os, const Node& node);

private:
    std::array<uint8_t, LEN> bytes_;
};

} // namespace das_integrity
