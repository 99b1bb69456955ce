#include "types/node.hpp"
#include "codec/base58.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace das_integrity {

Node Node::from_bytes(const uint8_t* data) {
    Node node;
    std::memcpy(node.bytes_.data(), data, LEN);
    return node;
}

bool Node::is_zero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

std::string Node::to_hex() const {
    std::ostringstream oss;
    for (uint8_t b : bytes_) {
        oss << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(b);
    }
    return oss.str();
}

Node Node::from_hex(const std::string& hex) {
    if (hex.length() != LEN * 2) {
        throw std::invalid_argument("Invalid hex string length for Node");
    }

    Node node;
    for (size_t i = 0; i < LEN; ++i) {
        std::string byte_str = hex.substr(i * 2, 2);
        size_t consumed = 0;
        unsigned long value = std::stoul(byte_str, &consumed, 16);
        if (consumed != 2) {
            throw std::invalid_argument("Invalid hex digit in Node: " + byte_str);
        }
        node.bytes_[i] = static_cast<uint8_t>(value);
    }
    return node;
}

std::string Node::to_base58() const {
    return codec::base58_encode(bytes_.data(), bytes_.size());
}

Node Node::from_base58(const std::string& text) {
    std::vector<uint8_t> decoded = codec::base58_decode(text);
    if (decoded.size() != LEN) {
        throw std::invalid_argument("Invalid base58 length for Node: " + text);
    }
    return from_bytes(decoded.data());
}

std::ostream& operator<<(std::ostream& os, const Node& node) {
    return os << node.to_base58();
}

} // namespace das_integrity
