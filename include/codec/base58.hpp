#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace das_integrity {
namespace codec {

/**
 * Base58 with the Bitcoin alphabet, as used for Solana account keys.
 * Leading zero bytes map to leading '1' characters.
 */
std::string base58_encode(const uint8_t* data, size_t len);

// @throws std::invalid_argument on a character outside the alphabet
std::vector<uint8_t> base58_decode(const std::string& text);

} // namespace codec
} // namespace das_integrity
