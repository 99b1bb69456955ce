#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace das_integrity {
namespace codec {

// Standard alphabet with '=' padding (RFC 4648), the chain RPC's account encoding
std::string base64_encode(const uint8_t* data, size_t len);

// @throws std::invalid_argument on bad characters or a length that is not a multiple of 4
std::vector<uint8_t> base64_decode(const std::string& text);

} // namespace codec
} // namespace das_integrity
