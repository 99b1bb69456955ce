#include "codec/base64.hpp"
#include <array>
#include <stdexcept>

namespace das_integrity {
namespace codec {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
    static const auto table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 64; ++i) {
            t[static_cast<uint8_t>(kAlphabet[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();
    return table[static_cast<uint8_t>(c)];
}

} // namespace

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve((len + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += kAlphabet[(v >> 18) & 0x3F];
        out += kAlphabet[(v >> 12) & 0x3F];
        out += kAlphabet[(v >> 6) & 0x3F];
        out += kAlphabet[v & 0x3F];
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t v = uint32_t(data[i]) << 16;
        out += kAlphabet[(v >> 18) & 0x3F];
        out += kAlphabet[(v >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out += kAlphabet[(v >> 18) & 0x3F];
        out += kAlphabet[(v >> 12) & 0x3F];
        out += kAlphabet[(v >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("Invalid base64 length: " + std::to_string(text.size()));
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        size_t padding = 0;
        uint32_t v = 0;
        for (size_t k = 0; k < 4; ++k) {
            char c = text[i + k];
            if (c == '=') {
                // Padding is only allowed in the last two positions of the last group
                if (i + 4 != text.size() || k < 2) {
                    throw std::invalid_argument("Invalid base64 padding");
                }
                ++padding;
                v <<= 6;
                continue;
            }
            if (padding > 0) {
                throw std::invalid_argument("Invalid base64 padding");
            }
            int d = decode_char(c);
            if (d < 0) {
                throw std::invalid_argument(std::string("Invalid base64 character: ") + c);
            }
            v = (v << 6) | static_cast<uint32_t>(d);
        }

        out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        if (padding < 2) {
            out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        }
        if (padding < 1) {
            out.push_back(static_cast<uint8_t>(v & 0xFF));
        }
    }
    return out;
}

} // namespace codec
} // namespace das_integrity
