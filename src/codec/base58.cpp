#include "codec/base58.hpp"
#include <array>
#include <stdexcept>

namespace das_integrity {
namespace codec {

namespace {

constexpr char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int8_t alphabet_index(char c) {
    static const auto table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 58; ++i) {
            t[static_cast<uint8_t>(kAlphabet[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();
    return table[static_cast<uint8_t>(c)];
}

} // namespace

std::string base58_encode(const uint8_t* data, size_t len) {
    size_t zeros = 0;
    while (zeros < len && data[zeros] == 0) {
        ++zeros;
    }

    // log(256) / log(58) ~ 1.37, rounded up
    std::vector<uint8_t> b58((len - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < len; ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = b58.begin() + static_cast<std::ptrdiff_t>(b58.size() - length);
    while (it != b58.end() && *it == 0) {
        ++it;
    }

    std::string out(zeros, '1');
    for (; it != b58.end(); ++it) {
        out += kAlphabet[*it];
    }
    return out;
}

std::vector<uint8_t> base58_decode(const std::string& text) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') {
        ++zeros;
    }

    // log(58) / log(256) ~ 0.733, rounded up
    std::vector<uint8_t> b256((text.size() - zeros) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < text.size(); ++i) {
        int8_t digit = alphabet_index(text[i]);
        if (digit < 0) {
            throw std::invalid_argument("Invalid base58 character in: " + text);
        }
        int carry = digit;
        size_t j = 0;
        for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = b256.begin() + static_cast<std::ptrdiff_t>(b256.size() - length);
    while (it != b256.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> out(zeros, 0);
    out.insert(out.end(), it, b256.end());
    return out;
}

} // namespace codec
} // namespace das_integrity
