#include "tessera/encoding/base58.hpp"
#include "tessera/core/format.hpp"

#include <algorithm>
#include <array>

namespace tessera::protocol::encoding {

namespace {
    constexpr uint32_t kBase = 58;
    constexpr uint32_t kByteBase = 256;
    constexpr int8_t kInvalidDigit = -1;

    constexpr std::array<int8_t, 128> BuildDecodeTable() {
        std::array<int8_t, 128> table{};
        for (auto& entry : table) {
            entry = kInvalidDigit;
        }
        for (size_t i = 0; i < Base58::ALPHABET.size(); ++i) {
            table[static_cast<uint8_t>(Base58::ALPHABET[i])] = static_cast<int8_t>(i);
        }
        return table;
    }

    constexpr auto kDecodeTable = BuildDecodeTable();
}

std::string Base58::Encode(std::span<const uint8_t> data) {
    const auto leading_zeros = static_cast<size_t>(
        std::find_if(data.begin(), data.end(), [](uint8_t b) { return b != 0; }) - data.begin());

    // log(256) / log(58) ~= 1.37, so 138/100 is a safe upper bound.
    std::vector<uint8_t> digits((data.size() - leading_zeros) * 138 / 100 + 1, 0);
    size_t digits_len = 0;
    for (size_t i = leading_zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < digits_len) && it != digits.rend(); ++it, ++j) {
            carry += kByteBase * (*it);
            *it = static_cast<uint8_t>(carry % kBase);
            carry /= kBase;
        }
        digits_len = j;
    }

    auto first = std::find_if(digits.begin(), digits.end(), [](uint8_t d) { return d != 0; });
    std::string encoded(leading_zeros, ALPHABET[0]);
    encoded.reserve(leading_zeros + static_cast<size_t>(digits.end() - first));
    for (; first != digits.end(); ++first) {
        encoded.push_back(ALPHABET[*first]);
    }
    return encoded;
}

Result<std::vector<uint8_t>, ProtocolFailure> Base58::Decode(std::string_view text) {
    const auto leading_ones = static_cast<size_t>(
        std::find_if(text.begin(), text.end(), [](char c) { return c != ALPHABET[0]; }) - text.begin());

    // log(58) / log(256) ~= 0.733, so 733/1000 is a safe upper bound.
    std::vector<uint8_t> bytes((text.size() - leading_ones) * 733 / 1000 + 1, 0);
    size_t bytes_len = 0;
    for (size_t i = leading_ones; i < text.size(); ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        const int8_t digit = ch < kDecodeTable.size() ? kDecodeTable[ch] : kInvalidDigit;
        if (digit == kInvalidDigit) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("Invalid base58 character '{}' at position {}", text[i], i)));
        }
        uint32_t carry = static_cast<uint32_t>(digit);
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < bytes_len) && it != bytes.rend(); ++it, ++j) {
            carry += kBase * (*it);
            *it = static_cast<uint8_t>(carry % kByteBase);
            carry /= kByteBase;
        }
        bytes_len = j;
    }

    auto first = std::find_if(bytes.begin(), bytes.end(), [](uint8_t b) { return b != 0; });
    std::vector<uint8_t> decoded(leading_ones, 0);
    decoded.insert(decoded.end(), first, bytes.end());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(decoded));
}

}
