// PRICEGATE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#ifndef PRICEGATE_CORE_HEX_H
#define PRICEGATE_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace pricegate {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes (case-insensitive).
/// Throws std::invalid_argument on odd length or a non-hex character.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Decode exactly out.size() * 2 hex characters starting at hex[offset]
/// into out. Returns false, leaving out unspecified, if any character in
/// the range is not a hex digit or the range runs past the input.
template<size_t N>
bool DecodeHexInto(const std::string& hex, size_t offset, std::array<HexByte, N>& out);

/// Strip a leading "0x" / "0X" if present
std::string StripHexPrefix(const std::string& str);

// ============================================================================
// Template Implementation
// ============================================================================

namespace detail {
int HexCharToNibble(char c);
}

template<size_t N>
bool DecodeHexInto(const std::string& hex, size_t offset, std::array<HexByte, N>& out) {
    if (offset > hex.length() || hex.length() - offset < N * 2) {
        return false;
    }
    for (size_t i = 0; i < N; ++i) {
        int high = detail::HexCharToNibble(hex[offset + 2 * i]);
        int low = detail::HexCharToNibble(hex[offset + 2 * i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        out[i] = static_cast<HexByte>((high << 4) | low);
    }
    return true;
}

} // namespace pricegate

#endif // PRICEGATE_CORE_HEX_H
