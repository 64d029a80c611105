// PRICEGATE - Core Types Header
// Copyright (c) 2024 PRICEGATE Developers
// MIT License
//
// This file defines fundamental types used throughout PRICEGATE.

#ifndef PRICEGATE_CORE_TYPES_H
#define PRICEGATE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <limits>
#include <string>
#include <cstring>

namespace pricegate {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Chain slot number
using Slot = uint64_t;

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// Add a non-negative offset to a timestamp, clamping at the int64 maximum.
/// Offsets larger than INT64_MAX are treated as INT64_MAX.
inline int64_t SaturatingAdd(int64_t base, uint64_t offset) noexcept {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    if (offset > static_cast<uint64_t>(kMax)) {
        offset = static_cast<uint64_t>(kMax);
    }
    int64_t delta = static_cast<int64_t>(offset);
    if (base > 0 && delta > kMax - base) {
        return kMax;
    }
    return base + delta;
}

// ============================================================================
// Fixed-Size Byte Strings
// ============================================================================

/// Fixed-width opaque byte string. Bytes are kept and rendered in storage
/// order; there is no display reversal.
template<size_t N>
class FixedBytes {
public:
    static constexpr size_t SIZE = N;

    /// Default constructor - all zeros
    FixedBytes() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit FixedBytes(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    FixedBytes(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    const std::array<Byte, SIZE>& bytes() const noexcept { return data_; }

    bool operator==(const FixedBytes& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const FixedBytes& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic in storage order
    bool operator<(const FixedBytes& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex in storage order
    std::string ToHex() const;

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit opaque value (32 bytes)
using Bytes32 = FixedBytes<32>;

// ============================================================================
// Typed Identifiers
// ============================================================================

/// Identifier of one logical price feed (e.g. SOL/USD)
class FeedId : public Bytes32 {
public:
    using Bytes32::Bytes32;
    FeedId() = default;
    explicit FeedId(const Bytes32& b) : Bytes32(b) {}

    /// "0x" followed by lowercase hex
    std::string ToHexPrefixed() const { return "0x" + ToHex(); }
};

/// Account identity (32-byte public key)
class Pubkey : public Bytes32 {
public:
    using Bytes32::Bytes32;
    Pubkey() = default;
    explicit Pubkey(const Bytes32& b) : Bytes32(b) {}
};

} // namespace pricegate

#endif // PRICEGATE_CORE_TYPES_H
