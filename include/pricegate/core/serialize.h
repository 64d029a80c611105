// PRICEGATE - Serialization Header
// Copyright (c) 2024 PRICEGATE Developers
// MIT License
//
// Fixed-width little-endian serialization, matching the Borsh layout of
// on-chain account data. Integers are written byte by byte, so the result
// does not depend on host byte order.

#ifndef PRICEGATE_CORE_SERIALIZE_H
#define PRICEGATE_CORE_SERIALIZE_H

#include "pricegate/core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <type_traits>
#include <vector>

namespace pricegate {

// ============================================================================
// DataStream - Append-only writer / forward-only reader over a byte buffer
// ============================================================================

class DataStream {
public:
    DataStream() = default;

    DataStream(const Byte* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }

    /// Buffer size including bytes already read
    size_t TotalSize() const noexcept { return data_.size(); }

    /// Bytes consumed so far
    size_t ReadPosition() const noexcept { return readPos_; }

    void reserve(size_t n) { data_.reserve(n); }

    const std::vector<Byte>& Data() const noexcept { return data_; }

    void Write(const Byte* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void WriteZeros(size_t n) {
        data_.insert(data_.end(), n, 0);
    }

    /// Throws std::ios_base::failure if fewer than len bytes remain
    void Read(Byte* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<Byte> data_;
    size_t readPos_{0};
};

/// Counts bytes instead of storing them
class SizeComputer {
public:
    void Write(const Byte*, size_t len) { size_ += len; }
    size_t size() const noexcept { return size_; }

private:
    size_t size_{0};
};

// ============================================================================
// Little-Endian Integers
// ============================================================================

template<typename Stream, typename T>
void WriteLE(Stream& s, T value) {
    static_assert(std::is_integral<T>::value, "integral type required");
    using U = typename std::make_unsigned<T>::type;
    U bits = static_cast<U>(value);
    Byte buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = static_cast<Byte>(bits >> (8 * i));
    }
    s.Write(buf, sizeof(T));
}

template<typename T, typename Stream>
T ReadLE(Stream& s) {
    static_assert(std::is_integral<T>::value, "integral type required");
    using U = typename std::make_unsigned<T>::type;
    Byte buf[sizeof(T)];
    s.Read(buf, sizeof(T));
    U bits = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        bits |= static_cast<U>(static_cast<U>(buf[i]) << (8 * i));
    }
    return static_cast<T>(bits);
}

template<typename Stream> void Serialize(Stream& s, uint8_t v) { WriteLE(s, v); }
template<typename Stream> void Serialize(Stream& s, int32_t v) { WriteLE(s, v); }
template<typename Stream> void Serialize(Stream& s, uint32_t v) { WriteLE(s, v); }
template<typename Stream> void Serialize(Stream& s, int64_t v) { WriteLE(s, v); }
template<typename Stream> void Serialize(Stream& s, uint64_t v) { WriteLE(s, v); }

template<typename Stream> void Unserialize(Stream& s, uint8_t& v) { v = ReadLE<uint8_t>(s); }
template<typename Stream> void Unserialize(Stream& s, int32_t& v) { v = ReadLE<int32_t>(s); }
template<typename Stream> void Unserialize(Stream& s, uint32_t& v) { v = ReadLE<uint32_t>(s); }
template<typename Stream> void Unserialize(Stream& s, int64_t& v) { v = ReadLE<int64_t>(s); }
template<typename Stream> void Unserialize(Stream& s, uint64_t& v) { v = ReadLE<uint64_t>(s); }

// ============================================================================
// Fixed-Size Byte Strings (written verbatim, no length prefix)
// ============================================================================

template<typename Stream, size_t N>
void Serialize(Stream& s, const std::array<Byte, N>& arr) {
    s.Write(arr.data(), N);
}

template<typename Stream, size_t N>
void Unserialize(Stream& s, std::array<Byte, N>& arr) {
    s.Read(arr.data(), N);
}

// Also picks up FeedId and Pubkey through derived-to-base deduction
template<typename Stream, size_t N>
void Serialize(Stream& s, const FixedBytes<N>& bytes) {
    s.Write(bytes.data(), N);
}

template<typename Stream, size_t N>
void Unserialize(Stream& s, FixedBytes<N>& bytes) {
    s.Read(bytes.data(), N);
}

template<typename T>
size_t GetSerializeSize(const T& obj) {
    SizeComputer sc;
    Serialize(sc, obj);
    return sc.size();
}

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace pricegate

#endif // PRICEGATE_CORE_SERIALIZE_H
