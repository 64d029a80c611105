// PRICEGATE - Core Types Implementation
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include "pricegate/core/types.h"
#include "pricegate/core/hex.h"

namespace pricegate {

// ============================================================================
// FixedBytes Implementation
// ============================================================================

template<size_t N>
std::string FixedBytes<N>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

// Explicit template instantiations
template class FixedBytes<32>;

} // namespace pricegate
