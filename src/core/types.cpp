// STAKELEDGER - Core Types Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/core/types.h"
#include "stakeledger/core/hex.h"

#include <vector>

namespace stakeledger {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    std::vector<Byte> bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

template class BaseHash<160>;

// ============================================================================
// Address Parsing
// ============================================================================

bool ParseAddress(const std::string& str, Address& out) {
    std::string hex = StripHexPrefix(str);
    if (hex.length() != Address::SIZE * 2 || !IsValidHex(hex)) {
        return false;
    }
    out = Address::FromHex(hex);
    return true;
}

} // namespace stakeledger
