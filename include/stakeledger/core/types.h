// STAKELEDGER - Core Types Header
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Fundamental types shared by the ledger, the token books and the store.

#ifndef STAKELEDGER_CORE_TYPES_H
#define STAKELEDGER_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace stakeledger {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in smallest units
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Largest representable token amount
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// Seconds in a day
constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

/// Seconds in an accrual year (365 days, leap days ignored)
constexpr int64_t SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;

/// Add two amounts, returning false if the sum does not fit
inline bool CheckedAdd(Amount a, Amount b, Amount& out) {
    if (a > MAX_AMOUNT - b) {
        return false;
    }
    out = a + b;
    return true;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to hex string (storage byte order)
    std::string ToHex() const;

    /// Parse from hex string, throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 160-bit identifier (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    explicit Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Participant / privileged identity
using Address = Hash160;

/// Parse an address, accepting an optional "0x" prefix.
/// Returns false on malformed input.
bool ParseAddress(const std::string& str, Address& out);

} // namespace stakeledger

#endif // STAKELEDGER_CORE_TYPES_H
