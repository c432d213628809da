// STELLEND - Core Types Header
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// This file defines fundamental types used throughout STELLEND.

#ifndef STELLEND_CORE_TYPES_H
#define STELLEND_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace stellend {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Ledger timestamp (Unix epoch seconds)
using Timestamp = uint64_t;

/// Signed amount used for vote weights, prices and loan amounts
using Amount = int64_t;

/// Intermediate width for products of amounts
__extension__ typedef __int128 WideAmount;

/// Proposal identifier, assigned by a monotonic counter starting at 1
using ProposalId = uint64_t;

/// Basis points denominator (10000 bps = 100%)
constexpr int64_t BPS_DENOMINATOR = 10000;

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// Add two amounts, returning false on signed overflow
inline bool CheckedAdd(Amount a, Amount b, Amount* out) {
    return !__builtin_add_overflow(a, b, out);
}

/// Multiply two amounts, returning false on signed overflow
inline bool CheckedMul(Amount a, Amount b, Amount* out) {
    return !__builtin_mul_overflow(a, b, out);
}

/// Add seconds to a timestamp, returning false on overflow
inline bool CheckedAddTime(Timestamp t, uint64_t secs, Timestamp* out) {
    return !__builtin_add_overflow(t, secs, out);
}

/// a - b, clamped at zero
inline uint64_t SaturatingSub(uint64_t a, uint64_t b) {
    return a > b ? a - b : 0;
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

    /// Construct from raw bytes (zero-padded when shorter than SIZE)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    bool IsNull() const noexcept {
        return std::all_of(data_.begin(), data_.end(), [](Byte b) { return b == 0; });
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
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

    /// Convert to lowercase hex string (storage byte order)
    std::string ToHex() const;

    /// Parse from hex string; throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
};

// ============================================================================
// Address
// ============================================================================

/**
 * 32-byte account or contract identity.
 *
 * Identifies proposers, voters, delegates, assets, price sources and
 * the protocol admin.
 */
class Address : public Hash256 {
public:
    Address() = default;
    explicit Address(const Hash256& h) : Hash256(h) {}
    explicit Address(const std::array<Byte, SIZE>& data) : Hash256(data) {}
    Address(const Byte* data, size_t len) : Hash256(data, len) {}

    static Address FromHex(const std::string& hex) {
        return Address(Hash256(BaseHash<256>::FromHex(hex)));
    }

    /// Short form for log output
    std::string ToShortString() const { return ToHex().substr(0, 12); }
};

} // namespace stellend

#endif // STELLEND_CORE_TYPES_H
