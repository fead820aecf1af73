// NeuroShield - Core Types Header
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// This file defines fundamental types used throughout NeuroShield.

#ifndef NEUROSHIELD_CORE_TYPES_H
#define NEUROSHIELD_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace neuroshield {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Governance token amount in indivisible units
using TokenAmount = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Proposal identifier (monotonically increasing from 0)
using ProposalId = uint64_t;

/// Upper bound for a single stake or balance
constexpr TokenAmount MAX_TOKENS = 1000000000000000000ULL;

/// Check if amount is in valid range
inline bool TokenRange(TokenAmount value) {
    return value <= MAX_TOKENS;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-width byte string
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

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if hash is all zeros
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

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic byte order
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lower-case hex string in storage byte order
    std::string ToHex() const;

    /// Create from hex string (throws std::invalid_argument)
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}
};

/// Hasher for using BaseHash types as unordered_map keys
struct BaseHashHasher {
    template<size_t BITS>
    size_t operator()(const BaseHash<BITS>& h) const noexcept {
        size_t result = 0;
        std::memcpy(&result, h.data(), std::min(sizeof(result), BaseHash<BITS>::SIZE));
        return result;
    }
};

} // namespace neuroshield

#endif // NEUROSHIELD_CORE_TYPES_H
