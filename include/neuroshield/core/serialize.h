// NeuroShield - Serialization Header
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Little-endian binary serialization used for ledger journal entries
// and encoded governance commands.

#ifndef NEUROSHIELD_CORE_SERIALIZE_H
#define NEUROSHIELD_CORE_SERIALIZE_H

#include "neuroshield/core/types.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <ios>
#include <type_traits>

namespace neuroshield {

// ============================================================================
// Constants
// ============================================================================

/// Largest length prefix accepted when decoding (4 MB)
static constexpr uint64_t MAX_SIZE = 0x00400000;

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using size_type = std::size_t;

    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len) {}

    /// Returns unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    void clear() {
        data_.clear();
        read_pos_ = 0;
    }

    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    /// Whole underlying buffer, including bytes already read
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    /// Throws std::ios_base::failure if fewer than len bytes remain
    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    /// Unread bytes as lowercase hex
    std::string ToHex() const;

    /// Replace the contents with decoded hex
    void FromHex(const std::string& hex);

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

/// Write an unsigned integer least significant byte first
template<typename Stream, typename UInt>
void WriteLE(Stream& s, UInt value) {
    static_assert(std::is_unsigned<UInt>::value, "WriteLE takes unsigned types");
    uint8_t bytes[sizeof(UInt)];
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(bytes, sizeof(UInt));
}

template<typename UInt, typename Stream>
UInt ReadLE(Stream& s) {
    static_assert(std::is_unsigned<UInt>::value, "ReadLE takes unsigned types");
    uint8_t bytes[sizeof(UInt)];
    s.Read(bytes, sizeof(UInt));
    UInt value = 0;
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        value |= static_cast<UInt>(bytes[i]) << (8 * i);
    }
    return value;
}

// ============================================================================
// CompactSize Length Prefix
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 0xFD + 2 bytes
//   size <= 0xFFFFFFFF -- 0xFE + 4 bytes
//   otherwise          -- 0xFF + 8 bytes

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        WriteLE(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE(s, uint8_t{0xFD});
        WriteLE(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        WriteLE(s, uint8_t{0xFE});
        WriteLE(s, static_cast<uint32_t>(size));
    } else {
        WriteLE(s, uint8_t{0xFF});
        WriteLE(s, size);
    }
}

/// Rejects non-minimal encodings, and sizes above MAX_SIZE when range_check
template<typename Stream>
uint64_t ReadCompactSize(Stream& s, bool range_check = true) {
    const uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t size = marker;
    uint64_t minimum = 0;

    if (marker == 0xFD) {
        size = ReadLE<uint16_t>(s);
        minimum = 253;
    } else if (marker == 0xFE) {
        size = ReadLE<uint32_t>(s);
        minimum = 0x10000;
    } else if (marker == 0xFF) {
        size = ReadLE<uint64_t>(s);
        minimum = 0x100000000ULL;
    }

    if (size < minimum) {
        throw std::ios_base::failure("non-canonical ReadCompactSize()");
    }
    if (range_check && size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Field Types
// ============================================================================
// Command tags, the journal version, ids, token amounts, timestamps, flags,
// text, command bytes and hashes. Signed values travel as their
// two's-complement bit pattern.

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { WriteLE(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<uint8_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { WriteLE(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ReadLE<uint32_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { WriteLE(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<uint64_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { WriteLE(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ReadLE<uint64_t>(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { WriteLE(s, static_cast<uint8_t>(a ? 1 : 0)); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = ReadLE<uint8_t>(s) != 0; }

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    s.Write(str.data(), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    if (size > s.size()) {
        throw std::ios_base::failure("Unserialize(): string longer than stream");
    }
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) {
    WriteCompactSize(s, v.size());
    s.Write(v.data(), v.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) {
    uint64_t size = ReadCompactSize(s);
    if (size > s.size()) {
        throw std::ios_base::failure("Unserialize(): byte vector longer than stream");
    }
    v.resize(size);
    if (size > 0) {
        s.Read(v.data(), size);
    }
}

/// Hashes are written raw, without a length prefix
template<typename Stream>
void Serialize(Stream& s, const Hash256& hash) {
    s.Write(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash256& hash) {
    s.Read(hash.data(), Hash256::SIZE);
}

// ============================================================================
// DataStream Stream Operators
// ============================================================================

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

} // namespace neuroshield

#endif // NEUROSHIELD_CORE_SERIALIZE_H
