// NeuroShield - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#ifndef NEUROSHIELD_CORE_HEX_H
#define NEUROSHIELD_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace neuroshield {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lower-case hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes (throws std::invalid_argument)
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

/// Strip a leading "0x" / "0X" if present
std::string StripHexPrefix(const std::string& str);

} // namespace neuroshield

#endif // NEUROSHIELD_CORE_HEX_H
