// NeuroShield - Account Address Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/core/address.h"
#include "neuroshield/core/hex.h"

namespace neuroshield {

std::optional<Address> Address::Parse(const std::string& text) {
    if (text.size() != 2 + SIZE * 2) {
        return std::nullopt;
    }
    if (text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        return std::nullopt;
    }

    std::string digits = text.substr(2);
    if (!IsValidHex(digits)) {
        return std::nullopt;
    }

    std::vector<Byte> bytes = HexToBytes(digits);
    return Address(bytes.data(), bytes.size());
}

std::string Address::ToString() const {
    return "0x" + ToHex();
}

std::string Address::ToShortString() const {
    std::string hex = ToHex();
    return "0x" + hex.substr(0, 4) + ".." + hex.substr(hex.size() - 4);
}

} // namespace neuroshield
