// NeuroShield - Account Address
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// 20-byte account address as used by the governed token ledger.
// Text form is "0x" followed by 40 hex digits.

#ifndef NEUROSHIELD_CORE_ADDRESS_H
#define NEUROSHIELD_CORE_ADDRESS_H

#include "neuroshield/core/types.h"

#include <functional>
#include <optional>
#include <string>

namespace neuroshield {

/**
 * Account address.
 *
 * The null (all-zero) address is representable so that it can be parsed
 * and reported, but it is never accepted as a proposal target or caller.
 */
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    Address(const BaseHash<160>& h) : BaseHash<160>(h) {}

    /// Parse "0x" + 40 hex digits (either case). Returns nullopt otherwise.
    static std::optional<Address> Parse(const std::string& text);

    /// Lower-case "0x..." form
    std::string ToString() const;

    /// Abbreviated form for log lines ("0x1234..abcd")
    std::string ToShortString() const;
};

/// Hasher for unordered containers keyed by Address
struct AddressHasher {
    size_t operator()(const Address& addr) const noexcept {
        return BaseHashHasher{}(addr);
    }
};

template<typename Stream>
void Serialize(Stream& s, const Address& addr) {
    s.Write(addr.data(), Address::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Address& addr) {
    s.Read(addr.data(), Address::SIZE);
}

} // namespace neuroshield

#endif // NEUROSHIELD_CORE_ADDRESS_H
