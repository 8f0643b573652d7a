#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace autosplit_sdk {

// Address - A location in the attached process's address space
// Wraps the raw integer so it cannot be mixed up with sizes, counts or
// values read from memory. Holding an Address says nothing about whether
// the location is mapped; only a successful read does.
class Address {
public:
    constexpr Address() = default;
    constexpr explicit Address(uint64_t value) : m_value(value) {}

    constexpr uint64_t value() const { return m_value; }
    constexpr bool is_null() const { return m_value == 0; }

    // Byte offset from this address (module base + offset)
    constexpr Address operator+(uint64_t offset) const { return Address(m_value + offset); }
    Address& operator+=(uint64_t offset) {
        m_value += offset;
        return *this;
    }

    constexpr bool operator==(Address other) const { return m_value == other.m_value; }
    constexpr bool operator!=(Address other) const { return m_value != other.m_value; }
    constexpr bool operator<(Address other) const { return m_value < other.m_value; }
    constexpr bool operator<=(Address other) const { return m_value <= other.m_value; }
    constexpr bool operator>(Address other) const { return m_value > other.m_value; }
    constexpr bool operator>=(Address other) const { return m_value >= other.m_value; }

private:
    uint64_t m_value = 0;
};

// "0x00000000000000d1"
std::string to_string(Address address);

std::ostream& operator<<(std::ostream& os, Address address);

} // namespace autosplit_sdk

namespace std {
template <>
struct hash<autosplit_sdk::Address> {
    size_t operator()(autosplit_sdk::Address address) const noexcept {
        return hash<uint64_t>()(address.value());
    }
};
} // namespace std
