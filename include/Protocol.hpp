#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include "TransferTypes.hpp"

namespace filepush {

// Wire-level constants. All integers travel big-endian.
namespace protocol {
    constexpr uint8_t ACK_BYTE = 0x01;
    constexpr size_t CAPABILITY_BYTES = 1;
    constexpr size_t SIZE_FIELD_BYTES = 8;
    constexpr size_t NAME_FIELD_BYTES = 255;
    constexpr size_t DIGEST_BYTES = 32;
    constexpr size_t CHUNK_SIZE = 16 * 1024;
    constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};
    constexpr std::chrono::seconds MAX_TIMEOUT = std::chrono::hours(24);

    static_assert(DIGEST_BYTES == sizeof(Digest), "Digest must match the wire width");
}

// Session-wide behavior flags, each a distinct bit of the capability byte
enum class Capability : uint8_t {
    SingleFile = 1,
    MultiFiles = 2,
    Timeout = 4,
    NoTimeout = 16
};

const char* toString(Capability capability);

class CapabilitySet {
public:
    CapabilitySet() : bits_(0) {}
    CapabilitySet(std::initializer_list<Capability> capabilities);

    CapabilitySet& set(Capability capability);
    CapabilitySet& clear(Capability capability);
    bool has(Capability capability) const;
    bool empty() const { return bits_ == 0; }

    uint8_t encode() const { return bits_; }

    // Only defined bits survive; anything else in the byte is dropped.
    static CapabilitySet decode(uint8_t byte);

    std::string toString() const;

    bool operator==(const CapabilitySet& other) const { return bits_ == other.bits_; }
    bool operator!=(const CapabilitySet& other) const { return bits_ != other.bits_; }

private:
    uint8_t bits_;
};

} // namespace filepush
