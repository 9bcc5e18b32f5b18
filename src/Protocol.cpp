#include "Protocol.hpp"

namespace filepush {

namespace {
    constexpr Capability DEFINED_CAPABILITIES[] = {
        Capability::SingleFile,
        Capability::MultiFiles,
        Capability::Timeout,
        Capability::NoTimeout
    };

    constexpr uint8_t bit(Capability capability) {
        return static_cast<uint8_t>(capability);
    }
}

const char* toString(Capability capability) {
    switch (capability) {
        case Capability::SingleFile: return "SINGLE_FILE";
        case Capability::MultiFiles: return "MULTI_FILES";
        case Capability::Timeout:    return "TIMEOUT";
        case Capability::NoTimeout:  return "NO_TIMEOUT";
        default:                     return "UNKNOWN";
    }
}

CapabilitySet::CapabilitySet(std::initializer_list<Capability> capabilities) : bits_(0) {
    for (Capability capability : capabilities) {
        set(capability);
    }
}

CapabilitySet& CapabilitySet::set(Capability capability) {
    bits_ |= bit(capability);
    return *this;
}

CapabilitySet& CapabilitySet::clear(Capability capability) {
    bits_ &= static_cast<uint8_t>(~bit(capability));
    return *this;
}

bool CapabilitySet::has(Capability capability) const {
    return (bits_ & bit(capability)) != 0;
}

CapabilitySet CapabilitySet::decode(uint8_t byte) {
    CapabilitySet result;
    if (byte & bit(Capability::SingleFile)) result.set(Capability::SingleFile);
    if (byte & bit(Capability::MultiFiles)) result.set(Capability::MultiFiles);
    if (byte & bit(Capability::Timeout))    result.set(Capability::Timeout);
    if (byte & bit(Capability::NoTimeout))  result.set(Capability::NoTimeout);
    return result;
}

std::string CapabilitySet::toString() const {
    std::string out;
    for (Capability capability : DEFINED_CAPABILITIES) {
        if (!has(capability)) continue;
        if (!out.empty()) out += "|";
        out += filepush::toString(capability);
    }
    return out.empty() ? "NONE" : out;
}

} // namespace filepush
