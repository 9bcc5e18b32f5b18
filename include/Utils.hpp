#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include "Protocol.hpp"

namespace filepush {

struct Endpoint {
    std::string host;
    uint16_t port;
};

class Utils {
public:
    using SizeField = std::array<uint8_t, protocol::SIZE_FIELD_BYTES>;
    using NameField = std::array<uint8_t, protocol::NAME_FIELD_BYTES>;

    // Big-endian size field
    static SizeField encodeSize(uint64_t size);
    static uint64_t decodeSize(const SizeField& field);

    // Fixed-width name field. padName throws NameTooLong for names over
    // NAME_FIELD_BYTES and InvalidParameter for empty names or embedded NULs.
    static NameField padName(std::string_view name);
    static std::string stripName(const NameField& field);

    static bool isValidUtf8(std::string_view text);

    // True for a single path component that is not "." or ".."
    static bool isPlainFileName(std::string_view name);

    // Parses "host:port" or, when allowBarePort is set, a lone "port"
    // (host defaults to 0.0.0.0).
    static Endpoint parseEndpoint(std::string_view text, bool allowBarePort = false);
    static uint16_t validatePort(std::string_view portText);

    // Positive whole seconds, at most protocol::MAX_TIMEOUT
    static std::chrono::seconds parseTimeout(std::string_view secondsText);

private:
    Utils() = delete;
};

} // namespace filepush
