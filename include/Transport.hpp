#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "NetworkStack.hpp"
#include "Protocol.hpp"

namespace filepush {

/**
 * Byte-exact framing over a connected stream socket.
 *
 * Every operation either completes the full field or throws TransferError;
 * nothing here retries. recvAck is the one exception: a missing or wrong ACK
 * byte is reported as false and left to the caller.
 */
class Transport {
public:
    // Streams exactly `length` bytes from source, hashing each chunk.
    static Digest sendExact(Connection& connection, std::istream& source, uint64_t length);

    // Receives exactly `size` bytes into sink, hashing each chunk.
    static Digest recvExact(Connection& connection, std::ostream& sink, uint64_t size);

    // Fixed-size fields without hashing
    static void sendBuffer(Connection& connection, const uint8_t* data, size_t length);
    static void recvBuffer(Connection& connection, uint8_t* data, size_t length);

    static void sendAck(Connection& connection);
    static bool recvAck(Connection& connection);

    static void sendDigest(Connection& connection, const Digest& digest);
    static Digest recvDigest(Connection& connection);

    static void sendCapabilities(Connection& connection, CapabilitySet capabilities);
    static CapabilitySet recvCapabilities(Connection& connection);

    static void sendSize(Connection& connection, uint64_t size);
    // std::nullopt marks end of batch: the peer half-closed, sent a short
    // field, or sent an explicit zero.
    static std::optional<uint64_t> recvSize(Connection& connection);

    static void sendName(Connection& connection, std::string_view name);
    static std::string recvName(Connection& connection);

private:
    // Reads until `length` bytes or end of stream; returns the count read.
    static size_t recvUpTo(Connection& connection, uint8_t* data, size_t length);

    Transport() = delete;
};

} // namespace filepush
