#include "Transport.hpp"
#include "Crypto.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <vector>

namespace filepush {

Digest Transport::sendExact(Connection& connection, std::istream& source, uint64_t length) {
    std::vector<uint8_t> buffer(protocol::CHUNK_SIZE);
    Sha256 hasher;
    uint64_t remaining = length;

    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        source.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(source.gcount());
        if (got == 0) {
            throw TransferError(ErrorCode::FileAccessError,
                "Source ended after " + std::to_string(length - remaining) + " of " +
                std::to_string(length) + " bytes");
        }

        hasher.update(buffer.data(), got);
        sendBuffer(connection, buffer.data(), got);
        remaining -= got;
    }

    return hasher.finish();
}

Digest Transport::recvExact(Connection& connection, std::ostream& sink, uint64_t size) {
    std::vector<uint8_t> buffer(protocol::CHUNK_SIZE);
    Sha256 hasher;
    uint64_t remaining = size;

    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        size_t got = connection.recvSome(buffer.data(), want);
        if (got == 0) {
            throw TransferError(ErrorCode::ConnectionBroken,
                connection.peer() + " closed the connection after " +
                std::to_string(size - remaining) + " of " + std::to_string(size) + " bytes");
        }

        hasher.update(buffer.data(), got);
        sink.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(got));
        if (!sink) {
            throw TransferError(ErrorCode::FileAccessError, "Failed to write received data");
        }
        remaining -= got;
    }

    return hasher.finish();
}

void Transport::sendBuffer(Connection& connection, const uint8_t* data, size_t length) {
    size_t total_sent = 0;
    while (total_sent < length) {
        size_t sent = connection.sendSome(data + total_sent, length - total_sent);
        if (sent == 0) {
            throw TransferError(ErrorCode::ConnectionBroken,
                "Send to " + connection.peer() + " made no progress");
        }
        total_sent += sent;
    }
}

size_t Transport::recvUpTo(Connection& connection, uint8_t* data, size_t length) {
    size_t total = 0;
    while (total < length) {
        size_t got = connection.recvSome(data + total, length - total);
        if (got == 0) break;
        total += got;
    }
    return total;
}

void Transport::recvBuffer(Connection& connection, uint8_t* data, size_t length) {
    size_t got = recvUpTo(connection, data, length);
    if (got < length) {
        throw TransferError(ErrorCode::ConnectionBroken,
            connection.peer() + " closed the connection after " + std::to_string(got) +
            " of " + std::to_string(length) + " bytes");
    }
}

void Transport::sendAck(Connection& connection) {
    uint8_t ack = protocol::ACK_BYTE;
    sendBuffer(connection, &ack, 1);
}

bool Transport::recvAck(Connection& connection) {
    uint8_t byte = 0;
    try {
        if (recvUpTo(connection, &byte, 1) != 1) {
            return false;
        }
    }
    catch (const TransferError& e) {
        if (e.code() == ErrorCode::Timeout) {
            throw;
        }
        Logger::logEvent(LogLevel::Debug, std::string("ACK read failed: ") + e.what());
        return false;
    }
    return byte == protocol::ACK_BYTE;
}

void Transport::sendDigest(Connection& connection, const Digest& digest) {
    sendBuffer(connection, digest.data(), digest.size());
}

Digest Transport::recvDigest(Connection& connection) {
    Digest digest;
    recvBuffer(connection, digest.data(), digest.size());
    return digest;
}

void Transport::sendCapabilities(Connection& connection, CapabilitySet capabilities) {
    uint8_t byte = capabilities.encode();
    sendBuffer(connection, &byte, protocol::CAPABILITY_BYTES);
}

CapabilitySet Transport::recvCapabilities(Connection& connection) {
    uint8_t byte = 0;
    if (recvUpTo(connection, &byte, protocol::CAPABILITY_BYTES) != protocol::CAPABILITY_BYTES) {
        throw TransferError(ErrorCode::ProtocolDecodeFailure,
            connection.peer() + " closed the connection before sending capabilities");
    }
    return CapabilitySet::decode(byte);
}

void Transport::sendSize(Connection& connection, uint64_t size) {
    Utils::SizeField field = Utils::encodeSize(size);
    sendBuffer(connection, field.data(), field.size());
}

std::optional<uint64_t> Transport::recvSize(Connection& connection) {
    Utils::SizeField field{};
    size_t got = recvUpTo(connection, field.data(), field.size());
    if (got == 0) {
        return std::nullopt;
    }
    if (got < field.size()) {
        Logger::logEvent(LogLevel::Warning,
            "Short size field (" + std::to_string(got) + " bytes), treating as end of batch");
        return std::nullopt;
    }

    uint64_t size = Utils::decodeSize(field);
    if (size == 0) {
        return std::nullopt;
    }
    return size;
}

void Transport::sendName(Connection& connection, std::string_view name) {
    // Validation happens before anything reaches the socket
    Utils::NameField field = Utils::padName(name);
    sendBuffer(connection, field.data(), field.size());
}

std::string Transport::recvName(Connection& connection) {
    Utils::NameField field{};
    size_t got = recvUpTo(connection, field.data(), field.size());
    if (got < field.size()) {
        throw TransferError(ErrorCode::ConnectionBroken,
            connection.peer() + " closed the connection inside the name field");
    }

    std::string name = Utils::stripName(field);
    if (name.empty() || name.find('\0') != std::string::npos) {
        throw TransferError(ErrorCode::ProtocolDecodeFailure, "Malformed file name field");
    }
    if (!Utils::isValidUtf8(name)) {
        throw TransferError(ErrorCode::ProtocolDecodeFailure, "File name is not valid UTF-8");
    }
    return name;
}

} // namespace filepush
