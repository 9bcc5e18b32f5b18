#include "Receiver.hpp"
#include "Crypto.hpp"
#include "Logger.hpp"
#include "Transport.hpp"
#include "Utils.hpp"
#include <fstream>
#include <utility>

namespace filepush {

namespace fs = std::filesystem;

Receiver::Receiver(ReceiverOptions options) : options_(std::move(options)) {}

uint16_t Receiver::listen() {
    if (!listener_) {
        listener_.emplace(NetworkStack::listen(options_.local));
    }
    return listener_->localPort();
}

SessionReport Receiver::run() {
    try {
        if (!fs::is_directory(options_.destination)) {
            throw TransferError(ErrorCode::InvalidParameter,
                "Destination is not a directory: " + options_.destination.string());
        }

        listen();
        connection_.emplace(listener_->accept());
        // One connection per session
        listener_.reset();

        negotiate();

        SessionReport report;
        // Orderly EOF ends the batch; a reset raises ConnectionBroken instead
        while (auto size = Transport::recvSize(*connection_)) {
            report.push_back(receiveFile(*size));
        }

        Logger::logEvent(LogLevel::Info,
            "Received " + std::to_string(report.size()) + " file(s) from " + connection_->peer());
        connection_.reset();
        return report;
    }
    catch (const TransferError& e) {
        Logger::logError(e.code(), std::string("Receive session failed: ") + e.what());
        connection_.reset();
        listener_.reset();
        throw;
    }
}

void Receiver::negotiate() {
    capabilities_ = Transport::recvCapabilities(*connection_);
    Logger::logEvent(LogLevel::Info, "Peer capabilities " + capabilities_.toString());

    // TIMEOUT wins if a peer sets both timeout bits
    if (capabilities_.has(Capability::Timeout)) {
        connection_->setTimeout(options_.timeout);
        Logger::logEvent(LogLevel::Debug,
            "Timeout set to " + std::to_string(options_.timeout.count()) + " ms");
    }

    Transport::sendAck(*connection_);
}

TransferRecord Receiver::receiveFile(uint64_t size) {
    Transport::sendAck(*connection_);

    std::string name = Transport::recvName(*connection_);
    if (!Utils::isPlainFileName(name)) {
        throw TransferError(ErrorCode::ProtocolDecodeFailure,
            "Refusing file name outside the destination: " + name);
    }
    Transport::sendAck(*connection_);

    fs::path target = options_.destination / fs::u8path(name);
    Logger::logEvent(LogLevel::Info,
        "Receiving " + name + " (" + std::to_string(size) + " bytes)");

    std::ofstream sink(target, std::ios::binary | std::ios::trunc);
    if (!sink.is_open()) {
        throw TransferError(ErrorCode::FileAccessError,
            "Cannot open " + target.string() + " for writing");
    }

    Digest digest = Transport::recvExact(*connection_, sink, size);
    sink.close();
    if (!sink) {
        throw TransferError(ErrorCode::FileAccessError, "Failed to flush " + target.string());
    }

    Transport::sendDigest(*connection_, digest);
    Logger::logEvent(LogLevel::Debug, "Digest " + Crypto::toHex(digest));

    if (!Transport::recvAck(*connection_)) {
        throw TransferError(ErrorCode::AckRejected,
            connection_->peer() + " did not acknowledge " + name);
    }

    Logger::logEvent(LogLevel::Info, "Received " + name + " sha256=" + Crypto::toHex(digest));
    return TransferRecord{name, size, digest};
}

} // namespace filepush
