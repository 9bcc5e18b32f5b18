#include "Sender.hpp"
#include "Crypto.hpp"
#include "Logger.hpp"
#include "Transport.hpp"
#include "Utils.hpp"
#include <fstream>
#include <system_error>
#include <utility>

namespace filepush {

namespace fs = std::filesystem;

Sender::Sender(SenderOptions options) : options_(std::move(options)) {}

void Sender::addFile(const fs::path& path, std::optional<std::string> wireName) {
    OutgoingFile file;
    file.path = path;
    file.name = wireName ? *wireName : path.filename().string();
    files_.push_back(std::move(file));
}

CapabilitySet Sender::capabilities() const {
    CapabilitySet caps;
    caps.set(files_.size() == 1 ? Capability::SingleFile : Capability::MultiFiles);
    caps.set(options_.useTimeout ? Capability::Timeout : Capability::NoTimeout);
    return caps;
}

SessionReport Sender::run() {
    try {
        preflight();

        connection_.emplace(NetworkStack::connect(options_.remote, options_.local));
        if (options_.useTimeout) {
            connection_->setTimeout(options_.timeout);
        }

        negotiate();

        SessionReport report;
        for (const auto& file : files_) {
            report.push_back(sendFile(file));
        }

        // End of batch: no further size fields will follow
        connection_->shutdownWrite();
        Logger::logEvent(LogLevel::Info,
            "Sent " + std::to_string(report.size()) + " file(s) to " + connection_->peer());
        connection_.reset();
        return report;
    }
    catch (const TransferError& e) {
        Logger::logError(e.code(), std::string("Send session failed: ") + e.what());
        connection_.reset();
        throw;
    }
}

// Every file is checked before the connection is opened.
void Sender::preflight() {
    for (auto& file : files_) {
        std::error_code ec;
        fs::file_status status = fs::status(file.path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw TransferError(ErrorCode::FileAccessError,
                "Cannot stat " + file.path.string() + ": " + ec.message());
        }
        if (!fs::exists(status)) {
            throw TransferError(ErrorCode::FileNotFound, "No such file: " + file.path.string());
        }
        if (!fs::is_regular_file(status)) {
            throw TransferError(ErrorCode::NotARegularFile,
                "Not a regular file: " + file.path.string());
        }

        std::ifstream readable(file.path, std::ios::binary);
        if (!readable.is_open()) {
            throw TransferError(ErrorCode::FileAccessError,
                "Cannot open " + file.path.string() + " for reading");
        }

        file.size = fs::file_size(file.path, ec);
        if (ec) {
            throw TransferError(ErrorCode::FileAccessError,
                "Cannot read size of " + file.path.string() + ": " + ec.message());
        }
        // A zero size field ends the batch on the wire
        if (file.size == 0) {
            throw TransferError(ErrorCode::InvalidParameter,
                "Empty files cannot be transferred: " + file.path.string());
        }

        // Throws NameTooLong / InvalidParameter
        Utils::padName(file.name);
        // The receiver accepts only UTF-8 names that are a single path component
        if (!Utils::isValidUtf8(file.name)) {
            throw TransferError(ErrorCode::InvalidParameter,
                "Wire name is not valid UTF-8: " + file.path.string());
        }
        if (!Utils::isPlainFileName(file.name)) {
            throw TransferError(ErrorCode::InvalidParameter,
                "Wire name must be a plain file name: " + file.name);
        }
    }
}

void Sender::negotiate() {
    CapabilitySet caps = capabilities();
    Logger::logEvent(LogLevel::Info, "Announcing capabilities " + caps.toString());
    Transport::sendCapabilities(*connection_, caps);
    expectAck("capabilities");
}

TransferRecord Sender::sendFile(const OutgoingFile& file) {
    Logger::logEvent(LogLevel::Info,
        "Sending " + file.name + " (" + std::to_string(file.size) + " bytes)");

    std::ifstream source(file.path, std::ios::binary);
    if (!source.is_open()) {
        throw TransferError(ErrorCode::FileAccessError,
            "Cannot open " + file.path.string() + " for reading");
    }

    Transport::sendSize(*connection_, file.size);
    expectAck("size");

    Transport::sendName(*connection_, file.name);
    expectAck("name");

    Digest local = Transport::sendExact(*connection_, source, file.size);
    Digest remote = Transport::recvDigest(*connection_);
    Logger::logEvent(LogLevel::Debug, "Local digest  " + Crypto::toHex(local));
    Logger::logEvent(LogLevel::Debug, "Remote digest " + Crypto::toHex(remote));

    if (!Crypto::digestsEqual(local, remote)) {
        throw TransferError(ErrorCode::IntegrityMismatch,
            "Digest mismatch for " + file.name + ": local " + Crypto::toHex(local) +
            ", remote " + Crypto::toHex(remote));
    }

    Transport::sendAck(*connection_);
    Logger::logEvent(LogLevel::Info, "Sent " + file.name + " sha256=" + Crypto::toHex(local));
    return TransferRecord{file.name, file.size, local};
}

void Sender::expectAck(const std::string& step) {
    if (!Transport::recvAck(*connection_)) {
        throw TransferError(ErrorCode::AckRejected,
            connection_->peer() + " did not acknowledge " + step);
    }
    Logger::logEvent(LogLevel::Debug, "Acknowledged " + step);
}

} // namespace filepush
