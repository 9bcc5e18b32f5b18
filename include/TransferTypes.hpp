#pragma once // Ensures this header is included only once during compilation

#include <array>     // Provides std::array for fixed-size digests
#include <cstdint>   // Provides fixed-width integer types like uint64_t
#include <stdexcept> // Provides std::runtime_error
#include <string>
#include <vector>

namespace filepush {

// Error codes for the file transfer library
enum class ErrorCode {
    None = 0,
    ConnectionBroken,
    ProtocolDecodeFailure,
    AckRejected,
    IntegrityMismatch,
    NameTooLong,
    Timeout,
    FileNotFound,
    NotARegularFile,
    FileAccessError,
    NetworkError,
    InvalidParameter,
    CryptoError
};

// Converts an ErrorCode to a human-readable string
inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "No error";
        case ErrorCode::ConnectionBroken:
            return "Connection Broken"; // Peer went away mid-transfer
        case ErrorCode::ProtocolDecodeFailure:
            return "Protocol Decode Failure"; // Malformed or short protocol field
        case ErrorCode::AckRejected:
            return "Acknowledgement Rejected";
        case ErrorCode::IntegrityMismatch:
            return "Integrity Mismatch"; // Sender and receiver digests differ
        case ErrorCode::NameTooLong:
            return "File Name Too Long";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::FileNotFound:
            return "File Not Found";
        case ErrorCode::NotARegularFile:
            return "Not A Regular File";
        case ErrorCode::FileAccessError:
            return "File Access Error"; // Local open, read or write failed
        case ErrorCode::NetworkError:
            return "Network Error";
        case ErrorCode::InvalidParameter:
            return "Invalid Parameter";
        case ErrorCode::CryptoError:
            return "Crypto Error";
        default:
            return "Unknown error";
    }
}

// Every failure in a session is raised as a TransferError and is terminal
// for that session.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// SHA-256 digest of one transfer unit's payload
using Digest = std::array<uint8_t, 32>;

// Outcome of one completed transfer unit
struct TransferRecord {
    std::string name;
    uint64_t size;
    Digest digest;
};

using SessionReport = std::vector<TransferRecord>;

} // namespace filepush
