#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "NetworkStack.hpp"
#include "Protocol.hpp"
#include "TransferTypes.hpp"

namespace filepush {

struct SenderOptions {
    Endpoint remote;
    std::optional<Endpoint> local;
    bool useTimeout = false;
    std::chrono::milliseconds timeout = protocol::DEFAULT_TIMEOUT;
};

// One file queued for sending
struct OutgoingFile {
    std::filesystem::path path;
    std::string name;   // wire name
    uint64_t size = 0;  // filled in by preflight
};

/**
 * Pushes a batch of files to one Receiver over a single connection.
 *
 * run() validates every file, connects, announces capabilities and then
 * walks each file through SIZE -> NAME -> DATA -> DIGEST -> ACK before
 * half-closing. Any failure is terminal and thrown as TransferError.
 */
class Sender {
public:
    explicit Sender(SenderOptions options);

    // Queue a file; the wire name defaults to the file's base name.
    void addFile(const std::filesystem::path& path,
        std::optional<std::string> wireName = std::nullopt);

    SessionReport run();

    // Capabilities announced for the current batch
    CapabilitySet capabilities() const;

    const std::vector<OutgoingFile>& files() const { return files_; }

private:
    void preflight();
    void negotiate();
    TransferRecord sendFile(const OutgoingFile& file);
    void expectAck(const std::string& step);

    SenderOptions options_;
    std::vector<OutgoingFile> files_;
    std::optional<Connection> connection_;
};

} // namespace filepush
