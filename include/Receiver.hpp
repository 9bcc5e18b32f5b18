#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include "NetworkStack.hpp"
#include "Protocol.hpp"
#include "TransferTypes.hpp"

namespace filepush {

struct ReceiverOptions {
    Endpoint local{"0.0.0.0", 0};
    std::filesystem::path destination = ".";
    // Applied only when the sender negotiates the TIMEOUT capability
    std::chrono::milliseconds timeout = protocol::DEFAULT_TIMEOUT;
};

/**
 * Accepts one Sender connection and stores the files it pushes.
 *
 * Received files are written to the destination directory, replacing any
 * existing file of the same name. A file whose transfer fails part way is
 * left as written.
 */
class Receiver {
public:
    explicit Receiver(ReceiverOptions options);

    // Binds and listens; returns the bound port. Called by run() if needed.
    uint16_t listen();

    SessionReport run();

    // Capabilities the connected sender announced
    CapabilitySet capabilities() const { return capabilities_; }

private:
    void negotiate();
    TransferRecord receiveFile(uint64_t size);

    ReceiverOptions options_;
    std::optional<Listener> listener_;
    std::optional<Connection> connection_;
    CapabilitySet capabilities_;
};

} // namespace filepush
