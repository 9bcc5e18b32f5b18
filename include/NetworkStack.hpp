#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "Utils.hpp"

namespace filepush {

// Owns one connected stream socket.
class Connection {
public:
    explicit Connection(int fd, std::string peer = "peer");
    ~Connection();

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Single send/recv call. sendSome returns the bytes accepted by the
    // kernel, recvSome returns 0 on orderly shutdown by the peer. Both throw
    // Timeout when a negotiated timeout expires and ConnectionBroken when the
    // socket is unusable.
    size_t sendSome(const uint8_t* data, size_t length);
    size_t recvSome(uint8_t* data, size_t length);

    void setTimeout(std::chrono::milliseconds timeout);
    void shutdownWrite();
    void close();

    int fd() const { return fd_; }
    bool isOpen() const { return fd_ >= 0; }
    const std::string& peer() const { return peer_; }

private:
    int fd_;
    std::string peer_;
};

// Owns one bound, listening socket.
class Listener {
public:
    explicit Listener(int fd);
    ~Listener();

    Listener(Listener&& other) noexcept;
    Listener& operator=(Listener&& other) noexcept;
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    Connection accept();
    uint16_t localPort() const;
    void close();

    int fd() const { return fd_; }

private:
    int fd_;
};

class NetworkStack {
public:
    static Connection connect(const Endpoint& remote,
        const std::optional<Endpoint>& local = std::nullopt);
    static Listener listen(const Endpoint& local);

private:
    static constexpr int LISTEN_BACKLOG = 1;

    static bool setSocketOptions(int socket);

    // Prevent instantiation
    NetworkStack() = delete;
    ~NetworkStack() = delete;
    NetworkStack(const NetworkStack&) = delete;
    NetworkStack& operator=(const NetworkStack&) = delete;
};

} // namespace filepush
