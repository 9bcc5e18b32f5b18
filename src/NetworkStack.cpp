#include "NetworkStack.hpp"
#include "Logger.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <memory>
#include <utility>

namespace filepush {

namespace {
    std::string errnoString(const std::string& operation) {
        return operation + ": " + strerror(errno);
    }

    sockaddr_in resolve(const Endpoint& endpoint) {
        addrinfo hints;
        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* raw = nullptr;
        int rc = getaddrinfo(endpoint.host.c_str(), nullptr, &hints, &raw);
        if (rc != 0 || raw == nullptr) {
            throw TransferError(ErrorCode::NetworkError,
                "Failed to resolve " + endpoint.host + ": " + gai_strerror(rc));
        }
        std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> result(raw, &freeaddrinfo);

        sockaddr_in addr;
        memcpy(&addr, result->ai_addr, sizeof(addr));
        addr.sin_port = htons(endpoint.port);
        return addr;
    }

    std::string describe(const sockaddr_in& addr) {
        char buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
    }

    bool isTimeoutErrno(int err) {
        return err == EAGAIN || err == EWOULDBLOCK;
    }
}

// --- Connection ---------------------------------------------------------

Connection::Connection(int fd, std::string peer) : fd_(fd), peer_(std::move(peer)) {}

Connection::~Connection() {
    close();
}

Connection::Connection(Connection&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), peer_(std::move(other.peer_)) {}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        peer_ = std::move(other.peer_);
    }
    return *this;
}

size_t Connection::sendSome(const uint8_t* data, size_t length) {
    if (fd_ < 0) {
        throw TransferError(ErrorCode::ConnectionBroken, "Send on closed connection");
    }

    while (true) {
        ssize_t sent = ::send(fd_, data, length, MSG_NOSIGNAL);
        if (sent >= 0) {
            return static_cast<size_t>(sent);
        }
        if (errno == EINTR) {
            continue;
        }
        if (isTimeoutErrno(errno)) {
            throw TransferError(ErrorCode::Timeout, "Send to " + peer_ + " timed out");
        }
        throw TransferError(ErrorCode::ConnectionBroken, errnoString("Send to " + peer_));
    }
}

size_t Connection::recvSome(uint8_t* data, size_t length) {
    if (fd_ < 0) {
        throw TransferError(ErrorCode::ConnectionBroken, "Receive on closed connection");
    }

    while (true) {
        ssize_t received = ::recv(fd_, data, length, 0);
        if (received >= 0) {
            return static_cast<size_t>(received);
        }
        if (errno == EINTR) {
            continue;
        }
        if (isTimeoutErrno(errno)) {
            throw TransferError(ErrorCode::Timeout, "Receive from " + peer_ + " timed out");
        }
        throw TransferError(ErrorCode::ConnectionBroken, errnoString("Receive from " + peer_));
    }
}

void Connection::setTimeout(std::chrono::milliseconds timeout) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw TransferError(ErrorCode::NetworkError, errnoString("Failed to set socket timeout"));
    }
}

void Connection::shutdownWrite() {
    if (fd_ < 0 || ::shutdown(fd_, SHUT_WR) < 0) {
        throw TransferError(ErrorCode::ConnectionBroken,
            errnoString("Failed to half-close connection to " + peer_));
    }
}

void Connection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// --- Listener -----------------------------------------------------------

Listener::Listener(int fd) : fd_(fd) {}

Listener::~Listener() {
    close();
}

Listener::Listener(Listener&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Listener& Listener::operator=(Listener&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

Connection Listener::accept() {
    while (true) {
        struct sockaddr_in client_addr;
        socklen_t addr_len = sizeof(client_addr);

        int client_sock = ::accept(fd_, (struct sockaddr*)&client_addr, &addr_len);
        if (client_sock >= 0) {
            Connection connection(client_sock, describe(client_addr));
            Logger::logEvent(LogLevel::Info, "Accepted connection from " + connection.peer());
            return connection;
        }
        if (errno == EINTR) {
            continue;
        }
        throw TransferError(ErrorCode::NetworkError, errnoString("Accept failed"));
    }
}

uint16_t Listener::localPort() const {
    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd_, (struct sockaddr*)&addr, &addr_len) < 0) {
        throw TransferError(ErrorCode::NetworkError, errnoString("getsockname failed"));
    }
    return ntohs(addr.sin_port);
}

void Listener::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// --- NetworkStack -------------------------------------------------------

bool NetworkStack::setSocketOptions(int socket) {
    if (socket < 0) return false;

    // Enable TCP keepalive
    int keepalive = 1;
    if (setsockopt(socket, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive)) < 0) {
        return false;
    }

    return true;
}

Connection NetworkStack::connect(const Endpoint& remote, const std::optional<Endpoint>& local) {
    sockaddr_in server_addr = resolve(remote);

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        throw TransferError(ErrorCode::NetworkError, errnoString("Failed to create client socket"));
    }
    Connection connection(sock, describe(server_addr));

    if (!setSocketOptions(sock)) {
        throw TransferError(ErrorCode::NetworkError, errnoString("Failed to set socket options"));
    }

    if (local) {
        int reuse = 1;
        if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            throw TransferError(ErrorCode::NetworkError, errnoString("Failed to set SO_REUSEADDR"));
        }
        sockaddr_in local_addr = resolve(*local);
        if (bind(sock, (struct sockaddr*)&local_addr, sizeof(local_addr)) < 0) {
            throw TransferError(ErrorCode::NetworkError,
                errnoString("Failed to bind to " + describe(local_addr)));
        }
    }

    while (::connect(sock, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        if (errno == EINTR) continue;
        throw TransferError(ErrorCode::NetworkError,
            errnoString("Connection to " + connection.peer() + " failed"));
    }

    Logger::logEvent(LogLevel::Info, "Connected to " + connection.peer());
    return connection;
}

Listener NetworkStack::listen(const Endpoint& local) {
    sockaddr_in server_addr = resolve(local);

    int server_sock = socket(AF_INET, SOCK_STREAM, 0);
    if (server_sock < 0) {
        throw TransferError(ErrorCode::NetworkError, errnoString("Failed to create server socket"));
    }
    Listener listener(server_sock);

    if (!setSocketOptions(server_sock)) {
        throw TransferError(ErrorCode::NetworkError, errnoString("Failed to set socket options"));
    }

    // Enable address reuse
    int reuse = 1;
    if (setsockopt(server_sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        throw TransferError(ErrorCode::NetworkError, errnoString("Failed to set SO_REUSEADDR"));
    }

    if (bind(server_sock, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        throw TransferError(ErrorCode::NetworkError,
            errnoString("Failed to bind to " + describe(server_addr)));
    }

    if (::listen(server_sock, LISTEN_BACKLOG) < 0) {
        throw TransferError(ErrorCode::NetworkError, errnoString("Failed to listen on server socket"));
    }

    Logger::logEvent(LogLevel::Info,
        "Listening on " + local.host + ":" + std::to_string(listener.localPort()));
    return listener;
}

} // namespace filepush
