#include "metacache/net/connection.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cstdint>
#include <utility>

#include "metacache/meta/errors.hpp"
#include "metacache/util/logger.hpp"

namespace metacache::net {

namespace {

bool send_all(int fd, const void* data, size_t len) {
    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    size_t total_sent = 0;
    while (total_sent < len) {
        ssize_t sent = send(fd, ptr + total_sent, len - total_sent, MSG_NOSIGNAL);
        if (sent <= 0) {
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }
    return true;
}

}  // namespace

TcpConnection::TcpConnection(std::string host, uint16_t port, int timeout_seconds)
    : host_(std::move(host)), port_(port), timeout_seconds_(timeout_seconds) {}

TcpConnection::~TcpConnection() {
    close();
}

void TcpConnection::connect() {
    if (socket_fd_ >= 0) {
        return;
    }

    socket_fd_ = socket(AF_INET, SOCK_STREAM, 0);

    if (socket_fd_ < 0) {
        throw meta::TransportError("failed to create socket");
    }

    if (timeout_seconds_ > 0) {
        struct timeval tv;
        tv.tv_sec = timeout_seconds_;
        tv.tv_usec = 0;
        setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);

    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) <= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
        throw meta::TransportError("invalid address: " + host_);
    }

    if (::connect(socket_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
        throw meta::TransportError("failed to connect to " + host_ + ":" +
                                   std::to_string(port_));
    }

    LOG_INFO("connected to " + host_ + ":" + std::to_string(port_));
}

void TcpConnection::close() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
    write_buffer_.clear();
    read_buffer_.clear();
}

bool TcpConnection::is_open() const noexcept {
    return socket_fd_ >= 0;
}

bool TcpConnection::write(std::string_view bytes) {
    if (socket_fd_ < 0) {
        return false;
    }
    write_buffer_.append(bytes.data(), bytes.size());
    return true;
}

bool TcpConnection::flush() {
    if (socket_fd_ < 0) {
        return false;
    }
    bool ok = send_all(socket_fd_, write_buffer_.data(), write_buffer_.size());
    write_buffer_.clear();
    return ok;
}

std::optional<std::string> TcpConnection::read_line() {
    while (true) {
        size_t pos = read_buffer_.find('\n');
        if (pos != std::string::npos) {
            std::string line = read_buffer_.substr(0, pos);
            read_buffer_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }

        if (!fill()) {
            return std::nullopt;
        }
    }
}

std::optional<std::string> TcpConnection::read_exact(std::size_t n) {
    while (read_buffer_.size() < n) {
        if (!fill()) {
            return std::nullopt;
        }
    }
    std::string out = read_buffer_.substr(0, n);
    read_buffer_.erase(0, n);
    return out;
}

bool TcpConnection::fill() {
    if (socket_fd_ < 0) {
        return false;
    }

    char chunk[4096];
    ssize_t n = recv(socket_fd_, chunk, sizeof(chunk), 0);
    if (n <= 0) {
        return false;
    }
    read_buffer_.append(chunk, static_cast<size_t>(n));
    return true;
}

}  // namespace metacache::net
